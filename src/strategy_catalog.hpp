#ifndef PLANCALC_STRATEGY_CATALOG_HPP
#define PLANCALC_STRATEGY_CATALOG_HPP

#include "strategy.hpp"
#include <cstddef>
#include <iterator>
#include <vector>

namespace plancalc {

// Caller-supplied parameter grid
struct StrategyRanges {
    std::vector<int> withdrawal_intervals;      // Years between partial withdrawals
    std::vector<double> withdrawal_ratios;      // Fraction withdrawn, (0, 1]
    std::vector<int> full_withdrawal_years;
    std::vector<int> switch_years;
    std::vector<double> switch_fee_rates;       // [0, 1)

    // Grid used by the interactive analysis:
    //   intervals 1-5 years, ratios 10%-100% in 10% steps,
    //   full withdrawal at every year 1..period,
    //   switch at every year 1..period-1 with fees 1%-5%
    static StrategyRanges defaults(int period_years);
};

// Lazy, finite sequence of strategy descriptors
//
// Iteration order is the nested cartesian order of the input lists:
//   1. PartialWithdrawal: for each interval, for each ratio
//   2. FullWithdrawal: for each year
//   3. Switch: for each year, for each fee rate
//
// Degenerate combinations are skipped and counted:
//   - interval >= period (no withdrawal event before maturity)
//   - switch year >= period (nothing left to reinvest)
class StrategyCatalog {
public:
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = StrategyDescriptor;
        using difference_type = std::ptrdiff_t;
        using pointer = const StrategyDescriptor*;
        using reference = const StrategyDescriptor&;

        const_iterator();

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        const_iterator& operator++();
        const_iterator operator++(int);

        bool operator==(const const_iterator& other) const;
        bool operator!=(const const_iterator& other) const { return !(*this == other); }

    private:
        friend class StrategyCatalog;

        const_iterator(const StrategyCatalog* catalog, size_t position);
        void settle();

        const StrategyCatalog* catalog_;
        size_t position_;           // Index into the unfiltered cartesian sequence
        StrategyDescriptor current_;
    };

    // Throws InvalidInput when period_years <= 0 or a range value is out of
    // domain: intervals and years < 1, full-withdrawal year > period,
    // ratio outside (0, 1], switch fee outside [0, 1)
    StrategyCatalog(StrategyRanges ranges, int period_years);

    const_iterator begin() const;
    const_iterator end() const;

    // I×R + Y + S×F
    size_t upper_bound() const;
    // Descriptors produced by iteration
    size_t size() const { return upper_bound() - skipped_; }
    // Degenerate combinations filtered out
    size_t skipped() const { return skipped_; }
    bool empty() const { return size() == 0; }

    std::vector<StrategyDescriptor> to_vector() const;

    const StrategyRanges& ranges() const { return ranges_; }
    int period_years() const { return period_years_; }

private:
    StrategyRanges ranges_;
    int period_years_;
    size_t skipped_;

    size_t partial_count() const;
    size_t switch_count() const;
    bool is_degenerate(size_t position) const;
    StrategyDescriptor descriptor_at(size_t position) const;
};

} // namespace plancalc

#endif // PLANCALC_STRATEGY_CATALOG_HPP
