#ifndef PLANCALC_STRATEGY_HPP
#define PLANCALC_STRATEGY_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace plancalc {

enum class StrategyType : uint8_t {
    FullWithdrawal = 0,
    PartialWithdrawal = 1,
    Switch = 2
};

// Surrender the plan at the end of `year`
struct FullWithdrawal {
    int year;

    bool operator==(const FullWithdrawal& other) const { return year == other.year; }
};

// Withdraw `ratio` of the balance every `interval_years` until maturity
struct PartialWithdrawal {
    int interval_years;
    double ratio;                   // Fraction of the balance, (0, 1]

    bool operator==(const PartialWithdrawal& other) const {
        return interval_years == other.interval_years && ratio == other.ratio;
    }
};

// Surrender at `year` and move the proceeds plus the remaining premiums into
// the alternative vehicle
struct Switch {
    int year;
    double fee_rate;                // Transfer fee on the amount moved, [0, 1)

    bool operator==(const Switch& other) const {
        return year == other.year && fee_rate == other.fee_rate;
    }
};

using StrategyDescriptor = std::variant<FullWithdrawal, PartialWithdrawal, Switch>;

StrategyType strategy_type(const StrategyDescriptor& descriptor);

// Human-readable and unique per parameterization, e.g.
//   "Full withdrawal at year 10"
//   "Partial withdrawal every 2y at 50%"
//   "Switch at year 5 with 1.5% fee"
std::string strategy_label(const StrategyDescriptor& descriptor);

// Defining parameters as (name, value) pairs in declaration order
std::vector<std::pair<std::string, double>> strategy_parameters(const StrategyDescriptor& descriptor);

std::string type_to_string(StrategyType type);
StrategyType type_from_string(const std::string& name);

} // namespace plancalc

#endif // PLANCALC_STRATEGY_HPP
