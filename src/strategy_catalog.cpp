#include "strategy_catalog.hpp"
#include "errors.hpp"
#include <cmath>
#include <utility>

namespace plancalc {

// ============================================================================
// StrategyRanges Implementation
// ============================================================================

StrategyRanges StrategyRanges::defaults(int period_years) {
    StrategyRanges ranges;
    for (int i = 1; i <= 5; ++i) {
        ranges.withdrawal_intervals.push_back(i);
    }
    for (int i = 1; i <= 10; ++i) {
        ranges.withdrawal_ratios.push_back(i / 10.0);
    }
    for (int y = 1; y <= period_years; ++y) {
        ranges.full_withdrawal_years.push_back(y);
    }
    for (int y = 1; y < period_years; ++y) {
        ranges.switch_years.push_back(y);
    }
    for (int i = 1; i <= 5; ++i) {
        ranges.switch_fee_rates.push_back(i / 100.0);
    }
    return ranges;
}

// ============================================================================
// StrategyCatalog Implementation
// ============================================================================

StrategyCatalog::StrategyCatalog(StrategyRanges ranges, int period_years)
    : ranges_(std::move(ranges)),
      period_years_(period_years),
      skipped_(0) {
    if (period_years_ <= 0) {
        throw InvalidInput("period_years must be positive");
    }

    for (int interval : ranges_.withdrawal_intervals) {
        if (interval < 1) {
            throw InvalidInput("Withdrawal interval must be at least 1 year, got " +
                               std::to_string(interval));
        }
        if (interval >= period_years_) {
            skipped_ += ranges_.withdrawal_ratios.size();
        }
    }
    for (double ratio : ranges_.withdrawal_ratios) {
        if (!std::isfinite(ratio) || ratio <= 0.0 || ratio > 1.0) {
            throw InvalidInput("Withdrawal ratio must be in (0, 1]");
        }
    }
    for (int year : ranges_.full_withdrawal_years) {
        if (year < 1 || year > period_years_) {
            throw InvalidInput("Full withdrawal year must be in [1, " +
                               std::to_string(period_years_) + "], got " + std::to_string(year));
        }
    }
    for (int year : ranges_.switch_years) {
        if (year < 1) {
            throw InvalidInput("Switch year must be at least 1, got " + std::to_string(year));
        }
        if (year >= period_years_) {
            skipped_ += ranges_.switch_fee_rates.size();
        }
    }
    for (double fee : ranges_.switch_fee_rates) {
        if (!std::isfinite(fee) || fee < 0.0 || fee >= 1.0) {
            throw InvalidInput("Switch fee rate must be in [0, 1)");
        }
    }
}

size_t StrategyCatalog::partial_count() const {
    return ranges_.withdrawal_intervals.size() * ranges_.withdrawal_ratios.size();
}

size_t StrategyCatalog::switch_count() const {
    return ranges_.switch_years.size() * ranges_.switch_fee_rates.size();
}

size_t StrategyCatalog::upper_bound() const {
    return partial_count() + ranges_.full_withdrawal_years.size() + switch_count();
}

bool StrategyCatalog::is_degenerate(size_t position) const {
    size_t partial = partial_count();
    if (position < partial) {
        size_t interval_idx = position / ranges_.withdrawal_ratios.size();
        return ranges_.withdrawal_intervals[interval_idx] >= period_years_;
    }
    position -= partial;

    if (position < ranges_.full_withdrawal_years.size()) {
        return false;
    }
    position -= ranges_.full_withdrawal_years.size();

    size_t year_idx = position / ranges_.switch_fee_rates.size();
    return ranges_.switch_years[year_idx] >= period_years_;
}

StrategyDescriptor StrategyCatalog::descriptor_at(size_t position) const {
    size_t partial = partial_count();
    if (position < partial) {
        size_t ratios = ranges_.withdrawal_ratios.size();
        return PartialWithdrawal{ranges_.withdrawal_intervals[position / ratios],
                                 ranges_.withdrawal_ratios[position % ratios]};
    }
    position -= partial;

    if (position < ranges_.full_withdrawal_years.size()) {
        return FullWithdrawal{ranges_.full_withdrawal_years[position]};
    }
    position -= ranges_.full_withdrawal_years.size();

    size_t fees = ranges_.switch_fee_rates.size();
    return Switch{ranges_.switch_years[position / fees],
                  ranges_.switch_fee_rates[position % fees]};
}

StrategyCatalog::const_iterator StrategyCatalog::begin() const {
    return const_iterator(this, 0);
}

StrategyCatalog::const_iterator StrategyCatalog::end() const {
    return const_iterator(this, upper_bound());
}

std::vector<StrategyDescriptor> StrategyCatalog::to_vector() const {
    std::vector<StrategyDescriptor> out;
    out.reserve(size());
    for (const auto& descriptor : *this) {
        out.push_back(descriptor);
    }
    return out;
}

// ============================================================================
// StrategyCatalog::const_iterator Implementation
// ============================================================================

StrategyCatalog::const_iterator::const_iterator()
    : catalog_(nullptr),
      position_(0),
      current_(FullWithdrawal{0}) {}

StrategyCatalog::const_iterator::const_iterator(const StrategyCatalog* catalog, size_t position)
    : catalog_(catalog),
      position_(position),
      current_(FullWithdrawal{0}) {
    settle();
}

void StrategyCatalog::const_iterator::settle() {
    size_t end = catalog_->upper_bound();
    while (position_ < end && catalog_->is_degenerate(position_)) {
        ++position_;
    }
    if (position_ < end) {
        current_ = catalog_->descriptor_at(position_);
    }
}

StrategyCatalog::const_iterator& StrategyCatalog::const_iterator::operator++() {
    ++position_;
    settle();
    return *this;
}

StrategyCatalog::const_iterator StrategyCatalog::const_iterator::operator++(int) {
    const_iterator previous = *this;
    ++(*this);
    return previous;
}

bool StrategyCatalog::const_iterator::operator==(const const_iterator& other) const {
    return catalog_ == other.catalog_ && position_ == other.position_;
}

} // namespace plancalc
