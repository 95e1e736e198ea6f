#include "premium_plan.hpp"
#include "errors.hpp"
#include <cmath>

namespace plancalc {

namespace {

void check_fee_rate(double rate, const char* name) {
    if (!std::isfinite(rate) || rate < 0.0 || rate >= 1.0) {
        throw InvalidInput(std::string(name) + " must be in [0, 1)");
    }
}

} // anonymous namespace

// ============================================================================
// PremiumPlan Implementation
// ============================================================================

PremiumPlan::PremiumPlan(double monthly_premium,
                         double annual_growth_rate,
                         int period_years,
                         double setup_fee_rate,
                         double balance_fee_rate,
                         double withdrawal_fee_rate)
    : monthly_premium_(monthly_premium),
      annual_growth_rate_(annual_growth_rate),
      period_years_(period_years),
      setup_fee_rate_(setup_fee_rate),
      balance_fee_rate_(balance_fee_rate),
      withdrawal_fee_rate_(withdrawal_fee_rate) {
    if (!std::isfinite(monthly_premium_) || monthly_premium_ <= 0.0) {
        throw InvalidInput("monthly_premium must be positive");
    }
    if (!std::isfinite(annual_growth_rate_) || annual_growth_rate_ < -1.0) {
        throw InvalidInput("annual_growth_rate must not be below -100%");
    }
    if (period_years_ <= 0) {
        throw InvalidInput("period_years must be positive");
    }
    check_fee_rate(setup_fee_rate_, "setup_fee_rate");
    check_fee_rate(balance_fee_rate_, "balance_fee_rate");
    check_fee_rate(withdrawal_fee_rate_, "withdrawal_fee_rate");
}

bool PremiumPlan::operator==(const PremiumPlan& other) const {
    return monthly_premium_ == other.monthly_premium_ &&
           annual_growth_rate_ == other.annual_growth_rate_ &&
           period_years_ == other.period_years_ &&
           setup_fee_rate_ == other.setup_fee_rate_ &&
           balance_fee_rate_ == other.balance_fee_rate_ &&
           withdrawal_fee_rate_ == other.withdrawal_fee_rate_;
}

// ============================================================================
// InvestmentVehicle Implementation
// ============================================================================

InvestmentVehicle::InvestmentVehicle()
    : annual_return(0.0),
      annual_fee(0.0),
      capital_gains_tax_rate(DEFAULT_CAPITAL_GAINS_TAX_RATE),
      tax_exempt(false) {}

InvestmentVehicle::InvestmentVehicle(double annual_return_value, double annual_fee_value,
                                     double capital_gains_tax_rate_value, bool tax_exempt_value)
    : annual_return(annual_return_value),
      annual_fee(annual_fee_value),
      capital_gains_tax_rate(capital_gains_tax_rate_value),
      tax_exempt(tax_exempt_value) {}

double InvestmentVehicle::monthly_rate() const {
    return (annual_return - annual_fee) / 12.0;
}

void InvestmentVehicle::validate() const {
    if (!std::isfinite(annual_return) || !std::isfinite(annual_fee)) {
        throw InvalidInput("Investment vehicle rates must be finite");
    }
    if (annual_fee < 0.0) {
        throw InvalidInput("Investment vehicle annual_fee must be non-negative");
    }
    if (annual_return - annual_fee < -1.0) {
        throw InvalidInput("Investment vehicle net return must not be below -100%");
    }
    if (!std::isfinite(capital_gains_tax_rate) ||
        capital_gains_tax_rate < 0.0 || capital_gains_tax_rate > 1.0) {
        throw InvalidInput("capital_gains_tax_rate must be between 0.0 and 1.0");
    }
}

InvestmentVehicle InvestmentVehicle::deposit_default() {
    return InvestmentVehicle(0.01, 0.0);
}

InvestmentVehicle InvestmentVehicle::fund_matching(const PremiumPlan& plan) {
    return InvestmentVehicle(plan.annual_growth_rate(), 0.0);
}

} // namespace plancalc
