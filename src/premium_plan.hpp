#ifndef PLANCALC_PREMIUM_PLAN_HPP
#define PLANCALC_PREMIUM_PLAN_HPP

namespace plancalc {

// Premium schedule and fee structure of the savings/insurance plan
//
// Rates are decimal (0.0125 = 1.25%). The balance fee is charged monthly on
// the balance after growth. Immutable once constructed.
class PremiumPlan {
public:
    static constexpr double DEFAULT_SETUP_FEE_RATE = 0.013;
    static constexpr double DEFAULT_BALANCE_FEE_RATE = 0.00008;
    static constexpr double DEFAULT_WITHDRAWAL_FEE_RATE = 0.01;

    // Throws InvalidInput when:
    //   monthly_premium <= 0
    //   annual_growth_rate < -1.0 (below -100%/year)
    //   period_years <= 0
    //   any fee rate outside [0, 1)
    PremiumPlan(double monthly_premium,
                double annual_growth_rate,
                int period_years,
                double setup_fee_rate = DEFAULT_SETUP_FEE_RATE,
                double balance_fee_rate = DEFAULT_BALANCE_FEE_RATE,
                double withdrawal_fee_rate = DEFAULT_WITHDRAWAL_FEE_RATE);

    double monthly_premium() const { return monthly_premium_; }
    double annual_growth_rate() const { return annual_growth_rate_; }
    int period_years() const { return period_years_; }
    double setup_fee_rate() const { return setup_fee_rate_; }
    double balance_fee_rate() const { return balance_fee_rate_; }
    double withdrawal_fee_rate() const { return withdrawal_fee_rate_; }

    double annual_premium() const { return monthly_premium_ * 12.0; }
    int total_months() const { return period_years_ * 12; }
    double monthly_rate() const { return annual_growth_rate_ / 12.0; }

    // Premium credited to the balance after the setup fee
    double net_monthly_premium() const { return monthly_premium_ * (1.0 - setup_fee_rate_); }

    bool operator==(const PremiumPlan& other) const;

private:
    double monthly_premium_;
    double annual_growth_rate_;
    int period_years_;
    double setup_fee_rate_;
    double balance_fee_rate_;
    double withdrawal_fee_rate_;
};

// Vehicle receiving money that leaves the plan: the reinvestment account of
// partial withdrawals, or the alternative investment after a switch
struct InvestmentVehicle {
    static constexpr double DEFAULT_CAPITAL_GAINS_TAX_RATE = 0.20315;

    double annual_return;           // Gross annual return (decimal)
    double annual_fee;              // Annual running cost (decimal)
    double capital_gains_tax_rate;  // Tax on the gain at sale (0.0-1.0)
    bool tax_exempt;                // No tax on sale (e.g. NISA)

    InvestmentVehicle();
    InvestmentVehicle(double annual_return, double annual_fee,
                      double capital_gains_tax_rate = DEFAULT_CAPITAL_GAINS_TAX_RATE,
                      bool tax_exempt = false);

    // (annual_return - annual_fee) / 12
    double monthly_rate() const;

    // Throws InvalidInput when the net return is below -100% or a rate is
    // outside its domain
    void validate() const;

    // Bank deposit at 1%
    static InvestmentVehicle deposit_default();

    // Fund earning the plan's own growth rate
    static InvestmentVehicle fund_matching(const PremiumPlan& plan);
};

} // namespace plancalc

#endif // PLANCALC_PREMIUM_PLAN_HPP
