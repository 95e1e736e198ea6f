#ifndef PLANCALC_CASHFLOW_SIMULATOR_HPP
#define PLANCALC_CASHFLOW_SIMULATOR_HPP

#include "premium_plan.hpp"
#include "tax_engine.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace plancalc {

enum class SimulatorPhase : uint8_t {
    Accumulating = 0,
    WithdrawalEvent = 1,        // A partial withdrawal happened this month
    SwitchEvent = 2,            // Plan surrendered, proceeds awaiting the alternative vehicle
    Terminal = 3
};

std::string phase_to_string(SimulatorPhase phase);

// Running totals of one strategy run
struct SimulationState {
    int month;                      // Elapsed months since inception
    double balance;                 // Plan balance
    double cost_basis;              // Premiums still attributed to the balance
    double contributions;           // Cumulative gross premiums paid
    double fees;                    // Cumulative setup + balance fees
    double withdrawal_fees;         // Cumulative fees on partial withdrawals
    double surrender_charges;       // Surrender deduction on liquidation
    double transfer_fees;           // Switch fee on the amount moved
    double tax_savings;             // Cumulative premium-deduction tax savings
    double one_time_tax;            // Cumulative one-time income tax paid
    double capital_gains_tax;       // Tax on reinvestment/alternative gains
    double withdrawn;               // Cumulative gross amount taken out of the plan
    double reinvestment_balance;    // Account receiving partial withdrawals
    double reinvestment_principal;  // Money put into the reinvestment account
    double cash;                    // After-tax proceeds held outside any vehicle
    int withdrawal_events;
    SimulatorPhase phase;

    SimulationState();
};

// End-of-year view for detailed output
struct YearlySnapshot {
    int year;                       // Policy year (1-based)
    double balance;
    double cost_basis;
    double contributions;
    double fees;
    double tax_savings;
    double reinvestment_balance;
};

// Outcome of liquidating the whole plan balance
struct SurrenderResult {
    double gross;                   // Balance before deductions
    double surrender_charge;
    double profit;                  // gross - charge - cost basis
    double one_time_tax;
    double proceeds;                // After charge and tax
};

// Outcome of holding money in an InvestmentVehicle to the horizon
struct VehicleOutcome {
    double gross_value;
    double principal;               // Money put in
    double gain;
    double capital_gains_tax;
    double net_value;               // gross_value - capital_gains_tax

    VehicleOutcome();
};

// Balance after `months` in `vehicle`, starting from `initial` and adding
// `monthly_contribution` after each month's growth, taxed on sale
VehicleOutcome project_vehicle(const InvestmentVehicle& vehicle,
                               double initial,
                               double monthly_contribution,
                               int months);

// Month-by-month state machine of one plan run
//
//   Accumulating -> (WithdrawalEvent | SwitchEvent)* -> Terminal
//
// Each month:
//   1. Reinvestment account grows at the reinvestment vehicle's rate
//   2. Premium net of the setup fee is added to the balance
//   3. Balance grows by (1 + monthly_rate)
//   4. Balance fee is deducted
//   5. At each completed policy year the annual tax saving is accrued
//
// The plan and tax engine are held by reference and must outlive the
// simulator.
class CashflowSimulator {
public:
    CashflowSimulator(const PremiumPlan& plan,
                      const TaxEngine& tax_engine,
                      double taxable_income,
                      const InvestmentVehicle& reinvestment = InvestmentVehicle::deposit_default());

    // Record a YearlySnapshot at every completed policy year
    void set_record_snapshots(bool record) { record_snapshots_ = record; }

    void step_month();

    // Advance `months` months, never past the plan period. Uses the
    // annuity-due closed form when the plan has no balance fee.
    void advance(int months);
    void advance_to_month(int month);

    // Withdraw `ratio` of the balance, charge the withdrawal fee and
    // one-time tax, and move the rest to the reinvestment account.
    // Returns the amount reinvested. Throws InvalidInput unless 0 < ratio <= 1.
    double partial_withdrawal(double ratio);

    // Liquidate the plan and hold the proceeds as cash (Terminal)
    SurrenderResult surrender();

    // Liquidate the plan and hold the proceeds for a switch (SwitchEvent).
    // When months remain, `fee_rate` of the proceeds is charged as a transfer
    // fee. Throws InvalidInput unless 0 <= fee_rate < 1.
    SurrenderResult switch_out(double fee_rate);

    // Hold the switched proceeds in `vehicle` for the remaining months while
    // the monthly premium keeps being paid into it, then sell (Terminal)
    VehicleOutcome invest_alternative(const InvestmentVehicle& vehicle);

    // Sell the reinvestment account at the horizon, paying capital gains tax
    void liquidate_reinvestment();

    // Cash + reinvestment account; after Terminal this is the after-tax value
    // the investor walks away with
    double terminal_value() const;

    // terminal_value + tax_savings - contributions
    double net_benefit() const;

    const SimulationState& state() const { return state_; }
    const std::vector<YearlySnapshot>& snapshots() const { return snapshots_; }
    double annual_tax_saving() const { return annual_tax_saving_; }
    int remaining_months() const { return plan_.total_months() - state_.month; }

    // max(0, 10% - 1% × elapsed_years)
    static double surrender_deduction_rate(int elapsed_years);

private:
    const PremiumPlan& plan_;
    const TaxEngine& tax_engine_;
    double taxable_income_;
    InvestmentVehicle reinvestment_;
    double annual_tax_saving_;
    bool record_snapshots_;
    SimulationState state_;
    std::vector<YearlySnapshot> snapshots_;

    void require_active(const char* operation) const;
    void advance_closed_form(int months);
    void on_month_completed();
    SurrenderResult liquidate_plan();
};

} // namespace plancalc

#endif // PLANCALC_CASHFLOW_SIMULATOR_HPP
