#include "cashflow_simulator.hpp"
#include "errors.hpp"
#include "financial_math.hpp"
#include <algorithm>
#include <stdexcept>

namespace plancalc {

namespace {

constexpr int MONTHS_PER_YEAR = 12;
constexpr double MAX_SURRENDER_DEDUCTION = 0.10;
constexpr double SURRENDER_DECAY_PER_YEAR = 0.01;

} // anonymous namespace

std::string phase_to_string(SimulatorPhase phase) {
    switch (phase) {
        case SimulatorPhase::Accumulating: return "Accumulating";
        case SimulatorPhase::WithdrawalEvent: return "WithdrawalEvent";
        case SimulatorPhase::SwitchEvent: return "SwitchEvent";
        case SimulatorPhase::Terminal: return "Terminal";
    }
    return "Unknown";
}

// ============================================================================
// SimulationState / VehicleOutcome Implementation
// ============================================================================

SimulationState::SimulationState()
    : month(0),
      balance(0.0),
      cost_basis(0.0),
      contributions(0.0),
      fees(0.0),
      withdrawal_fees(0.0),
      surrender_charges(0.0),
      transfer_fees(0.0),
      tax_savings(0.0),
      one_time_tax(0.0),
      capital_gains_tax(0.0),
      withdrawn(0.0),
      reinvestment_balance(0.0),
      reinvestment_principal(0.0),
      cash(0.0),
      withdrawal_events(0),
      phase(SimulatorPhase::Accumulating) {}

VehicleOutcome::VehicleOutcome()
    : gross_value(0.0),
      principal(0.0),
      gain(0.0),
      capital_gains_tax(0.0),
      net_value(0.0) {}

VehicleOutcome project_vehicle(const InvestmentVehicle& vehicle,
                               double initial,
                               double monthly_contribution,
                               int months)
{
    vehicle.validate();

    VehicleOutcome outcome;
    int n = std::max(0, months);
    double rate = vehicle.monthly_rate();

    // Growth first, then the month's contribution: ordinary annuity
    outcome.gross_value = finmath::future_value(initial, rate, n) +
                          finmath::annuity_future_value(monthly_contribution, rate, n);
    outcome.principal = initial + monthly_contribution * n;
    outcome.gain = outcome.gross_value - outcome.principal;
    if (!vehicle.tax_exempt) {
        outcome.capital_gains_tax = std::max(0.0, outcome.gain) * vehicle.capital_gains_tax_rate;
    }
    outcome.net_value = outcome.gross_value - outcome.capital_gains_tax;
    return outcome;
}

// ============================================================================
// CashflowSimulator Implementation
// ============================================================================

CashflowSimulator::CashflowSimulator(const PremiumPlan& plan,
                                     const TaxEngine& tax_engine,
                                     double taxable_income,
                                     const InvestmentVehicle& reinvestment)
    : plan_(plan),
      tax_engine_(tax_engine),
      taxable_income_(taxable_income),
      reinvestment_(reinvestment),
      annual_tax_saving_(0.0),
      record_snapshots_(false) {
    if (taxable_income_ < 0.0) {
        throw InvalidInput("taxable_income must be non-negative");
    }
    reinvestment_.validate();
    annual_tax_saving_ = tax_engine_.annual_tax_savings(plan_.annual_premium(), taxable_income_).total;
}

double CashflowSimulator::surrender_deduction_rate(int elapsed_years) {
    return std::max(0.0, MAX_SURRENDER_DEDUCTION - SURRENDER_DECAY_PER_YEAR * elapsed_years);
}

void CashflowSimulator::require_active(const char* operation) const {
    if (state_.phase == SimulatorPhase::SwitchEvent || state_.phase == SimulatorPhase::Terminal) {
        throw std::runtime_error(std::string("Cannot ") + operation +
                                 " after the plan was surrendered");
    }
}

void CashflowSimulator::step_month() {
    require_active("step");
    if (state_.month >= plan_.total_months()) {
        throw std::out_of_range("Plan period already completed");
    }

    state_.reinvestment_balance *= (1.0 + reinvestment_.monthly_rate());

    double premium = plan_.monthly_premium();
    double setup_fee = premium * plan_.setup_fee_rate();
    state_.balance = (state_.balance + premium - setup_fee) * (1.0 + plan_.monthly_rate());

    double balance_fee = state_.balance * plan_.balance_fee_rate();
    state_.balance -= balance_fee;

    state_.contributions += premium;
    state_.cost_basis += premium;
    state_.fees += setup_fee + balance_fee;
    state_.month++;
    state_.phase = SimulatorPhase::Accumulating;

    on_month_completed();
}

void CashflowSimulator::on_month_completed() {
    if (state_.month % MONTHS_PER_YEAR != 0) {
        return;
    }
    state_.tax_savings += annual_tax_saving_;

    if (record_snapshots_) {
        YearlySnapshot snap;
        snap.year = state_.month / MONTHS_PER_YEAR;
        snap.balance = state_.balance;
        snap.cost_basis = state_.cost_basis;
        snap.contributions = state_.contributions;
        snap.fees = state_.fees;
        snap.tax_savings = state_.tax_savings;
        snap.reinvestment_balance = state_.reinvestment_balance;
        snapshots_.push_back(snap);
    }
}

void CashflowSimulator::advance(int months) {
    require_active("advance");
    int n = std::min(std::max(0, months), remaining_months());
    if (n == 0) {
        return;
    }

    if (plan_.balance_fee_rate() != 0.0) {
        for (int i = 0; i < n; ++i) {
            step_month();
        }
        return;
    }

    // Closed form per chunk; chunks end on year boundaries so the yearly
    // accruals and snapshots land where the monthly loop would put them
    while (n > 0) {
        int to_year_end = MONTHS_PER_YEAR - state_.month % MONTHS_PER_YEAR;
        int chunk = std::min(n, to_year_end);
        advance_closed_form(chunk);
        n -= chunk;
    }
}

void CashflowSimulator::advance_to_month(int month) {
    advance(month - state_.month);
}

void CashflowSimulator::advance_closed_form(int months) {
    double rate = plan_.monthly_rate();
    double premium = plan_.monthly_premium();
    double net_premium = plan_.net_monthly_premium();

    state_.reinvestment_balance = finmath::future_value(
        state_.reinvestment_balance, reinvestment_.monthly_rate(), months);

    // (balance + net) × (1 + r) each month is an annuity-due;
    // at r == 0 this is balance + net × months
    state_.balance = finmath::future_value(state_.balance, rate, months) +
                     finmath::annuity_due_future_value(net_premium, rate, months);

    state_.contributions += premium * months;
    state_.cost_basis += premium * months;
    state_.fees += premium * plan_.setup_fee_rate() * months;
    state_.month += months;
    state_.phase = SimulatorPhase::Accumulating;

    on_month_completed();
}

double CashflowSimulator::partial_withdrawal(double ratio) {
    require_active("withdraw");
    if (!(ratio > 0.0) || ratio > 1.0) {
        throw InvalidInput("Withdrawal ratio must be in (0, 1]");
    }

    double amount = state_.balance * ratio;
    double fee = amount * plan_.withdrawal_fee_rate();
    double profit = (amount - fee) - state_.cost_basis * ratio;
    double tax = tax_engine_.one_time_withdrawal_tax(profit, taxable_income_);
    double reinvested = amount - fee - tax;

    state_.balance *= (1.0 - ratio);
    state_.cost_basis *= (1.0 - ratio);
    state_.withdrawn += amount;
    state_.withdrawal_fees += fee;
    state_.one_time_tax += tax;
    state_.reinvestment_balance += reinvested;
    state_.reinvestment_principal += reinvested;
    state_.withdrawal_events++;
    state_.phase = SimulatorPhase::WithdrawalEvent;

    return reinvested;
}

SurrenderResult CashflowSimulator::liquidate_plan() {
    SurrenderResult result;
    result.gross = state_.balance;
    result.surrender_charge = result.gross * surrender_deduction_rate(state_.month / MONTHS_PER_YEAR);

    double after_charge = result.gross - result.surrender_charge;
    result.profit = after_charge - state_.cost_basis;
    result.one_time_tax = tax_engine_.one_time_withdrawal_tax(result.profit, taxable_income_);
    result.proceeds = after_charge - result.one_time_tax;

    state_.withdrawn += result.gross;
    state_.surrender_charges += result.surrender_charge;
    state_.one_time_tax += result.one_time_tax;
    state_.balance = 0.0;
    state_.cost_basis = 0.0;
    return result;
}

SurrenderResult CashflowSimulator::surrender() {
    require_active("surrender");
    SurrenderResult result = liquidate_plan();
    state_.cash += result.proceeds;
    state_.phase = SimulatorPhase::Terminal;
    return result;
}

SurrenderResult CashflowSimulator::switch_out(double fee_rate) {
    require_active("switch");
    if (!(fee_rate >= 0.0) || fee_rate >= 1.0) {
        throw InvalidInput("Switch fee rate must be in [0, 1)");
    }

    SurrenderResult result = liquidate_plan();
    double transfer_fee = remaining_months() > 0 ? result.proceeds * fee_rate : 0.0;
    state_.transfer_fees += transfer_fee;
    state_.cash += result.proceeds - transfer_fee;
    state_.phase = SimulatorPhase::SwitchEvent;
    return result;
}

VehicleOutcome CashflowSimulator::invest_alternative(const InvestmentVehicle& vehicle) {
    if (state_.phase != SimulatorPhase::SwitchEvent) {
        throw std::runtime_error("invest_alternative requires a preceding switch_out");
    }

    int months = remaining_months();
    VehicleOutcome outcome = project_vehicle(vehicle, state_.cash, plan_.monthly_premium(), months);

    state_.contributions += plan_.monthly_premium() * months;
    state_.capital_gains_tax += outcome.capital_gains_tax;
    state_.cash = outcome.net_value;
    state_.month += months;
    state_.phase = SimulatorPhase::Terminal;
    return outcome;
}

void CashflowSimulator::liquidate_reinvestment() {
    double gain = state_.reinvestment_balance - state_.reinvestment_principal;
    double tax = 0.0;
    if (!reinvestment_.tax_exempt) {
        tax = std::max(0.0, gain) * reinvestment_.capital_gains_tax_rate;
    }

    state_.capital_gains_tax += tax;
    state_.cash += state_.reinvestment_balance - tax;
    state_.reinvestment_balance = 0.0;
    state_.reinvestment_principal = 0.0;
}

double CashflowSimulator::terminal_value() const {
    return state_.cash + state_.reinvestment_balance;
}

double CashflowSimulator::net_benefit() const {
    return terminal_value() + state_.tax_savings - state_.contributions;
}

} // namespace plancalc
