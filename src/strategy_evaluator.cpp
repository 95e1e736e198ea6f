#include "strategy_evaluator.hpp"
#include "errors.hpp"
#include "financial_math.hpp"
#include <cmath>

namespace plancalc {

// ============================================================================
// Result / Options Implementation
// ============================================================================

ResultBreakdown::ResultBreakdown()
    : terminal_value(0.0),
      total_contributions(0.0),
      total_fees(0.0),
      total_withdrawal_fees(0.0),
      surrender_charges(0.0),
      transfer_fees(0.0),
      total_tax_savings(0.0),
      total_one_time_tax(0.0),
      capital_gains_tax(0.0),
      total_withdrawn(0.0),
      withdrawal_events(0),
      months_in_plan(0),
      horizon_months(0),
      return_on_contributions(0.0) {}

StrategyResult::StrategyResult()
    : descriptor(FullWithdrawal{0}),
      net_benefit(0.0) {}

EvaluationOptions::EvaluationOptions()
    : reinvestment(InvestmentVehicle::deposit_default()),
      detailed_snapshots(false),
      compute_irr(true) {}

namespace {

constexpr int MONTHS_PER_YEAR = 12;
constexpr double MONTHLY_IRR_GUESS = 0.005;

void check_year(int year, int period_years, const char* what) {
    if (year < 1 || year > period_years) {
        throw InvalidInput(std::string(what) + " must be in [1, " +
                           std::to_string(period_years) + "], got " + std::to_string(year));
    }
}

// Drives the simulator for one descriptor kind
struct SimulationDriver {
    const PremiumPlan& plan;
    CashflowSimulator& sim;
    const InvestmentVehicle& alternative;

    void operator()(const FullWithdrawal& s) const {
        check_year(s.year, plan.period_years(), "Full withdrawal year");
        sim.advance_to_month(s.year * MONTHS_PER_YEAR);
        sim.surrender();
        sim.liquidate_reinvestment();
    }

    void operator()(const PartialWithdrawal& s) const {
        if (s.interval_years < 1) {
            throw InvalidInput("Withdrawal interval must be at least 1 year");
        }
        if (!(s.ratio > 0.0) || s.ratio > 1.0) {
            throw InvalidInput("Withdrawal ratio must be in (0, 1]");
        }

        int total = plan.total_months();
        int step = s.interval_years * MONTHS_PER_YEAR;
        for (int month = step; month < total; month += step) {
            sim.advance_to_month(month);
            sim.partial_withdrawal(s.ratio);
        }
        sim.advance_to_month(total);
        sim.surrender();
        sim.liquidate_reinvestment();
    }

    void operator()(const Switch& s) const {
        check_year(s.year, plan.period_years(), "Switch year");
        sim.advance_to_month(s.year * MONTHS_PER_YEAR);
        sim.switch_out(s.fee_rate);
        sim.invest_alternative(alternative);
    }
};

int months_in_plan(const PremiumPlan& plan, const StrategyDescriptor& descriptor) {
    if (const auto* full = std::get_if<FullWithdrawal>(&descriptor)) {
        return full->year * MONTHS_PER_YEAR;
    }
    if (const auto* sw = std::get_if<Switch>(&descriptor)) {
        return sw->year * MONTHS_PER_YEAR;
    }
    return plan.total_months();
}

// Investor's monthly cash flows: premium out at the start of every month,
// tax savings in at each plan year end, terminal value in at the horizon
std::vector<double> investor_cash_flows(const PremiumPlan& plan,
                                        const ResultBreakdown& breakdown,
                                        double annual_tax_saving) {
    std::vector<double> flows(static_cast<size_t>(breakdown.horizon_months) + 1, 0.0);
    for (int m = 0; m < breakdown.horizon_months; ++m) {
        flows[m] -= plan.monthly_premium();
    }
    for (int m = MONTHS_PER_YEAR; m <= breakdown.months_in_plan; m += MONTHS_PER_YEAR) {
        flows[m] += annual_tax_saving;
    }
    flows[breakdown.horizon_months] += breakdown.terminal_value;
    return flows;
}

} // anonymous namespace

// ============================================================================
// Evaluation
// ============================================================================

StrategyResult evaluate(
    const PremiumPlan& plan,
    const TaxEngine& tax_engine,
    const TaxContext& tax_context,
    const StrategyDescriptor& descriptor,
    const EvaluationOptions& options)
{
    InvestmentVehicle alternative = options.alternative
        ? *options.alternative
        : InvestmentVehicle::fund_matching(plan);

    CashflowSimulator sim(plan, tax_engine, tax_context.taxable_income, options.reinvestment);
    sim.set_record_snapshots(options.detailed_snapshots);

    std::visit(SimulationDriver{plan, sim, alternative}, descriptor);

    const SimulationState& state = sim.state();

    StrategyResult result;
    result.descriptor = descriptor;
    result.label = strategy_label(descriptor);
    result.net_benefit = sim.net_benefit();

    ResultBreakdown& b = result.breakdown;
    b.terminal_value = sim.terminal_value();
    b.total_contributions = state.contributions;
    b.total_fees = state.fees;
    b.total_withdrawal_fees = state.withdrawal_fees;
    b.surrender_charges = state.surrender_charges;
    b.transfer_fees = state.transfer_fees;
    b.total_tax_savings = state.tax_savings;
    b.total_one_time_tax = state.one_time_tax;
    b.capital_gains_tax = state.capital_gains_tax;
    b.total_withdrawn = state.withdrawn;
    b.withdrawal_events = state.withdrawal_events;
    b.months_in_plan = months_in_plan(plan, descriptor);
    b.horizon_months = state.month;
    b.return_on_contributions = state.contributions > 0.0
        ? result.net_benefit / state.contributions
        : 0.0;

    // Extreme growth overflows the balance; inf - inf would rank as NaN
    if (!std::isfinite(result.net_benefit) || !std::isfinite(b.terminal_value)) {
        throw InvalidInput("Strategy '" + result.label + "' produced a non-finite net benefit; "
                           "growth rate too large for the plan period");
    }

    if (options.compute_irr && b.horizon_months > 0) {
        finmath::IrrOptions irr_options;
        irr_options.guess = MONTHLY_IRR_GUESS;
        auto monthly = finmath::irr(investor_cash_flows(plan, b, sim.annual_tax_saving()), irr_options);
        if (monthly) {
            b.irr = finmath::annualize(*monthly, MONTHS_PER_YEAR);
        }
    }

    if (options.detailed_snapshots) {
        result.snapshots = sim.snapshots();
    }

    return result;
}

StrategyResult evaluate(
    const PremiumPlan& plan,
    const TaxContext& tax_context,
    const StrategyDescriptor& descriptor,
    const EvaluationOptions& options)
{
    TaxEngine tax_engine(tax_context);
    return evaluate(plan, tax_engine, tax_context, descriptor, options);
}

} // namespace plancalc
