#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <stdexcept>
#include "cashflow_simulator.hpp"
#include "errors.hpp"

using namespace plancalc;
using Catch::Approx;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

namespace {

// Zero growth and no fees except the withdrawal fee
PremiumPlan create_flat_plan(int years, double withdrawal_fee = 0.0) {
    return PremiumPlan(10000.0, 0.0, years, 0.0, 0.0, withdrawal_fee);
}

} // anonymous namespace

// ============================================================================
// Accumulation
// ============================================================================

TEST_CASE("step_month applies setup fee, growth and balance fee", "[simulator]") {
    PremiumPlan plan(10000.0, 0.12, 5, 0.01, 0.001, 0.01);
    TaxEngine engine;
    CashflowSimulator sim(plan, engine, 0.0);

    sim.step_month();

    // (10,000 - 100) × 1.01 = 9,999, then 0.1% balance fee
    REQUIRE(sim.state().balance == Approx(9989.001));
    REQUIRE(sim.state().fees == Approx(100.0 + 9.999));
    REQUIRE(sim.state().contributions == 10000.0);
    REQUIRE(sim.state().cost_basis == 10000.0);
    REQUIRE(sim.state().month == 1);
    REQUIRE(sim.state().phase == SimulatorPhase::Accumulating);
}

TEST_CASE("zero growth accumulates premiums exactly", "[simulator]") {
    PremiumPlan plan = create_flat_plan(2);
    TaxEngine engine;
    CashflowSimulator sim(plan, engine, 0.0);

    sim.advance(12);
    REQUIRE(sim.state().balance == Approx(120000.0));
    REQUIRE(sim.state().contributions == Approx(120000.0));
    REQUIRE(sim.state().fees == 0.0);
}

TEST_CASE("closed form matches the monthly loop", "[simulator]") {
    PremiumPlan plan(9000.0, 0.0125, 20, 0.013, 0.0, 0.01);
    TaxEngine engine;

    CashflowSimulator closed(plan, engine, 6000000.0);
    CashflowSimulator looped(plan, engine, 6000000.0);

    closed.advance(30);
    for (int i = 0; i < 30; ++i) {
        looped.step_month();
    }

    REQUIRE(closed.state().month == looped.state().month);
    REQUIRE_THAT(closed.state().balance, WithinRel(looped.state().balance, 1e-10));
    REQUIRE_THAT(closed.state().fees, WithinRel(looped.state().fees, 1e-10));
    REQUIRE(closed.state().contributions == Approx(looped.state().contributions));
    REQUIRE(closed.state().tax_savings == Approx(looped.state().tax_savings));
}

TEST_CASE("advance clamps to the plan period", "[simulator][edge-case]") {
    PremiumPlan plan = create_flat_plan(2);
    TaxEngine engine;
    CashflowSimulator sim(plan, engine, 0.0);

    sim.advance(-5);
    REQUIRE(sim.state().month == 0);

    sim.advance(1000);
    REQUIRE(sim.state().month == 24);
    REQUIRE(sim.remaining_months() == 0);

    REQUIRE_THROWS_AS(sim.step_month(), std::out_of_range);
}

TEST_CASE("advance_to_month", "[simulator]") {
    PremiumPlan plan = create_flat_plan(3);
    TaxEngine engine;
    CashflowSimulator sim(plan, engine, 0.0);

    sim.advance_to_month(18);
    REQUIRE(sim.state().month == 18);
    sim.advance_to_month(10);
    REQUIRE(sim.state().month == 18);
}

TEST_CASE("tax savings accrue at each completed year", "[simulator][tax]") {
    PremiumPlan plan(9000.0, 0.0125, 20);
    TaxEngine engine;
    CashflowSimulator sim(plan, engine, 6000000.0);

    REQUIRE(sim.annual_tax_saving() == Approx(15210.0));

    sim.advance(11);
    REQUIRE(sim.state().tax_savings == 0.0);
    sim.advance(1);
    REQUIRE(sim.state().tax_savings == Approx(15210.0));
    sim.advance(23);
    REQUIRE(sim.state().tax_savings == Approx(30420.0));
}

TEST_CASE("no tax savings without taxable income", "[simulator][tax]") {
    PremiumPlan plan(9000.0, 0.0125, 20);
    TaxEngine engine;
    CashflowSimulator sim(plan, engine, 0.0);

    sim.advance(60);
    REQUIRE(sim.annual_tax_saving() == 0.0);
    REQUIRE(sim.state().tax_savings == 0.0);
}

TEST_CASE("yearly snapshots", "[simulator]") {
    PremiumPlan plan = create_flat_plan(5);
    TaxEngine engine;
    CashflowSimulator sim(plan, engine, 0.0);
    sim.set_record_snapshots(true);

    sim.advance(30);

    REQUIRE(sim.snapshots().size() == 2);
    REQUIRE(sim.snapshots()[0].year == 1);
    REQUIRE(sim.snapshots()[1].year == 2);
    REQUIRE(sim.snapshots()[1].contributions == Approx(240000.0));
    REQUIRE(sim.snapshots()[1].balance == Approx(240000.0));
}

TEST_CASE("snapshots are off by default", "[simulator]") {
    PremiumPlan plan = create_flat_plan(5);
    TaxEngine engine;
    CashflowSimulator sim(plan, engine, 0.0);

    sim.advance(36);
    REQUIRE(sim.snapshots().empty());
}

TEST_CASE("simulator rejects negative taxable income", "[simulator]") {
    PremiumPlan plan = create_flat_plan(5);
    TaxEngine engine;
    REQUIRE_THROWS_AS(CashflowSimulator(plan, engine, -1.0), InvalidInput);
}

// ============================================================================
// Withdrawals and surrender
// ============================================================================

TEST_CASE("partial_withdrawal charges the fee and reinvests the rest", "[simulator][withdrawal]") {
    PremiumPlan plan = create_flat_plan(3, 0.01);
    TaxEngine engine;
    CashflowSimulator sim(plan, engine, 0.0);

    sim.advance(24);
    double reinvested = sim.partial_withdrawal(0.5);

    // 120,000 withdrawn, 1% fee, profit is negative so no one-time tax
    REQUIRE(reinvested == Approx(118800.0));
    REQUIRE(sim.state().withdrawal_fees == Approx(1200.0));
    REQUIRE(sim.state().withdrawn == Approx(120000.0));
    REQUIRE(sim.state().one_time_tax == 0.0);
    REQUIRE(sim.state().balance == Approx(120000.0));
    REQUIRE(sim.state().cost_basis == Approx(120000.0));
    REQUIRE(sim.state().reinvestment_balance == Approx(118800.0));
    REQUIRE(sim.state().reinvestment_principal == Approx(118800.0));
    REQUIRE(sim.state().withdrawal_events == 1);
    REQUIRE(sim.state().phase == SimulatorPhase::WithdrawalEvent);
}

TEST_CASE("reinvestment account grows and is taxed on the gain", "[simulator][withdrawal]") {
    PremiumPlan plan = create_flat_plan(3, 0.01);
    TaxEngine engine;
    CashflowSimulator sim(plan, engine, 0.0);

    sim.advance(24);
    sim.partial_withdrawal(0.5);
    sim.advance(12);
    REQUIRE(sim.state().phase == SimulatorPhase::Accumulating);

    double grown = 118800.0 * std::pow(1.0 + 0.01 / 12.0, 12);
    REQUIRE(sim.state().reinvestment_balance == Approx(grown));
    REQUIRE(sim.state().balance == Approx(240000.0));

    sim.surrender();
    sim.liquidate_reinvestment();

    double cgt = (grown - 118800.0) * InvestmentVehicle::DEFAULT_CAPITAL_GAINS_TAX_RATE;
    REQUIRE(sim.state().capital_gains_tax == Approx(cgt));
    REQUIRE(sim.state().reinvestment_balance == 0.0);
    // Year 3 surrender keeps 93% of the plan balance
    REQUIRE(sim.terminal_value() == Approx(240000.0 * 0.93 + grown - cgt));
}

TEST_CASE("partial_withdrawal triggers one-time tax on large profits", "[simulator][withdrawal]") {
    PremiumPlan plan(100000.0, 0.5, 10, 0.0, 0.0, 0.0);
    TaxEngine engine;
    CashflowSimulator sim(plan, engine, 6000000.0);

    sim.advance(60);
    double balance = sim.state().balance;
    double basis = sim.state().cost_basis;
    sim.partial_withdrawal(1.0);

    double profit = balance - basis;
    REQUIRE(profit > TaxEngine::ONE_TIME_ALLOWANCE);
    REQUIRE(sim.state().one_time_tax == Approx(engine.one_time_withdrawal_tax(profit, 6000000.0)));
    REQUIRE(sim.state().balance == 0.0);
}

TEST_CASE("partial_withdrawal ratio validation", "[simulator][withdrawal]") {
    PremiumPlan plan = create_flat_plan(3);
    TaxEngine engine;
    CashflowSimulator sim(plan, engine, 0.0);
    sim.advance(12);

    REQUIRE_THROWS_AS(sim.partial_withdrawal(0.0), InvalidInput);
    REQUIRE_THROWS_AS(sim.partial_withdrawal(1.5), InvalidInput);
    REQUIRE_THROWS_AS(sim.partial_withdrawal(-0.2), InvalidInput);
}

TEST_CASE("surrender applies the declining surrender charge", "[simulator][surrender]") {
    PremiumPlan plan = create_flat_plan(5);
    TaxEngine engine;
    CashflowSimulator sim(plan, engine, 0.0);

    sim.advance(36);
    SurrenderResult result = sim.surrender();

    REQUIRE(result.gross == Approx(360000.0));
    REQUIRE(result.surrender_charge == Approx(25200.0));
    REQUIRE(result.one_time_tax == 0.0);
    REQUIRE(result.proceeds == Approx(334800.0));
    REQUIRE(sim.state().cash == Approx(334800.0));
    REQUIRE(sim.state().balance == 0.0);
    REQUIRE(sim.state().phase == SimulatorPhase::Terminal);
}

TEST_CASE("surrender_deduction_rate", "[simulator][surrender]") {
    REQUIRE(CashflowSimulator::surrender_deduction_rate(0) == Approx(0.10));
    REQUIRE(CashflowSimulator::surrender_deduction_rate(3) == Approx(0.07));
    REQUIRE(CashflowSimulator::surrender_deduction_rate(10) == Approx(0.0).margin(1e-12));
    REQUIRE(CashflowSimulator::surrender_deduction_rate(15) == 0.0);
}

TEST_CASE("flat plan held to maturity breaks even", "[simulator][surrender]") {
    PremiumPlan plan = create_flat_plan(10);
    TaxEngine engine;
    CashflowSimulator sim(plan, engine, 0.0);

    sim.advance(120);
    sim.surrender();
    sim.liquidate_reinvestment();

    REQUIRE_THAT(sim.net_benefit(), WithinAbs(0.0, 1e-6));
}

TEST_CASE("operations after surrender are rejected", "[simulator][phase]") {
    PremiumPlan plan = create_flat_plan(5);
    TaxEngine engine;
    CashflowSimulator sim(plan, engine, 0.0);

    sim.advance(12);
    sim.surrender();

    REQUIRE_THROWS_AS(sim.step_month(), std::runtime_error);
    REQUIRE_THROWS_AS(sim.advance(1), std::runtime_error);
    REQUIRE_THROWS_AS(sim.partial_withdrawal(0.5), std::runtime_error);
    REQUIRE_THROWS_AS(sim.surrender(), std::runtime_error);
    REQUIRE_THROWS_AS(sim.invest_alternative(InvestmentVehicle(0.0, 0.0)), std::runtime_error);
}

// ============================================================================
// Switch
// ============================================================================

TEST_CASE("switch_out charges the transfer fee when months remain", "[simulator][switch]") {
    PremiumPlan plan = create_flat_plan(5);
    TaxEngine engine;
    CashflowSimulator sim(plan, engine, 0.0);

    sim.advance(36);
    SurrenderResult result = sim.switch_out(0.02);

    REQUIRE(result.proceeds == Approx(334800.0));
    REQUIRE(sim.state().transfer_fees == Approx(6696.0));
    REQUIRE(sim.state().cash == Approx(328104.0));
    REQUIRE(sim.state().phase == SimulatorPhase::SwitchEvent);

    VehicleOutcome outcome = sim.invest_alternative(InvestmentVehicle(0.0, 0.0));
    REQUIRE(outcome.gain == Approx(0.0).margin(1e-6));
    REQUIRE(sim.state().cash == Approx(328104.0 + 240000.0));
    REQUIRE(sim.state().contributions == Approx(600000.0));
    REQUIRE(sim.state().month == 60);
    REQUIRE(sim.state().phase == SimulatorPhase::Terminal);
}

TEST_CASE("switch at maturity charges no transfer fee", "[simulator][switch][edge-case]") {
    PremiumPlan plan = create_flat_plan(5);
    TaxEngine engine;
    CashflowSimulator sim(plan, engine, 0.0);

    sim.advance(60);
    sim.switch_out(0.05);

    REQUIRE(sim.state().transfer_fees == 0.0);
    // Year 5 surrender charge is 5%
    REQUIRE(sim.state().cash == Approx(570000.0));
}

TEST_CASE("switch_out fee validation", "[simulator][switch]") {
    PremiumPlan plan = create_flat_plan(5);
    TaxEngine engine;
    CashflowSimulator sim(plan, engine, 0.0);
    sim.advance(12);

    REQUIRE_THROWS_AS(sim.switch_out(1.0), InvalidInput);
    REQUIRE_THROWS_AS(sim.switch_out(-0.01), InvalidInput);
}

TEST_CASE("invest_alternative requires a switch", "[simulator][switch]") {
    PremiumPlan plan = create_flat_plan(5);
    TaxEngine engine;
    CashflowSimulator sim(plan, engine, 0.0);
    sim.advance(12);

    REQUIRE_THROWS_AS(sim.invest_alternative(InvestmentVehicle(0.03, 0.0)), std::runtime_error);
}

// ============================================================================
// project_vehicle
// ============================================================================

TEST_CASE("project_vehicle compounds and taxes the gain", "[simulator][vehicle]") {
    VehicleOutcome outcome = project_vehicle(InvestmentVehicle(0.12, 0.0), 1000.0, 0.0, 12);

    REQUIRE(outcome.gross_value == Approx(1126.825));
    REQUIRE(outcome.principal == 1000.0);
    REQUIRE(outcome.gain == Approx(126.825));
    REQUIRE(outcome.capital_gains_tax == Approx(25.7645).margin(1e-3));
    REQUIRE(outcome.net_value == Approx(outcome.gross_value - outcome.capital_gains_tax));
}

TEST_CASE("project_vehicle with contributions at zero return", "[simulator][vehicle]") {
    VehicleOutcome outcome = project_vehicle(InvestmentVehicle(0.0, 0.0), 100.0, 10.0, 5);

    REQUIRE(outcome.gross_value == Approx(150.0));
    REQUIRE(outcome.principal == Approx(150.0));
    REQUIRE(outcome.capital_gains_tax == 0.0);
}

TEST_CASE("project_vehicle tax-exempt and losses", "[simulator][vehicle]") {
    VehicleOutcome exempt = project_vehicle(InvestmentVehicle(0.12, 0.0, 0.20315, true), 1000.0, 0.0, 12);
    REQUIRE(exempt.capital_gains_tax == 0.0);
    REQUIRE(exempt.net_value == Approx(exempt.gross_value));

    VehicleOutcome loss = project_vehicle(InvestmentVehicle(-0.12, 0.0), 1000.0, 0.0, 12);
    REQUIRE(loss.gain < 0.0);
    REQUIRE(loss.capital_gains_tax == 0.0);
}

TEST_CASE("phase_to_string", "[simulator][phase]") {
    REQUIRE(phase_to_string(SimulatorPhase::Accumulating) == "Accumulating");
    REQUIRE(phase_to_string(SimulatorPhase::Terminal) == "Terminal");
}
