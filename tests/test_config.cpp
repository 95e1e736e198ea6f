#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include "config.hpp"
#include "errors.hpp"

using namespace plancalc;
using Catch::Approx;

namespace {

const char* kMinimalConfig = R"({
    "plan": {"monthly_premium": 9000, "annual_growth_rate": 0.0125, "period_years": 20},
    "tax": {"taxable_income": 6000000}
})";

} // anonymous namespace

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("minimal config uses defaults", "[config]") {
    RunConfig config = parse_run_config_from_string(kMinimalConfig);

    REQUIRE(config.plan.monthly_premium == 9000.0);
    REQUIRE(config.plan.annual_growth_rate == 0.0125);
    REQUIRE(config.plan.period_years == 20);
    REQUIRE(config.plan.setup_fee_rate == PremiumPlan::DEFAULT_SETUP_FEE_RATE);
    REQUIRE(config.tax.taxable_income == 6000000.0);
    REQUIRE(config.tax.resident_tax_rate == TaxContext::DEFAULT_RESIDENT_TAX_RATE);
    REQUIRE_FALSE(config.tax.brackets.has_value());
    REQUIRE_FALSE(config.alternative.has_value());
    REQUIRE(config.reinvestment.annual_return == 0.01);
    REQUIRE(config.run.batch_size == 256);
    REQUIRE(config.run.top == 0);
    REQUIRE(config.run.output_path.empty());
    REQUIRE(config.logging.min_level == LogLevel::INFO);

    StrategyRanges ranges = config.strategy_ranges();
    StrategyRanges defaults = StrategyRanges::defaults(20);
    REQUIRE(ranges.withdrawal_intervals == defaults.withdrawal_intervals);
    REQUIRE(ranges.withdrawal_ratios == defaults.withdrawal_ratios);
    REQUIRE(ranges.full_withdrawal_years == defaults.full_withdrawal_years);
    REQUIRE(ranges.switch_years == defaults.switch_years);
    REQUIRE(ranges.switch_fee_rates == defaults.switch_fee_rates);
}

TEST_CASE("full config", "[config]") {
    const char* json = R"({
        "plan": {
            "monthly_premium": 20000,
            "annual_growth_rate": 0.03,
            "period_years": 15,
            "setup_fee_rate": 0.02,
            "balance_fee_rate": 0.0001,
            "withdrawal_fee_rate": 0.005
        },
        "tax": {
            "taxable_income": 8000000,
            "resident_tax_rate": 0.1,
            "brackets": [
                {"threshold": 1950000, "rate": 0.05},
                {"threshold": 3300000, "rate": 0.10},
                {"threshold": null, "rate": 0.20}
            ]
        },
        "reinvestment": {"annual_return": 0.02, "annual_fee": 0.001},
        "alternative": {"annual_fee": 0.002, "tax_exempt": true},
        "strategies": {
            "withdrawal_intervals": [2, 3],
            "withdrawal_ratios": {"from": 0.1, "to": 0.5, "step": 0.1},
            "full_withdrawal_years": {"from": 5, "to": 15, "step": 5},
            "switch_years": [4, 8],
            "switch_fee_rates": [0.0, 0.01]
        },
        "run": {"batch_size": 32, "max_strategies": 100, "top": 5},
        "logging": {"level": "debug", "json": false}
    })";

    RunConfig config = parse_run_config_from_string(json);

    REQUIRE(config.plan.setup_fee_rate == 0.02);
    REQUIRE(config.plan.withdrawal_fee_rate == 0.005);
    REQUIRE(config.premium_plan().net_monthly_premium() == Approx(19600.0));

    REQUIRE(config.tax.brackets.has_value());
    REQUIRE(config.tax.brackets->size() == 3);
    REQUIRE(config.tax.brackets->brackets()[1].cumulative_deduction == Approx(97500.0));
    REQUIRE(std::isinf(config.tax.brackets->brackets()[2].threshold));

    REQUIRE(config.reinvestment.annual_return == 0.02);
    REQUIRE(config.reinvestment.annual_fee == 0.001);
    REQUIRE(config.alternative.has_value());
    REQUIRE(config.alternative->annual_return == 0.03);
    REQUIRE(config.alternative->annual_fee == 0.002);
    REQUIRE(config.alternative->tax_exempt);

    StrategyRanges ranges = config.strategy_ranges();
    REQUIRE(ranges.withdrawal_intervals == std::vector<int>{2, 3});
    REQUIRE(ranges.withdrawal_ratios == std::vector<double>{0.1, 0.2, 0.3, 0.4, 0.5});
    REQUIRE(ranges.full_withdrawal_years == std::vector<int>{5, 10, 15});
    REQUIRE(ranges.switch_years == std::vector<int>{4, 8});
    REQUIRE(ranges.switch_fee_rates == std::vector<double>{0.0, 0.01});

    REQUIRE(config.run.batch_size == 32);
    REQUIRE(config.run.max_strategies == 100);
    REQUIRE(config.run.top == 5);
    REQUIRE(config.logging.min_level == LogLevel::DEBUG);
    REQUIRE_FALSE(config.logging.enable_json);

    ComparisonConfig comparison = config.comparison_config();
    REQUIRE(comparison.batch_size == 32);
    REQUIRE(comparison.max_strategies == 100);
    REQUIRE(comparison.evaluation.reinvestment.annual_return == 0.02);
    REQUIRE(comparison.evaluation.alternative.has_value());
}

TEST_CASE("explicit bracket deductions are used as given", "[config]") {
    const char* json = R"({
        "plan": {"monthly_premium": 9000, "annual_growth_rate": 0.0125, "period_years": 20},
        "tax": {
            "taxable_income": 6000000,
            "brackets": [
                {"threshold": 1000000, "rate": 0.1, "deduction": 0},
                {"rate": 0.2, "deduction": 50000}
            ]
        }
    })";

    RunConfig config = parse_run_config_from_string(json);
    TaxContext ctx = config.tax_context();
    REQUIRE(ctx.brackets.brackets()[1].cumulative_deduction == 50000.0);
    REQUIRE(ctx.brackets.brackets()[1].marginal_rate == 0.2);
}

TEST_CASE("parse errors", "[config][error]") {
    SECTION("Invalid JSON") {
        REQUIRE_THROWS_AS(parse_run_config_from_string("{ not json"), ConfigParseError);
    }

    SECTION("Missing plan section") {
        REQUIRE_THROWS_AS(parse_run_config_from_string(R"({"tax": {"taxable_income": 0}})"),
                          ConfigParseError);
    }

    SECTION("Missing tax section") {
        const char* json = R"({"plan": {"monthly_premium": 1, "annual_growth_rate": 0, "period_years": 1}})";
        REQUIRE_THROWS_AS(parse_run_config_from_string(json), ConfigParseError);
    }

    SECTION("Missing required field") {
        const char* json = R"({
            "plan": {"monthly_premium": 9000, "annual_growth_rate": 0.0125},
            "tax": {"taxable_income": 0}
        })";
        REQUIRE_THROWS_AS(parse_run_config_from_string(json), ConfigParseError);
    }

    SECTION("Wrong type") {
        const char* json = R"({
            "plan": {"monthly_premium": "lots", "annual_growth_rate": 0.0125, "period_years": 20},
            "tax": {"taxable_income": 0}
        })";
        REQUIRE_THROWS_AS(parse_run_config_from_string(json), ConfigParseError);
    }

    SECTION("Both bracket sources") {
        const char* json = R"({
            "plan": {"monthly_premium": 9000, "annual_growth_rate": 0.0125, "period_years": 20},
            "tax": {"taxable_income": 0, "brackets": [{"rate": 0.1}], "brackets_csv": "b.csv"}
        })";
        REQUIRE_THROWS_AS(parse_run_config_from_string(json), ConfigParseError);
    }

    SECTION("Unknown log level") {
        const char* json = R"({
            "plan": {"monthly_premium": 9000, "annual_growth_rate": 0.0125, "period_years": 20},
            "tax": {"taxable_income": 0},
            "logging": {"level": "chatty"}
        })";
        REQUIRE_THROWS_AS(parse_run_config_from_string(json), ConfigParseError);
    }

    SECTION("Range with zero step") {
        const char* json = R"({
            "plan": {"monthly_premium": 9000, "annual_growth_rate": 0.0125, "period_years": 20},
            "tax": {"taxable_income": 0},
            "strategies": {"switch_years": {"from": 1, "to": 5, "step": 0}}
        })";
        REQUIRE_THROWS_AS(parse_run_config_from_string(json), ConfigParseError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(parse_run_config_from_file("/nonexistent/run.json"), ConfigParseError);
    }
}

TEST_CASE("numbers are range-checked before conversion", "[config][error]") {
    SECTION("Huge range expansion") {
        const char* json = R"({
            "plan": {"monthly_premium": 9000, "annual_growth_rate": 0.0125, "period_years": 20},
            "tax": {"taxable_income": 0},
            "strategies": {"withdrawal_ratios": {"from": 0, "to": 1e15}}
        })";
        REQUIRE_THROWS_AS(parse_run_config_from_string(json), ConfigParseError);
    }

    SECTION("Range at the expansion limit") {
        const char* json = R"({
            "plan": {"monthly_premium": 9000, "annual_growth_rate": 0.0125, "period_years": 20},
            "tax": {"taxable_income": 0},
            "strategies": {"withdrawal_ratios": {"from": 0.0001, "to": 1.0, "step": 0.0001}}
        })";
        RunConfig config = parse_run_config_from_string(json);
        REQUIRE(config.strategies.withdrawal_ratios->size() == 10000);
    }

    SECTION("Integer field beyond int") {
        const char* json = R"({
            "plan": {"monthly_premium": 9000, "annual_growth_rate": 0.0125, "period_years": 1e20},
            "tax": {"taxable_income": 0}
        })";
        REQUIRE_THROWS_AS(parse_run_config_from_string(json), ConfigParseError);
    }

    SECTION("Fractional integer field") {
        const char* json = R"({
            "plan": {"monthly_premium": 9000, "annual_growth_rate": 0.0125, "period_years": 2.5},
            "tax": {"taxable_income": 0}
        })";
        REQUIRE_THROWS_AS(parse_run_config_from_string(json), ConfigParseError);
    }

    SECTION("Whole float accepted for an integer field") {
        const char* json = R"({
            "plan": {"monthly_premium": 9000, "annual_growth_rate": 0.0125, "period_years": 20.0},
            "tax": {"taxable_income": 0}
        })";
        REQUIRE(parse_run_config_from_string(json).plan.period_years == 20);
    }

    SECTION("Negative count") {
        const char* json = R"({
            "plan": {"monthly_premium": 9000, "annual_growth_rate": 0.0125, "period_years": 20},
            "tax": {"taxable_income": 0},
            "run": {"top": -1}
        })";
        REQUIRE_THROWS_AS(parse_run_config_from_string(json), ConfigParseError);
    }

    SECTION("Integer range bounds beyond int") {
        const char* json = R"({
            "plan": {"monthly_premium": 9000, "annual_growth_rate": 0.0125, "period_years": 20},
            "tax": {"taxable_income": 0},
            "strategies": {"switch_years": {"from": 1e12, "to": 1e12}}
        })";
        REQUIRE_THROWS_AS(parse_run_config_from_string(json), ConfigParseError);
    }
}

TEST_CASE("out-of-domain values fail validation", "[config][error]") {
    SECTION("Negative premium") {
        const char* json = R"({
            "plan": {"monthly_premium": -1, "annual_growth_rate": 0.0125, "period_years": 20},
            "tax": {"taxable_income": 0}
        })";
        REQUIRE_THROWS_AS(parse_run_config_from_string(json), InvalidInput);
    }

    SECTION("Negative taxable income") {
        const char* json = R"({
            "plan": {"monthly_premium": 9000, "annual_growth_rate": 0.0125, "period_years": 20},
            "tax": {"taxable_income": -5}
        })";
        REQUIRE_THROWS_AS(parse_run_config_from_string(json), InvalidInput);
    }

    SECTION("Full withdrawal year past the period") {
        const char* json = R"({
            "plan": {"monthly_premium": 9000, "annual_growth_rate": 0.0125, "period_years": 20},
            "tax": {"taxable_income": 0},
            "strategies": {"full_withdrawal_years": [21]}
        })";
        REQUIRE_THROWS_AS(parse_run_config_from_string(json), InvalidInput);
    }

    SECTION("Zero batch size") {
        const char* json = R"({
            "plan": {"monthly_premium": 9000, "annual_growth_rate": 0.0125, "period_years": 20},
            "tax": {"taxable_income": 0},
            "run": {"batch_size": 0}
        })";
        REQUIRE_THROWS_AS(parse_run_config_from_string(json), InvalidInput);
    }

    SECTION("Negative vehicle fee") {
        const char* json = R"({
            "plan": {"monthly_premium": 9000, "annual_growth_rate": 0.0125, "period_years": 20},
            "tax": {"taxable_income": 0},
            "reinvestment": {"annual_fee": -0.01}
        })";
        REQUIRE_THROWS_AS(parse_run_config_from_string(json), InvalidInput);
    }
}

// ============================================================================
// Paths and environment
// ============================================================================

TEST_CASE("bracket CSV resolves relative to the config file", "[config][file]") {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "plancalc_config_test";
    fs::create_directories(dir);

    {
        std::ofstream csv(dir / "brackets.csv");
        csv << "threshold,rate\n1950000,0.05\n3300000,0.10\ninf,0.20\n";
    }
    {
        std::ofstream cfg(dir / "run.json");
        cfg << R"({
            "plan": {"monthly_premium": 9000, "annual_growth_rate": 0.0125, "period_years": 20},
            "tax": {"taxable_income": 6000000, "brackets_csv": "brackets.csv"},
            "run": {"output": "ranking.json"}
        })";
    }

    RunConfig config = parse_run_config_from_file((dir / "run.json").string());

    REQUIRE(config.tax.brackets.has_value());
    REQUIRE(config.tax.brackets->size() == 3);
    REQUIRE(config.run.output_path == (dir / "ranking.json").string());

    fs::remove_all(dir);
}

TEST_CASE("expand_environment_variables", "[config][env]") {
    setenv("PLANCALC_TEST_DIR", "/data/plans", 1);
    unsetenv("PLANCALC_TEST_UNSET");

    REQUIRE(expand_environment_variables("${PLANCALC_TEST_DIR}/run.json") == "/data/plans/run.json");
    REQUIRE(expand_environment_variables("$PLANCALC_TEST_DIR/run.json") == "/data/plans/run.json");
    REQUIRE(expand_environment_variables("/x/${PLANCALC_TEST_UNSET}/y") == "/x//y");
    REQUIRE(expand_environment_variables("no variables") == "no variables");
}

TEST_CASE("resolve_relative_path", "[config][env]") {
    REQUIRE(resolve_relative_path("brackets.csv", "/etc/plancalc") == "/etc/plancalc/brackets.csv");
    REQUIRE(resolve_relative_path("/abs/brackets.csv", "/etc/plancalc") == "/abs/brackets.csv");
    REQUIRE(resolve_relative_path("brackets.csv", "") == "brackets.csv");
}
