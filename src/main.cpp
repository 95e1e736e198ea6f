#include <iostream>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <vector>
#include <cstdlib>
#include "breakeven.hpp"
#include "comparison.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "scenario_analysis.hpp"
#include "tax_engine.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"

namespace {

struct CLIArgs {
    std::string config_path;
    std::string brackets_path;
    std::string output_path;
    std::string parquet_path;
    std::string log_level;
    // Plan and tax overrides (unset = from config)
    bool has_monthly_premium = false;
    double monthly_premium = 0.0;
    bool has_growth_rate = false;
    double growth_rate = 0.0;
    bool has_period = false;
    int period_years = 0;
    bool has_taxable_income = false;
    double taxable_income = 0.0;
    bool has_top = false;
    size_t top = 0;
    bool breakeven = false;
    std::string sensitivity;            // <parameter>=<v1,v2,...>
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "PlanCalc Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --config <path>             JSON run configuration\n";
    std::cerr << "  --brackets <path>           CSV income-tax bracket table (threshold,rate[,deduction])\n\n";
    std::cerr << "Plan options (override the config):\n";
    std::cerr << "  --monthly-premium <amount>  Monthly premium\n";
    std::cerr << "  --growth-rate <rate>        Annual growth rate (e.g. 0.0125)\n";
    std::cerr << "  --period <years>            Plan period in years\n";
    std::cerr << "  --taxable-income <amount>   Taxable income\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --top <n>                   Number of ranked strategies to write (default: all)\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --parquet <path>            Also write the ranking as Parquet\n";
    std::cerr << "  --breakeven                 Report the breakeven year to stderr\n";
    std::cerr << "  --sensitivity <p>=<v,...>   Best strategy per value of p (monthly_premium,\n";
    std::cerr << "                              growth_rate, period or taxable_income) to stderr\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Either --config or all of --monthly-premium, --growth-rate, --period and\n";
    std::cerr << "--taxable-income are required.\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Default strategy grid:\n";
    std::cerr << "     " << program_name << " --monthly-premium 9000 --growth-rate 0.0125 \\\n";
    std::cerr << "         --period 20 --taxable-income 6000000 --top 10\n\n";
    std::cerr << "  2. Configured run with Parquet output:\n";
    std::cerr << "     " << program_name << " --config run.json \\\n";
    std::cerr << "         --output ranking.json --parquet ranking.parquet\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--brackets" && i + 1 < argc) {
            args.brackets_path = argv[++i];
        } else if (arg == "--monthly-premium" && i + 1 < argc) {
            args.monthly_premium = std::stod(argv[++i]);
            args.has_monthly_premium = true;
        } else if (arg == "--growth-rate" && i + 1 < argc) {
            args.growth_rate = std::stod(argv[++i]);
            args.has_growth_rate = true;
        } else if (arg == "--period" && i + 1 < argc) {
            args.period_years = std::stoi(argv[++i]);
            args.has_period = true;
        } else if (arg == "--taxable-income" && i + 1 < argc) {
            args.taxable_income = std::stod(argv[++i]);
            args.has_taxable_income = true;
        } else if (arg == "--top" && i + 1 < argc) {
            args.top = static_cast<size_t>(std::stoul(argv[++i]));
            args.has_top = true;
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--parquet" && i + 1 < argc) {
            args.parquet_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--breakeven") {
            args.breakeven = true;
        } else if (arg == "--sensitivity" && i + 1 < argc) {
            args.sensitivity = argv[++i];
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    bool has_config = !args.config_path.empty();
    if (has_config && !file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    if (!has_config) {
        if (!args.has_monthly_premium) {
            std::cerr << "Error: --monthly-premium is required (or use --config)\n";
            valid = false;
        }
        if (!args.has_growth_rate) {
            std::cerr << "Error: --growth-rate is required (or use --config)\n";
            valid = false;
        }
        if (!args.has_period) {
            std::cerr << "Error: --period is required (or use --config)\n";
            valid = false;
        }
        if (!args.has_taxable_income) {
            std::cerr << "Error: --taxable-income is required (or use --config)\n";
            valid = false;
        }
    }

    if (!args.brackets_path.empty() && !file_exists(args.brackets_path)) {
        std::cerr << "Error: Bracket file not found: " << args.brackets_path << "\n";
        valid = false;
    }

    if (args.has_monthly_premium && args.monthly_premium <= 0) {
        std::cerr << "Error: --monthly-premium must be positive\n";
        valid = false;
    }

    if (args.has_growth_rate && args.growth_rate < -1.0) {
        std::cerr << "Error: --growth-rate must not be below -1.0\n";
        valid = false;
    }

    if (args.has_period && args.period_years <= 0) {
        std::cerr << "Error: --period must be greater than 0\n";
        valid = false;
    }

    if (args.has_taxable_income && args.taxable_income < 0) {
        std::cerr << "Error: --taxable-income must be non-negative\n";
        valid = false;
    }

    if (!args.log_level.empty()) {
        try {
            plancalc::string_to_level(args.log_level);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: " << e.what() << "\n";
            valid = false;
        }
    }

    return valid;
}

// Config file first, then command-line overrides
plancalc::RunConfig build_run_config(const CLIArgs& args) {
    plancalc::RunConfig config;
    if (!args.config_path.empty()) {
        config = plancalc::parse_run_config_from_file(args.config_path);
    }

    if (args.has_monthly_premium) config.plan.monthly_premium = args.monthly_premium;
    if (args.has_growth_rate) config.plan.annual_growth_rate = args.growth_rate;
    if (args.has_period) config.plan.period_years = args.period_years;
    if (args.has_taxable_income) config.tax.taxable_income = args.taxable_income;
    if (!args.brackets_path.empty()) {
        config.tax.brackets = plancalc::TaxBracketTable::load_from_csv(args.brackets_path);
    }
    if (args.has_top) config.run.top = args.top;
    if (!args.output_path.empty()) config.run.output_path = args.output_path;
    if (!args.parquet_path.empty()) config.run.parquet_path = args.parquet_path;
    if (!args.log_level.empty()) config.logging.min_level = plancalc::string_to_level(args.log_level);

    config.validate();
    return config;
}

std::map<std::string, std::string> config_fields(const plancalc::RunConfig& config) {
    std::map<std::string, std::string> fields;
    fields["monthly_premium"] = std::to_string(config.plan.monthly_premium);
    fields["annual_growth_rate"] = std::to_string(config.plan.annual_growth_rate);
    fields["period_years"] = std::to_string(config.plan.period_years);
    fields["taxable_income"] = std::to_string(config.tax.taxable_income);
    fields["custom_brackets"] = config.tax.brackets ? "true" : "false";
    fields["batch_size"] = std::to_string(config.run.batch_size);
    fields["max_strategies"] = std::to_string(config.run.max_strategies);
    return fields;
}

void report_breakeven(const plancalc::RunConfig& config) {
    plancalc::PremiumPlan plan = config.premium_plan();
    plancalc::TaxContext tax_context = config.tax_context();
    plancalc::TaxEngine tax_engine(tax_context);

    plancalc::BreakevenAnalysis analysis = plancalc::analyze_breakeven(plan, tax_engine, tax_context);

    std::cerr << "\nBreakeven:\n";
    for (const auto& row : analysis.years) {
        std::cerr << "  Year " << row.year
                  << ": paid " << row.premiums_paid
                  << ", surrender value " << row.surrender_value
                  << ", tax savings " << row.tax_savings
                  << (row.covered ? " (covered)" : "") << "\n";
    }
    if (analysis.breakeven_year) {
        std::cerr << "  Breakeven year: " << *analysis.breakeven_year << "\n";
    } else {
        std::cerr << "  Breakeven not reached\n";
    }
}

void report_sensitivity(const plancalc::RunConfig& config, const std::string& sweep) {
    size_t eq = sweep.find('=');
    if (eq == std::string::npos || eq + 1 >= sweep.size()) {
        throw plancalc::InvalidInput("--sensitivity expects <parameter>=<v1,v2,...>, got: " + sweep);
    }
    plancalc::SensitivityParameter parameter = plancalc::parameter_from_string(sweep.substr(0, eq));

    std::vector<double> values;
    std::stringstream list(sweep.substr(eq + 1));
    std::string item;
    while (std::getline(list, item, ',')) {
        size_t used = 0;
        double value = std::stod(item, &used);
        if (used != item.size()) {
            throw plancalc::InvalidInput("Invalid sensitivity value: " + item);
        }
        values.push_back(value);
    }

    std::vector<plancalc::BestStrategyPoint> points = plancalc::analyze_best_strategy_sensitivity(
        config.premium_plan(), config.tax_context(), parameter, values, config.comparison_config());

    std::cerr << "\nSensitivity (" << plancalc::parameter_to_string(parameter) << "):\n";
    for (const auto& point : points) {
        std::cerr << "  " << point.value << ": ";
        if (point.best_label.empty()) {
            std::cerr << "no strategy ranked\n";
        } else {
            std::cerr << point.best_label << " (net benefit " << point.best_net_benefit << ")\n";
        }
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    try {
        if (!parse_args(argc, argv, args)) {
            std::cerr << "Use --help for usage information.\n";
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid argument value: " << e.what() << "\n";
        return 1;
    }

    // Handle help
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    // If no arguments provided, show usage
    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    // Validate arguments
    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    plancalc::Logger& logger = plancalc::Logger::get_instance();

    try {
        plancalc::RunConfig config = build_run_config(args);
        logger.configure(config.logging);
        logger.log_config_loaded(args.config_path.empty() ? "<cli>" : args.config_path,
                                 config_fields(config));

        plancalc::PremiumPlan plan = config.premium_plan();
        plancalc::TaxContext tax_context = config.tax_context();

        plancalc::ComparisonResult result = plancalc::run_comparison(
            plan, tax_context, config.strategy_ranges(), config.comparison_config());

        // Report summary to stderr
        std::cerr << "\nResults:\n";
        std::cerr << "  Evaluated: " << result.strategies_evaluated << "\n";
        std::cerr << "  Skipped:   " << result.strategies_skipped << "\n";
        std::cerr << "  Failed:    " << result.strategies_failed << "\n";
        if (!result.table.empty()) {
            const plancalc::StrategyResult& best = result.table.best().result;
            std::cerr << "  Best:      " << best.label << " (net benefit " << best.net_benefit << ")\n";
        }
        std::cerr << "  Execution: " << result.execution_time_ms << " ms\n";

        if (args.breakeven) {
            report_breakeven(config);
        }

        if (!args.sensitivity.empty()) {
            report_sensitivity(config, args.sensitivity);
        }

        // Write JSON output
        if (config.run.output_path.empty()) {
            plancalc::io::write_comparison_result_json(std::cout, result, config.run.top);
        } else {
            plancalc::io::write_comparison_result_json(config.run.output_path, result, config.run.top);
            std::cerr << "\nOutput written to: " << config.run.output_path << "\n";
        }

        if (!config.run.parquet_path.empty()) {
            plancalc::ParquetWriter::write_ranking(result.table, config.run.parquet_path);
            std::cerr << "Parquet written to: " << config.run.parquet_path << "\n";
        }

        logger.flush();
        return 0;
    } catch (const std::exception& e) {
        logger.log_error(plancalc::RunContext("cli"), e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
