#include "config.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace plancalc {

// ============================================================================
// Settings defaults
// ============================================================================

PlanSettings::PlanSettings()
    : monthly_premium(0.0),
      annual_growth_rate(0.0),
      period_years(0),
      setup_fee_rate(PremiumPlan::DEFAULT_SETUP_FEE_RATE),
      balance_fee_rate(PremiumPlan::DEFAULT_BALANCE_FEE_RATE),
      withdrawal_fee_rate(PremiumPlan::DEFAULT_WITHDRAWAL_FEE_RATE) {}

TaxSettings::TaxSettings()
    : taxable_income(0.0),
      resident_tax_rate(TaxContext::DEFAULT_RESIDENT_TAX_RATE) {}

RunSettings::RunSettings()
    : batch_size(256),
      max_strategies(0),
      top(0) {}

RunConfig::RunConfig()
    : reinvestment(InvestmentVehicle::deposit_default()) {}

// ============================================================================
// Derived objects
// ============================================================================

PremiumPlan RunConfig::premium_plan() const {
    return PremiumPlan(plan.monthly_premium, plan.annual_growth_rate, plan.period_years,
                       plan.setup_fee_rate, plan.balance_fee_rate, plan.withdrawal_fee_rate);
}

TaxContext RunConfig::tax_context() const {
    return TaxContext(tax.taxable_income,
                      tax.brackets ? *tax.brackets : TaxBracketTable::japan_default(),
                      tax.resident_tax_rate);
}

StrategyRanges RunConfig::strategy_ranges() const {
    StrategyRanges ranges = StrategyRanges::defaults(plan.period_years);
    if (strategies.withdrawal_intervals) ranges.withdrawal_intervals = *strategies.withdrawal_intervals;
    if (strategies.withdrawal_ratios) ranges.withdrawal_ratios = *strategies.withdrawal_ratios;
    if (strategies.full_withdrawal_years) ranges.full_withdrawal_years = *strategies.full_withdrawal_years;
    if (strategies.switch_years) ranges.switch_years = *strategies.switch_years;
    if (strategies.switch_fee_rates) ranges.switch_fee_rates = *strategies.switch_fee_rates;
    return ranges;
}

ComparisonConfig RunConfig::comparison_config() const {
    ComparisonConfig config;
    config.batch_size = run.batch_size;
    config.max_strategies = run.max_strategies;
    config.evaluation.reinvestment = reinvestment;
    config.evaluation.alternative = alternative;
    return config;
}

void RunConfig::validate() const {
    PremiumPlan p = premium_plan();
    tax_context();
    StrategyCatalog catalog(strategy_ranges(), p.period_years());
    reinvestment.validate();
    if (alternative) {
        alternative->validate();
    }
    if (run.batch_size == 0) {
        throw InvalidInput("run.batch_size must be positive");
    }
}

// ============================================================================
// Path helpers
// ============================================================================

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos++;

        bool braces = pos < result.size() && result[pos] == '{';
        if (braces) {
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";
        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& base_dir) {
    fs::path p(path);
    if (p.is_absolute() || base_dir.empty()) {
        return path;
    }
    return (fs::path(base_dir) / p).string();
}

// ============================================================================
// JSON parsing
// ============================================================================

namespace {

// Upper bound on values produced by one {"from", "to", "step"} range
constexpr long MAX_RANGE_VALUES = 10000;

// Range-checked conversion; nlohmann's own cast is undefined out of range
template <typename T>
T to_number(double value, const std::string& name) {
    if (!std::isfinite(value)) {
        throw ConfigParseError(name + " must be a finite number");
    }
    if constexpr (std::is_integral<T>::value) {
        if (value != std::round(value)) {
            throw ConfigParseError(name + " must be an integer");
        }
        // max() + 1 is a power of two and exact as a double
        const double limit = std::ldexp(1.0, std::numeric_limits<T>::digits);
        if (value < static_cast<double>(std::numeric_limits<T>::lowest()) || value >= limit) {
            throw ConfigParseError(name + " is out of range");
        }
    }
    return static_cast<T>(value);
}

template <typename T>
T get_number(const json& node, const std::string& name) {
    if (!node.is_number()) {
        throw ConfigParseError(name + " must be a number");
    }
    if constexpr (std::is_integral<T>::value) {
        // Exact integers skip the double round trip
        if (node.is_number_unsigned()) {
            auto v = node.get<uint64_t>();
            if (v > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
                throw ConfigParseError(name + " is out of range");
            }
            return static_cast<T>(v);
        }
        if (node.is_number_integer()) {
            auto v = node.get<int64_t>();
            if (v < static_cast<int64_t>(std::numeric_limits<T>::lowest()) ||
                (v > 0 && static_cast<uint64_t>(v) > static_cast<uint64_t>(std::numeric_limits<T>::max()))) {
                throw ConfigParseError(name + " is out of range");
            }
            return static_cast<T>(v);
        }
    }
    return to_number<T>(node.get<double>(), name);
}

template <typename T>
T require(const json& section, const std::string& section_name, const std::string& key) {
    if (!section.contains(key)) {
        throw ConfigParseError("Missing required field: " + section_name + "." + key);
    }
    return get_number<T>(section[key], section_name + "." + key);
}

template <typename T>
T optional_number(const json& section, const std::string& section_name, const std::string& key, T fallback) {
    if (!section.contains(key)) {
        return fallback;
    }
    return get_number<T>(section[key], section_name + "." + key);
}

// Array of values, or {"from", "to", "step"} expanded inclusively
template <typename T>
std::vector<T> parse_range(const json& node, const std::string& name) {
    std::vector<T> values;

    if (node.is_array()) {
        if (node.size() > static_cast<size_t>(MAX_RANGE_VALUES)) {
            throw ConfigParseError(name + " has more than " + std::to_string(MAX_RANGE_VALUES) + " values");
        }
        for (const auto& v : node) {
            values.push_back(get_number<T>(v, name));
        }
        return values;
    }

    if (!node.is_object() || !node.contains("from") || !node.contains("to")) {
        throw ConfigParseError(name + " must be an array or an object with 'from' and 'to'");
    }

    double from = get_number<double>(node["from"], name + ".from");
    double to = get_number<double>(node["to"], name + ".to");
    double step = optional_number<double>(node, name, "step", 1.0);
    if (!(step > 0.0)) {
        throw ConfigParseError(name + ".step must be positive");
    }

    double span = std::floor((to - from) / step + 1e-9);
    if (!(span < static_cast<double>(MAX_RANGE_VALUES))) {
        throw ConfigParseError(name + " expands to more than " + std::to_string(MAX_RANGE_VALUES) + " values");
    }

    long count = static_cast<long>(span) + 1;
    for (long i = 0; i < count; ++i) {
        double v = from + static_cast<double>(i) * step;
        if constexpr (std::is_integral<T>::value) {
            values.push_back(to_number<T>(std::round(v), name));
        } else {
            // Drop accumulated binary noise (0.1 × 3 -> 0.3)
            values.push_back(std::round(v * 1e12) / 1e12);
        }
    }
    return values;
}

InvestmentVehicle parse_vehicle(const json& node, InvestmentVehicle vehicle) {
    if (!node.is_object()) {
        throw ConfigParseError("Investment vehicle must be an object");
    }
    vehicle.annual_return = node.value("annual_return", vehicle.annual_return);
    vehicle.annual_fee = node.value("annual_fee", vehicle.annual_fee);
    vehicle.capital_gains_tax_rate = node.value("capital_gains_tax_rate", vehicle.capital_gains_tax_rate);
    vehicle.tax_exempt = node.value("tax_exempt", vehicle.tax_exempt);
    return vehicle;
}

TaxBracketTable parse_brackets(const json& node) {
    if (!node.is_array() || node.empty()) {
        throw ConfigParseError("tax.brackets must be a non-empty array");
    }

    std::vector<TaxBracket> rows;
    bool all_have_deduction = true;
    for (const auto& b : node) {
        if (!b.contains("rate")) {
            throw ConfigParseError("Tax bracket missing required field: rate");
        }
        TaxBracket row;
        row.threshold = (b.contains("threshold") && !b["threshold"].is_null())
            ? b["threshold"].get<double>()
            : std::numeric_limits<double>::infinity();
        row.marginal_rate = b["rate"].get<double>();
        if (b.contains("deduction")) {
            row.cumulative_deduction = b["deduction"].get<double>();
        } else {
            row.cumulative_deduction = 0.0;
            all_have_deduction = false;
        }
        rows.push_back(row);
    }

    if (all_have_deduction) {
        return TaxBracketTable(std::move(rows));
    }

    std::vector<std::pair<double, double>> pairs;
    for (const auto& r : rows) {
        pairs.emplace_back(r.threshold, r.marginal_rate);
    }
    return TaxBracketTable::from_marginal_rates(pairs);
}

std::string parse_path(const json& node, const std::string& base_path) {
    return resolve_relative_path(expand_environment_variables(node.get<std::string>()), base_path);
}

} // anonymous namespace

RunConfig parse_run_config_from_string(const std::string& json_string, const std::string& base_path) {
    RunConfig config;

    try {
        json j = json::parse(json_string);

        // Parse plan (required)
        if (!j.contains("plan")) {
            throw ConfigParseError("Missing required section: plan");
        }
        const json& plan = j["plan"];
        config.plan.monthly_premium = require<double>(plan, "plan", "monthly_premium");
        config.plan.annual_growth_rate = require<double>(plan, "plan", "annual_growth_rate");
        config.plan.period_years = require<int>(plan, "plan", "period_years");
        config.plan.setup_fee_rate = plan.value("setup_fee_rate", config.plan.setup_fee_rate);
        config.plan.balance_fee_rate = plan.value("balance_fee_rate", config.plan.balance_fee_rate);
        config.plan.withdrawal_fee_rate = plan.value("withdrawal_fee_rate", config.plan.withdrawal_fee_rate);

        // Parse tax (required)
        if (!j.contains("tax")) {
            throw ConfigParseError("Missing required section: tax");
        }
        const json& tax = j["tax"];
        config.tax.taxable_income = require<double>(tax, "tax", "taxable_income");
        config.tax.resident_tax_rate = tax.value("resident_tax_rate", config.tax.resident_tax_rate);
        if (tax.contains("brackets") && tax.contains("brackets_csv")) {
            throw ConfigParseError("tax.brackets and tax.brackets_csv are mutually exclusive");
        }
        if (tax.contains("brackets")) {
            config.tax.brackets = parse_brackets(tax["brackets"]);
        } else if (tax.contains("brackets_csv")) {
            config.tax.brackets = TaxBracketTable::load_from_csv(parse_path(tax["brackets_csv"], base_path));
        }

        // Parse vehicles (optional)
        if (j.contains("reinvestment")) {
            config.reinvestment = parse_vehicle(j["reinvestment"], config.reinvestment);
        }
        if (j.contains("alternative")) {
            // Unset fields follow the plan's growth rate
            InvestmentVehicle base(config.plan.annual_growth_rate, 0.0);
            config.alternative = parse_vehicle(j["alternative"], base);
        }

        // Parse strategies (optional)
        if (j.contains("strategies")) {
            const json& s = j["strategies"];
            if (s.contains("withdrawal_intervals")) {
                config.strategies.withdrawal_intervals =
                    parse_range<int>(s["withdrawal_intervals"], "strategies.withdrawal_intervals");
            }
            if (s.contains("withdrawal_ratios")) {
                config.strategies.withdrawal_ratios =
                    parse_range<double>(s["withdrawal_ratios"], "strategies.withdrawal_ratios");
            }
            if (s.contains("full_withdrawal_years")) {
                config.strategies.full_withdrawal_years =
                    parse_range<int>(s["full_withdrawal_years"], "strategies.full_withdrawal_years");
            }
            if (s.contains("switch_years")) {
                config.strategies.switch_years =
                    parse_range<int>(s["switch_years"], "strategies.switch_years");
            }
            if (s.contains("switch_fee_rates")) {
                config.strategies.switch_fee_rates =
                    parse_range<double>(s["switch_fee_rates"], "strategies.switch_fee_rates");
            }
        }

        // Parse run (optional)
        if (j.contains("run")) {
            const json& run = j["run"];
            config.run.batch_size = optional_number<size_t>(run, "run", "batch_size", config.run.batch_size);
            config.run.max_strategies =
                optional_number<size_t>(run, "run", "max_strategies", config.run.max_strategies);
            config.run.top = optional_number<size_t>(run, "run", "top", config.run.top);
            if (run.contains("output")) {
                config.run.output_path = parse_path(run["output"], base_path);
            }
            if (run.contains("parquet")) {
                config.run.parquet_path = parse_path(run["parquet"], base_path);
            }
        }

        // Parse logging (optional)
        if (j.contains("logging")) {
            const json& logging = j["logging"];
            if (logging.contains("level")) {
                try {
                    config.logging.min_level = string_to_level(logging["level"].get<std::string>());
                } catch (const std::invalid_argument& e) {
                    throw ConfigParseError(std::string("logging.level: ") + e.what());
                }
            }
            config.logging.enable_json = logging.value("json", config.logging.enable_json);
            if (logging.contains("file")) {
                config.logging.enable_file = true;
                config.logging.log_file_path = parse_path(logging["file"], base_path);
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    config.validate();
    return config;
}

RunConfig parse_run_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    return parse_run_config_from_string(buffer.str(), fs::path(file_path).parent_path().string());
}

} // namespace plancalc
