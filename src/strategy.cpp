#include "strategy.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace plancalc {

namespace {

// Percent without trailing zeros: 0.5 -> "50", 0.015 -> "1.5"
std::string format_percent(double fraction) {
    std::ostringstream oss;
    oss << std::setprecision(10) << fraction * 100.0;
    return oss.str();
}

struct TypeVisitor {
    StrategyType operator()(const FullWithdrawal&) const { return StrategyType::FullWithdrawal; }
    StrategyType operator()(const PartialWithdrawal&) const { return StrategyType::PartialWithdrawal; }
    StrategyType operator()(const Switch&) const { return StrategyType::Switch; }
};

struct LabelVisitor {
    std::string operator()(const FullWithdrawal& s) const {
        return "Full withdrawal at year " + std::to_string(s.year);
    }
    std::string operator()(const PartialWithdrawal& s) const {
        return "Partial withdrawal every " + std::to_string(s.interval_years) +
               "y at " + format_percent(s.ratio) + "%";
    }
    std::string operator()(const Switch& s) const {
        return "Switch at year " + std::to_string(s.year) +
               " with " + format_percent(s.fee_rate) + "% fee";
    }
};

struct ParameterVisitor {
    std::vector<std::pair<std::string, double>> operator()(const FullWithdrawal& s) const {
        return {{"year", static_cast<double>(s.year)}};
    }
    std::vector<std::pair<std::string, double>> operator()(const PartialWithdrawal& s) const {
        return {{"interval_years", static_cast<double>(s.interval_years)},
                {"ratio", s.ratio}};
    }
    std::vector<std::pair<std::string, double>> operator()(const Switch& s) const {
        return {{"year", static_cast<double>(s.year)},
                {"fee_rate", s.fee_rate}};
    }
};

} // anonymous namespace

StrategyType strategy_type(const StrategyDescriptor& descriptor) {
    return std::visit(TypeVisitor{}, descriptor);
}

std::string strategy_label(const StrategyDescriptor& descriptor) {
    return std::visit(LabelVisitor{}, descriptor);
}

std::vector<std::pair<std::string, double>> strategy_parameters(const StrategyDescriptor& descriptor) {
    return std::visit(ParameterVisitor{}, descriptor);
}

std::string type_to_string(StrategyType type) {
    switch (type) {
        case StrategyType::FullWithdrawal: return "FullWithdrawal";
        case StrategyType::PartialWithdrawal: return "PartialWithdrawal";
        case StrategyType::Switch: return "Switch";
    }
    return "Unknown";
}

StrategyType type_from_string(const std::string& name) {
    if (name == "FullWithdrawal" || name == "full") return StrategyType::FullWithdrawal;
    if (name == "PartialWithdrawal" || name == "partial") return StrategyType::PartialWithdrawal;
    if (name == "Switch" || name == "switch") return StrategyType::Switch;
    throw std::invalid_argument("Unknown strategy type: " + name);
}

} // namespace plancalc
