#include "financial_math.hpp"
#include "errors.hpp"
#include <cmath>

namespace plancalc {
namespace finmath {

IrrOptions::IrrOptions()
    : guess(0.1),
      max_iterations(100),
      tolerance(1e-6) {}

double future_value(double principal, double rate, int periods) {
    if (periods <= 0) {
        return principal;
    }
    return principal * std::pow(1.0 + rate, periods);
}

double present_value(double future_value, double rate, int periods) {
    if (periods <= 0) {
        return future_value;
    }
    return future_value / std::pow(1.0 + rate, periods);
}

double annuity_future_value(double payment, double rate, int periods) {
    if (periods <= 0) {
        return 0.0;
    }
    if (rate == 0.0) {
        return payment * periods;
    }
    return payment * (std::pow(1.0 + rate, periods) - 1.0) / rate;
}

double annuity_present_value(double payment, double rate, int periods) {
    if (periods <= 0) {
        return 0.0;
    }
    if (rate == 0.0) {
        return payment * periods;
    }
    return payment * (1.0 - std::pow(1.0 + rate, -periods)) / rate;
}

double annuity_due_future_value(double payment, double rate, int periods) {
    return annuity_future_value(payment, rate, periods) * (1.0 + rate);
}

double npv(const std::vector<double>& cash_flows, double rate) {
    if (cash_flows.empty()) {
        throw InvalidInput("NPV requires at least one cash flow");
    }
    double total = 0.0;
    double discount = 1.0;
    for (double cf : cash_flows) {
        total += cf / discount;
        discount *= (1.0 + rate);
    }
    return total;
}

std::optional<double> irr(const std::vector<double>& cash_flows, const IrrOptions& options) {
    if (cash_flows.size() < 2) {
        throw InvalidInput("IRR requires at least two cash flows");
    }

    double rate = options.guess;
    for (int iter = 0; iter < options.max_iterations; ++iter) {
        if (rate <= -1.0) {
            return std::nullopt;
        }

        double value = 0.0;
        double derivative = 0.0;
        double discount = 1.0;  // (1 + rate)^t
        for (size_t t = 0; t < cash_flows.size(); ++t) {
            value += cash_flows[t] / discount;
            derivative -= static_cast<double>(t) * cash_flows[t] / (discount * (1.0 + rate));
            discount *= (1.0 + rate);
        }

        if (std::abs(derivative) < 1e-10) {
            return std::nullopt;
        }

        double next = rate - value / derivative;
        if (!std::isfinite(next)) {
            return std::nullopt;
        }
        if (std::abs(next - rate) < options.tolerance) {
            return next;
        }
        rate = next;
    }

    return std::nullopt;
}

double annualize(double periodic_rate, int periods_per_year) {
    return std::pow(1.0 + periodic_rate, periods_per_year) - 1.0;
}

} // namespace finmath
} // namespace plancalc
