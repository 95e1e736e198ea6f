#ifndef PLANCALC_FINANCIAL_MATH_HPP
#define PLANCALC_FINANCIAL_MATH_HPP

#include <optional>
#include <vector>

namespace plancalc {
namespace finmath {

// Stateless time-value-of-money helpers shared by the simulator and the
// evaluator. Rates are per period, in decimal form (0.01 = 1%).

// principal × (1 + rate)^periods
double future_value(double principal, double rate, int periods);

// future_value / (1 + rate)^periods
double present_value(double future_value, double rate, int periods);

// Ordinary annuity (payment at end of each period)
// Falls back to payment × periods when rate == 0
double annuity_future_value(double payment, double rate, int periods);
double annuity_present_value(double payment, double rate, int periods);

// Annuity-due (payment at start of each period, then growth)
// Matches a balance updated as (balance + payment) × (1 + rate)
double annuity_due_future_value(double payment, double rate, int periods);

// Net present value of cash_flows[t] discounted at rate for t = 0..n-1
// Throws InvalidInput on an empty sequence
double npv(const std::vector<double>& cash_flows, double rate);

struct IrrOptions {
    double guess;
    int max_iterations;
    double tolerance;

    IrrOptions();
};

// Internal rate of return by Newton's method
// Returns std::nullopt when no root is found (flat derivative, divergence,
// non-finite iterate or iteration limit). Throws InvalidInput when fewer than
// two cash flows are given.
std::optional<double> irr(const std::vector<double>& cash_flows,
                          const IrrOptions& options = IrrOptions());

// (1 + periodic)^periods_per_year - 1
double annualize(double periodic_rate, int periods_per_year);

} // namespace finmath
} // namespace plancalc

#endif // PLANCALC_FINANCIAL_MATH_HPP
