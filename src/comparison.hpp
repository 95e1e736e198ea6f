#ifndef PLANCALC_COMPARISON_HPP
#define PLANCALC_COMPARISON_HPP

#include "premium_plan.hpp"
#include "ranker.hpp"
#include "strategy_catalog.hpp"
#include "strategy_evaluator.hpp"
#include "tax_engine.hpp"
#include <atomic>
#include <functional>
#include <string>

namespace plancalc {

// Cooperative cancellation flag shared with a running comparison
// Cancelling stops enqueueing; evaluations already started finish and the
// collected results are still ranked.
class CancellationToken {
public:
    CancellationToken() : cancelled_(false) {}

    void cancel() { cancelled_.store(true); }
    void reset() { cancelled_.store(false); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_;
};

// Called on the calling thread after each batch barrier with the number of
// completed batches and of results collected so far
using BatchCallback = std::function<void(size_t batches_completed, size_t results_collected)>;

// Configuration options for a comparison run
struct ComparisonConfig {
    size_t batch_size;                  // Descriptors pulled from the catalog per batch
    size_t max_strategies;              // Stop after this many evaluations (0 = no limit)
    EvaluationOptions evaluation;       // Passed to every evaluation
    std::string run_id;                 // Reported in log events
    BatchCallback on_batch_complete;    // Optional progress hook

    ComparisonConfig();
};

// Result of a comparison run
struct ComparisonResult {
    RankingTable table;

    // Execution metrics
    size_t strategies_evaluated;        // Successful evaluations (table size)
    size_t strategies_skipped;          // Degenerate descriptors filtered by the catalog
    size_t strategies_failed;           // Evaluations that threw
    size_t batches;
    bool cancelled;
    double execution_time_ms;

    ComparisonResult();
};

// Run the full search:
//   1. Build the TaxEngine and catalog once
//   2. Pull descriptors lazily in batches of config.batch_size
//   3. Evaluate each batch (OpenMP parallel for when available)
//   4. Rank everything collected after the last batch
//
// Results are collected in catalog order, so the ranking is identical with
// and without OpenMP. A strategy that throws is logged and counted in
// strategies_failed. Throws InvalidInput when the ranges are invalid.
ComparisonResult run_comparison(
    const PremiumPlan& plan,
    const TaxContext& tax_context,
    const StrategyRanges& ranges,
    const ComparisonConfig& config = ComparisonConfig(),
    const CancellationToken* cancel = nullptr
);

} // namespace plancalc

#endif // PLANCALC_COMPARISON_HPP
