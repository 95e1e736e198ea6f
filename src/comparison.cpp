#include "comparison.hpp"
#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <map>
#include <optional>
#include <vector>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace plancalc {

// ============================================================================
// ComparisonConfig / ComparisonResult Implementation
// ============================================================================

ComparisonConfig::ComparisonConfig()
    : batch_size(256),
      max_strategies(0),
      run_id("comparison") {}

ComparisonResult::ComparisonResult()
    : strategies_evaluated(0),
      strategies_skipped(0),
      strategies_failed(0),
      batches(0),
      cancelled(false),
      execution_time_ms(0.0) {}

namespace {

bool is_cancelled(const CancellationToken* cancel) {
    return cancel != nullptr && cancel->is_cancelled();
}

std::map<std::string, std::string> plan_summary(const PremiumPlan& plan, const TaxContext& tax_context) {
    std::map<std::string, std::string> fields;
    fields["monthly_premium"] = std::to_string(plan.monthly_premium());
    fields["annual_growth_rate"] = std::to_string(plan.annual_growth_rate());
    fields["period_years"] = std::to_string(plan.period_years());
    fields["taxable_income"] = std::to_string(tax_context.taxable_income);
    return fields;
}

} // anonymous namespace

// ============================================================================
// Comparison Run
// ============================================================================

ComparisonResult run_comparison(
    const PremiumPlan& plan,
    const TaxContext& tax_context,
    const StrategyRanges& ranges,
    const ComparisonConfig& config,
    const CancellationToken* cancel)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    Logger& logger = Logger::get_instance();
    RunContext ctx(config.run_id);
    ctx.phase = "catalog";

    ComparisonResult result;

    const TaxEngine tax_engine(tax_context);
    const StrategyCatalog catalog(ranges, plan.period_years());
    result.strategies_skipped = catalog.skipped();

    logger.log_comparison_start(ctx, plan_summary(plan, tax_context), catalog.upper_bound());
    logger.log_catalog_summary(ctx, catalog.size(), catalog.skipped());

    size_t batch_size = config.batch_size > 0 ? config.batch_size : 1;
    size_t limit = config.max_strategies > 0 ? config.max_strategies : catalog.size();

    std::vector<StrategyResult> collected;
    collected.reserve(std::min(limit, catalog.size()));

    ctx.phase = "evaluate";
    auto it = catalog.begin();
    size_t enqueued = 0;

    while (it != catalog.end() && enqueued < limit) {
        if (is_cancelled(cancel)) {
            result.cancelled = true;
            break;
        }

        // Pull the next batch lazily
        std::vector<StrategyDescriptor> batch;
        batch.reserve(batch_size);
        while (it != catalog.end() && batch.size() < batch_size && enqueued < limit) {
            batch.push_back(*it);
            ++it;
            ++enqueued;
        }

        ctx.batch = result.batches;
        std::vector<std::optional<StrategyResult>> outcomes(batch.size());
        size_t failed_in_batch = 0;

#ifdef HAVE_OPENMP
        // Evaluations share only read-only inputs
        #pragma omp parallel for schedule(dynamic, 8) reduction(+:failed_in_batch)
        for (long i = 0; i < static_cast<long>(batch.size()); ++i) {
            if (is_cancelled(cancel)) {
                continue;
            }
            try {
                outcomes[i] = evaluate(plan, tax_engine, tax_context, batch[i], config.evaluation);
                logger.log_strategy_evaluated(ctx, outcomes[i]->label, outcomes[i]->net_benefit);
            } catch (const std::exception& e) {
                logger.log_strategy_failed(ctx, strategy_label(batch[i]), e.what());
                failed_in_batch++;
            }
        }
#else
        // Single-threaded fallback when OpenMP not available
        for (size_t i = 0; i < batch.size(); ++i) {
            if (is_cancelled(cancel)) {
                break;
            }
            try {
                outcomes[i] = evaluate(plan, tax_engine, tax_context, batch[i], config.evaluation);
                logger.log_strategy_evaluated(ctx, outcomes[i]->label, outcomes[i]->net_benefit);
            } catch (const std::exception& e) {
                logger.log_strategy_failed(ctx, strategy_label(batch[i]), e.what());
                failed_in_batch++;
            }
        }
#endif

        // Barrier: append in catalog order
        for (auto& outcome : outcomes) {
            if (outcome) {
                collected.push_back(std::move(*outcome));
            }
        }
        result.strategies_failed += failed_in_batch;
        result.batches++;

        if (config.on_batch_complete) {
            config.on_batch_complete(result.batches, collected.size());
        }
    }

    // Cancelled with work left: skipped inside a batch or never enqueued
    size_t finished = collected.size() + result.strategies_failed;
    if (is_cancelled(cancel) &&
        (finished < enqueued || (it != catalog.end() && enqueued < limit))) {
        result.cancelled = true;
    }

    ctx.phase = "rank";
    result.strategies_evaluated = collected.size();
    result.table = rank(std::move(collected));

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();

    RunMetrics metrics;
    metrics.strategies_evaluated = result.strategies_evaluated;
    metrics.strategies_skipped = result.strategies_skipped;
    metrics.strategies_failed = result.strategies_failed;
    metrics.batches = result.batches;
    metrics.execution_time_ms = result.execution_time_ms;

    if (result.cancelled) {
        logger.log_comparison_cancelled(ctx, metrics);
    }
    if (result.table.empty()) {
        logger.log_comparison_complete(ctx, metrics, "", 0.0);
    } else {
        const StrategyResult& best = result.table.best().result;
        logger.log_comparison_complete(ctx, metrics, best.label, best.net_benefit);
    }

    return result;
}

} // namespace plancalc
