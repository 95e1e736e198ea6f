#ifndef PLANCALC_RANKER_HPP
#define PLANCALC_RANKER_HPP

#include "strategy_evaluator.hpp"
#include <vector>

namespace plancalc {

struct RankedStrategy {
    size_t rank;                    // 1 = highest net benefit
    StrategyResult result;
};

// Ranked results, ordered by rank
class RankingTable {
public:
    RankingTable() = default;
    explicit RankingTable(std::vector<RankedStrategy> entries);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const std::vector<RankedStrategy>& entries() const { return entries_; }
    std::vector<RankedStrategy>::const_iterator begin() const { return entries_.begin(); }
    std::vector<RankedStrategy>::const_iterator end() const { return entries_.end(); }

    // Throws std::out_of_range
    const RankedStrategy& at(size_t index) const;
    const RankedStrategy& best() const;

    // Highest-ranked entry of the given kind, nullptr when there is none
    const RankedStrategy* best_of(StrategyType type) const;

    // First min(n, size()) entries
    std::vector<RankedStrategy> top(size_t n) const;

private:
    std::vector<RankedStrategy> entries_;
};

// Sort by net benefit descending, ties by label ascending, and assign
// contiguous ranks 1..N
RankingTable rank(std::vector<StrategyResult> results);

} // namespace plancalc

#endif // PLANCALC_RANKER_HPP
