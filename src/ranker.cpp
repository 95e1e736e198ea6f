#include "ranker.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace plancalc {

RankingTable::RankingTable(std::vector<RankedStrategy> entries)
    : entries_(std::move(entries)) {}

const RankedStrategy& RankingTable::at(size_t index) const {
    if (index >= entries_.size()) {
        throw std::out_of_range("Ranking index out of range: " + std::to_string(index));
    }
    return entries_[index];
}

const RankedStrategy& RankingTable::best() const {
    if (entries_.empty()) {
        throw std::out_of_range("Ranking table is empty");
    }
    return entries_.front();
}

const RankedStrategy* RankingTable::best_of(StrategyType type) const {
    auto it = std::find_if(entries_.begin(), entries_.end(), [type](const RankedStrategy& e) {
        return e.result.type() == type;
    });
    return it == entries_.end() ? nullptr : &*it;
}

std::vector<RankedStrategy> RankingTable::top(size_t n) const {
    size_t count = std::min(n, entries_.size());
    return std::vector<RankedStrategy>(entries_.begin(), entries_.begin() + count);
}

RankingTable rank(std::vector<StrategyResult> results) {
    std::stable_sort(results.begin(), results.end(),
        [](const StrategyResult& a, const StrategyResult& b) {
            // NaN sorts last so the comparator stays a strict weak ordering
            bool a_nan = std::isnan(a.net_benefit);
            bool b_nan = std::isnan(b.net_benefit);
            if (a_nan != b_nan) {
                return b_nan;
            }
            if (!a_nan && a.net_benefit != b.net_benefit) {
                return a.net_benefit > b.net_benefit;
            }
            return a.label < b.label;
        });

    std::vector<RankedStrategy> entries;
    entries.reserve(results.size());
    for (size_t i = 0; i < results.size(); ++i) {
        entries.push_back(RankedStrategy{i + 1, std::move(results[i])});
    }
    return RankingTable(std::move(entries));
}

} // namespace plancalc
