#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <vector>
#include "strategy_catalog.hpp"
#include "errors.hpp"

using namespace plancalc;

namespace {

StrategyRanges create_small_ranges() {
    StrategyRanges ranges;
    ranges.withdrawal_intervals = {2, 10};
    ranges.withdrawal_ratios = {0.5};
    ranges.full_withdrawal_years = {5, 10};
    ranges.switch_years = {3, 10};
    ranges.switch_fee_rates = {0.01, 0.02};
    return ranges;
}

} // anonymous namespace

TEST_CASE("catalog filters degenerate combinations", "[catalog]") {
    StrategyCatalog catalog(create_small_ranges(), 10);

    REQUIRE(catalog.upper_bound() == 8);
    REQUIRE(catalog.skipped() == 3);
    REQUIRE(catalog.size() == 5);
    REQUIRE_FALSE(catalog.empty());
}

TEST_CASE("catalog iterates in nested cartesian order", "[catalog]") {
    StrategyCatalog catalog(create_small_ranges(), 10);

    std::vector<StrategyDescriptor> expected = {
        PartialWithdrawal{2, 0.5},
        FullWithdrawal{5},
        FullWithdrawal{10},
        Switch{3, 0.01},
        Switch{3, 0.02},
    };
    REQUIRE(catalog.to_vector() == expected);
}

TEST_CASE("catalog iteration is repeatable", "[catalog]") {
    StrategyCatalog catalog(StrategyRanges::defaults(20), 20);

    std::vector<StrategyDescriptor> first = catalog.to_vector();
    std::vector<StrategyDescriptor> second(catalog.begin(), catalog.end());
    REQUIRE(first == second);
}

TEST_CASE("default grid size", "[catalog]") {
    SECTION("20-year plan") {
        StrategyCatalog catalog(StrategyRanges::defaults(20), 20);
        // 5×10 partial + 20 full + 19×5 switch
        REQUIRE(catalog.upper_bound() == 165);
        REQUIRE(catalog.skipped() == 0);
        REQUIRE(catalog.size() == 165);
        REQUIRE(static_cast<size_t>(std::distance(catalog.begin(), catalog.end())) == 165);
    }

    SECTION("3-year plan skips long intervals") {
        StrategyCatalog catalog(StrategyRanges::defaults(3), 3);
        REQUIRE(catalog.upper_bound() == 63);
        REQUIRE(catalog.skipped() == 30);
        REQUIRE(catalog.size() == 33);
        REQUIRE(catalog.to_vector().size() == 33);
    }

    SECTION("1-year plan has only the full withdrawal") {
        StrategyCatalog catalog(StrategyRanges::defaults(1), 1);
        REQUIRE(catalog.size() == 1);
        REQUIRE(*catalog.begin() == StrategyDescriptor(FullWithdrawal{1}));
    }
}

TEST_CASE("defaults builds the expected lists", "[catalog]") {
    StrategyRanges ranges = StrategyRanges::defaults(20);
    REQUIRE(ranges.withdrawal_intervals == std::vector<int>{1, 2, 3, 4, 5});
    REQUIRE(ranges.withdrawal_ratios.size() == 10);
    REQUIRE(ranges.withdrawal_ratios.back() == 1.0);
    REQUIRE(ranges.full_withdrawal_years.size() == 20);
    REQUIRE(ranges.switch_years.size() == 19);
    REQUIRE(ranges.switch_fee_rates.size() == 5);
}

TEST_CASE("no degenerate descriptor is produced", "[catalog][property]") {
    StrategyCatalog catalog(StrategyRanges::defaults(4), 4);

    for (const auto& descriptor : catalog) {
        if (const auto* p = std::get_if<PartialWithdrawal>(&descriptor)) {
            REQUIRE(p->interval_years < 4);
        } else if (const auto* s = std::get_if<Switch>(&descriptor)) {
            REQUIRE(s->year < 4);
        }
    }
}

TEST_CASE("catalog with every combination filtered is empty", "[catalog][edge-case]") {
    StrategyRanges ranges;
    ranges.withdrawal_intervals = {5, 6};
    ranges.withdrawal_ratios = {0.5, 1.0};
    ranges.switch_years = {5};
    ranges.switch_fee_rates = {0.01};

    StrategyCatalog catalog(ranges, 5);
    REQUIRE(catalog.upper_bound() == 5);
    REQUIRE(catalog.skipped() == 5);
    REQUIRE(catalog.empty());
    REQUIRE(catalog.begin() == catalog.end());
}

TEST_CASE("empty ranges produce an empty catalog", "[catalog][edge-case]") {
    StrategyCatalog catalog(StrategyRanges(), 10);
    REQUIRE(catalog.empty());
    REQUIRE(catalog.to_vector().empty());
}

TEST_CASE("duplicate range values are kept", "[catalog]") {
    StrategyRanges ranges;
    ranges.full_withdrawal_years = {5, 5};

    StrategyCatalog catalog(ranges, 10);
    REQUIRE(catalog.size() == 2);
}

TEST_CASE("catalog validation", "[catalog]") {
    SECTION("Non-positive period") {
        REQUIRE_THROWS_AS(StrategyCatalog(StrategyRanges(), 0), InvalidInput);
    }

    SECTION("Interval below 1") {
        StrategyRanges ranges;
        ranges.withdrawal_intervals = {0};
        ranges.withdrawal_ratios = {0.5};
        REQUIRE_THROWS_AS(StrategyCatalog(ranges, 10), InvalidInput);
    }

    SECTION("Ratio outside (0, 1]") {
        StrategyRanges ranges;
        ranges.withdrawal_intervals = {1};
        ranges.withdrawal_ratios = {1.5};
        REQUIRE_THROWS_AS(StrategyCatalog(ranges, 10), InvalidInput);

        ranges.withdrawal_ratios = {0.0};
        REQUIRE_THROWS_AS(StrategyCatalog(ranges, 10), InvalidInput);
    }

    SECTION("Full withdrawal year beyond the period") {
        StrategyRanges ranges;
        ranges.full_withdrawal_years = {11};
        REQUIRE_THROWS_AS(StrategyCatalog(ranges, 10), InvalidInput);
    }

    SECTION("Switch fee of 100%") {
        StrategyRanges ranges;
        ranges.switch_years = {2};
        ranges.switch_fee_rates = {1.0};
        REQUIRE_THROWS_AS(StrategyCatalog(ranges, 10), InvalidInput);
    }

    SECTION("Switch year below 1") {
        StrategyRanges ranges;
        ranges.switch_years = {0};
        ranges.switch_fee_rates = {0.01};
        REQUIRE_THROWS_AS(StrategyCatalog(ranges, 10), InvalidInput);
    }
}

TEST_CASE("iterator post-increment", "[catalog]") {
    StrategyCatalog catalog(create_small_ranges(), 10);

    auto it = catalog.begin();
    auto previous = it++;
    REQUIRE(*previous == StrategyDescriptor(PartialWithdrawal{2, 0.5}));
    REQUIRE(*it == StrategyDescriptor(FullWithdrawal{5}));
}
