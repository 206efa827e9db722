/*
===============================================================================
TEST GREEDY FALLBACK — Tests for greedy_fallback.h
===============================================================================

OVERVIEW
--------
Validates the ranking, the acceptance rule, the early stop at the lower
bound, the operator cap, and the two coverage policies.

TEST ORGANIZATION
-----------------
• Section A: Ranking
• Section B: Construction
• Section C: Upper bound cap
• Section D: Coverage policies

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• greedy_fallback.h - System under test
• preprocessor.h, feasibility.h - Inputs and verification

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>

#include <wavepick/greedy_fallback.h>
#include <wavepick/feasibility.h>

#include "support/fixtures.h"

#include <vector>

using namespace wavepick;
using namespace wavepick::testing;

// ============================================================================
// SECTION A: RANKING
// ============================================================================

/**
 * @test Ranking::EfficiencyThenId
 * @brief Orders sort by units per eligible aisle, descending; ties by id
 *
 * @covers GreedyFallback::rank()
 */
TEST_CASE("A1: Ranking::EfficiencyThenId", "[greedy][rank]")
{
    // order 0: 2 units / 1 aisle = 2
    // order 1: 4 units / 2 aisles = 2
    // order 2: 3 units / 1 aisle = 3
    Instance inst({ { {0, 2} }, { {1, 4} }, { {2, 3} } },
                  { { {0, 5} }, { {1, 2} }, { {1, 3} }, { {2, 3} } },
                  3, 1, 20);
    const Preprocessing data = Preprocessor().run(inst);

    REQUIRE(GreedyFallback::rank(inst, data) == std::vector<int>{ 2, 0, 1 });
}

TEST_CASE("A2: Ranking::OnlyValidOrders", "[greedy][rank]")
{
    const Instance inst = dominance();
    const Preprocessing data = Preprocessor().run(inst);

    // order 0 is dominated; 1 -> 4/1, 2 -> 4/1
    REQUIRE(GreedyFallback::rank(inst, data) == std::vector<int>{ 1, 2 });
}

// ============================================================================
// SECTION B: CONSTRUCTION
// ============================================================================

TEST_CASE("B1: Construction::StopsAtLowerBound", "[greedy][run]")
{
    const Instance inst = exampleOne();
    const Preprocessing data = Preprocessor().run(inst);

    auto wave = GreedyFallback().run(inst, data);

    REQUIRE(wave.has_value());
    REQUIRE(wave->orders == std::set<int>{ 0 });
    REQUIRE(wave->aisles == std::set<int>{ 0 });
    REQUIRE(isFeasible(inst, *wave));
}

/**
 * @test Construction::SkipsOverflowAndContinues
 * @brief An order that would exceed UB is skipped, later orders still fit
 */
TEST_CASE("B2: Construction::SkipsOverflowAndContinues", "[greedy][run]")
{
    Instance inst({ { {0, 8} }, { {1, 3} }, { {2, 2} } },
                  { { {0, 8} }, { {1, 3} }, { {2, 2} } },
                  3, 9, 10);
    const Preprocessing data = Preprocessor().run(inst);

    auto wave = GreedyFallback().run(inst, data);

    REQUIRE(wave.has_value());
    REQUIRE(wave->orders == std::set<int>{ 0, 2 });
    REQUIRE(wave->aisles == std::set<int>{ 0, 2 });
    REQUIRE(isFeasible(inst, *wave));
}

TEST_CASE("B3: Construction::NoWaveBelowLowerBound", "[greedy][run]")
{
    const Instance inst = exampleTwo();
    const Preprocessing data = Preprocessor().run(inst);

    REQUIRE_FALSE(GreedyFallback().run(inst, data).has_value());
}

TEST_CASE("B4: Construction::NoValidOrders", "[greedy][run]")
{
    Instance inst({ { {0, 3} } }, { { {0, 1} } }, 1, 0, 10);
    const Preprocessing data = Preprocessor().run(inst);

    REQUIRE(data.validOrders().empty());
    REQUIRE_FALSE(GreedyFallback().run(inst, data).has_value());
}

/**
 * @test Construction::EmptyOrdersStillVisitAnAisle
 * @brief With a zero lower bound, a wave of empty orders visits one aisle
 *        instead of being discarded for having none
 */
TEST_CASE("B5: Construction::EmptyOrdersStillVisitAnAisle", "[greedy][run]")
{
    Instance inst({ {} }, { { {0, 1} } }, 1, 0, 5);
    const Preprocessing data = Preprocessor().run(inst);
    REQUIRE(data.eligibleAisles(0).empty());

    for (CoveragePolicy policy : { CoveragePolicy::AggregateOnly, CoveragePolicy::PerItem }) {
        auto wave = GreedyFallback(policy).run(inst, data);

        REQUIRE(wave.has_value());
        REQUIRE(wave->orders == std::set<int>{ 0 });
        REQUIRE(wave->aisles == std::set<int>{ 0 });
        REQUIRE(isFeasible(inst, *wave));
    }
}

// ============================================================================
// SECTION C: UPPER BOUND CAP
// ============================================================================

TEST_CASE("C1: UpperBoundCap::RealUpperBound", "[greedy][cap]")
{
    const Instance inst = exampleOne();
    GreedyFallback greedy;

    REQUIRE(greedy.realUpperBound(inst) == 10);

    greedy.upperBoundCap(4);
    REQUIRE(greedy.realUpperBound(inst) == 4);

    greedy.upperBoundCap(40);
    REQUIRE(greedy.realUpperBound(inst) == 10);

    greedy.upperBoundCap(-1);
    REQUIRE(greedy.realUpperBound(inst) == 10);
}

TEST_CASE("C2: UpperBoundCap::CapBlocksLargeOrders", "[greedy][cap]")
{
    const Instance inst = exampleOne();
    const Preprocessing data = Preprocessor().run(inst);

    GreedyFallback greedy;
    greedy.upperBoundCap(4);

    // order 0 (5 units) exceeds the cap, order 1 alone is below LB
    REQUIRE_FALSE(greedy.run(inst, data).has_value());
}

// ============================================================================
// SECTION D: COVERAGE POLICIES
// ============================================================================

/**
 * @test Coverage::AggregateOnlyMayViolateItems
 * @brief Two individually coverable orders together exceed item 0 supply
 *
 * @given coverageGap(): orders need 3 + 3 of item 0, aisles hold 4
 * @when The fallback runs with CoveragePolicy::AggregateOnly
 * @then The wave passes the aggregate check and fails the full check
 */
TEST_CASE("D1: Coverage::AggregateOnlyMayViolateItems", "[greedy][coverage]")
{
    const Instance inst = coverageGap();
    const Preprocessing data = Preprocessor().run(inst);

    REQUIRE(GreedyFallback::rank(inst, data) == std::vector<int>{ 1, 0 });

    auto wave = GreedyFallback(CoveragePolicy::AggregateOnly).run(inst, data);

    REQUIRE(wave.has_value());
    REQUIRE(wave->orders == std::set<int>{ 0, 1 });
    REQUIRE(checkAggregateBounds(inst, *wave).feasible());
    REQUIRE(checkFeasibility(inst, *wave).reason == FeasibilityReason::ItemShortage);
}

TEST_CASE("D2: Coverage::PerItemRejectsOvercommittedOrder", "[greedy][coverage]")
{
    const Instance inst = coverageGap();
    const Preprocessing data = Preprocessor().run(inst);

    GreedyFallback greedy;
    REQUIRE(greedy.coveragePolicy() == CoveragePolicy::PerItem);

    SECTION("Lower bound unreachable without the second order")
    {
        REQUIRE_FALSE(greedy.run(inst, data).has_value());
    }

    SECTION("Lower bound reachable with one order")
    {
        Instance relaxed(inst.orders(), inst.aisles(), inst.numItems(), 3, 10);
        const Preprocessing relaxedData = Preprocessor().run(relaxed);

        auto wave = greedy.run(relaxed, relaxedData);
        REQUIRE(wave.has_value());
        REQUIRE(wave->orders == std::set<int>{ 1 });
        REQUIRE(isFeasible(relaxed, *wave));
    }
}

TEST_CASE("D3: Coverage::PolicyNames", "[greedy][coverage]")
{
    REQUIRE(coveragePolicyString(CoveragePolicy::PerItem) == "PER_ITEM");
    REQUIRE(coveragePolicyString(CoveragePolicy::AggregateOnly) == "AGGREGATE_ONLY");
}
