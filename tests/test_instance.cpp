/*
===============================================================================
TEST INSTANCE — Tests for instance.h and instance_io.h
===============================================================================

OVERVIEW
--------
Validates construction-time checks of Instance, its accessors, and the text
reader/writer for the challenge format.

TEST ORGANIZATION
-----------------
• Section A: Construction and validation
• Section B: Accessors
• Section C: Instance reader
• Section D: Solution writer

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• instance.h, instance_io.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>

#include <wavepick/instance.h>
#include <wavepick/instance_io.h>

#include <sstream>
#include <string>

using namespace wavepick;

// ============================================================================
// SECTION A: CONSTRUCTION AND VALIDATION
// ============================================================================

/**
 * @test InstanceValidation::RejectsBadData
 * @brief Invalid bounds, item ids and quantities throw std::invalid_argument
 *
 * @covers Instance::Instance()
 */
TEST_CASE("A1: InstanceValidation::RejectsBadData", "[instance][validation]")
{
    SECTION("Lower bound above upper bound")
    {
        REQUIRE_THROWS_AS(Instance({}, {}, 1, 5, 4), std::invalid_argument);
    }

    SECTION("Negative lower bound")
    {
        REQUIRE_THROWS_AS(Instance({}, {}, 1, -1, 4), std::invalid_argument);
    }

    SECTION("Negative item count")
    {
        REQUIRE_THROWS_AS(Instance({}, {}, -1, 0, 4), std::invalid_argument);
    }

    SECTION("Order item outside [0, nItems)")
    {
        REQUIRE_THROWS_AS(Instance({ { {2, 1} } }, {}, 2, 0, 4), std::invalid_argument);
    }

    SECTION("Aisle item outside [0, nItems)")
    {
        REQUIRE_THROWS_AS(Instance({}, { { {-1, 1} } }, 2, 0, 4), std::invalid_argument);
    }

    SECTION("Non-positive quantity")
    {
        REQUIRE_THROWS_AS(Instance({ { {0, 0} } }, {}, 1, 0, 4), std::invalid_argument);
        REQUIRE_THROWS_AS(Instance({}, { { {0, -3} } }, 1, 0, 4), std::invalid_argument);
    }

    SECTION("LB == UB is accepted")
    {
        REQUIRE_NOTHROW(Instance({ { {0, 1} } }, { { {0, 1} } }, 1, 3, 3));
    }
}

// ============================================================================
// SECTION B: ACCESSORS
// ============================================================================

TEST_CASE("B1: InstanceAccessors::UnitsAndCounts", "[instance][accessors]")
{
    Instance inst({ { {0, 3}, {1, 2} }, { {2, 4} }, {} },
                  { { {0, 3} } },
                  3, 1, 10);

    REQUIRE(inst.numOrders() == 3);
    REQUIRE(inst.numAisles() == 1);
    REQUIRE(inst.numItems() == 3);
    REQUIRE(inst.waveSizeLB() == 1);
    REQUIRE(inst.waveSizeUB() == 10);

    REQUIRE(inst.orderUnits(0) == 5);
    REQUIRE(inst.orderUnits(1) == 4);
    REQUIRE(inst.orderUnits(2) == 0);
    REQUIRE(inst.order(0).at(1) == 2);

    REQUIRE(inst.hasOrder(2));
    REQUIRE_FALSE(inst.hasOrder(3));
    REQUIRE_FALSE(inst.hasAisle(-1));

    REQUIRE_THROWS_AS(inst.order(3), std::out_of_range);
    REQUIRE_THROWS_AS(inst.aisle(1), std::out_of_range);
    REQUIRE_THROWS_AS(inst.orderUnits(-1), std::out_of_range);
}

// ============================================================================
// SECTION C: INSTANCE READER
// ============================================================================

/**
 * @test InstanceReader::ParsesChallengeFormat
 * @brief Header, order lines, aisle lines and bounds are read in sequence
 *
 * @covers readInstance()
 */
TEST_CASE("C1: InstanceReader::ParsesChallengeFormat", "[instance][io]")
{
    std::istringstream in(
        "2 3 2\n"
        "2 0 3 1 2\n"
        "1 2 4\n"
        "\n"
        "2 0 3 1 2\n"
        "1 2 4\n"
        "5 10\n");

    Instance inst = readInstance(in);

    REQUIRE(inst.numOrders() == 2);
    REQUIRE(inst.numAisles() == 2);
    REQUIRE(inst.numItems() == 3);
    REQUIRE(inst.orderUnits(0) == 5);
    REQUIRE(inst.aisle(1).at(2) == 4);
    REQUIRE(inst.waveSizeLB() == 5);
    REQUIRE(inst.waveSizeUB() == 10);
}

TEST_CASE("C2: InstanceReader::RepeatedItemsAddUp", "[instance][io]")
{
    std::istringstream in(
        "1 1 1\n"
        "2 0 3 0 2\n"
        "1 0 9\n"
        "1 5\n");

    Instance inst = readInstance(in);
    REQUIRE(inst.order(0).at(0) == 5);
    REQUIRE(inst.order(0).size() == 1);
}

TEST_CASE("C3: InstanceReader::MalformedInput", "[instance][io][exception]")
{
    SECTION("Truncated before bounds")
    {
        std::istringstream in("1 1 1\n1 0 3\n1 0 3\n");
        REQUIRE_THROWS_AS(readInstance(in), std::runtime_error);
    }

    SECTION("Order line shorter than its count")
    {
        std::istringstream in("1 1 1\n2 0 3\n1 0 3\n1 5\n");
        REQUIRE_THROWS_AS(readInstance(in), std::runtime_error);
    }

    SECTION("Non-numeric header")
    {
        std::istringstream in("x 1 1\n");
        REQUIRE_THROWS_AS(readInstance(in), std::runtime_error);
    }

    SECTION("Invalid data reaches Instance validation")
    {
        std::istringstream in("1 1 1\n1 4 3\n1 0 3\n1 5\n");
        REQUIRE_THROWS_AS(readInstance(in), std::invalid_argument);
    }

    SECTION("Missing file")
    {
        REQUIRE_THROWS_AS(readInstanceFile("/nonexistent/wavepick/instance.txt"),
                          std::runtime_error);
    }
}

// ============================================================================
// SECTION D: SOLUTION WRITER
// ============================================================================

TEST_CASE("D1: SolutionWriter::CountsThenIds", "[instance][io]")
{
    Solution sol({ 3, 0 }, { 1 });

    std::ostringstream out;
    writeSolution(out, sol);

    REQUIRE(out.str() == "2\n0\n3\n1\n1\n");
}
