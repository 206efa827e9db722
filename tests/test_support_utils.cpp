/*
===============================================================================
TEST SUPPORT UTILS — Tests for data_store.h, enum_utils.h and naming.h
===============================================================================

OVERVIEW
--------
Covers the small utilities the solver layers are built on: the typed Value
store used for parameters and statistics, the enum declaration macro that
sizes the builder's handle tables, and debug-only model names.

TEST ORGANIZATION
-----------------
• Section A: Value access and type safety
• Section B: DataStore conventions
• Section C: Enum utilities
• Section D: Naming

BUILD CONFIGURATION NOTES
-------------------------
Section D checks make_name:: against naming_enabled(), so it passes in both
debug and release builds.

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• data_store.h, enum_utils.h, naming.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>

#include <wavepick/data_store.h>
#include <wavepick/enum_utils.h>
#include <wavepick/naming.h>

#include <array>
#include <string>
#include <vector>

using namespace wavepick;

// ============================================================================
// SECTION A: VALUE ACCESS AND TYPE SAFETY
// ============================================================================

/**
 * @test ValueAccess::ThrowsOnTypeMismatch
 * @brief get<T>() demands the exact stored type
 *
 * @covers Value::get<T>()
 * @covers Value::is<T>()
 */
TEST_CASE("A1: ValueAccess::ThrowsOnTypeMismatch", "[data_store][value][exception]")
{
    DataStore data;
    data["x"] = 10;

    REQUIRE(data["x"].is<int>());
    REQUIRE_FALSE(data["x"].is<long long>());
    REQUIRE_THROWS_AS(data["x"].get<double>(), std::bad_any_cast);
    REQUIRE(data["x"].get<int>() == 10);
}

TEST_CASE("A2: ValueAccess::SafeAccessors", "[data_store][value]")
{
    Value v = 3.5;

    REQUIRE(v.get_or<double>(0.0) == 3.5);
    REQUIRE(v.get_or<int>(7) == 7);

    v.reset();
    REQUIRE_FALSE(v.has_value());
    REQUIRE(v.get_or<double>(1.0) == 1.0);
}

TEST_CASE("A3: ValueAccess::CopyKeepsContents", "[data_store][value]")
{
    Value a = std::string("EXACT_SOLVER");
    Value b = a;
    Value c;
    c = a;

    REQUIRE(b.get<std::string>() == "EXACT_SOLVER");
    REQUIRE(c.is<std::string>());
}

// ============================================================================
// SECTION B: DATASTORE CONVENTIONS
// ============================================================================

TEST_CASE("B1: DataStore::ParamAndStatKeys", "[data_store][integration]")
{
    DataStore store;
    store["param:TimeLimit"] = 30.0;
    store["stat:valid_orders"] = 12;
    store["stat:source"] = std::string("GREEDY_FALLBACK");

    REQUIRE(store.size() == 3);
    REQUIRE(store["param:TimeLimit"].get_or(600.0) == 30.0);
    REQUIRE(store["stat:valid_orders"].get<int>() == 12);
    REQUIRE(store["stat:source"].get<std::string>() == "GREEDY_FALLBACK");

    // Overwriting changes the stored type.
    store["stat:valid_orders"] = 12.0;
    REQUIRE(store["stat:valid_orders"].is<double>());

    REQUIRE(store.count("param:Threads") == 0);
}

// ============================================================================
// SECTION C: ENUM UTILITIES
// ============================================================================

WAVEPICK_DECLARE_ENUM(Phase, Preprocess, Exact, Fallback);
WAVEPICK_DECLARE_ENUM(Single, Only);

TEST_CASE("C1: EnumUtils::CountAndIndex", "[enum_utils]")
{
    STATIC_REQUIRE(Phase_COUNT == 3);
    STATIC_REQUIRE(Single_COUNT == 1);
    STATIC_REQUIRE(enum_size<Phase>::value == 3);
    STATIC_REQUIRE(enum_index(Phase::Fallback) == 2);

    STATIC_REQUIRE(is_valid_enum_value(Phase::Exact));
    STATIC_REQUIRE_FALSE(is_valid_enum_value(Phase::COUNT));

    std::array<int, Phase_COUNT> hits{};
    hits[enum_index(Phase::Exact)] += 1;
    REQUIRE(hits[1] == 1);
}

// ============================================================================
// SECTION D: NAMING
// ============================================================================

TEST_CASE("D1: Naming::DebugOnlyNames", "[naming]")
{
    REQUIRE(naming_enabled() == WAVEPICK_DEBUG_NAMES);

    if (naming_enabled()) {
        REQUIRE(make_name::index("order", 3) == "order_3");
    }
    else {
        REQUIRE(make_name::index("order", 3).empty());
    }
}

TEST_CASE("D2: Naming::ForcedNames", "[naming][force]")
{
    REQUIRE(force_name::index("item_cover", 17) == "item_cover_17");
    REQUIRE(force_name::index("x", 1, 2) == "x_1_2");
    REQUIRE(force_name::index("total_units") == "total_units");
    REQUIRE(force_name::index("neg", -4) == "neg_-4");

    REQUIRE_THROWS_AS(force_name::index("", 1), std::invalid_argument);
}
