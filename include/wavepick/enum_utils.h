#pragma once
/*
===============================================================================
ENUM UTILS — Compile-time enumeration helpers for wavepick
===============================================================================

OVERVIEW
--------
Declares strongly-typed enumerations with a trailing COUNT sentinel and a
matching size constant. ModelBuilder uses the sentinel to size its variable
and constraint tables, so every group of model elements is addressed by an
enum key instead of a magic integer.

USAGE EXAMPLES
--------------
    WAVEPICK_DECLARE_ENUM(WaveVars, Order, Aisle, TotalUnits, TotalAisles);

    std::array<std::vector<Var>, WaveVars_COUNT> groups{};
    groups[enum_index(WaveVars::Aisle)].push_back(v);

DEPENDENCIES
------------
• <cstddef> - For std::size_t type

EXCEPTION SAFETY
----------------
• No-throw guarantee for all generated code

===============================================================================
*/

#include <cstddef>

/**
 * @macro WAVEPICK_DECLARE_ENUM
 * @brief Declares an enum class with automatic COUNT sentinel
 *
 * @param Name The name of the enumeration type
 * @param ...  Comma-separated list of enumerator identifiers (at least one)
 *
 * @details
 * Expands to an enum class with the given enumerators plus COUNT, and a
 * constexpr size constant named <Name>_COUNT.
 *
 * @warning Do not explicitly define COUNT in your enumerator list
 *
 * @example
 *     WAVEPICK_DECLARE_ENUM(WaveCons, UnitsLink, UnitsLower);
 *     // enum class WaveCons { UnitsLink, UnitsLower, COUNT };
 *     // static constexpr std::size_t WaveCons_COUNT = 2;
 */
#define WAVEPICK_DECLARE_ENUM(Name, ...)                                  \
    enum class Name { __VA_ARGS__, COUNT };                               \
    static constexpr std::size_t Name##_COUNT =                           \
        static_cast<std::size_t>(Name::COUNT)

namespace wavepick {

    /**
     * @brief Compile-time enumeration size trait
     *
     * @tparam Enum Enumeration type declared with WAVEPICK_DECLARE_ENUM
     */
    template<typename Enum>
    struct enum_size {
        static constexpr std::size_t value = static_cast<std::size_t>(Enum::COUNT);
    };

    /// @brief True if value is a user enumerator (COUNT is not)
    template<typename Enum>
    constexpr bool is_valid_enum_value(Enum value) noexcept {
        return static_cast<std::size_t>(value) < static_cast<std::size_t>(Enum::COUNT);
    }

    /// @brief Position of an enumerator, for indexing enum-keyed arrays
    template<typename Enum>
    constexpr std::size_t enum_index(Enum value) noexcept {
        return static_cast<std::size_t>(value);
    }

} // namespace wavepick
