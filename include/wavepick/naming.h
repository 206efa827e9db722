#pragma once
/*
===============================================================================
NAMING — Debug-aware symbolic names for model variables and constraints
===============================================================================

OVERVIEW
--------
Backends accept a name for every variable and constraint. Readable names
("order_3", "item_cover_17") help when a model is exported or inspected, but
building thousands of strings costs time on large instances. Names are
therefore produced only in debug builds; release builds get empty strings.

    // Debug: "aisle_4"   Release: ""
    auto n = make_name::index("aisle", 4);

    // Always produces "aisle_4"
    auto n = force_name::index("aisle", 4);

CONFIGURATION
-------------
• Debug builds (WAVEPICK_DEBUG or _DEBUG defined): human-readable names
• Release builds: empty names

EXCEPTION SAFETY
----------------
• make_name:: no-throw when naming is disabled
• Empty base with indices throws std::invalid_argument in debug builds

===============================================================================
*/

#include <string>
#include <string_view>
#include <stdexcept>
#include <type_traits>
#include <concepts>

#if defined(WAVEPICK_DEBUG) || defined(_DEBUG)
inline constexpr bool WAVEPICK_DEBUG_NAMES = true;
#else
inline constexpr bool WAVEPICK_DEBUG_NAMES = false;
#endif

namespace wavepick {

    [[nodiscard]] constexpr bool naming_enabled() noexcept {
        return WAVEPICK_DEBUG_NAMES;
    }

    namespace naming_detail {

        template<typename T>
        concept Integral = std::is_integral_v<std::remove_cvref_t<T>>;

        template<Integral... Indices>
        inline std::string index_impl(std::string_view base, Indices... idx) {
            constexpr std::size_t N = sizeof...(idx);
            if (N > 0 && base.empty()) {
                throw std::invalid_argument(
                    "naming: base name cannot be empty when indices are present");
            }

            std::string result;
            result.reserve(base.size() + (N * 6));
            result.append(base);
            ((result.append("_").append(std::to_string(static_cast<long long>(idx)))), ...);
            return result;
        }

    } // namespace naming_detail

    /**
     * @namespace make_name
     * @brief Names that exist only when naming_enabled()
     */
    namespace make_name {

        /**
         * @brief Index-style name: base_i_j...
         * @return Name in debug builds, empty string otherwise
         */
        template<naming_detail::Integral... Indices>
        [[nodiscard]] inline std::string index(std::string_view base, Indices... idx) {
            if constexpr (!WAVEPICK_DEBUG_NAMES) {
                (void)base;
                ((void)idx, ...);
                return {};
            }
            else {
                return naming_detail::index_impl(base, idx...);
            }
        }

    } // namespace make_name

    /**
     * @namespace force_name
     * @brief Names produced regardless of build mode (logging, exports)
     */
    namespace force_name {

        template<naming_detail::Integral... Indices>
        [[nodiscard]] inline std::string index(std::string_view base, Indices... idx) {
            return naming_detail::index_impl(base, idx...);
        }

    } // namespace force_name

} // namespace wavepick
