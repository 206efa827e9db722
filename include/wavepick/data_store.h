#pragma once
/*
===============================================================================
DATA STORE — Typed key/value holder for solver parameters and run statistics
===============================================================================

OVERVIEW
--------
The solver and the model builder record every parameter they apply and every
statistic they compute under string keys, so a caller can inspect a run after
the fact without a dedicated struct for each field.

Key conventions used across wavepick:

    "param:<Name>"   a configured parameter      (param:TimeLimit)
    "stat:<name>"    a value measured during run  (stat:valid_orders)

USAGE EXAMPLES
--------------
    DataStore store;
    store["param:TimeLimit"] = 30.0;

    double limit = store["param:TimeLimit"].get_or(600.0);
    int valid    = store["stat:valid_orders"].get<int>();

THREAD SAFETY
-------------
• Not thread-safe; a store belongs to one solver run

EXCEPTION SAFETY
----------------
• get<T>(): Throws std::bad_any_cast on type mismatch
• get_or<T>(): No-throw, returns default on mismatch

===============================================================================
*/

#include <any>
#include <concepts>
#include <type_traits>
#include <string>
#include <unordered_map>
#include <typeinfo>

namespace wavepick {

    /**
     * @class Value
     * @brief Type-erased container with safe access methods
     *
     * @note Stored types must be copyable. String literals should be wrapped
     *       in std::string, otherwise a const char* is stored.
     */
    class Value
    {
        std::any storage;

    public:
        Value() = default;

        template <typename T>
            requires (!std::same_as<std::remove_cvref_t<T>, Value>)
        Value(T&& v)
            : storage(std::forward<T>(v))
        {
        }

        template <typename T>
            requires (!std::same_as<std::remove_cvref_t<T>, Value>)
        Value& operator=(T&& v)
        {
            storage = std::forward<T>(v);
            return *this;
        }

        bool has_value() const noexcept
        {
            return storage.has_value();
        }

        /// @brief Exact type match, no conversion considered
        template <typename T>
        bool is() const noexcept
        {
            return storage.type() == typeid(T);
        }

        /**
         * @brief Retrieves a const reference to the stored value
         * @throws std::bad_any_cast if stored type is not T
         */
        template <typename T>
        const T& get() const
        {
            return std::any_cast<const T&>(storage);
        }

        /**
         * @brief Retrieves the stored value or a default if type mismatches
         *
         * @example
         *     Value v = 3.14;
         *     double d = v.get_or<double>(0.0);  // 3.14
         *     int i = v.get_or<int>(0);          // 0 (type mismatch)
         */
        template <typename T>
        T get_or(const T& default_value) const
        {
            if (is<T>())
                return get<T>();
            return default_value;
        }

        void reset() noexcept
        {
            storage.reset();
        }
    };

    /**
     * @typedef DataStore
     * @brief String-keyed map of Value objects
     *
     * @note Keys are case-sensitive
     */
    using DataStore = std::unordered_map<std::string, Value>;

} // namespace wavepick
