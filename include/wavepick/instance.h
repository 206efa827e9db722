#pragma once
/*
===============================================================================
INSTANCE — Immutable wave picking problem data
===============================================================================

OVERVIEW
--------
An Instance holds everything one run needs to know about the warehouse:

    * orders      sparse item -> demanded quantity, identified by position
    * aisles      sparse item -> available quantity, identified by position
    * nItems      item ids live in [0, nItems)
    * waveSizeLB  minimum total units in a wave (inclusive)
    * waveSizeUB  maximum total units in a wave (inclusive)

The data is validated once in the constructor and never mutated afterwards.
Every other component takes the Instance by const reference and can rely on
the invariants below without re-checking them.

Invariants
----------
    * nItems >= 0
    * 0 <= waveSizeLB <= waveSizeUB
    * every item id referenced by an order or aisle lies in [0, nItems)
    * every stored quantity is strictly positive

USAGE EXAMPLES
--------------
    std::vector<ItemQuantities> orders = { {{0, 3}, {1, 2}}, {{2, 4}} };
    std::vector<ItemQuantities> aisles = { {{0, 3}, {1, 2}}, {{2, 4}} };

    Instance inst(orders, aisles, 3, 5, 10);
    inst.orderUnits(0);   // 5

EXCEPTION SAFETY
----------------
• Constructor throws std::invalid_argument when an invariant is violated
• order(o) / aisle(a) / orderUnits(o) throw std::out_of_range on bad ids

===============================================================================
*/

#include <vector>
#include <unordered_map>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace wavepick {

    /// Sparse item id -> quantity mapping used for both orders and aisles.
    using ItemQuantities = std::unordered_map<int, int>;

    /// Unit totals may exceed the range of a single quantity.
    using Units = long long;

    /**
     * @brief Sum of all quantities in a sparse mapping
     */
    inline Units totalQuantity(const ItemQuantities& q) noexcept {
        Units sum = 0;
        for (const auto& [item, qty] : q)
            sum += qty;
        return sum;
    }

    class Instance {
    private:
        std::vector<ItemQuantities> orders_;
        std::vector<ItemQuantities> aisles_;
        std::vector<Units> orderUnits_;
        int nItems_ = 0;
        int waveSizeLB_ = 0;
        int waveSizeUB_ = 0;

        void checkEntries(const std::vector<ItemQuantities>& entries, const char* kind) const
        {
            for (std::size_t k = 0; k < entries.size(); ++k) {
                for (const auto& [item, qty] : entries[k]) {
                    if (item < 0 || item >= nItems_) {
                        throw std::invalid_argument(fmt::format(
                            "Instance: {} {} references item {} outside [0, {})",
                            kind, k, item, nItems_));
                    }
                    if (qty <= 0) {
                        throw std::invalid_argument(fmt::format(
                            "Instance: {} {} has non-positive quantity {} for item {}",
                            kind, k, qty, item));
                    }
                }
            }
        }

    public:
        Instance(std::vector<ItemQuantities> orders,
                 std::vector<ItemQuantities> aisles,
                 int nItems, int waveSizeLB, int waveSizeUB)
            : orders_(std::move(orders)),
            aisles_(std::move(aisles)),
            nItems_(nItems),
            waveSizeLB_(waveSizeLB),
            waveSizeUB_(waveSizeUB)
        {
            if (nItems_ < 0) {
                throw std::invalid_argument(
                    fmt::format("Instance: nItems must be non-negative, got {}", nItems_));
            }
            if (waveSizeLB_ < 0 || waveSizeLB_ > waveSizeUB_) {
                throw std::invalid_argument(fmt::format(
                    "Instance: wave bounds must satisfy 0 <= LB <= UB, got [{}, {}]",
                    waveSizeLB_, waveSizeUB_));
            }
            checkEntries(orders_, "order");
            checkEntries(aisles_, "aisle");

            orderUnits_.reserve(orders_.size());
            for (const auto& o : orders_)
                orderUnits_.push_back(totalQuantity(o));
        }

        // -------------------------------------------------------------------------
        // Accessors
        // -------------------------------------------------------------------------

        const std::vector<ItemQuantities>& orders() const noexcept { return orders_; }
        const std::vector<ItemQuantities>& aisles() const noexcept { return aisles_; }

        const ItemQuantities& order(int o) const {
            if (!hasOrder(o))
                throw std::out_of_range(fmt::format("Instance::order: id {} out of range", o));
            return orders_[static_cast<std::size_t>(o)];
        }

        const ItemQuantities& aisle(int a) const {
            if (!hasAisle(a))
                throw std::out_of_range(fmt::format("Instance::aisle: id {} out of range", a));
            return aisles_[static_cast<std::size_t>(a)];
        }

        /// @brief Total units demanded by order o (cached at construction)
        Units orderUnits(int o) const {
            if (!hasOrder(o))
                throw std::out_of_range(fmt::format("Instance::orderUnits: id {} out of range", o));
            return orderUnits_[static_cast<std::size_t>(o)];
        }

        int numOrders() const noexcept { return static_cast<int>(orders_.size()); }
        int numAisles() const noexcept { return static_cast<int>(aisles_.size()); }
        int numItems() const noexcept { return nItems_; }
        int waveSizeLB() const noexcept { return waveSizeLB_; }
        int waveSizeUB() const noexcept { return waveSizeUB_; }

        bool hasOrder(int o) const noexcept { return o >= 0 && o < numOrders(); }
        bool hasAisle(int a) const noexcept { return a >= 0 && a < numAisles(); }
    };

} // namespace wavepick
