#pragma once
/*
===============================================================================
PREPROCESSOR — Derived relations and dominance pruning for one run
===============================================================================

Overview
--------
Computes, once per run, the read-only relations the greedy fallback needs:

    itemToAisles[i]            aisles with positive supply of item i
    orderToEligibleAisles[o]   union of itemToAisles over the items o demands
    itemSupply[i]              units of item i over all aisles
    satisfiable[o]             every item of o has at least that much supply
    validOrders                satisfiable orders that are not dominated

Eligible aisles are an upper bound on the aisles that could help fill an
order. They are not a committed per-item assignment.

Dominance
---------
Order A is dominated by order B iff

    units(B) >= units(A),
    |eligible(B)| <= |eligible(A)|,
    for every item A demands, B demands at least as much.

Only satisfiable orders may dominate. Two orders with identical demand
dominate each other; of such a pair only the larger id is pruned, so every
class of equivalent orders keeps one representative. Because dominance is
transitive, every pruned order has a surviving dominator.

Candidates B for a given A are taken from the orders that demand A's
scarcest item (fewest demanding orders), which is usually a short list.
The worst case stays quadratic in the number of orders, so dominance is
skipped entirely above Preprocessor::dominanceOrderLimit() and the result
reports dominanceSkipped().

The exact MILP never consults validOrders; it always sees every order.

Typical Usage
-------------
    Preprocessor pre;
    pre.dominanceOrderLimit(5000);
    const Preprocessing data = pre.run(inst);

    for (int o : data.validOrders()) { ... }

===============================================================================
*/

#include <vector>
#include <algorithm>
#include <limits>

#include "instance.h"

namespace wavepick {

    class Preprocessor;

    /**
     * @class Preprocessing
     * @brief Immutable result of one preprocessing pass
     */
    class Preprocessing {
        friend class Preprocessor;

    private:
        std::vector<std::vector<int>> itemToAisles_;
        std::vector<std::vector<int>> orderToEligibleAisles_;
        std::vector<Units> itemSupply_;
        std::vector<bool> satisfiable_;
        std::vector<int> dominatedBy_;
        std::vector<int> validOrders_;
        bool dominanceSkipped_ = false;

        Preprocessing() = default;

    public:
        const std::vector<std::vector<int>>& itemToAisles() const noexcept { return itemToAisles_; }
        const std::vector<std::vector<int>>& orderToEligibleAisles() const noexcept { return orderToEligibleAisles_; }

        const std::vector<int>& itemAisles(int item) const { return itemToAisles_.at(static_cast<std::size_t>(item)); }
        const std::vector<int>& eligibleAisles(int order) const { return orderToEligibleAisles_.at(static_cast<std::size_t>(order)); }

        Units itemSupply(int item) const { return itemSupply_.at(static_cast<std::size_t>(item)); }
        bool satisfiable(int order) const { return satisfiable_.at(static_cast<std::size_t>(order)); }

        /// @brief Id of a surviving order that dominates `order`, or -1
        int dominatedBy(int order) const { return dominatedBy_.at(static_cast<std::size_t>(order)); }

        /// @brief Satisfiable, non-dominated orders in ascending id order
        const std::vector<int>& validOrders() const noexcept { return validOrders_; }

        bool dominanceSkipped() const noexcept { return dominanceSkipped_; }

        int numUnsatisfiable() const noexcept {
            return static_cast<int>(std::count(satisfiable_.begin(), satisfiable_.end(), false));
        }

        int numDominated() const noexcept {
            return static_cast<int>(std::count_if(dominatedBy_.begin(), dominatedBy_.end(),
                [](int d) { return d >= 0; }));
        }
    };

    /**
     * @class Preprocessor
     * @brief Stateless builder of Preprocessing objects
     */
    class Preprocessor {
    private:
        int dominanceOrderLimit_ = 20000;

    public:
        Preprocessor() = default;
        explicit Preprocessor(int dominanceOrderLimit)
            : dominanceOrderLimit_(dominanceOrderLimit)
        {
        }

        /// @brief Skip dominance when the instance has more orders than this
        void dominanceOrderLimit(int n) noexcept { dominanceOrderLimit_ = n; }
        int dominanceOrderLimit() const noexcept { return dominanceOrderLimit_; }

        /**
         * @brief Does order b dominate order a?
         *
         * @note Identical orders dominate each other; run() breaks that tie by id.
         */
        static bool dominates(const Instance& inst, const Preprocessing& data, int b, int a)
        {
            if (!data.satisfiable(b))
                return false;
            if (inst.orderUnits(b) < inst.orderUnits(a))
                return false;
            if (data.eligibleAisles(b).size() > data.eligibleAisles(a).size())
                return false;

            const ItemQuantities& demandB = inst.order(b);
            for (const auto& [item, qty] : inst.order(a)) {
                auto it = demandB.find(item);
                if (it == demandB.end() || it->second < qty)
                    return false;
            }
            return true;
        }

        Preprocessing run(const Instance& inst) const
        {
            Preprocessing data;

            const int nItems = inst.numItems();
            const int nOrders = inst.numOrders();
            const int nAisles = inst.numAisles();

            // ---------------------------------------------------------------
            // item -> aisles, item supply
            // ---------------------------------------------------------------
            data.itemToAisles_.assign(static_cast<std::size_t>(nItems), {});
            data.itemSupply_.assign(static_cast<std::size_t>(nItems), 0);

            for (int a = 0; a < nAisles; ++a) {
                for (const auto& [item, qty] : inst.aisle(a)) {
                    data.itemToAisles_[static_cast<std::size_t>(item)].push_back(a);
                    data.itemSupply_[static_cast<std::size_t>(item)] += qty;
                }
            }

            // ---------------------------------------------------------------
            // order -> eligible aisles, satisfiability
            // ---------------------------------------------------------------
            data.orderToEligibleAisles_.assign(static_cast<std::size_t>(nOrders), {});
            data.satisfiable_.assign(static_cast<std::size_t>(nOrders), true);

            for (int o = 0; o < nOrders; ++o) {
                auto& eligible = data.orderToEligibleAisles_[static_cast<std::size_t>(o)];
                for (const auto& [item, qty] : inst.order(o)) {
                    const auto& aisles = data.itemToAisles_[static_cast<std::size_t>(item)];
                    eligible.insert(eligible.end(), aisles.begin(), aisles.end());

                    if (qty > data.itemSupply_[static_cast<std::size_t>(item)])
                        data.satisfiable_[static_cast<std::size_t>(o)] = false;
                }
                std::sort(eligible.begin(), eligible.end());
                eligible.erase(std::unique(eligible.begin(), eligible.end()), eligible.end());
            }

            // ---------------------------------------------------------------
            // dominance
            // ---------------------------------------------------------------
            data.dominatedBy_.assign(static_cast<std::size_t>(nOrders), -1);
            data.dominanceSkipped_ = nOrders > dominanceOrderLimit_;

            if (!data.dominanceSkipped_)
                markDominated(inst, data);

            for (int o = 0; o < nOrders; ++o) {
                if (data.satisfiable(o) && data.dominatedBy(o) < 0)
                    data.validOrders_.push_back(o);
            }
            return data;
        }

    private:
        static void markDominated(const Instance& inst, Preprocessing& data)
        {
            const int nOrders = inst.numOrders();

            std::vector<std::vector<int>> itemToOrders(static_cast<std::size_t>(inst.numItems()));
            std::vector<int> emptyOrders;
            for (int o = 0; o < nOrders; ++o) {
                if (inst.order(o).empty())
                    emptyOrders.push_back(o);
                for (const auto& [item, qty] : inst.order(o))
                    itemToOrders[static_cast<std::size_t>(item)].push_back(o);
            }

            for (int a = 0; a < nOrders; ++a) {
                if (!data.satisfiable(a))
                    continue;

                // Any dominator demands every item of a, so it sits in the
                // demand list of a's scarcest item.
                const std::vector<int>* candidates = &emptyOrders;
                if (!inst.order(a).empty()) {
                    std::size_t best = std::numeric_limits<std::size_t>::max();
                    for (const auto& [item, qty] : inst.order(a)) {
                        const auto& list = itemToOrders[static_cast<std::size_t>(item)];
                        if (list.size() < best) {
                            best = list.size();
                            candidates = &list;
                        }
                    }
                }

                for (int b : *candidates) {
                    if (b == a || !dominates(inst, data, b, a))
                        continue;
                    // Mutual dominance means identical demand: keep the smaller id.
                    if (dominates(inst, data, a, b) && b > a)
                        continue;
                    data.dominatedBy_[static_cast<std::size_t>(a)] = b;
                    break;
                }
            }

            // Point every pruned order at a surviving dominator.
            for (int a = 0; a < nOrders; ++a) {
                int d = data.dominatedBy_[static_cast<std::size_t>(a)];
                while (d >= 0 && data.dominatedBy_[static_cast<std::size_t>(d)] >= 0)
                    d = data.dominatedBy_[static_cast<std::size_t>(d)];
                data.dominatedBy_[static_cast<std::size_t>(a)] = d;
            }
        }
    };

} // namespace wavepick
