#pragma once
/*
===============================================================================
GREEDY FALLBACK — Constructive wave when the exact path fails
===============================================================================

Overview
--------
Runs over Preprocessing::validOrders() only:

    1. rank orders by efficiency = units / max(1, |eligible aisles|),
       descending, ties by ascending order id
    2. scan the ranking; accept an order when
           running + units <= realUpperBound
       (and, under CoveragePolicy::PerItem, when item supply still covers
       the picked units, see below); on accept add its units and union its
       eligible aisles into the visited set (aisles are never removed)
    3. stop as soon as running >= waveSizeLB
    4. if every accepted order is empty (possible only when waveSizeLB is
       0), visit the lowest-numbered aisle so the wave is not aisle-less
    5. return the wave iff running lies in [waveSizeLB, waveSizeUB] and it
       has at least one order and one aisle; otherwise std::nullopt

realUpperBound is min(upperBoundCap, waveSizeUB); without a cap it is
waveSizeUB. The greedy does not look for more units once the lower bound is
reached, even with headroom left.

Coverage
--------
Eligible aisles say which aisles could help an order, not which units they
commit to it. Two accepted orders may each be coverable alone and still
exceed the combined supply of an item.

    AggregateOnly   checks the unit bounds only. The result always passes
                    checkAggregateBounds() but may fail the per-item rule.
    PerItem         accepting an order visits every aisle that stocks any of
                    its items, so the available amount of each of its items
                    becomes the item's total supply. The order is accepted
                    only if picked + demand <= itemSupply for each of its
                    items. The result then passes checkFeasibility().

Cost: one sort of the valid orders, then a single scan where an accepted
order costs its sparsity plus its eligible aisle count. No time limit is
needed on this phase.

===============================================================================
*/

#include <optional>
#include <vector>
#include <algorithm>
#include <string>

#include "instance.h"
#include "solution.h"
#include "preprocessor.h"

namespace wavepick {

    enum class CoveragePolicy { AggregateOnly, PerItem };

    inline std::string coveragePolicyString(CoveragePolicy p) {
        return p == CoveragePolicy::PerItem ? "PER_ITEM" : "AGGREGATE_ONLY";
    }

    class GreedyFallback {
    private:
        Units upperBoundCap_ = -1;
        CoveragePolicy policy_ = CoveragePolicy::PerItem;

    public:
        GreedyFallback() = default;
        explicit GreedyFallback(CoveragePolicy policy) : policy_(policy) {}

        /// @brief Operator-supplied cap on running units; negative removes it
        void upperBoundCap(Units cap) noexcept { upperBoundCap_ = cap; }
        Units upperBoundCap() const noexcept { return upperBoundCap_; }

        void coveragePolicy(CoveragePolicy p) noexcept { policy_ = p; }
        CoveragePolicy coveragePolicy() const noexcept { return policy_; }

        Units realUpperBound(const Instance& inst) const noexcept {
            const Units ub = inst.waveSizeUB();
            return upperBoundCap_ < 0 ? ub : std::min(upperBoundCap_, ub);
        }

        /**
         * @brief Valid orders in greedy order
         *
         * @details Efficiencies are compared by cross-multiplication, so equal
         *          ratios tie exactly and fall back to the order id.
         */
        static std::vector<int> rank(const Instance& inst, const Preprocessing& data)
        {
            std::vector<int> ranked = data.validOrders();

            auto denom = [&](int o) -> Units {
                return std::max<Units>(1, static_cast<Units>(data.eligibleAisles(o).size()));
            };

            std::sort(ranked.begin(), ranked.end(), [&](int o1, int o2) {
                const Units lhs = inst.orderUnits(o1) * denom(o2);
                const Units rhs = inst.orderUnits(o2) * denom(o1);
                if (lhs != rhs)
                    return lhs > rhs;
                return o1 < o2;
            });
            return ranked;
        }

        std::optional<Solution> run(const Instance& inst, const Preprocessing& data) const
        {
            const Units cap = realUpperBound(inst);
            Units running = 0;
            Solution wave;

            std::vector<Units> picked;
            if (policy_ == CoveragePolicy::PerItem)
                picked.assign(static_cast<std::size_t>(inst.numItems()), 0);

            for (int o : rank(inst, data)) {
                const Units units = inst.orderUnits(o);
                if (running + units > cap)
                    continue;

                if (policy_ == CoveragePolicy::PerItem && !coverable(inst, data, picked, o))
                    continue;

                wave.orders.insert(o);
                running += units;
                const auto& eligible = data.eligibleAisles(o);
                wave.aisles.insert(eligible.begin(), eligible.end());

                if (policy_ == CoveragePolicy::PerItem) {
                    for (const auto& [item, qty] : inst.order(o))
                        picked[static_cast<std::size_t>(item)] += qty;
                }

                if (running >= inst.waveSizeLB())
                    break;
            }

            // Empty orders have no eligible aisles.
            if (!wave.orders.empty() && wave.aisles.empty() && inst.numAisles() > 0)
                wave.aisles.insert(0);

            if (wave.orders.empty() || wave.aisles.empty())
                return std::nullopt;
            if (running < inst.waveSizeLB() || running > inst.waveSizeUB())
                return std::nullopt;
            return wave;
        }

    private:
        static bool coverable(const Instance& inst, const Preprocessing& data,
                              const std::vector<Units>& picked, int o)
        {
            for (const auto& [item, qty] : inst.order(o)) {
                if (picked[static_cast<std::size_t>(item)] + qty > data.itemSupply(item))
                    return false;
            }
            return true;
        }
    };

} // namespace wavepick
