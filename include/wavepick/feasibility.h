#pragma once
/*
===============================================================================
FEASIBILITY — Solver-independent validation of a wave
===============================================================================

Overview
--------
A Solution is feasible for an Instance iff

    1. the selected order set is non-empty,
    2. the visited aisle set is non-empty,
    3. every id refers to an existing order / aisle,
    4. total picked units lie in [waveSizeLB, waveSizeUB],
    5. for every item, units picked <= units available in visited aisles.

The check never consults a solver, so the same function validates the exact
path's extracted assignment and the greedy fallback's construction. Rule 1
and 2 are explicit: with waveSizeLB == 0 an empty wave would otherwise pass
the bound test vacuously.

Typical Usage
-------------
    auto report = checkFeasibility(inst, sol);
    if (!report) {
        logger->warn("rejected: {}", reasonString(report.reason));
    }

===============================================================================
*/

#include <string>
#include <vector>

#include "instance.h"
#include "solution.h"

namespace wavepick {

    enum class FeasibilityReason {
        Feasible,
        EmptyOrders,
        EmptyAisles,
        UnknownOrder,
        UnknownAisle,
        BelowLowerBound,
        AboveUpperBound,
        ItemShortage
    };

    inline std::string reasonString(FeasibilityReason r) {
        switch (r) {
            case FeasibilityReason::Feasible:        return "FEASIBLE";
            case FeasibilityReason::EmptyOrders:     return "EMPTY_ORDERS";
            case FeasibilityReason::EmptyAisles:     return "EMPTY_AISLES";
            case FeasibilityReason::UnknownOrder:    return "UNKNOWN_ORDER";
            case FeasibilityReason::UnknownAisle:    return "UNKNOWN_AISLE";
            case FeasibilityReason::BelowLowerBound: return "BELOW_LOWER_BOUND";
            case FeasibilityReason::AboveUpperBound: return "ABOVE_UPPER_BOUND";
            case FeasibilityReason::ItemShortage:    return "ITEM_SHORTAGE";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Outcome of a feasibility check
     *
     * @details totalUnits is filled whenever the ids were valid. For an
     *          ItemShortage, item/picked/available describe the first short
     *          item in ascending item order.
     */
    struct FeasibilityReport {
        FeasibilityReason reason = FeasibilityReason::Feasible;
        Units totalUnits = 0;
        int item = -1;
        Units picked = 0;
        Units available = 0;

        bool feasible() const noexcept { return reason == FeasibilityReason::Feasible; }
        explicit operator bool() const noexcept { return feasible(); }
    };

    namespace feasibility_detail {

        inline FeasibilityReport checkIdsAndBounds(const Instance& inst, const Solution& sol)
        {
            FeasibilityReport report;

            if (sol.orders.empty()) {
                report.reason = FeasibilityReason::EmptyOrders;
                return report;
            }
            if (sol.aisles.empty()) {
                report.reason = FeasibilityReason::EmptyAisles;
                return report;
            }
            for (int o : sol.orders) {
                if (!inst.hasOrder(o)) {
                    report.reason = FeasibilityReason::UnknownOrder;
                    return report;
                }
            }
            for (int a : sol.aisles) {
                if (!inst.hasAisle(a)) {
                    report.reason = FeasibilityReason::UnknownAisle;
                    return report;
                }
            }

            for (int o : sol.orders)
                report.totalUnits += inst.orderUnits(o);

            if (report.totalUnits < inst.waveSizeLB())
                report.reason = FeasibilityReason::BelowLowerBound;
            else if (report.totalUnits > inst.waveSizeUB())
                report.reason = FeasibilityReason::AboveUpperBound;

            return report;
        }

    } // namespace feasibility_detail

    /**
     * @brief Check only the non-empty, id and aggregate-bound rules (1-4)
     *
     * @note The greedy fallback satisfies this half by construction whatever
     *       its coverage policy.
     */
    inline FeasibilityReport checkAggregateBounds(const Instance& inst, const Solution& sol)
    {
        return feasibility_detail::checkIdsAndBounds(inst, sol);
    }

    /**
     * @brief Full feasibility check (rules 1-5)
     *
     * @complexity O(nItems + sum of sparsity over selected orders and visited aisles)
     */
    inline FeasibilityReport checkFeasibility(const Instance& inst, const Solution& sol)
    {
        FeasibilityReport report = feasibility_detail::checkIdsAndBounds(inst, sol);
        if (!report)
            return report;

        const auto n = static_cast<std::size_t>(inst.numItems());
        std::vector<Units> picked(n, 0);
        std::vector<Units> available(n, 0);

        for (int o : sol.orders) {
            for (const auto& [item, qty] : inst.order(o))
                picked[static_cast<std::size_t>(item)] += qty;
        }
        for (int a : sol.aisles) {
            for (const auto& [item, qty] : inst.aisle(a))
                available[static_cast<std::size_t>(item)] += qty;
        }

        for (std::size_t i = 0; i < n; ++i) {
            if (picked[i] > available[i]) {
                report.reason = FeasibilityReason::ItemShortage;
                report.item = static_cast<int>(i);
                report.picked = picked[i];
                report.available = available[i];
                return report;
            }
        }
        return report;
    }

    inline bool isFeasible(const Instance& inst, const Solution& sol)
    {
        return checkFeasibility(inst, sol).feasible();
    }

} // namespace wavepick
