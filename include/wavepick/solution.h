#pragma once
/*
===============================================================================
SOLUTION — A candidate wave: selected orders and visited aisles
===============================================================================

A Solution is a plain value: two ordered id sets with no structural link
between them beyond the feasibility relation checked by feasibility.h. Both
the exact solver path and the greedy fallback produce Solutions; neither
mutates one after handing it out.

Ordered sets keep output and logging deterministic across runs.

===============================================================================
*/

#include <set>
#include <utility>

namespace wavepick {

    struct Solution {
        std::set<int> orders;   ///< Selected order ids
        std::set<int> aisles;   ///< Visited aisle ids

        Solution() = default;
        Solution(std::set<int> selectedOrders, std::set<int> visitedAisles)
            : orders(std::move(selectedOrders)), aisles(std::move(visitedAisles))
        {
        }

        bool empty() const noexcept { return orders.empty() && aisles.empty(); }

        friend bool operator==(const Solution&, const Solution&) = default;
    };

} // namespace wavepick
