#pragma once
/*
===============================================================================
OBJECTIVE — Reporting metric for a wave
===============================================================================

    objective = units picked by the selected orders / number of visited aisles

This is the quantity the run is judged on. It is not linear, so the MILP
optimizes a linear surrogate instead (see wave_model.h); this header only
reports the true ratio for any Solution, whichever path produced it.

===============================================================================
*/

#include "instance.h"
#include "solution.h"

namespace wavepick {

    /**
     * @brief Units demanded by a set of orders
     * @throws std::out_of_range if an id is not an order of inst
     */
    template <typename OrderIds>
    Units totalUnits(const Instance& inst, const OrderIds& orders)
    {
        Units sum = 0;
        for (int o : orders)
            sum += inst.orderUnits(o);
        return sum;
    }

    /**
     * @brief Units picked per visited aisle; 0 when either set is empty
     */
    inline double objectiveValue(const Instance& inst, const Solution& sol)
    {
        if (sol.orders.empty() || sol.aisles.empty())
            return 0.0;

        return static_cast<double>(totalUnits(inst, sol.orders)) /
               static_cast<double>(sol.aisles.size());
    }

} // namespace wavepick
