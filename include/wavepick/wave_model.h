#pragma once
/*
===============================================================================
WAVE MODEL — MILP formulation of wave picking
===============================================================================

MATHEMATICAL MODEL
------------------
Sets:
    O = {0..|O|-1}      orders
    A = {0..|A|-1}      aisles
    I = {0..nItems-1}   items

Parameters:
    units[o]        total units of order o
    demand[o][i]    units of item i in order o
    supply[a][i]    units of item i in aisle a
    LB, UB          wave size bounds
    w               per-aisle penalty (aislePenalty)

Variables:
    x[o] in {0,1}           order o is in the wave
    y[a] in {0,1}           aisle a is visited
    U in [0, UB] integer    total units
    K in [1, |A|] integer   aisles visited

Constraints:
    UnitsLink:   U - sum_o units[o] x[o]                     in [0, 0]
    UnitsLower:  U                                          >= LB
    UnitsUpper:  U                                          in [0, UB]
    ItemCover:   sum_a supply[a][i] y[a] - sum_o demand[o][i] x[o] >= 0   for all i
    AislesLink:  K - sum_a y[a]                              in [0, 0]

Objective:
    max  U - w K

The true goal U / K is not linear. Charging w per visited aisle is a linear
surrogate: with w on the order of nItems an extra aisle must buy more units
than it costs, which steers the solver toward dense waves. w is a parameter;
WaveSolver derives it as aislePenaltyFactor * nItems.

Extraction
----------
After a solve with an assignment, afterOptimize() reads x and y with a 0.5
threshold into a Solution (extracted()). The Solution is a candidate only;
WaveSolver hands it to checkFeasibility() before accepting it.

Time limit
----------
params.timeLimit is queried in beforeOptimize(), after the model is built,
so time spent building is not granted to the backend again.

===============================================================================
*/

#include <functional>
#include <optional>
#include <vector>
#include <utility>
#include <stdexcept>

#include "model_builder.h"
#include "naming.h"
#include "instance.h"
#include "solution.h"

namespace wavepick {

    WAVEPICK_DECLARE_ENUM(WaveVars, Order, Aisle, TotalUnits, TotalAisles);
    WAVEPICK_DECLARE_ENUM(WaveCons, UnitsLink, UnitsLower, UnitsUpper, ItemCover, AislesLink);

    struct WaveModelParams {
        double aislePenalty = 0.0;   ///< Objective weight of one visited aisle
        std::function<double()> timeLimit;   ///< Seconds granted to the backend; empty = no limit
        int threads = 0;             ///< 0 = backend default
        double mipGap = -1.0;        ///< Negative = backend default
        bool quiet = true;
    };

    /**
     * @brief Read boolean variables into an id set with the 0.5 threshold
     */
    inline std::set<int> selectedIds(const MipBackend& backend, const std::vector<Var>& vars)
    {
        std::set<int> ids;
        for (std::size_t k = 0; k < vars.size(); ++k) {
            if (backend.value(vars[k]) > 0.5)
                ids.insert(static_cast<int>(k));
        }
        return ids;
    }

    class WaveModelBuilder : public ModelBuilder<WaveVars, WaveCons> {
    private:
        const Instance& inst_;
        WaveModelParams params_;
        std::optional<Solution> extracted_;

    public:
        WaveModelBuilder(MipBackend& backend, const Instance& inst, WaveModelParams params)
            : ModelBuilder(backend), inst_(inst), params_(params)
        {
            store()["param:AislePenalty"] = params_.aislePenalty;
        }

        const Instance& instance() const noexcept { return inst_; }
        const WaveModelParams& params() const noexcept { return params_; }

        /// @brief Candidate read from the assignment; empty without one
        const std::optional<Solution>& extracted() const noexcept { return extracted_; }

    protected:
        void addVariables() override
        {
            if (inst_.numAisles() == 0)
                throw std::invalid_argument("WaveModelBuilder: instance has no aisles");

            auto& b = backend();

            variables().reserve(WaveVars::Order, static_cast<std::size_t>(inst_.numOrders()));
            for (int o = 0; o < inst_.numOrders(); ++o)
                variables().add(WaveVars::Order, b.addBoolVar(make_name::index("order", o)));

            variables().reserve(WaveVars::Aisle, static_cast<std::size_t>(inst_.numAisles()));
            for (int a = 0; a < inst_.numAisles(); ++a)
                variables().add(WaveVars::Aisle, b.addBoolVar(make_name::index("aisle", a)));

            variables().add(WaveVars::TotalUnits,
                b.addIntVar(0.0, inst_.waveSizeUB(), "total_units"));
            variables().add(WaveVars::TotalAisles,
                b.addIntVar(1.0, inst_.numAisles(), "total_aisles"));
        }

        void addConstraints() override
        {
            auto& b = backend();
            const auto& X = variables().get(WaveVars::Order);
            const auto& Y = variables().get(WaveVars::Aisle);
            const Var U = variables().var(WaveVars::TotalUnits);
            const Var K = variables().var(WaveVars::TotalAisles);

            // U == sum of selected order units
            LinExpr unitsLink(U);
            unitsLink += sum(0, inst_.numOrders(), [&](int o) {
                return LinExpr(X[static_cast<std::size_t>(o)],
                               -static_cast<double>(inst_.orderUnits(o)));
            });
            constraints().add(WaveCons::UnitsLink, b.addConstraint(unitsLink, 0.0, 0.0, "units_link"));

            constraints().add(WaveCons::UnitsLower,
                b.addConstraint(LinExpr(U), inst_.waveSizeLB(), kInfinity, "units_lower"));
            constraints().add(WaveCons::UnitsUpper,
                b.addConstraint(LinExpr(U), 0.0, inst_.waveSizeUB(), "units_upper"));

            // Per-item coefficient lists, gathered in one pass over the data.
            const auto nItems = static_cast<std::size_t>(inst_.numItems());
            std::vector<std::vector<std::pair<int, int>>> supplyOf(nItems), demandOf(nItems);
            for (int a = 0; a < inst_.numAisles(); ++a)
                for (const auto& [item, qty] : inst_.aisle(a))
                    supplyOf[static_cast<std::size_t>(item)].emplace_back(a, qty);
            for (int o = 0; o < inst_.numOrders(); ++o)
                for (const auto& [item, qty] : inst_.order(o))
                    demandOf[static_cast<std::size_t>(item)].emplace_back(o, qty);

            constraints().reserve(WaveCons::ItemCover, nItems);
            for (std::size_t i = 0; i < nItems; ++i) {
                LinExpr cover;
                for (const auto& [a, qty] : supplyOf[i])
                    cover.add(Y[static_cast<std::size_t>(a)], qty);
                for (const auto& [o, qty] : demandOf[i])
                    cover.add(X[static_cast<std::size_t>(o)], -qty);
                constraints().add(WaveCons::ItemCover,
                    b.addConstraint(cover, 0.0, kInfinity, make_name::index("item_cover", i)));
            }

            // K == number of visited aisles
            LinExpr aislesLink(K);
            for (const Var& y : Y)
                aislesLink -= y;
            constraints().add(WaveCons::AislesLink, b.addConstraint(aislesLink, 0.0, 0.0, "aisles_link"));
        }

        void addParameters() override
        {
            if (params_.threads > 0)
                threads(params_.threads);
            if (params_.mipGap >= 0.0)
                mipGapLimit(params_.mipGap);
            if (params_.quiet)
                quiet();
            else
                verbose();
        }

        void addObjective() override
        {
            LinExpr obj(variables().var(WaveVars::TotalUnits));
            obj.add(variables().var(WaveVars::TotalAisles), -params_.aislePenalty);
            maximize(obj);
        }

        void beforeOptimize() override
        {
            if (params_.timeLimit)
                timeLimit(params_.timeLimit());
        }

        void afterOptimize() override
        {
            store()["stat:status"] = statusString(status());
            store()["stat:model_vars"] = backend().numVars();
            store()["stat:model_constrs"] = backend().numConstrs();

            if (!hasSolution())
                return;

            extracted_ = Solution(
                selectedIds(backend(), variables().get(WaveVars::Order)),
                selectedIds(backend(), variables().get(WaveVars::Aisle)));

            store()["stat:selected_orders"] = static_cast<int>(extracted_->orders.size());
            store()["stat:visited_aisles"] = static_cast<int>(extracted_->aisles.size());
        }
    };

} // namespace wavepick
