#pragma once
/*
===============================================================================
GUROBI BACKEND — MipBackend implementation over the Gurobi C++ API
===============================================================================

Overview
--------
Owns one GRBEnv and one GRBModel. Both are created lazily on first use:

    * GRBEnv is constructed with deferred start
    * output is silenced before start() unless verbose output was requested
    * GRBModel is created on the started environment

so constructing a GurobiBackend never touches the licence. A missing licence
surfaces as an exception from the first model call, which WaveSolver reports
as SolverUnavailable.

Errors
------
GRBException does not derive from std::exception. Every Gurobi call made by
this class goes through guarded(), which rethrows as std::runtime_error with
the Gurobi error code and message, so callers can handle a single hierarchy.

Status mapping
--------------
    GRB_OPTIMAL                                     -> Optimal
    GRB_SUBOPTIMAL                                  -> Feasible
    TIME/NODE/SOLUTION/ITERATION limit, INTERRUPTED,
    USER_OBJ_LIMIT with SolCount > 0                -> Feasible
    GRB_INFEASIBLE                                  -> Infeasible
    GRB_INF_OR_UNBD when every variable is bounded  -> Infeasible
    everything else (incl. UNBOUNDED)               -> Other

Presolve with the default DualReductions reports many infeasible MIPs as
INF_OR_UNBD. A model whose variables all have finite bounds cannot be
unbounded, so for such a model the status means infeasible. The wave model
is one of them.

===============================================================================
*/

#include <memory>
#include <string>
#include <vector>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "gurobi_c++.h"

#include "mip_backend.h"

namespace wavepick {

    /**
     * @brief Convert Gurobi status code to human-readable string
     */
    inline std::string gurobiStatusString(int status) {
        switch (status) {
            case GRB_LOADED:          return "LOADED";
            case GRB_OPTIMAL:         return "OPTIMAL";
            case GRB_INFEASIBLE:      return "INFEASIBLE";
            case GRB_INF_OR_UNBD:     return "INF_OR_UNBD";
            case GRB_UNBOUNDED:       return "UNBOUNDED";
            case GRB_CUTOFF:          return "CUTOFF";
            case GRB_ITERATION_LIMIT: return "ITERATION_LIMIT";
            case GRB_NODE_LIMIT:      return "NODE_LIMIT";
            case GRB_TIME_LIMIT:      return "TIME_LIMIT";
            case GRB_SOLUTION_LIMIT:  return "SOLUTION_LIMIT";
            case GRB_INTERRUPTED:     return "INTERRUPTED";
            case GRB_NUMERIC:         return "NUMERIC";
            case GRB_SUBOPTIMAL:      return "SUBOPTIMAL";
            case GRB_INPROGRESS:      return "INPROGRESS";
            case GRB_USER_OBJ_LIMIT:  return "USER_OBJ_LIMIT";
            default:                  return "UNKNOWN(" + std::to_string(status) + ")";
        }
    }

    /**
     * @brief Map a Gurobi status plus solution count to SolveStatus
     * @param boundedModel every variable has finite bounds
     */
    inline SolveStatus mapGurobiStatus(int status, int solutionCount, bool boundedModel = true) noexcept {
        switch (status) {
            case GRB_OPTIMAL:
                return SolveStatus::Optimal;
            case GRB_SUBOPTIMAL:
                return SolveStatus::Feasible;
            case GRB_INFEASIBLE:
                return SolveStatus::Infeasible;
            case GRB_INF_OR_UNBD:
                return boundedModel ? SolveStatus::Infeasible : SolveStatus::Other;
            case GRB_TIME_LIMIT:
            case GRB_NODE_LIMIT:
            case GRB_SOLUTION_LIMIT:
            case GRB_ITERATION_LIMIT:
            case GRB_INTERRUPTED:
            case GRB_USER_OBJ_LIMIT:
                return solutionCount > 0 ? SolveStatus::Feasible : SolveStatus::Other;
            default:
                return SolveStatus::Other;
        }
    }

    class GurobiBackend : public MipBackend {
    private:
        std::unique_ptr<GRBEnv>   env_;
        std::unique_ptr<GRBModel> model_;
        std::vector<GRBVar>    vars_;
        std::vector<GRBConstr> constrs_;

        bool quiet_ = true;
        bool bounded_ = true;
        int  grbStatus_ = GRB_LOADED;

        template <typename F>
        static decltype(auto) guarded(const char* what, F&& f)
        {
            try {
                return f();
            }
            catch (const GRBException& e) {
                throw std::runtime_error(fmt::format(
                    "GurobiBackend::{}: Gurobi error {}: {}", what, e.getErrorCode(), e.getMessage()));
            }
        }

        GRBModel& model()
        {
            if (!model_) {
                guarded("initialize", [&] {
                    env_ = std::make_unique<GRBEnv>(true);  // defer licence check
                    env_->set(GRB_IntParam_OutputFlag, quiet_ ? 0 : 1);
                    env_->start();
                    model_ = std::make_unique<GRBModel>(*env_);
                });
            }
            return *model_;
        }

        const GRBVar& grbVar(Var v) const
        {
            if (v.index < 0 || static_cast<std::size_t>(v.index) >= vars_.size())
                throw std::out_of_range(fmt::format("GurobiBackend: unknown variable {}", v.index));
            return vars_[static_cast<std::size_t>(v.index)];
        }

        GRBLinExpr toGurobi(const LinExpr& expr) const
        {
            GRBLinExpr out;
            for (const auto& [v, coef] : expr.terms())
                out += coef * grbVar(v);
            return out;
        }

        static double toGurobiBound(double b) noexcept
        {
            if (b >= kInfinity) return GRB_INFINITY;
            if (b <= -kInfinity) return -GRB_INFINITY;
            return b;
        }

        Var addVar(double lb, double ub, char type, const std::string& name)
        {
            GRBVar v = guarded("addVar", [&] {
                return model().addVar(toGurobiBound(lb), toGurobiBound(ub), 0.0, type, name);
            });
            vars_.push_back(v);
            if (lb <= -kInfinity || ub >= kInfinity)
                bounded_ = false;
            return Var{ static_cast<int>(vars_.size()) - 1 };
        }

    public:
        GurobiBackend() = default;

        std::string name() const override { return "gurobi"; }

        Var addBoolVar(const std::string& name) override
        {
            return addVar(0.0, 1.0, GRB_BINARY, name);
        }

        Var addIntVar(double lb, double ub, const std::string& name) override
        {
            if (lb > ub)
                throw std::invalid_argument(fmt::format(
                    "GurobiBackend::addIntVar: empty domain [{}, {}] for '{}'", lb, ub, name));
            return addVar(lb, ub, GRB_INTEGER, name);
        }

        Constr addConstraint(const LinExpr& expr, double lb, double ub,
                             const std::string& name) override
        {
            if (lb > ub)
                throw std::invalid_argument(fmt::format(
                    "GurobiBackend::addConstraint: empty range [{}, {}] for '{}'", lb, ub, name));

            GRBLinExpr e = toGurobi(expr);
            GRBConstr c = guarded("addConstraint", [&] {
                if (lb == ub)
                    return model().addConstr(e, GRB_EQUAL, lb, name);
                if (lb <= -kInfinity)
                    return model().addConstr(e, GRB_LESS_EQUAL, ub, name);
                if (ub >= kInfinity)
                    return model().addConstr(e, GRB_GREATER_EQUAL, lb, name);
                return model().addRange(e, lb, ub, name);
            });
            constrs_.push_back(c);
            return Constr{ static_cast<int>(constrs_.size()) - 1 };
        }

        void setObjective(const LinExpr& expr, Sense sense) override
        {
            GRBLinExpr e = toGurobi(expr);
            guarded("setObjective", [&] {
                model().setObjective(e, sense == Sense::Maximize ? GRB_MAXIMIZE : GRB_MINIMIZE);
            });
        }

        void setTimeLimit(double seconds) override
        {
            guarded("setTimeLimit", [&] { model().set(GRB_DoubleParam_TimeLimit, seconds); });
        }

        void setThreads(int n) override
        {
            guarded("setThreads", [&] { model().set(GRB_IntParam_Threads, n); });
        }

        void setMipGap(double gap) override
        {
            guarded("setMipGap", [&] { model().set(GRB_DoubleParam_MIPGap, gap); });
        }

        void setQuiet(bool quiet) override
        {
            quiet_ = quiet;
            if (model_)
                guarded("setQuiet", [&] { model_->set(GRB_IntParam_OutputFlag, quiet ? 0 : 1); });
        }

        SolveStatus solve() override
        {
            return guarded("solve", [&] {
                GRBModel& m = model();
                m.optimize();
                grbStatus_ = m.get(GRB_IntAttr_Status);
                return mapGurobiStatus(grbStatus_, m.get(GRB_IntAttr_SolCount), bounded_);
            });
        }

        bool timeLimitReached() const override { return grbStatus_ == GRB_TIME_LIMIT; }

        std::string statusDetail() const override { return gurobiStatusString(grbStatus_); }

        double value(Var v) const override
        {
            GRBVar g = grbVar(v);
            return guarded("value", [&] { return g.get(GRB_DoubleAttr_X); });
        }

        int numVars() const override { return static_cast<int>(vars_.size()); }
        int numConstrs() const override { return static_cast<int>(constrs_.size()); }

        /// @brief Raw Gurobi status code of the last solve()
        int gurobiStatus() const noexcept { return grbStatus_; }
    };

} // namespace wavepick
