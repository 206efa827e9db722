#pragma once
/*
===============================================================================
MODEL BUILDER — Template-method orchestration over a MipBackend
===============================================================================

Overview
--------
ModelBuilder coordinates:

    * Variable creation (via VariableTable)
    * Constraint creation (via ConstraintTable)
    * Parameter assignment (time limit, threads, gap, output)
    * Objective construction
    * The solve call and post-solve extraction

It implements the "template method" pattern:

    optimize() {
        addVariables();
        addConstraints();
        addParameters();
        addObjective();
        beforeOptimize();
        backend.solve();
        afterOptimize();
    }

The builder never owns the backend. The caller creates one (GurobiBackend in
production, a test double in unit tests) and lends it for the builder's
lifetime, which keeps the formulation independent of any particular engine.

Variable and constraint groups are stored in enum-keyed tables, so derived
builders address them as vars(WaveVars::Order)[o] rather than by raw index.

Typical Usage
-------------
    WAVEPICK_DECLARE_ENUM(Vars, X);
    WAVEPICK_DECLARE_ENUM(Cons, Cap);

    class MyBuilder : public ModelBuilder<Vars, Cons> {
        using ModelBuilder::ModelBuilder;
        void addVariables() override {
            variables().add(Vars::X, backend().addBoolVar("x"));
        }
        void addObjective() override {
            maximize(LinExpr(variables().var(Vars::X, 0)));
        }
    };

    GurobiBackend gurobi;
    MyBuilder b(gurobi);
    SolveStatus s = b.optimize();

Design Notes
------------
* optimize() may run once; a second call throws std::logic_error because the
  backend already holds the model.
* Named parameter setters record their values in store() under "param:<Name>".

===============================================================================
*/

#include <array>
#include <vector>
#include <string>
#include <stdexcept>

#include <fmt/format.h>

#include "enum_utils.h"
#include "data_store.h"
#include "mip_backend.h"

namespace wavepick {

    // ============================================================================
    // HANDLE TABLES
    // ============================================================================
    /**
     * @class HandleTable
     * @brief Enum-keyed registry of variable or constraint handles
     *
     * @tparam EnumT   Enum class with COUNT sentinel
     * @tparam HandleT Var or Constr
     */
    template <typename EnumT, typename HandleT>
    class HandleTable {
    private:
        static constexpr std::size_t MAX = enum_size<EnumT>::value;
        std::array<std::vector<HandleT>, MAX> table_{};

        static std::size_t slot(EnumT key) {
            if (!is_valid_enum_value(key)) {
                throw std::out_of_range(
                    fmt::format("HandleTable: key {} >= {}", enum_index(key), MAX));
            }
            return enum_index(key);
        }

    public:
        void add(EnumT key, HandleT h) { table_[slot(key)].push_back(h); }

        void reserve(EnumT key, std::size_t n) { table_[slot(key)].reserve(n); }

        const std::vector<HandleT>& get(EnumT key) const { return table_[slot(key)]; }

        const std::vector<HandleT>& operator()(EnumT key) const { return get(key); }

        /**
         * @brief Handle at position i of group key
         * @throws std::out_of_range if i is not a valid position
         */
        HandleT at(EnumT key, std::size_t i) const {
            const auto& group = table_[slot(key)];
            if (i >= group.size()) {
                throw std::out_of_range(fmt::format(
                    "HandleTable::at: index {} >= size {} for key {}",
                    i, group.size(), enum_index(key)));
            }
            return group[i];
        }

        std::size_t size(EnumT key) const { return table_[slot(key)].size(); }

        std::size_t total() const noexcept {
            std::size_t n = 0;
            for (const auto& g : table_) n += g.size();
            return n;
        }
    };

    template <typename EnumT>
    class VariableTable : public HandleTable<EnumT, Var> {
    public:
        Var var(EnumT key, std::size_t i = 0) const { return this->at(key, i); }
    };

    template <typename EnumT>
    class ConstraintTable : public HandleTable<EnumT, Constr> {
    public:
        Constr constr(EnumT key, std::size_t i = 0) const { return this->at(key, i); }
    };

    /*
    ===============================================================================
    MODEL BUILDER TEMPLATE
    ===============================================================================
    */
    template <typename VarEnum, typename ConEnum>
    class ModelBuilder {
    public:
        using VarTable = VariableTable<VarEnum>;
        using ConTable = ConstraintTable<ConEnum>;

    private:
        MipBackend* backend_ = nullptr;
        bool optimized_ = false;
        SolveStatus status_ = SolveStatus::Other;

    protected:
        VarTable vars_;
        ConTable cons_;
        DataStore store_;

    public:
        explicit ModelBuilder(MipBackend& backend)
            : backend_(&backend)
        {
        }

        virtual ~ModelBuilder() = default;

        ModelBuilder(const ModelBuilder&) = delete;
        ModelBuilder& operator=(const ModelBuilder&) = delete;

        // -------------------------------------------------------------------------
        // Accessors
        // -------------------------------------------------------------------------

        MipBackend& backend() noexcept { return *backend_; }
        const MipBackend& backend() const noexcept { return *backend_; }

        VarTable& variables() noexcept { return vars_; }
        const VarTable& variables() const noexcept { return vars_; }

        ConTable& constraints() noexcept { return cons_; }
        const ConTable& constraints() const noexcept { return cons_; }

        DataStore& store() noexcept { return store_; }
        const DataStore& store() const noexcept { return store_; }

        // -------------------------------------------------------------------------
        // Parameter Configuration
        // -------------------------------------------------------------------------

        /**
         * @brief Set optimization time limit in seconds
         * @note Negative values are clamped to 0. Tracked in store()["param:TimeLimit"]
         */
        void timeLimit(double seconds) {
            if (seconds < 0.0) seconds = 0.0;
            backend().setTimeLimit(seconds);
            store_["param:TimeLimit"] = seconds;
        }

        /// @note Tracked in store()["param:Threads"]
        void threads(int n) {
            backend().setThreads(n);
            store_["param:Threads"] = n;
        }

        /// @note Tracked in store()["param:MIPGap"]
        void mipGapLimit(double gap) {
            backend().setMipGap(gap);
            store_["param:MIPGap"] = gap;
        }

        /// @note Tracked in store()["param:OutputFlag"]
        void quiet() {
            backend().setQuiet(true);
            store_["param:OutputFlag"] = 0;
        }

        void verbose() {
            backend().setQuiet(false);
            store_["param:OutputFlag"] = 1;
        }

        // -------------------------------------------------------------------------
        // Objective Helpers
        // -------------------------------------------------------------------------

        void minimize(const LinExpr& expr) { backend().setObjective(expr, Sense::Minimize); }
        void maximize(const LinExpr& expr) { backend().setObjective(expr, Sense::Maximize); }

        // -------------------------------------------------------------------------
        // Solution Diagnostics
        // -------------------------------------------------------------------------

        bool optimized() const noexcept { return optimized_; }

        /// @note Meaningful after optimize()
        SolveStatus status() const noexcept { return status_; }

        bool hasSolution() const noexcept { return optimized_ && isSolutionStatus(status_); }

        bool isOptimal() const noexcept { return optimized_ && status_ == SolveStatus::Optimal; }

        bool isInfeasible() const noexcept { return optimized_ && status_ == SolveStatus::Infeasible; }

        /**
         * @brief Value of v in the returned assignment
         * @throws std::logic_error if no assignment is available
         */
        double value(Var v) const {
            if (!hasSolution()) {
                throw std::logic_error(fmt::format(
                    "ModelBuilder::value: no assignment (status {})", statusString(status_)));
            }
            return backend().value(v);
        }

        // -------------------------------------------------------------------------
        // Template-method hooks for derived classes
        // -------------------------------------------------------------------------

        /// @brief Add parameters (time limit, threads, gap).
        virtual void addParameters() {}

        /// @brief Define decision variables into vars_ and the backend.
        virtual void addVariables() {}

        /// @brief Define constraints into cons_ and the backend.
        virtual void addConstraints() {}

        /// @brief Define objective function (min or max).
        virtual void addObjective() {}

        /// @brief Optional pre-solve hook.
        virtual void beforeOptimize() {}

        /// @brief Optional post-solve hook (solution extraction).
        virtual void afterOptimize() {}

        // -------------------------------------------------------------------------
        // Main orchestration
        // -------------------------------------------------------------------------

        /**
         * @brief Construct and solve the model using the template workflow.
         *
         * Steps:
         *     1. addVariables()
         *     2. addConstraints()
         *     3. addParameters()
         *     4. addObjective()
         *     5. beforeOptimize()
         *     6. backend.solve()
         *     7. afterOptimize()
         *
         * @throws std::logic_error on a second call
         */
        SolveStatus optimize()
        {
            if (optimized_)
                throw std::logic_error("ModelBuilder::optimize: model already solved");

            addVariables();
            addConstraints();
            addParameters();
            addObjective();

            beforeOptimize();
            status_ = backend().solve();
            optimized_ = true;
            afterOptimize();

            return status_;
        }
    };

} // namespace wavepick
