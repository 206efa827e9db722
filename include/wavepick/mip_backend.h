#pragma once
/*
===============================================================================
MIP BACKEND — Swappable mixed-integer programming capability
===============================================================================

Overview
--------
The wave formulation needs only a small slice of what a MILP engine offers:

    * boolean variables
    * bounded integer variables
    * ranged linear constraints      lb <= expr <= ub
    * a linear objective with a sense
    * a wall-clock time limit
    * solve() returning OPTIMAL / FEASIBLE / INFEASIBLE / OTHER
    * per-variable values of the returned assignment

MipBackend is that slice as an abstract class. GurobiBackend implements it on
top of the Gurobi C++ API; unit tests implement it with scripted or
enumerating backends, so the model and the orchestration can be exercised
without a solver licence.

Handles
-------
Var and Constr are plain indices into the backend that created them. They
carry no pointer to the backend and must not be mixed across backends.

Infinite bounds use kInfinity; backends translate it to their own constant.

Typical Usage
-------------
    Var x = backend.addBoolVar("x");
    Var t = backend.addIntVar(0, 10, "t");

    LinExpr link;
    link += t;
    link.add(x, -5.0);
    backend.addConstraint(link, 0.0, 0.0, "link");   // t == 5x

    backend.setObjective(LinExpr(t), Sense::Maximize);
    backend.setTimeLimit(30.0);

    if (isSolutionStatus(backend.solve()))
        use(backend.value(x));

===============================================================================
*/

#include <string>
#include <vector>
#include <utility>
#include <limits>

namespace wavepick {

    inline constexpr double kInfinity = std::numeric_limits<double>::infinity();

    enum class Sense { Minimize, Maximize };

    /// Timeouts, unboundedness and backend errors all collapse into Other.
    enum class SolveStatus { Optimal, Feasible, Infeasible, Other };

    inline std::string statusString(SolveStatus s) {
        switch (s) {
            case SolveStatus::Optimal:    return "OPTIMAL";
            case SolveStatus::Feasible:   return "FEASIBLE";
            case SolveStatus::Infeasible: return "INFEASIBLE";
            case SolveStatus::Other:      return "OTHER";
        }
        return "UNKNOWN";
    }

    /// @brief True if the status comes with a usable assignment
    constexpr bool isSolutionStatus(SolveStatus s) noexcept {
        return s == SolveStatus::Optimal || s == SolveStatus::Feasible;
    }

    struct Var {
        int index = -1;
        bool valid() const noexcept { return index >= 0; }
        friend bool operator==(Var, Var) = default;
    };

    struct Constr {
        int index = -1;
        bool valid() const noexcept { return index >= 0; }
        friend bool operator==(Constr, Constr) = default;
    };

    // ============================================================================
    // LINEAR EXPRESSION
    // ============================================================================
    /**
     * @class LinExpr
     * @brief Sparse list of (variable, coefficient) terms
     *
     * @details Terms are kept in insertion order and are not merged; a
     *          variable added twice contributes the sum of its coefficients.
     *          Backends receive the list as is.
     */
    class LinExpr {
    public:
        using Term = std::pair<Var, double>;

    private:
        std::vector<Term> terms_;

    public:
        LinExpr() = default;
        explicit LinExpr(Var v, double coef = 1.0) { add(v, coef); }

        LinExpr& add(Var v, double coef) {
            terms_.emplace_back(v, coef);
            return *this;
        }

        LinExpr& operator+=(Var v) { return add(v, 1.0); }
        LinExpr& operator-=(Var v) { return add(v, -1.0); }

        LinExpr& operator+=(const LinExpr& other) {
            terms_.insert(terms_.end(), other.terms_.begin(), other.terms_.end());
            return *this;
        }

        const std::vector<Term>& terms() const noexcept { return terms_; }
        std::size_t size() const noexcept { return terms_.size(); }
        bool empty() const noexcept { return terms_.empty(); }

        /// @brief Coefficient of v summed over all its terms
        double coefficient(Var v) const noexcept {
            double c = 0.0;
            for (const auto& [var, coef] : terms_)
                if (var == v) c += coef;
            return c;
        }

        /// @brief Evaluate against a dense value vector indexed by Var::index
        double evaluate(const std::vector<double>& values) const {
            double total = 0.0;
            for (const auto& [var, coef] : terms_)
                total += coef * values.at(static_cast<std::size_t>(var.index));
            return total;
        }
    };

    /**
     * @brief Sum of f(i) over i in [first, last)
     *
     * @example
     *     auto expr = sum(0, n, [&](int o) { return LinExpr(X[o], units[o]); });
     */
    template <typename Func>
    LinExpr sum(int first, int last, Func&& f) {
        LinExpr expr;
        for (int i = first; i < last; ++i)
            expr += f(i);
        return expr;
    }

    // ============================================================================
    // BACKEND INTERFACE
    // ============================================================================
    class MipBackend {
    public:
        virtual ~MipBackend() = default;

        /// @brief Human-readable backend name for logs ("gurobi", "scripted", ...)
        virtual std::string name() const = 0;

        virtual Var addBoolVar(const std::string& name) = 0;

        /// @throws std::invalid_argument if lb > ub
        virtual Var addIntVar(double lb, double ub, const std::string& name) = 0;

        /**
         * @brief Add lb <= expr <= ub
         *
         * @details lb == ub gives an equality; use -kInfinity / kInfinity for a
         *          one-sided constraint.
         */
        virtual Constr addConstraint(const LinExpr& expr, double lb, double ub,
                                     const std::string& name) = 0;

        virtual void setObjective(const LinExpr& expr, Sense sense) = 0;

        /// @param seconds Wall-clock limit; 0 asks the backend to stop immediately
        virtual void setTimeLimit(double seconds) = 0;

        /// @param n Worker threads for the backend's own search (0 = automatic)
        virtual void setThreads(int n) { (void)n; }

        virtual void setMipGap(double gap) { (void)gap; }

        virtual void setQuiet(bool quiet) { (void)quiet; }

        virtual SolveStatus solve() = 0;

        /// @brief True if the last solve() stopped on its time limit
        virtual bool timeLimitReached() const = 0;

        /// @brief Backend-specific status of the last solve() ("TIME_LIMIT", ...)
        virtual std::string statusDetail() const = 0;

        /// @pre The last solve() returned Optimal or Feasible
        virtual double value(Var v) const = 0;

        virtual int numVars() const = 0;
        virtual int numConstrs() const = 0;
    };

    /**
     * @brief Brief summary string like "12 vars, 9 constrs (gurobi)"
     */
    inline std::string modelSummary(const MipBackend& backend) {
        return std::to_string(backend.numVars()) + " vars, " +
               std::to_string(backend.numConstrs()) + " constrs (" +
               backend.name() + ")";
    }

} // namespace wavepick
