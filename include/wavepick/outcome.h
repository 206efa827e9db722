#pragma once
/*
===============================================================================
OUTCOME — What a run returns instead of throwing
===============================================================================

Failure taxonomy
----------------
    SolverUnavailable         no backend, backend creation failed, the model
                              could not be built, or the exact path threw
    SolverTimeoutNoIncumbent  time limit reached without an assignment
    SolverAborted             other non-terminal stop without an assignment
                              (unbounded, numeric trouble, interrupted)
    SolverInfeasibleDomain    the backend proved the model infeasible
    SolverResultRejected      the backend returned an assignment that
                              checkFeasibility() rejects
    FallbackExhausted         the greedy fallback found no feasible wave

Every exact-path failure routes to the greedy fallback. A WaveOutcome holds a
Solution only when that Solution passed checkFeasibility(); otherwise the
caller gets failure == FallbackExhausted and decides whether to retry, relax
the bounds or abort.

===============================================================================
*/

#include <optional>
#include <string>

#include "solution.h"
#include "mip_backend.h"
#include "feasibility.h"

namespace wavepick {

    enum class FailureKind {
        None,
        SolverUnavailable,
        SolverTimeoutNoIncumbent,
        SolverAborted,
        SolverInfeasibleDomain,
        SolverResultRejected,
        FallbackExhausted
    };

    inline std::string failureString(FailureKind f) {
        switch (f) {
            case FailureKind::None:                     return "NONE";
            case FailureKind::SolverUnavailable:        return "SOLVER_UNAVAILABLE";
            case FailureKind::SolverTimeoutNoIncumbent: return "SOLVER_TIMEOUT_NO_INCUMBENT";
            case FailureKind::SolverAborted:            return "SOLVER_ABORTED";
            case FailureKind::SolverInfeasibleDomain:   return "SOLVER_INFEASIBLE_DOMAIN";
            case FailureKind::SolverResultRejected:     return "SOLVER_RESULT_REJECTED";
            case FailureKind::FallbackExhausted:        return "FALLBACK_EXHAUSTED";
        }
        return "UNKNOWN";
    }

    enum class SolutionSource { None, ExactSolver, GreedyFallback };

    inline std::string sourceString(SolutionSource s) {
        switch (s) {
            case SolutionSource::None:           return "NONE";
            case SolutionSource::ExactSolver:    return "EXACT_SOLVER";
            case SolutionSource::GreedyFallback: return "GREEDY_FALLBACK";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Failure implied by a backend status that carries no assignment
     *
     * @return None for Optimal/Feasible; the caller still has to check the
     *         extracted Solution.
     */
    constexpr FailureKind classifyStatus(SolveStatus status, bool timeLimitReached) noexcept {
        switch (status) {
            case SolveStatus::Optimal:
            case SolveStatus::Feasible:
                return FailureKind::None;
            case SolveStatus::Infeasible:
                return FailureKind::SolverInfeasibleDomain;
            case SolveStatus::Other:
                break;
        }
        return timeLimitReached ? FailureKind::SolverTimeoutNoIncumbent : FailureKind::SolverAborted;
    }

    struct WaveOutcome {
        std::optional<Solution> solution;
        SolutionSource source = SolutionSource::None;

        FailureKind exactFailure = FailureKind::None;   ///< Why the exact path was not used
        FailureKind failure = FailureKind::None;        ///< None iff solution is present

        std::optional<SolveStatus> solverStatus;        ///< Unset if solve() never ran
        std::optional<FeasibilityReport> rejection;     ///< Set for SolverResultRejected

        double objective = 0.0;
        std::string detail;

        bool ok() const noexcept { return solution.has_value(); }
    };

} // namespace wavepick
