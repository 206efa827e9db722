#pragma once
/*
===============================================================================
TIME BUDGET — Remaining wall-clock time for a whole run
===============================================================================

All phases of a run (preprocessing, model build, solve, fallback) share one
budget. The solver asks the budget how much is left right before the solve
and passes exactly that, floored at zero, as the backend time limit.

WallClockBudget starts counting at construction, so the driver should create
it before reading the instance if input parsing is meant to count too.

===============================================================================
*/

#include <chrono>
#include <algorithm>

namespace wavepick {

    class TimeBudget {
    public:
        virtual ~TimeBudget() = default;

        /// @brief Seconds left in the run, never negative
        virtual double remainingSeconds() const = 0;
    };

    class WallClockBudget : public TimeBudget {
    public:
        using clock = std::chrono::steady_clock;

        /// Default run length of the challenge: ten minutes.
        static constexpr double kDefaultSeconds = 600.0;

        explicit WallClockBudget(double totalSeconds = kDefaultSeconds)
            : start_(clock::now()), total_(totalSeconds)
        {
        }

        double elapsedSeconds() const {
            return std::chrono::duration<double>(clock::now() - start_).count();
        }

        double remainingSeconds() const override {
            return std::max(0.0, total_ - elapsedSeconds());
        }

        double totalSeconds() const noexcept { return total_; }

    private:
        clock::time_point start_;
        double total_;
    };

} // namespace wavepick
