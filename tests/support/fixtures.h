#pragma once
/*
===============================================================================
FIXTURES — Small instances shared by the test suites
===============================================================================
*/

#include <memory>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>

#include <wavepick/instance.h>
#include <wavepick/time_budget.h>

namespace wavepick::testing {

    /// Two orders, two aisles, each order served by exactly one aisle.
    /// Best wave: both orders, both aisles, 9 units, objective 4.5.
    inline Instance exampleOne()
    {
        return Instance(
            { { {0, 3}, {1, 2} },     // order 0: 5 units
              { {2, 4} } },           // order 1: 4 units
            { { {0, 3}, {1, 2} },     // aisle 0
              { {2, 4} } },           // aisle 1
            3, 5, 10);
    }

    /// Order 0 demands item 1, which no aisle stocks. Order 1 alone is
    /// below the lower bound, so no wave exists.
    inline Instance exampleTwo()
    {
        return Instance(
            { { {1, 6} },             // order 0: unsatisfiable
              { {0, 2} } },           // order 1: 2 units
            { { {0, 5} } },           // aisle 0
            2, 5, 10);
    }

    /// Each order is coverable alone, together they need 6 units of item 0
    /// while only 4 exist. Greedy ranks order 1 first, then order 0.
    inline Instance coverageGap()
    {
        return Instance(
            { { {0, 3}, {1, 1} },     // order 0: 4 units, eligible {0, 1}
              { {0, 3} } },           // order 1: 3 units, eligible {0}
            { { {0, 4} },             // aisle 0
              { {1, 1} } },           // aisle 1
            2, 7, 10);
    }

    /// Order 1 dominates order 0; order 2 lives in its own aisle.
    inline Instance dominance()
    {
        return Instance(
            { { {0, 2} },             // order 0: dominated by 1
              { {0, 3}, {1, 1} },     // order 1
              { {2, 4} } },           // order 2
            { { {0, 10}, {1, 10} },   // aisle 0
              { {2, 10} } },          // aisle 1
            3, 1, 100);
    }

    /// Fixed remaining time, for reproducible time limits.
    class FixedBudget : public TimeBudget {
    public:
        explicit FixedBudget(double seconds) : seconds_(seconds) {}
        double remainingSeconds() const override { return seconds_; }
    private:
        double seconds_;
    };

    inline std::shared_ptr<spdlog::logger> silentLogger()
    {
        return std::make_shared<spdlog::logger>("test",
            std::make_shared<spdlog::sinks::null_sink_mt>());
    }

} // namespace wavepick::testing
