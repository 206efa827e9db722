/*
================================================================================
EXAMPLE 01: SOLVE AN INSTANCE FILE - Challenge driver with Gurobi
================================================================================
DIFFICULTY: Beginner
PROBLEM TYPE: Mixed-Integer Programming (MIP) with greedy fallback

PROBLEM DESCRIPTION
-------------------
Reads a warehouse instance in the challenge text format, selects a wave of
orders and the aisles to visit, and writes the solution file. The whole run,
input parsing included, shares one ten-minute budget.

USAGE
-----
    wavepick_solve <instance.txt> <solution.txt> [seconds]

EXIT CODES
----------
    0   a verified wave was written
    1   no feasible wave was found (exact path and fallback both failed)
    2   bad arguments, unreadable instance, or unwritable output

FEATURES DEMONSTRATED
---------------------
- readInstanceFile / writeSolutionFile   Challenge text format
- WallClockBudget                        One budget for the whole run
- WaveSolver + GurobiBackend             Exact path with verified fallback
- applyPreset(Preset::Quiet)             Parameter presets
- WaveOutcome                            Source and failure reporting

================================================================================
*/

#include <iostream>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include <wavepick/wavepick.h>
#include <wavepick/gurobi_backend.h>

using namespace wavepick;

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <instance.txt> <solution.txt> [seconds]\n";
        return 2;
    }

    double seconds = WallClockBudget::kDefaultSeconds;
    if (argc > 3) {
        try {
            seconds = std::stod(argv[3]);
        } catch (const std::exception&) {
            std::cerr << "invalid time budget '" << argv[3] << "'\n";
            return 2;
        }
    }

    WallClockBudget budget(seconds);

    try {
        const Instance inst = readInstanceFile(argv[1]);

        WaveSolver solver(inst, [] { return std::make_unique<GurobiBackend>(); });
        solver.applyPreset(WaveSolver::Preset::Quiet);

        WaveOutcome out = solver.solve(budget);

        spdlog::info("Run finished after {:.1f}s: source {}, exact path {}",
            budget.elapsedSeconds(), sourceString(out.source), failureString(out.exactFailure));

        if (!out.ok()) {
            spdlog::error("No feasible wave: {}", out.detail);
            return 1;
        }

        writeSolutionFile(argv[2], *out.solution);

        std::cout << "Orders: " << out.solution->orders.size()
                  << "  Aisles: " << out.solution->aisles.size()
                  << "  Objective: " << out.objective << "\n";

    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 2;
    }

    return 0;
}
