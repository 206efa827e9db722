/*
================================================================================
EXAMPLE 02: GREEDY FALLBACK - Wave construction without a MILP solver
================================================================================
DIFFICULTY: Beginner
PROBLEM TYPE: Constructive heuristic

PROBLEM DESCRIPTION
-------------------
A small warehouse with five orders and four aisles. The exact solver is
disabled (Preset::FallbackOnly), so the run goes through preprocessing and
the greedy construction only. The example prints the derived relations, the
greedy ranking and the verified wave, then shows what the aggregate-only
coverage policy would have returned.

An instance file in the challenge format may be given instead:

    wavepick_fallback_only [instance.txt]

FEATURES DEMONSTRATED
---------------------
- Preprocessor / Preprocessing      Eligible aisles, supply, dominance
- GreedyFallback::rank()            Efficiency ranking
- CoveragePolicy                    PerItem vs AggregateOnly
- checkFeasibility()                Independent verification
- DataStore                         Run statistics

================================================================================
*/

#include <iostream>
#include <iomanip>
#include <string>

#include <wavepick/wavepick.h>

using namespace wavepick;

// ============================================================================
// DATA
// ============================================================================
static Instance sampleInstance() {
    return Instance(
        {
            { {0, 3}, {1, 1} },   // order 0
            { {1, 1} },           // order 1 (dominated by order 0)
            { {2, 4} },           // order 2
            { {3, 2}, {1, 2} },   // order 3
            { {4, 9} }            // order 4 (no aisle stocks item 4)
        },
        {
            { {0, 4}, {1, 2} },   // aisle 0
            { {2, 5} },           // aisle 1
            { {3, 2} },           // aisle 2
            { {1, 3} }            // aisle 3
        },
        5, 8, 12);
}

static void printIds(const char* label, const std::set<int>& ids) {
    std::cout << label;
    for (int id : ids) std::cout << ' ' << id;
    std::cout << "\n";
}

int main(int argc, char** argv) {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 02: Greedy Fallback\n";
    std::cout << "================================================================\n\n";

    try {
        const Instance inst = argc > 1 ? readInstanceFile(argv[1]) : sampleInstance();

        // ====================================================================
        // PREPROCESSING
        // ====================================================================
        const Preprocessing data = Preprocessor().run(inst);

        std::cout << "PREPROCESSING\n";
        std::cout << "-------------\n";
        std::cout << "Valid orders: " << data.validOrders().size() << "/" << inst.numOrders()
                  << " (" << data.numUnsatisfiable() << " unsatisfiable, "
                  << data.numDominated() << " dominated)\n";

        if (inst.numOrders() <= 20) {
            for (int o = 0; o < inst.numOrders(); ++o) {
                std::cout << "  order " << std::setw(2) << o
                          << "  units " << std::setw(3) << inst.orderUnits(o)
                          << "  eligible aisles " << data.eligibleAisles(o).size();
                if (!data.satisfiable(o))
                    std::cout << "  [unsatisfiable]";
                else if (data.dominatedBy(o) >= 0)
                    std::cout << "  [dominated by " << data.dominatedBy(o) << "]";
                std::cout << "\n";
            }
        }

        std::cout << "Greedy ranking:";
        for (int o : GreedyFallback::rank(inst, data)) std::cout << ' ' << o;
        std::cout << "\n\n";

        // ====================================================================
        // SOLVE (fallback only)
        // ====================================================================
        WaveSolver solver(inst, BackendFactory{});
        solver.applyPreset(WaveSolver::Preset::FallbackOnly);

        WaveOutcome out = solver.solve(WallClockBudget(60.0));

        std::cout << "RESULT\n";
        std::cout << "------\n";
        std::cout << "Source: " << sourceString(out.source) << "\n";
        std::cout << "Exact path: " << failureString(out.exactFailure)
                  << " (preset " << solver.store()["param:Preset"].get<std::string>() << ")\n";
        std::cout << "Dominance skipped: "
                  << (solver.store()["stat:dominance_skipped"].get_or(false) ? "yes" : "no") << "\n";

        if (out.ok()) {
            printIds("Orders:", out.solution->orders);
            printIds("Aisles:", out.solution->aisles);
            std::cout << std::fixed << std::setprecision(3)
                      << "Objective: " << out.objective << " units per aisle\n";
        }
        else {
            std::cout << "Failure: " << failureString(out.failure) << " " << out.detail << "\n";
        }

        // ====================================================================
        // AGGREGATE-ONLY COMPARISON
        // ====================================================================
        auto loose = GreedyFallback(CoveragePolicy::AggregateOnly).run(inst, data);

        std::cout << "\nAggregate-only greedy: ";
        if (!loose) {
            std::cout << "no wave\n";
        }
        else {
            FeasibilityReport r = checkFeasibility(inst, *loose);
            std::cout << reasonString(r.reason);
            if (r.reason == FeasibilityReason::ItemShortage)
                std::cout << " (item " << r.item << ": " << r.picked << " picked, "
                          << r.available << " available)";
            std::cout << "\n";
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
