#pragma once
/*
===============================================================================
WAVE SOLVER — One complete run: exact path, verification, fallback
===============================================================================

Overview
--------
    Instance
      -> Preprocessor                 (fresh Preprocessing per run)
      -> WaveModelBuilder + backend   (time limit = remaining budget)
      -> extraction (x, y > 0.5)
      -> checkFeasibility             accept as EXACT_SOLVER
      -> otherwise GreedyFallback     over validOrders
      -> checkFeasibility             accept as GREEDY_FALLBACK
      -> otherwise FallbackExhausted

solve() does not throw. Exceptions from the backend factory, the model
builder or the backend, of any type, are logged and reported as
SolverUnavailable, then the fallback runs. An exception escaping the
fallback itself is reported as FallbackExhausted.

The backend time limit is read from the budget after the model is built,
right before the backend solves.

Configuration
-------------
Named setters record their value in store() under "param:<Name>":

    timeLimit(s)              cap on the backend time limit (default: none)
    aislePenaltyFactor(f)     objective weight per aisle = f * nItems (1.1)
    dominanceOrderLimit(n)    skip dominance above n orders (20000)
    upperBoundCap(u)          greedy cap on running units (default: UB)
    coveragePolicy(p)         greedy coverage check (PerItem)
    threads(n), mipGapLimit(g), quiet(), verbose()
    skipExactSolver(b)        go straight to the fallback

Presets bundle these (Fast, Accurate, Quiet, FallbackOnly). Run statistics
are recorded under "stat:<name>".

Typical Usage
-------------
    WallClockBudget budget(600.0);
    Instance inst = readInstanceFile(path);

    WaveSolver solver(inst, [] { return std::make_unique<GurobiBackend>(); });
    solver.applyPreset(WaveSolver::Preset::Quiet);

    WaveOutcome out = solver.solve(budget);
    if (out.ok())
        writeSolution(std::cout, *out.solution);

===============================================================================
*/

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <exception>
#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "instance.h"
#include "solution.h"
#include "data_store.h"
#include "mip_backend.h"
#include "naming.h"
#include "wave_model.h"
#include "preprocessor.h"
#include "greedy_fallback.h"
#include "feasibility.h"
#include "objective.h"
#include "outcome.h"
#include "time_budget.h"

namespace wavepick {

    /// Creates a fresh backend per run; may return nullptr or throw.
    using BackendFactory = std::function<std::unique_ptr<MipBackend>()>;

    class WaveSolver {
    public:
        enum class Preset {
            Fast,         ///< 60 s solver cap, 5% gap
            Accurate,     ///< 0.01% gap, no cap beyond the run budget
            Quiet,        ///< Suppress backend output
            FallbackOnly  ///< Skip the exact solver
        };

    private:
        const Instance& inst_;
        BackendFactory factory_;
        std::shared_ptr<spdlog::logger> logger_;
        DataStore store_;

        double timeLimit_ = -1.0;
        double aislePenaltyFactor_ = 1.1;
        int dominanceOrderLimit_ = 20000;
        Units upperBoundCap_ = -1;
        CoveragePolicy coverage_ = CoveragePolicy::PerItem;
        int threads_ = 0;
        double mipGap_ = -1.0;
        bool quiet_ = true;
        bool skipExact_ = false;

        struct ExactAttempt {
            std::optional<Solution> solution;
            FailureKind failure = FailureKind::None;
            std::optional<SolveStatus> status;
            std::optional<FeasibilityReport> rejection;
            std::string detail;
        };

    public:
        WaveSolver(const Instance& inst, BackendFactory factory)
            : inst_(inst), factory_(std::move(factory)), logger_(spdlog::default_logger())
        {
        }

        void setLogger(std::shared_ptr<spdlog::logger> logger) { logger_ = std::move(logger); }

        DataStore& store() noexcept { return store_; }
        const DataStore& store() const noexcept { return store_; }

        const Instance& instance() const noexcept { return inst_; }

        // -------------------------------------------------------------------------
        // Parameter Configuration
        // -------------------------------------------------------------------------

        /**
         * @brief Cap on the time granted to the backend, in seconds
         * @note The backend never gets more than the run budget has left.
         */
        void timeLimit(double seconds) {
            timeLimit_ = seconds;
            store_["param:TimeLimit"] = seconds;
        }

        /**
         * @brief Objective weight of one visited aisle, as a multiple of nItems
         * @throws std::invalid_argument if factor is negative
         */
        void aislePenaltyFactor(double factor) {
            if (factor < 0.0)
                throw std::invalid_argument(
                    fmt::format("WaveSolver::aislePenaltyFactor: negative factor {}", factor));
            aislePenaltyFactor_ = factor;
            store_["param:AislePenaltyFactor"] = factor;
        }

        void dominanceOrderLimit(int n) {
            dominanceOrderLimit_ = n;
            store_["param:DominanceOrderLimit"] = n;
        }

        void upperBoundCap(Units cap) {
            upperBoundCap_ = cap;
            store_["param:UpperBoundCap"] = cap;
        }

        void coveragePolicy(CoveragePolicy p) {
            coverage_ = p;
            store_["param:CoveragePolicy"] = coveragePolicyString(p);
        }

        void threads(int n) {
            threads_ = n;
            store_["param:Threads"] = n;
        }

        void mipGapLimit(double gap) {
            mipGap_ = gap;
            store_["param:MIPGap"] = gap;
        }

        void quiet() {
            quiet_ = true;
            store_["param:OutputFlag"] = 0;
        }

        void verbose() {
            quiet_ = false;
            store_["param:OutputFlag"] = 1;
        }

        void skipExactSolver(bool skip) {
            skipExact_ = skip;
            store_["param:SkipExactSolver"] = skip;
        }

        /// @brief Per-aisle objective weight for this instance
        double aislePenalty() const noexcept {
            return aislePenaltyFactor_ * static_cast<double>(inst_.numItems());
        }

        /**
         * @brief Apply a predefined parameter configuration
         * @note Preset name is tracked in store()["param:Preset"]
         */
        void applyPreset(Preset p) {
            switch (p) {
                case Preset::Fast:
                    timeLimit(60.0);
                    mipGapLimit(0.05);
                    store_["param:Preset"] = std::string("Fast");
                    break;

                case Preset::Accurate:
                    mipGapLimit(0.0001);
                    store_["param:Preset"] = std::string("Accurate");
                    break;

                case Preset::Quiet:
                    quiet();
                    store_["param:Preset"] = std::string("Quiet");
                    break;

                case Preset::FallbackOnly:
                    skipExactSolver(true);
                    store_["param:Preset"] = std::string("FallbackOnly");
                    break;
            }
        }

        // -------------------------------------------------------------------------
        // Run
        // -------------------------------------------------------------------------

        WaveOutcome solve(const TimeBudget& budget)
        {
            WaveOutcome out;
            try {
                logger_->info("Solving wave: {} orders, {} aisles, {} items, bounds [{}, {}]",
                    inst_.numOrders(), inst_.numAisles(), inst_.numItems(),
                    inst_.waveSizeLB(), inst_.waveSizeUB());

                Preprocessor pre(dominanceOrderLimit_);
                const Preprocessing data = pre.run(inst_);
                recordPreprocessing(data);

                ExactAttempt exact = runExact(budget);
                out.solverStatus = exact.status;
                out.rejection = exact.rejection;

                if (exact.solution) {
                    return accept(std::move(out), std::move(*exact.solution),
                                  SolutionSource::ExactSolver);
                }

                out.exactFailure = exact.failure;
                out.detail = exact.detail;
                logger_->warn("Exact path failed ({}: {}), using greedy fallback",
                    failureString(exact.failure), exact.detail);

                return runFallback(std::move(out), data);
            }
            catch (const std::exception& e) {
                return aborted(std::move(out), e.what());
            }
            catch (...) {
                return aborted(std::move(out), "unknown exception");
            }
        }

    private:
        WaveOutcome aborted(WaveOutcome out, const std::string& what)
        {
            logger_->error("Wave run aborted: {}", what);
            out.solution.reset();
            out.source = SolutionSource::None;
            out.failure = FailureKind::FallbackExhausted;
            out.detail = what;
            return out;
        }

        void recordPreprocessing(const Preprocessing& data)
        {
            store_["stat:valid_orders"] = static_cast<int>(data.validOrders().size());
            store_["stat:unsatisfiable_orders"] = data.numUnsatisfiable();
            store_["stat:dominated_orders"] = data.numDominated();
            store_["stat:dominance_skipped"] = data.dominanceSkipped();

            if (data.dominanceSkipped()) {
                logger_->warn("Dominance skipped: {} orders exceed limit {}",
                    inst_.numOrders(), dominanceOrderLimit_);
            }
            logger_->info("Valid orders after preprocessing: {}/{} ({} unsatisfiable, {} dominated)",
                data.validOrders().size(), inst_.numOrders(),
                data.numUnsatisfiable(), data.numDominated());
        }

        double solverTimeLimit(const TimeBudget& budget) const
        {
            double seconds = std::max(0.0, budget.remainingSeconds());
            if (timeLimit_ >= 0.0)
                seconds = std::min(seconds, timeLimit_);
            return seconds;
        }

        ExactAttempt runExact(const TimeBudget& budget)
        {
            ExactAttempt attempt;

            if (skipExact_) {
                attempt.failure = FailureKind::SolverUnavailable;
                attempt.detail = "exact solver disabled";
                return attempt;
            }
            if (!factory_) {
                attempt.failure = FailureKind::SolverUnavailable;
                attempt.detail = "no backend configured";
                return attempt;
            }

            try {
                std::unique_ptr<MipBackend> backend = factory_();
                if (!backend) {
                    attempt.failure = FailureKind::SolverUnavailable;
                    attempt.detail = "backend factory returned no backend";
                    return attempt;
                }

                WaveModelParams params;
                params.aislePenalty = aislePenalty();
                double grantedSeconds = -1.0;
                params.timeLimit = [this, &budget, &grantedSeconds] {
                    grantedSeconds = solverTimeLimit(budget);
                    return grantedSeconds;
                };
                params.threads = threads_;
                params.mipGap = mipGap_;
                params.quiet = quiet_;

                WaveModelBuilder builder(*backend, inst_, params);
                logger_->debug("Solving with {} (aisle penalty {})",
                    backend->name(), params.aislePenalty);

                const SolveStatus status = builder.optimize();
                attempt.status = status;
                store_["stat:time_limit"] = grantedSeconds;
                store_["stat:solver_status"] = statusString(status);
                store_["stat:solver_detail"] = backend->statusDetail();
                logger_->info("Solver {} finished: {} ({}), {}", backend->name(),
                    statusString(status), backend->statusDetail(), modelSummary(*backend));

                attempt.failure = classifyStatus(status, backend->timeLimitReached());
                if (attempt.failure != FailureKind::None) {
                    attempt.detail = backend->statusDetail();
                    return attempt;
                }

                const Solution& candidate = *builder.extracted();
                FeasibilityReport report = checkFeasibility(inst_, candidate);
                if (!report) {
                    if (report.reason == FeasibilityReason::ItemShortage) {
                        const std::string cover = force_name::index("item_cover", report.item);
                        store_["stat:violated_constraint"] = cover;
                        logger_->warn("Solver assignment violates {}: {} units picked, {} available",
                            cover, report.picked, report.available);
                    }
                    attempt.failure = FailureKind::SolverResultRejected;
                    attempt.rejection = report;
                    attempt.detail = reasonString(report.reason);
                    return attempt;
                }

                attempt.solution = candidate;
                return attempt;
            }
            catch (const std::exception& e) {
                logger_->error("Exact path error: {}", e.what());
                attempt.failure = FailureKind::SolverUnavailable;
                attempt.detail = e.what();
                return attempt;
            }
            catch (...) {
                logger_->error("Exact path error: unknown exception");
                attempt.failure = FailureKind::SolverUnavailable;
                attempt.detail = "unknown exception";
                return attempt;
            }
        }

        WaveOutcome runFallback(WaveOutcome out, const Preprocessing& data)
        {
            GreedyFallback greedy(coverage_);
            greedy.upperBoundCap(upperBoundCap_);

            std::optional<Solution> wave = greedy.run(inst_, data);
            if (!wave) {
                logger_->warn("Greedy fallback could not reach the lower bound {}", inst_.waveSizeLB());
                out.failure = FailureKind::FallbackExhausted;
                return out;
            }

            FeasibilityReport report = checkFeasibility(inst_, *wave);
            if (!report) {
                logger_->warn("Greedy wave rejected: {}", reasonString(report.reason));
                out.failure = FailureKind::FallbackExhausted;
                out.detail = reasonString(report.reason);
                return out;
            }

            return accept(std::move(out), std::move(*wave), SolutionSource::GreedyFallback);
        }

        WaveOutcome accept(WaveOutcome out, Solution sol, SolutionSource source)
        {
            out.objective = objectiveValue(inst_, sol);
            out.source = source;
            out.failure = FailureKind::None;

            store_["stat:objective"] = out.objective;
            store_["stat:source"] = sourceString(source);

            logger_->info("Wave from {}: {} orders, {} aisles, objective {:.4f}",
                sourceString(source), sol.orders.size(), sol.aisles.size(), out.objective);

            out.solution = std::move(sol);
            return out;
        }
    };

} // namespace wavepick
