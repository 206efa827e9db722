#pragma once
/*
===============================================================================
WAVEPICK — Unified Include Header
===============================================================================

OVERVIEW
--------
Single-include header for the wave picking optimizer. Including this file
provides every solver-independent component. The Gurobi backend lives in
gurobi_backend.h and is included separately, so code built against a test
backend does not need the Gurobi headers.

WHAT'S INCLUDED
---------------
• enum_utils.h      — WAVEPICK_DECLARE_ENUM with COUNT sentinel
• naming.h          — Debug-only model element names
• data_store.h      — Parameter and statistic store
• instance.h        — Orders, aisles, bounds
• solution.h        — Selected orders and visited aisles
• feasibility.h     — checkFeasibility(), checkAggregateBounds()
• objective.h       — objectiveValue(), totalUnits()
• preprocessor.h    — Derived relations and dominance pruning
• mip_backend.h     — MipBackend capability, LinExpr, SolveStatus
• model_builder.h   — ModelBuilder<VarEnum, ConEnum>
• wave_model.h      — WaveModelBuilder formulation
• greedy_fallback.h — GreedyFallback construction
• outcome.h         — FailureKind, WaveOutcome
• time_budget.h     — TimeBudget, WallClockBudget
• wave_solver.h     — WaveSolver orchestration
• instance_io.h     — Challenge text format

REQUIREMENTS
------------
• C++20 compiler
• fmt and spdlog
• Gurobi Optimizer with C++ API (gurobi_backend.h only)

CONFIGURATION
-------------
• Debug builds (WAVEPICK_DEBUG or _DEBUG defined): readable variable names
• Release builds: no symbolic names

===============================================================================
*/

#include "enum_utils.h"
#include "naming.h"
#include "data_store.h"

#include "instance.h"
#include "solution.h"
#include "feasibility.h"
#include "objective.h"
#include "preprocessor.h"

#include "mip_backend.h"
#include "model_builder.h"
#include "wave_model.h"
#include "greedy_fallback.h"

#include "outcome.h"
#include "time_budget.h"
#include "wave_solver.h"
#include "instance_io.h"
