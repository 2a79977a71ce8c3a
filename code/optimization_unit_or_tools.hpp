/**
 * optimization_unit_or_tools.hpp
 *
 * This file contains the adapter that hands a dispatch problem to
 * the MPSolver interface of Google OR-Tools.
 */

#ifndef OPTIMIZATION_UNIT_OR_TOOLS_HPP
#define OPTIMIZATION_UNIT_OR_TOOLS_HPP

#include "global.h"
#include "optimization_problem.h"
#include "optimization_unit_general.hpp"

#include "ortools/linear_solver/linear_solver.h"


/**
 * Solves a LinearProblem with an OR-Tools MPSolver backend (e.g. GLOP, CLP, SCIP, CBC, HiGHS).
 * The backend is selected by SolverSettings::solver_name.
 */
class ORToolsSolverAdapter : public BaseSolverAdapter {
    public:
        RawSolution solve(const LinearProblem& problem, const SolverSettings& settings) override;
        const char* get_backend_name() const override { return "or-tools"; }

        /**
         * Maps an MPSolver result status to a SolveStatus.
         * @param time_limited: True, if a time limit was set for the solve
         */
        static SolveStatus map_result_status(operations_research::MPSolver::ResultStatus status, bool time_limited);
};

#endif
