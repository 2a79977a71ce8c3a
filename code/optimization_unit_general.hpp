/**
 * optimization_unit_general.hpp
 *
 * This file contains all general classes / structs required
 * by the solver adapters.
 */

#ifndef OPTIMIZATION_UNIT_GENERAL_HPP
#define OPTIMIZATION_UNIT_GENERAL_HPP

#include <memory>
#include <string>
#include <vector>

#include "global.h"
#include "optimization_problem.h"


/*!
 * Outcome of a single solver call.
 */
enum struct SolveStatus : short {
    Optimal,
    Infeasible,
    Unbounded,
    Timeout, ///< Time limit reached before optimality was proven
    Error    ///< Missing backend, invalid model or abnormal termination
};

const char* solve_status_name(SolveStatus status);

/*!
 * Settings for one solver call.
 */
struct SolverSettings {
    global::SolverBackend backend = global::SolverBackend::ORTools;
    std::string solver_name = "GLOP"; ///< Name of the OR-Tools backend (ignored by Gurobi)
    double time_limit_s = 0.0;         ///< 0.0 means no limit
    double relative_mip_gap = 1e-4;    ///< Only used for problems with binary variables
};

/*!
 * Raw result of a solver call. values is only filled if status == SolveStatus::Optimal.
 */
struct RawSolution {
    SolveStatus status = SolveStatus::Error;
    std::vector<double> values; ///< Variable values in the order of LinearProblem::get_variables()
    double objective = 0.0;
    double wall_time_s = 0.0;
    std::string message;        ///< Human readable details (solver status, error text)
};


/**
 * This class represents the base class for all solver backends.
 * Every call to solve() creates its own solver instance, i.e. different
 * adapter objects can be used in parallel in different threads.
 */
class BaseSolverAdapter {
    public:
        virtual ~BaseSolverAdapter() = default;

        /**
         * Solves the given problem (minimization).
         * Solver failures are never thrown, they are reported as the status of the result.
         *
         * @param problem: The problem to solve
         * @param settings: Solver name, time limit and MIP gap
         * @return: The raw solution
         */
        virtual RawSolution solve(const LinearProblem& problem, const SolverSettings& settings) = 0;

        virtual const char* get_backend_name() const = 0;
};


/**
 * Creates a new solver adapter for the given backend.
 * @throws std::runtime_error: If the backend is not available in this build
 */
std::unique_ptr<BaseSolverAdapter> create_solver_adapter(global::SolverBackend backend);

#endif
