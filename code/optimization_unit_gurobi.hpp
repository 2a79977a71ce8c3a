/**
 * optimization_unit_gurobi.hpp
 *
 * This file contains the adapter that hands a dispatch problem
 * to the native C++ interface of gurobi.
 */

#ifndef OPTIMIZATION_UNIT_GUROBI_HPP
#define OPTIMIZATION_UNIT_GUROBI_HPP

#include <memory>

#include "global.h"
#include "optimization_problem.h"
#include "optimization_unit_general.hpp"

#include "gurobi_c++.h"

class GurobiSolverAdapter : public BaseSolverAdapter {

    private:
        std::unique_ptr<GRBEnv> env; ///< The environment of this adapter, created on the first call of solve()

    public:
        RawSolution solve(const LinearProblem& problem, const SolverSettings& settings) override;
        const char* get_backend_name() const override { return "gurobi"; }

        /**
         * Maps a gurobi status code (GRB_OPTIMAL, GRB_INFEASIBLE, ...) to a SolveStatus
         */
        static SolveStatus map_status(int grb_status);

};

#endif
