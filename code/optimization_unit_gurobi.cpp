#include "optimization_unit_gurobi.hpp"

#include <cmath>
#include <iostream>
#include <memory>
#include <sstream>
#include <vector>

#include "optimization_problem.h"
#include "optimization_unit_general.hpp"

#include "gurobi_c++.h"

using namespace std;


SolveStatus GurobiSolverAdapter::map_status(int grb_status) {
    switch (grb_status) {
        case GRB_OPTIMAL:    return SolveStatus::Optimal;
        case GRB_INFEASIBLE: return SolveStatus::Infeasible;
        case GRB_UNBOUNDED:  return SolveStatus::Unbounded;
        case GRB_TIME_LIMIT: return SolveStatus::Timeout;
        default:             return SolveStatus::Error;
    }
}


RawSolution GurobiSolverAdapter::solve(const LinearProblem& problem, const SolverSettings& settings) {
    RawSolution result;
    auto to_grb_bound = [](double value) {
        if (isinf(value))
            return value > 0 ? GRB_INFINITY : -GRB_INFINITY;
        return value;
    };
    try {
        if (!env) {
            env = make_unique<GRBEnv>(true);
            env->set(GRB_IntParam_OutputFlag, 0); // disable output
            env->start();
        }
        GRBModel model = GRBModel(*env);
        // distinguish between infeasible and unbounded problems
        model.set(GRB_IntParam_DualReductions, 0);
        if (settings.time_limit_s > 0.0)
            model.set(GRB_DoubleParam_TimeLimit, settings.time_limit_s);
        if (problem.has_integer_variables())
            model.set(GRB_DoubleParam_MIPGap, settings.relative_mip_gap);
        //
        // create the variables
        const vector<ProblemVariable>& variables = problem.get_variables();
        vector<GRBVar> grb_vars(variables.size());
        for (size_t idx = 0; idx < variables.size(); idx++) {
            const ProblemVariable& v = variables[idx];
            grb_vars[idx] = model.addVar(to_grb_bound(v.lower), to_grb_bound(v.upper), v.objective,
                                         v.type == VariableType::Binary ? GRB_BINARY : GRB_CONTINUOUS, v.name);
        }
        model.set(GRB_IntAttr_ModelSense, GRB_MINIMIZE);
        //
        // add the rows
        for (const ProblemRow& row : problem.get_rows()) {
            GRBLinExpr expr = 0.0;
            for (const auto& [var, coeff] : row.coefficients)
                expr += coeff * grb_vars[var];
            const bool has_lb = !isinf(row.lower);
            const bool has_ub = !isinf(row.upper);
            if (has_lb && has_ub && row.lower == row.upper) {
                model.addConstr(expr == row.lower, row.name);
            } else if (has_lb && has_ub) {
                model.addRange(expr, row.lower, row.upper, row.name);
            } else if (has_ub) {
                model.addConstr(expr <= row.upper, row.name);
            } else if (has_lb) {
                model.addConstr(expr >= row.lower, row.name);
            }
        }
        //
        // run the optimization
        model.optimize();
        const int status = model.get(GRB_IntAttr_Status);
        result.status = map_status(status);
        result.wall_time_s = model.get(GRB_DoubleAttr_Runtime);
        if (result.status != SolveStatus::Optimal) {
            stringstream strstr;
            strstr << "Gurobi terminated with status " << status;
            result.message = strstr.str();
            return result;
        }
        //
        // get the results
        result.values.resize(variables.size());
        for (size_t idx = 0; idx < variables.size(); idx++)
            result.values[idx] = grb_vars[idx].get(GRB_DoubleAttr_X);
        result.objective = model.get(GRB_DoubleAttr_ObjVal);
        result.message = "optimal";

    } catch (GRBException& e) {
        std::cerr << "Error during optimization (code = " << e.getErrorCode() << ") with message:" << std::endl;
        std::cerr << e.getMessage() << std::endl;
        result.status  = SolveStatus::Error;
        result.message = e.getMessage();
        result.values.clear();
    }
    return result;
}
