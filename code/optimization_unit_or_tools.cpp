#include "optimization_unit_or_tools.hpp"

#include <cmath>
#include <cstdint>
#include <memory>
#include <sstream>
#include <vector>

#include "optimization_problem.h"
#include "optimization_unit_general.hpp"

#include "ortools/linear_solver/linear_solver.h"

using namespace std;
using namespace operations_research;


SolveStatus ORToolsSolverAdapter::map_result_status(MPSolver::ResultStatus status, bool time_limited) {
    switch (status) {
        case MPSolver::OPTIMAL:
            return SolveStatus::Optimal;
        case MPSolver::INFEASIBLE:
            return SolveStatus::Infeasible;
        case MPSolver::UNBOUNDED:
            return SolveStatus::Unbounded;
        case MPSolver::FEASIBLE:
        case MPSolver::NOT_SOLVED:
            // interrupted before optimality was proven
            if (time_limited)
                return SolveStatus::Timeout;
            return SolveStatus::Error;
        default:
            return SolveStatus::Error;
    }
}


RawSolution ORToolsSolverAdapter::solve(const LinearProblem& problem, const SolverSettings& settings) {
    RawSolution result;
    //
    // Initialize the solver
    unique_ptr<MPSolver> model(MPSolver::CreateSolver(settings.solver_name));
    if (!model) {
        result.status  = SolveStatus::Error;
        result.message = "OR-Tools solver backend " + settings.solver_name + " unavailable.";
        return result;
    }
    const double infinity = model->infinity();
    auto to_solver_bound = [&](double value) {
        if (isinf(value))
            return value > 0 ? infinity : -infinity;
        return value;
    };
    //
    // Create the variables
    const vector<ProblemVariable>& variables = problem.get_variables();
    vector<MPVariable*> mp_vars(variables.size());
    for (size_t idx = 0; idx < variables.size(); idx++) {
        const ProblemVariable& v = variables[idx];
        mp_vars[idx] = model->MakeVar(to_solver_bound(v.lower), to_solver_bound(v.upper), v.type == VariableType::Binary, v.name);
    }
    //
    // Add the rows
    for (const ProblemRow& row : problem.get_rows()) {
        MPConstraint* c = model->MakeRowConstraint(to_solver_bound(row.lower), to_solver_bound(row.upper), row.name);
        for (const auto& [var, coeff] : row.coefficients)
            c->SetCoefficient(mp_vars[var], coeff);
    }
    //
    // Define the objective
    MPObjective* const objective = model->MutableObjective();
    for (size_t idx = 0; idx < variables.size(); idx++) {
        if (variables[idx].objective != 0.0)
            objective->SetCoefficient(mp_vars[idx], variables[idx].objective);
    }
    objective->SetMinimization();
    //
    // Solver parameters
    const bool time_limited = settings.time_limit_s > 0.0;
    if (time_limited) {
        model->set_time_limit(static_cast<int64_t>(ceil(settings.time_limit_s * 1000.0)));
    }
    MPSolverParameters params;
    if (problem.has_integer_variables()) {
        params.SetDoubleParam(MPSolverParameters::RELATIVE_MIP_GAP, settings.relative_mip_gap);
    }
    //
    // Execute the optimization and check results
    const MPSolver::ResultStatus result_status = model->Solve(params);
    result.wall_time_s = static_cast<double>(model->wall_time()) / 1000.0;
    result.status = map_result_status(result_status, time_limited);
    if (result.status != SolveStatus::Optimal) {
        stringstream strstr;
        strstr << settings.solver_name << " terminated with result status " << static_cast<int>(result_status);
        if (result.status == SolveStatus::Timeout)
            strstr << " after reaching the time limit of " << settings.time_limit_s << " s";
        result.message = strstr.str();
        return result;
    }
    //
    // Get the results
    result.values.resize(variables.size());
    for (size_t idx = 0; idx < variables.size(); idx++)
        result.values[idx] = mp_vars[idx]->solution_value();
    result.objective = objective->Value();
    result.message = "optimal";
    return result;
}
