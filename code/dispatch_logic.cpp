#include "dispatch_logic.h"
using namespace dispatch;

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "components.h"
#include "global.h"
#include "network.h"
#include "optimization_problem.h"
#include "optimization_unit_general.hpp"
#include "problem_formulator.h"
#include "result_extraction.h"

using namespace std;


const char* dispatch::failure_kind_name(FailureKind kind) {
    switch (kind) {
        case FailureKind::Infeasible:  return "infeasible";
        case FailureKind::Unbounded:   return "unbounded";
        case FailureKind::SolverError: return "solver error";
    }
    return "";
}

SolveOptions dispatch::default_solve_options_from_global() {
    SolveOptions opt;
    opt.mode                   = Global::get_solve_mode();
    opt.soc_boundary           = Global::get_soc_boundary_policy();
    opt.backend                = Global::get_solver_backend();
    opt.lp_solver              = Global::get_lp_solver_name();
    opt.milp_solver            = Global::get_milp_solver_name();
    opt.time_limit_s           = Global::get_solver_time_limit_s();
    opt.relative_mip_gap       = Global::get_relative_mip_gap();
    opt.diagnose_infeasibility = Global::get_diagnose_infeasibility();
    opt.state_threshold_kW     = Global::get_operating_state_threshold_kW();
    return opt;
}

SolverSettings dispatch::make_solver_settings(const SolveOptions& options, global::ProblemClass problem_class) {
    SolverSettings settings;
    settings.backend          = options.backend;
    settings.solver_name      = problem_class == global::ProblemClass::MILP ? options.milp_solver : options.lp_solver;
    settings.time_limit_s     = options.time_limit_s;
    settings.relative_mip_gap = options.relative_mip_gap;
    return settings;
}


vector<BalanceViolation> dispatch::diagnose_infeasibility(const FormulatedProblem& fp, const SolveOptions& options, BaseSolverAdapter& adapter) {
    //
    // create the elastic problem
    LinearProblem elastic = fp.problem;
    elastic.clear_objective();
    const vector<size_t> balance_rows = elastic.find_rows(RowKind::BusBalance);
    vector<size_t> shortfall(balance_rows.size());
    vector<size_t> surplus(balance_rows.size());
    for (size_t i = 0; i < balance_rows.size(); i++) {
        const size_t r = balance_rows[i];
        const string& row_name = elastic.get_rows()[r].name;
        shortfall[i] = elastic.add_variable(row_name + " shortfall", 0.0, LinearProblem::infinity(), 1.0);
        surplus[i]   = elastic.add_variable(row_name + " surplus",   0.0, LinearProblem::infinity(), 1.0);
        elastic.add_to_coefficient(r, shortfall[i],  1.0);
        elastic.add_to_coefficient(r, surplus[i],   -1.0);
    }
    //
    // solve it
    RawSolution sol = adapter.solve(elastic, make_solver_settings(options, fp.problem_class));
    vector<BalanceViolation> violations;
    if (sol.status != SolveStatus::Optimal) {
        cerr << "Warning: Infeasibility diagnosis failed with status " << solve_status_name(sol.status) << ": " << sol.message << endl;
        return violations;
    }
    for (size_t i = 0; i < balance_rows.size(); i++) {
        const double amount = sol.values[shortfall[i]] - sol.values[surplus[i]];
        if (sol.values[shortfall[i]] + sol.values[surplus[i]] > 1e-6) {
            const RowTag& tag = elastic.get_rows()[balance_rows[i]].tag;
            violations.push_back({tag.carrier, tag.timestep, amount});
        }
    }
    return violations;
}


DispatchOutcome dispatch::run_dispatch(const DispatchRequest& request) {
    unique_ptr<BaseSolverAdapter> adapter = create_solver_adapter(request.options.backend);
    return run_dispatch(request, *adapter);
}

DispatchOutcome dispatch::run_dispatch(const DispatchRequest& request, BaseSolverAdapter& adapter) {
    const SolveOptions& options = request.options;
    //
    // 1. build, constrain and formulate (errors are thrown)
    Network net = build_network(request.devices, request.scenario);
    FormulatedProblem fp = formulate(net, options.mode, options.soc_boundary);
    //
    // 2. solve
    const SolverSettings settings = make_solver_settings(options, fp.problem_class);
    RawSolution sol = adapter.solve(fp.problem, settings);
    //
    // 3. evaluate
    DispatchOutcome outcome;
    switch (sol.status) {
        case SolveStatus::Optimal:
        {
            DispatchResult result = extract_results(net, fp, sol.values, sol.objective, options.state_threshold_kW);
            result.solver_name  = string(adapter.get_backend_name()) + ":" + settings.solver_name;
            result.solve_time_s = sol.wall_time_s;
            outcome.result = std::move(result);
            break;
        }
        case SolveStatus::Infeasible:
        {
            SolveFailure failure{FailureKind::Infeasible, "no dispatch satisfies all constraints", {}};
            if (options.diagnose_infeasibility) {
                failure.violations = diagnose_infeasibility(fp, options, adapter);
                if (!failure.violations.empty()) {
                    stringstream strstr;
                    strstr << "energy balance cannot be met on " << failure.violations.size() << " bus time step(s)";
                    failure.reason = strstr.str();
                }
            }
            outcome.failure = std::move(failure);
            break;
        }
        case SolveStatus::Unbounded:
            outcome.failure = SolveFailure{FailureKind::Unbounded, "objective is unbounded: " + sol.message, {}};
            break;
        case SolveStatus::Timeout:
            outcome.failure = SolveFailure{FailureKind::SolverError, "timeout", {}};
            break;
        case SolveStatus::Error:
            outcome.failure = SolveFailure{FailureKind::SolverError, sol.message, {}};
            break;
    }
    return outcome;
}
