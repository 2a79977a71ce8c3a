#include "optimization_unit_general.hpp"

#include <memory>
#include <stdexcept>

#include "global.h"
#include "optimization_unit_or_tools.hpp"
#ifdef USE_GUROBI
#include "optimization_unit_gurobi.hpp"
#endif

using namespace std;


const char* solve_status_name(SolveStatus status) {
    switch (status) {
        case SolveStatus::Optimal:    return "optimal";
        case SolveStatus::Infeasible: return "infeasible";
        case SolveStatus::Unbounded:  return "unbounded";
        case SolveStatus::Timeout:    return "timeout";
        case SolveStatus::Error:      return "error";
    }
    return "";
}


unique_ptr<BaseSolverAdapter> create_solver_adapter(global::SolverBackend backend) {
    switch (backend) {
        case global::SolverBackend::ORTools:
            return make_unique<ORToolsSolverAdapter>();
        case global::SolverBackend::Gurobi:
#ifdef USE_GUROBI
            return make_unique<GurobiSolverAdapter>();
#else
            throw runtime_error("Solver backend gurobi is not available. Compile with USE_GUROBI to use it.");
#endif
    }
    throw runtime_error("Unknown solver backend.");
}
