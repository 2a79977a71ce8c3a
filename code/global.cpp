#include "global.h"

using namespace global;


#include <iostream>

using namespace std;



const char* global::solve_mode_name(SolveMode mode) {
    switch (mode) {
        case SolveMode::LP:   return "LP";
        case SolveMode::MILP: return "MILP";
        case SolveMode::Auto: return "Auto";
    }
    return "";
}

const char* global::problem_class_name(ProblemClass pclass) {
    switch (pclass) {
        case ProblemClass::LP:   return "LP";
        case ProblemClass::MILP: return "MILP";
    }
    return "";
}

const char* global::soc_boundary_policy_name(SOCBoundaryPolicy policy) {
    switch (policy) {
        case SOCBoundaryPolicy::Cyclic:       return "Cyclic";
        case SOCBoundaryPolicy::FixedInitial: return "FixedInitial";
    }
    return "";
}

const char* global::solver_backend_name(SolverBackend backend) {
    switch (backend) {
        case SolverBackend::ORTools: return "OR-Tools";
        case SolverBackend::Gurobi:  return "Gurobi";
    }
    return "";
}





// ----------------------------- //
//      Implementation of        //
//            Global             //
// ----------------------------- //

bool Global::is_locked = false;
string Global::output_path          = "../output/";
SolverBackend Global::solver_backend = SolverBackend::ORTools;
string Global::lp_solver_name       = "GLOP";
string Global::milp_solver_name     = "SCIP";
SolveMode Global::solve_mode        = SolveMode::Auto;
SOCBoundaryPolicy Global::soc_boundary_policy = SOCBoundaryPolicy::Cyclic;
double Global::solver_time_limit_s  = 0.0;
double Global::relative_mip_gap     = 1e-4;
bool   Global::diagnose_infeasibility = true;
double Global::operating_state_threshold_kW = 0.1;
unsigned int Global::n_threads      = 0;
//
bool Global::output_path_init       = false;
bool Global::solver_backend_init    = false;
bool Global::lp_solver_name_init    = false;
bool Global::milp_solver_name_init  = false;
bool Global::solve_mode_init        = false;
bool Global::soc_boundary_policy_init     = false;
bool Global::solver_time_limit_s_init     = false;
bool Global::relative_mip_gap_init        = false;
bool Global::diagnose_infeasibility_init  = false;
bool Global::operating_state_threshold_kW_init = false;
bool Global::n_threads_init         = false;

void Global::ResetAllVariables() {
    is_locked = false;
    output_path          = "../output/";
    solver_backend       = SolverBackend::ORTools;
    lp_solver_name       = "GLOP";
    milp_solver_name     = "SCIP";
    solve_mode           = SolveMode::Auto;
    soc_boundary_policy  = SOCBoundaryPolicy::Cyclic;
    solver_time_limit_s  = 0.0;
    relative_mip_gap     = 1e-4;
    diagnose_infeasibility = true;
    operating_state_threshold_kW = 0.1;
    n_threads            = 0;
    //
    output_path_init       = false;
    solver_backend_init    = false;
    lp_solver_name_init    = false;
    milp_solver_name_init  = false;
    solve_mode_init        = false;
    soc_boundary_policy_init     = false;
    solver_time_limit_s_init     = false;
    relative_mip_gap_init        = false;
    diagnose_infeasibility_init  = false;
    operating_state_threshold_kW_init = false;
    n_threads_init         = false;
}

void Global::LockAllVariables() {
    is_locked = true;
}

void Global::UnlockAllVariables() {
    is_locked = false;
}

void Global::set_output_path(const string& path) {
    if (is_locked && output_path_init) {
        cerr << "Output path already set!" << endl;
    } else {
        Global::output_path = path;
        Global::output_path_init = true;
    }
}
void Global::set_solver_backend(SolverBackend value) {
    if (is_locked && solver_backend_init) {
        cerr << "Global variable solver_backend is already initialized!" << endl;
    } else {
        Global::solver_backend = value;
        Global::solver_backend_init = true;
    }
}
void Global::set_lp_solver_name(const string& value) {
    if (is_locked && lp_solver_name_init) {
        cerr << "Global variable lp_solver_name is already initialized!" << endl;
    } else {
        Global::lp_solver_name = value;
        Global::lp_solver_name_init = true;
    }
}
void Global::set_milp_solver_name(const string& value) {
    if (is_locked && milp_solver_name_init) {
        cerr << "Global variable milp_solver_name is already initialized!" << endl;
    } else {
        Global::milp_solver_name = value;
        Global::milp_solver_name_init = true;
    }
}
void Global::set_solve_mode(SolveMode value) {
    if (is_locked && solve_mode_init) {
        cerr << "Global variable solve_mode is already initialized!" << endl;
    } else {
        Global::solve_mode = value;
        Global::solve_mode_init = true;
    }
}
void Global::set_soc_boundary_policy(SOCBoundaryPolicy value) {
    if (is_locked && soc_boundary_policy_init) {
        cerr << "Global variable soc_boundary_policy is already initialized!" << endl;
    } else {
        Global::soc_boundary_policy = value;
        Global::soc_boundary_policy_init = true;
    }
}
void Global::set_solver_time_limit_s(double value) {
    if (is_locked && solver_time_limit_s_init) {
        cerr << "Global variable solver_time_limit_s is already initialized!" << endl;
    } else if (value < 0.0) {
        cerr << "Global variable solver_time_limit_s must not be negative!" << endl;
    } else {
        Global::solver_time_limit_s = value;
        Global::solver_time_limit_s_init = true;
    }
}
void Global::set_relative_mip_gap(double value) {
    if (is_locked && relative_mip_gap_init) {
        cerr << "Global variable relative_mip_gap is already initialized!" << endl;
    } else if (value < 0.0) {
        cerr << "Global variable relative_mip_gap must not be negative!" << endl;
    } else {
        Global::relative_mip_gap = value;
        Global::relative_mip_gap_init = true;
    }
}
void Global::set_diagnose_infeasibility(bool value) {
    if (is_locked && diagnose_infeasibility_init) {
        cerr << "Global variable diagnose_infeasibility is already initialized!" << endl;
    } else {
        Global::diagnose_infeasibility = value;
        Global::diagnose_infeasibility_init = true;
    }
}
void Global::set_operating_state_threshold_kW(double value) {
    if (is_locked && operating_state_threshold_kW_init) {
        cerr << "Global variable operating_state_threshold_kW is already initialized!" << endl;
    } else {
        Global::operating_state_threshold_kW = value;
        Global::operating_state_threshold_kW_init = true;
    }
}
void Global::set_n_threads(unsigned int value) {
    if (is_locked && n_threads_init) {
        cerr << "Global variable n_threads is already initialized!" << endl;
    } else {
        Global::n_threads = value;
        Global::n_threads_init = true;
    }
}
