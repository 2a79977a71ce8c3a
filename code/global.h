/*
 *
 * global.h
 *
 * Contains a namespace where all global variables are stored
 *
 * */

#ifndef GLOBAL_H
#define GLOBAL_H

#include <chrono>
#include <filesystem>
#include <string>

/*!
 * Namespace global
 *
 * It contains all global attributes, enums and variables that
 * might change during program execution.
 *
 * Attention: There is no access protection for these variables!
 * For access protection use class Global.
 *
 * Attention: Do not confuse with class Global (mind the capital "G")!
 */
namespace global {

    inline std::filesystem::path current_output_dir; ///< The output directory of the current run (output path + run specific sub-directory)
    inline std::chrono::time_point<std::chrono::system_clock> time_of_run_start; ///< The time of the program start

    /*!
     * This enum defines the solve mode requested by the user.
     * It corresponds to the --mode cmd line parameter and the config key 'solve mode'.
     */
    enum struct SolveMode : short {
        LP,   ///< Linear program; promoted to MILP if the network needs mode exclusivity
        MILP, ///< Mixed-integer linear program, regardless of the network structure
        Auto  ///< LP or MILP, decided by the network structure
    };

    /*!
     * The problem class that is finally handed to the solver.
     */
    enum struct ProblemClass : short {
        LP,
        MILP
    };

    /*!
     * This enum defines how the state of charge of all storage units
     * is tied at the start and at the end of the horizon.
     */
    enum struct SOCBoundaryPolicy : short {
        Cyclic,      ///< SOC at the end of the horizon equals the SOC at its start (free start value)
        FixedInitial ///< SOC at the start of the horizon is fixed to the storage parameter 'initial_soc'
    };

    /*!
     * This enum defines the available solver backends.
     */
    enum struct SolverBackend : short {
        ORTools, ///< Google OR-Tools MPSolver with a configurable LP and MILP solver
        Gurobi   ///< Native Gurobi C++ API (only available if compiled with USE_GUROBI)
    };

    const char* solve_mode_name(SolveMode mode);
    const char* problem_class_name(ProblemClass pclass);
    const char* soc_boundary_policy_name(SOCBoundaryPolicy policy);
    const char* solver_backend_name(SolverBackend backend);

    /*!
     * The string to delmitit output sections
     */
    const char* const output_section_delimiter = "*********************************************************************************";

}


/*
 * class Global
 *
 * This class contains all global settings that cannot change
 * after they have been locked.
 *
 * Attention: Not to be confused with namespace global (mind the lower case "g").
 */
class Global {
    public:
        static void ResetAllVariables(); ///< Restores the default values and unlocks all variables
        //
        static void LockAllVariables();   ///< No (set) variable can be overwritten after this call, unset variables can still be set once
        static void UnlockAllVariables(); ///< All variables can now be overwritten
        static bool is_locked_state() { return is_locked; }
        //
        // getter methods
        static const std::string& get_output_path()          { return output_path; }
        static global::SolverBackend get_solver_backend()    { return solver_backend; }
        static const std::string& get_lp_solver_name()       { return lp_solver_name; }   ///< Name of the OR-Tools backend used for LP problems
        static const std::string& get_milp_solver_name()     { return milp_solver_name; } ///< Name of the OR-Tools backend used for MILP problems
        static global::SolveMode get_solve_mode()            { return solve_mode; }
        static global::SOCBoundaryPolicy get_soc_boundary_policy() { return soc_boundary_policy; }
        static double get_solver_time_limit_s()              { return solver_time_limit_s; } ///< 0.0 means no time limit
        static double get_relative_mip_gap()                 { return relative_mip_gap; }
        static bool   get_diagnose_infeasibility()           { return diagnose_infeasibility; }
        static double get_operating_state_threshold_kW()     { return operating_state_threshold_kW; }
        static unsigned int get_n_threads()                  { return n_threads; } ///< Number of worker threads, 0 means that the main thread solves all scenarios
        //
        // setter methods
        static void set_output_path(const std::string& path);
        static void set_solver_backend(global::SolverBackend value);
        static void set_lp_solver_name(const std::string& value);
        static void set_milp_solver_name(const std::string& value);
        static void set_solve_mode(global::SolveMode value);
        static void set_soc_boundary_policy(global::SOCBoundaryPolicy value);
        static void set_solver_time_limit_s(double value);
        static void set_relative_mip_gap(double value);
        static void set_diagnose_infeasibility(bool value);
        static void set_operating_state_threshold_kW(double value);
        static void set_n_threads(unsigned int value);
    private:
        Global(); ///< Global cannot be initialized, it is a static only class
        static bool is_locked;             ///< if set to true, values cannot be changed anymore
        // variables
        static std::string output_path;    ///< Path where all output directories are created
        static global::SolverBackend solver_backend;
        static std::string lp_solver_name;
        static std::string milp_solver_name;
        static global::SolveMode solve_mode;
        static global::SOCBoundaryPolicy soc_boundary_policy;
        static double solver_time_limit_s;
        static double relative_mip_gap;
        static bool   diagnose_infeasibility; ///< If true, an infeasible problem is solved a second time with slack on all bus balances to locate the failing bus and time steps
        static double operating_state_threshold_kW; ///< Minimal power for a device to count as running / charging / discharging
        static unsigned int n_threads;
        // init flags
        static bool output_path_init;
        static bool solver_backend_init;
        static bool lp_solver_name_init;
        static bool milp_solver_name_init;
        static bool solve_mode_init;
        static bool soc_boundary_policy_init;
        static bool solver_time_limit_s_init;
        static bool relative_mip_gap_init;
        static bool diagnose_infeasibility_init;
        static bool operating_state_threshold_kW_init;
        static bool n_threads_init;
};

#endif
