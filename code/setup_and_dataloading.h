/*
 *
 * setup_and_dataloading.h
 *
 * Contains all code required for loading the configuration
 * and the scenario data (json files or scenario database)
 *
 * */

#ifndef SETUP_AND_DATALOADING_H
#define SETUP_AND_DATALOADING_H

#include <ostream>
#include <string>
#include <vector>

#include "dispatch_logic.h"
#include "global.h"


/**
 * This namespace contains all functions required for loading the
 * config file and the scenario data
 **/
namespace configld {

    /*!
     * One entry of the "Scenarios" list of the config file, ready to be solved.
     */
    struct DispatchJob {
        unsigned long id;
        std::string name;
        dispatch::DispatchRequest request;
    };

    /**
     * Loads the "Settings" section of the config file into class Global.
     * Class Global is not locked by this function.
     *
     * @return false, if the file cannot be parsed
     * @throws std::runtime_error: If an enum setting has an unknown value
     */
    bool load_config_file(const std::string& filepath);

    /**
     * Loads the scenario entries with the given ids (all entries, if scenario_ids is empty)
     * of the config file including the scenario data and the per-scenario setting overrides.
     * Scenario entries can inherit from other entries using 'inherits from'.
     * Relative paths are resolved relative to the directory of the config file.
     * The solve options of every job start with the values stored in class Global.
     *
     * @param filepath: Path to the config file
     * @param scenario_ids: The ids to load (in this order)
     * @param jobs: Reference to the list where the loaded jobs are appended
     * @return false, if the file cannot be parsed, a scenario id is unknown, the inheritance contains
     *         a ring closure or the scenario data cannot be loaded
     * @throws std::runtime_error: If an enum setting has an unknown value
     * @throws ConfigurationError: If the horizon of a scenario is not positive
     */
    bool load_dispatch_jobs(const std::string& filepath, const std::vector<unsigned long>& scenario_ids, std::vector<DispatchJob>& jobs);

    /**
     * Loads a scenario json file (horizon, demand series, PV availability, tariff and devices)
     * into the scenario and the device list of request. Solve options are not touched.
     *
     * @return false, if the file cannot be read or parsed
     * @throws ConfigurationError: If the horizon is not a positive number of time steps
     */
    bool load_scenario_file(const std::string& filepath, dispatch::DispatchRequest& request);

    /**
     * Loads a scenario from the scenario database into the scenario and the device list of request.
     *
     * @return false, if the database cannot be opened, a query fails or the scenario id is unknown
     * @throws ConfigurationError: If the horizon is not a positive number of time steps
     */
    bool load_scenario_from_database(const std::string& filepath, unsigned long db_scenario_id, dispatch::DispatchRequest& request);

    /**
     * Translate the config / command line strings into the enum values.
     * @throws std::runtime_error: If the value is unknown
     */
    global::SolveMode parse_solve_mode(const std::string& value);
    global::SOCBoundaryPolicy parse_soc_boundary_policy(const std::string& value);
    global::SolverBackend parse_solver_backend(const std::string& value);

    /**
     * @brief Outputs the build information and all global parameter settings to the specified output stream.
     *
     * @param current_outstream Reference to an output stream where the configuration should be written (e.g. std::cout or a std::ofstream).
     */
    void output_variable_values(std::ostream& current_outstream);

}




#endif
