/**
 * @file python_module.hpp
 * @brief Definition and implementation of functions that connect the C++ dispatch optimization with Python via pybind11.
 *
 * This is a header-only file providing the functions that are exposed to Python.
 * The module definition itself is placed in main.cpp.
 */

#ifndef PYTHON_MODULE_HPP
#define PYTHON_MODULE_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h> // for converting C++ containers like std::map

#include "components.h"
#include "device_catalog.h"
#include "dispatch_logic.h"
#include "global.h"
#include "setup_and_dataloading.h"
#include "worker_threads.hpp"

namespace pyconn {

    /**
     * @brief Reads the solve options from a Python dict.
     *
     * Supported keys are the same as in the "Settings" section of the config file,
     * but with underscores instead of spaces:
     * - "mode" (string): "lp", "milp" or "auto"
     * - "soc_boundary" (string): "cyclic" or "fixed initial"
     * - "backend" (string): "or-tools" or "gurobi"
     * - "lp_solver", "milp_solver" (string): OR-Tools solver names
     * - "time_limit_s", "relative_mip_gap", "state_threshold_kW" (float)
     * - "diagnose_infeasibility" (bool)
     *
     * Missing keys are taken from the defaults stored in class Global.
     *
     * @throws std::runtime_error If an enum value is unknown
     */
    inline dispatch::SolveOptions solve_options_from_dict(const pybind11::dict& args) {
        dispatch::SolveOptions options = dispatch::default_solve_options_from_global();
        if (args.contains("mode"))
            options.mode = configld::parse_solve_mode(args["mode"].cast<std::string>());
        if (args.contains("soc_boundary"))
            options.soc_boundary = configld::parse_soc_boundary_policy(args["soc_boundary"].cast<std::string>());
        if (args.contains("backend"))
            options.backend = configld::parse_solver_backend(args["backend"].cast<std::string>());
        if (args.contains("lp_solver"))
            options.lp_solver = args["lp_solver"].cast<std::string>();
        if (args.contains("milp_solver"))
            options.milp_solver = args["milp_solver"].cast<std::string>();
        if (args.contains("time_limit_s"))
            options.time_limit_s = args["time_limit_s"].cast<double>();
        if (args.contains("relative_mip_gap"))
            options.relative_mip_gap = args["relative_mip_gap"].cast<double>();
        if (args.contains("state_threshold_kW"))
            options.state_threshold_kW = args["state_threshold_kW"].cast<double>();
        if (args.contains("diagnose_infeasibility"))
            options.diagnose_infeasibility = args["diagnose_infeasibility"].cast<bool>();
        return options;
    }

    /**
     * @brief Runs one dispatch optimization.
     *
     * The Python GIL is released during the solve.
     *
     * @param devices List of selected devices
     * @param scenario The time dependent input
     * @param options Dict with solve options (see solve_options_from_dict())
     * @return The outcome, i.e. either a result or a failure diagnosis
     * @throws ConfigurationError, TariffConfigError on invalid input
     */
    inline dispatch::DispatchOutcome solve(const std::vector<DeviceSpec>& devices, const Scenario& scenario, pybind11::dict options) {
        dispatch::DispatchRequest request;
        request.devices  = devices;
        request.scenario = scenario;
        request.options  = solve_options_from_dict(options);
        pybind11::gil_scoped_release release;
        return dispatch::run_dispatch(request);
    }

    /**
     * @brief Loads a config file and solves the selected scenarios.
     *
     * @param config_filepath Path to the JSON configuration file
     * @param scenario_ids IDs of the scenario entries to solve, all entries if empty
     * @param n_threads Number of worker threads, 0 solves all scenarios in the calling thread
     * @return One outcome per scenario in the order of scenario_ids (or the config file order)
     * @throws std::runtime_error If the config file or a scenario cannot be loaded
     */
    inline std::vector<dispatch::DispatchOutcome> solve_config(const std::string& config_filepath, const std::vector<unsigned long>& scenario_ids, unsigned int n_threads) {
        Global::ResetAllVariables();
        if (!configld::load_config_file(config_filepath))
            throw std::runtime_error("Config file " + config_filepath + " cannot be loaded.");
        std::vector<configld::DispatchJob> jobs;
        if (!configld::load_dispatch_jobs(config_filepath, scenario_ids, jobs))
            throw std::runtime_error("Scenarios of config file " + config_filepath + " cannot be loaded.");
        std::vector<dispatch::DispatchRequest> requests;
        requests.reserve(jobs.size());
        for (configld::DispatchJob& job : jobs)
            requests.push_back(std::move(job.request));
        std::vector<BatchEntry> entries;
        {
            pybind11::gil_scoped_release release;
            entries = run_dispatch_batch(requests, n_threads);
        }
        std::vector<dispatch::DispatchOutcome> outcomes;
        outcomes.reserve(entries.size());
        for (BatchEntry& entry : entries) {
            if (entry.error)
                std::rethrow_exception(entry.error);
            outcomes.push_back(std::move(*entry.outcome));
        }
        return outcomes;
    }

    /**
     * @brief Returns the type names of all devices in the catalog.
     */
    inline std::vector<std::string> list_device_types() {
        return DeviceCatalog::GetInstance().list_types();
    }

}

#endif
