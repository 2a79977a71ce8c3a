#include <iostream>
#include <fstream>
#include <string>
#include <sstream>
#include <chrono>
#include <exception>
#include <optional>
#include <vector>

#ifndef PYTHON_MODULE
#include <boost/program_options.hpp>
#else
#include <pybind11/pybind11.h>
#include <pybind11/stl.h> // for converting C++ containers like std::map
#endif

#include "global.h"

#include "components.h"
#include "dispatch_logic.h"
#include "output.h"
#include "result_extraction.h"
#include "setup_and_dataloading.h"
#include "tariff.h"
#include "worker_threads.hpp"

#ifdef PYTHON_MODULE
#include "python_module.hpp"
#endif

using namespace std;
#ifndef PYTHON_MODULE
namespace bpopts = boost::program_options;
#endif



/**
 * @brief Entry point of the dispatch optimization.
 *
 * This function loads the configuration and the selected scenarios, solves them
 * (optionally with multiple worker threads) and writes all results to the output directory.
 *
 * @param argc Number of command line arguments.
 * @param argv Array of command line argument strings.
 *
 * @return Return code indicating the execution result of the program:
 *   - **0**  Normal execution, all scenarios solved to optimality
 *   - **1**  Wrong parameters
 *   - **2**  Required file not found / error during database connections
 *   - **3**  At least one scenario is infeasible, unbounded or the solver failed
 *   - **4**  Erroneous input files
 *   - **5**  Nothing solved (e.g., help or device list displayed)
 */
#ifndef PYTHON_MODULE
int main(int argc, char* argv[]) {

	//
	// parsing command line arguments
	//
    vector<unsigned long> scenario_ids;
    string config_filepath;
    //
    bpopts::options_description opts_desc("Options");
    opts_desc.add_options()
        ("help,h",                            "Show help")
        ("config",   bpopts::value<string>(), "Path to the JSON configuration file")
        ("mode,m",   bpopts::value<string>(), "Solve mode: 'lp', 'milp' or 'auto'. Overrides the setting of the config file for all scenarios. 'lp' is promoted to 'milp' if a device needs exclusive operating modes.")
        ("time-limit,l", bpopts::value<double>(), "Time limit per solve in seconds. Overrides the setting of the config file for all scenarios. 0 means no limit.")
        ("n_threads,n",  bpopts::value<unsigned int>(), "Number of working threads. If all scenarios should be solved by the main thread, set this value to 0. Defaults to the config file setting.")
        ("output,o", bpopts::value<string>(), "Output directory. Overrides the setting of the config file.")
        ("list-devices",                      "Print all device types of the catalog with their parameters and exit")
        ("scenario", bpopts::value<vector<unsigned long>>()->multitoken(), "IDs of the scenarios that should be solved. If not given, all scenarios of the config file are solved.");
    bpopts::positional_options_description opts_desc_pos;
    opts_desc_pos.add("scenario", -1);
    bpopts::variables_map opts_vals;
    try {
        bpopts::command_line_parser parser{argc, argv};
        parser.options(opts_desc).positional(opts_desc_pos);
        bpopts::parsed_options parsed_options = parser.run();
        bpopts::store( parsed_options, opts_vals );
        bpopts::notify(opts_vals);
    } catch (const bpopts::error &err) {
        cerr << "Error when parsing command line arguments:" << "\n";
        cerr << err.what() << endl;
        return 1;
    }
    // now, command line arguments are parsed
    if (opts_vals.count("help") > 0) {
        cerr << opts_desc << endl;
        cerr << "Usage: iesdispatch [-h] [--config PATH] [--mode lp|milp|auto] [--time-limit S] [--n_threads N] [--output PATH] [--list-devices] [scenario IDs...]" << endl;
        return 5;
    }
    if (opts_vals.count("list-devices") > 0) {
        output::printDeviceCatalog(cout);
        return 5;
    }
    if (opts_vals.count("config") > 0) {
        config_filepath = opts_vals["config"].as<string>();
    } else {
        config_filepath = "../config/dispatch_config.json";
    }
    if (opts_vals.count("scenario") > 0) {
        scenario_ids = opts_vals["scenario"].as<vector<unsigned long>>();
    }

    // get time for time measurement
    auto t1 = std::chrono::system_clock::now();
    global::time_of_run_start = t1;

	//
	// open and parse global settings file
	//
    Global::ResetAllVariables();
    try {
        if (!configld::load_config_file(config_filepath)) {
            return 2;
        }
    } catch (const std::runtime_error& e) {
        cerr << "Error in config file " << config_filepath << ": " << e.what() << endl;
        return 4;
    }

    //
    // command line settings override the config file
    //
    optional<global::SolveMode> cli_mode;
    optional<double> cli_time_limit;
    try {
        if (opts_vals.count("mode") > 0) {
            cli_mode = configld::parse_solve_mode( opts_vals["mode"].as<string>() );
            Global::set_solve_mode(*cli_mode);
        }
    } catch (const std::runtime_error&) {
        cerr << "Error when parsing command line arguments: invalid option for --mode / -m given!" << endl;
        return 1;
    }
    if (opts_vals.count("time-limit") > 0) {
        double time_limit = opts_vals["time-limit"].as<double>();
        if (time_limit < 0.0) {
            cerr << "Error when parsing command line arguments: --time-limit / -l must not be negative!" << endl;
            return 1;
        }
        cli_time_limit = time_limit;
        Global::set_solver_time_limit_s(time_limit);
    }
    if (opts_vals.count("n_threads") > 0) {
        unsigned int n_threads = opts_vals["n_threads"].as<unsigned int>();
        Global::set_n_threads( n_threads );
        if (n_threads == 1) {
            cerr << "Warning: Defining only 1 working thread is useless, as the main thread will wait until the worker is finished.\nPlease increase the number of working threads or disable multi-threading by setting n_threads to 0." << std::endl;
        }
    }
    if (opts_vals.count("output") > 0) {
        Global::set_output_path( opts_vals["output"].as<string>() );
    }
    Global::LockAllVariables();

    //
    // Create the output directory
    //
    if (!output::initializeDirectories()) {
        return 2;
    }

    //
    // Load all selected scenarios
    //
    vector<configld::DispatchJob> jobs;
    try {
        if (!configld::load_dispatch_jobs(config_filepath, scenario_ids, jobs)) {
            return 2;
        }
    } catch (const std::runtime_error& e) {
        cerr << "Error in scenario definition: " << e.what() << endl;
        return 4;
    }
    if (jobs.empty()) {
        cerr << "No scenario selected in config file " << config_filepath << endl;
        return 5;
    }
    vector<dispatch::DispatchRequest> requests;
    requests.reserve(jobs.size());
    for (configld::DispatchJob& job : jobs) {
        if (cli_mode.has_value())
            job.request.options.mode = *cli_mode;
        if (cli_time_limit.has_value())
            job.request.options.time_limit_s = *cli_time_limit;
        requests.push_back(job.request);
    }

    //
    // Output all variable values (first time to stdout / cout)
    //
    configld::output_variable_values(std::cout);
    cout << "Solving " << requests.size() << " scenario(s)" << endl;

    // get time for time measurement
    auto t2 = std::chrono::system_clock::now();

    //
    // Solve all scenarios
    //
    vector<BatchEntry> entries = run_dispatch_batch(requests, Global::get_n_threads());

    auto t3 = std::chrono::system_clock::now();

    //
    // Write the results
    //
    int return_code = 0;
    for (size_t i = 0; i < jobs.size(); i++) {
        const configld::DispatchJob& job = jobs[i];
        BatchEntry& entry = entries[i];
        if (entry.error) {
            try {
                std::rethrow_exception(entry.error);
            } catch (const ConfigurationError& e) {
                cerr << "Scenario " << job.id << " (" << job.name << "): invalid configuration: " << e.what() << endl;
            } catch (const TariffConfigError& e) {
                cerr << "Scenario " << job.id << " (" << job.name << "): invalid tariff: " << e.what() << endl;
            } catch (const std::exception& e) {
                cerr << "Scenario " << job.id << " (" << job.name << "): error: " << e.what() << endl;
            }
            return_code = 4;
            continue;
        }
        const dispatch::DispatchOutcome& outcome = *entry.outcome;
        if (outcome.succeeded()) {
            output::outputDispatchResult(job.id, job.name, *outcome.result);
            cout << "Scenario " << job.id << " (" << job.name << "): optimal, total cost = " << outcome.result->costs.total << endl;
        } else {
            output::outputDispatchFailure(job.id, job.name, *outcome.failure);
            cerr << "Scenario " << job.id << " (" << job.name << "): " << dispatch::failure_kind_name(outcome.failure->kind) << ": " << outcome.failure->reason << endl;
            if (return_code == 0)
                return_code = 3;
        }
    }

    // get time for time measurement and send first values to the file
    long s_setup = std::chrono::duration_cast<std::chrono::seconds>(t2-t1).count();
    long s_main  = std::chrono::duration_cast<std::chrono::seconds>(t3-t2).count();
    output::outputRuntimeInformation(s_setup, s_main);

    auto t4 = std::chrono::system_clock::now();
    cout << "Run-time information:\n";
    cout << "  Setup and data loading: " << s_setup << "s\n";
    cout << "  Solving:                " << s_main  << "s\n";
    cout << "  Output:                 " << std::chrono::duration_cast<std::chrono::seconds>(t4-t3).count() << "s\n";
    cout << "  Complete run time:      " << std::chrono::duration_cast<std::chrono::seconds>(t4-t1).count() << "s" << std::endl;

	return return_code;
}
#endif

#ifdef PYTHON_MODULE

using namespace pybind11::literals;

// Module definition
PYBIND11_MODULE(iesdispatch, m) {
    m.doc() = "Python bindings for the IESDispatch multi-energy dispatch optimization.";

    pybind11::register_exception<ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
    pybind11::register_exception<TariffConfigError>(m, "TariffConfigError", PyExc_ValueError);

    pybind11::enum_<Carrier>(m, "Carrier")
        .value("Electricity", Carrier::Electricity)
        .value("Heat",        Carrier::Heat)
        .value("Cooling",     Carrier::Cooling)
        .value("Hydrogen",    Carrier::Hydrogen);

    pybind11::enum_<DeviceCapability>(m, "DeviceCapability")
        .value("Generator", DeviceCapability::Generator)
        .value("Storage",   DeviceCapability::Storage)
        .value("Link",      DeviceCapability::Link);

    pybind11::enum_<global::ProblemClass>(m, "ProblemClass")
        .value("LP",   global::ProblemClass::LP)
        .value("MILP", global::ProblemClass::MILP);

    pybind11::enum_<OperatingState>(m, "OperatingState")
        .value("Stopped",     OperatingState::Stopped)
        .value("Running",     OperatingState::Running)
        .value("Charging",    OperatingState::Charging)
        .value("Discharging", OperatingState::Discharging)
        .value("Idle",        OperatingState::Idle);

    pybind11::enum_<dispatch::FailureKind>(m, "FailureKind")
        .value("Infeasible",  dispatch::FailureKind::Infeasible)
        .value("Unbounded",   dispatch::FailureKind::Unbounded)
        .value("SolverError", dispatch::FailureKind::SolverError);

    pybind11::class_<DeviceSpec>(m, "DeviceSpec",
        "A device selected from the catalog plus its parameter values.")
        .def(pybind11::init<>())
        .def(pybind11::init([](const std::string& type, const std::string& id, const ParameterValues& parameters) {
                return DeviceSpec{type, id, parameters};
             }), "type"_a, "id"_a = "", "parameters"_a = ParameterValues())
        .def_readwrite("type", &DeviceSpec::type, "Catalog type name, e.g. 'battery'.")
        .def_readwrite("id", &DeviceSpec::id, "Unique device id.")
        .def_readwrite("parameters", &DeviceSpec::parameters, "Dict of parameter values, missing parameters use the catalog default.");

    pybind11::class_<TariffBand>(m, "TariffBand",
        "One time-of-use band.")
        .def(pybind11::init([](double start_hour, double end_hour, double buy_price, double sell_price) {
                return TariffBand{start_hour, end_hour, buy_price, sell_price};
             }), "start_hour"_a, "end_hour"_a, "buy_price"_a, "sell_price"_a = 0.0)
        .def_readwrite("start_hour", &TariffBand::start_hour)
        .def_readwrite("end_hour", &TariffBand::end_hour)
        .def_readwrite("buy_price", &TariffBand::buy_price)
        .def_readwrite("sell_price", &TariffBand::sell_price);

    pybind11::class_<Scenario>(m, "Scenario",
        "Horizon, demand series, PV availability and time-of-use tariff.")
        .def(pybind11::init<>())
        .def_readwrite("horizon_steps", &Scenario::horizon_steps)
        .def_readwrite("timestep_hours", &Scenario::timestep_hours)
        .def_readwrite("start_hour", &Scenario::start_hour)
        .def_readwrite("electrical_load", &Scenario::electrical_load)
        .def_readwrite("heat_load", &Scenario::heat_load)
        .def_readwrite("cooling_load", &Scenario::cooling_load)
        .def_readwrite("hydrogen_load", &Scenario::hydrogen_load)
        .def_readwrite("pv_availability", &Scenario::pv_availability)
        .def_readwrite("tou_bands", &Scenario::tou_bands);

    pybind11::class_<LinkModeDispatch>(m, "LinkModeDispatch")
        .def_readonly("name", &LinkModeDispatch::name)
        .def_readonly("flow_kW", &LinkModeDispatch::flow_kW)
        .def_readonly("on", &LinkModeDispatch::on);

    pybind11::class_<DeviceDispatch>(m, "DeviceDispatch",
        "Dispatch series of one device.")
        .def_readonly("device_id", &DeviceDispatch::device_id)
        .def_readonly("device_type", &DeviceDispatch::device_type)
        .def_readonly("capability", &DeviceDispatch::capability)
        .def_readonly("injection_kW", &DeviceDispatch::injection_kW)
        .def_readonly("output_kW", &DeviceDispatch::output_kW)
        .def_readonly("input_kW", &DeviceDispatch::input_kW)
        .def_readonly("charge_kW", &DeviceDispatch::charge_kW)
        .def_readonly("discharge_kW", &DeviceDispatch::discharge_kW)
        .def_readonly("soc_kWh", &DeviceDispatch::soc_kWh)
        .def_readonly("modes", &DeviceDispatch::modes)
        .def_readonly("states", &DeviceDispatch::states)
        .def_readonly("cost", &DeviceDispatch::cost);

    pybind11::class_<BusBalanceSeries>(m, "BusBalanceSeries")
        .def_readonly("carrier", &BusBalanceSeries::carrier)
        .def_readonly("supply_kW", &BusBalanceSeries::supply_kW)
        .def_readonly("consumption_kW", &BusBalanceSeries::consumption_kW)
        .def_readonly("demand_kW", &BusBalanceSeries::demand_kW)
        .def_readonly("residual_kW", &BusBalanceSeries::residual_kW);

    pybind11::class_<CostBreakdown>(m, "CostBreakdown")
        .def_readonly("fuel_cost", &CostBreakdown::fuel_cost)
        .def_readonly("grid_cost", &CostBreakdown::grid_cost)
        .def_readonly("cycling_penalty", &CostBreakdown::cycling_penalty)
        .def_readonly("total", &CostBreakdown::total);

    pybind11::class_<DispatchResult>(m, "DispatchResult",
        "Result of a successful dispatch solve.")
        .def_readonly("problem_class", &DispatchResult::problem_class)
        .def_readonly("solver_name", &DispatchResult::solver_name)
        .def_readonly("solve_time_s", &DispatchResult::solve_time_s)
        .def_readonly("objective_value", &DispatchResult::objective_value)
        .def_readonly("horizon", &DispatchResult::horizon)
        .def_readonly("timestep_hours", &DispatchResult::timestep_hours)
        .def_readonly("costs", &DispatchResult::costs)
        .def_readonly("devices", &DispatchResult::devices)
        .def_readonly("buses", &DispatchResult::buses);

    pybind11::class_<dispatch::BalanceViolation>(m, "BalanceViolation")
        .def_readonly("carrier", &dispatch::BalanceViolation::carrier)
        .def_readonly("timestep", &dispatch::BalanceViolation::timestep)
        .def_readonly("amount_kW", &dispatch::BalanceViolation::amount_kW,
                      "Positive = shortfall, negative = surplus.");

    pybind11::class_<dispatch::SolveFailure>(m, "SolveFailure",
        "Diagnosis of a failed solve.")
        .def_readonly("kind", &dispatch::SolveFailure::kind)
        .def_readonly("reason", &dispatch::SolveFailure::reason)
        .def_readonly("violations", &dispatch::SolveFailure::violations);

    pybind11::class_<dispatch::DispatchOutcome>(m, "DispatchOutcome",
        "Either a result or a failure is set.")
        .def_readonly("result", &dispatch::DispatchOutcome::result)
        .def_readonly("failure", &dispatch::DispatchOutcome::failure)
        .def("succeeded", &dispatch::DispatchOutcome::succeeded);

    m.def("solve", &pyconn::solve, "devices"_a, "scenario"_a, "options"_a = pybind11::dict(),
          "Solve one dispatch problem. Options use the keys of the config file settings with underscores.");
    m.def("solve_config", &pyconn::solve_config, "config"_a, "scenario_ids"_a = std::vector<unsigned long>(), "n_threads"_a = 0,
          "Load a config file and solve the selected scenarios (all, if no id is given).");
    m.def("list_device_types", &pyconn::list_device_types,
          "Returns the type names of all devices in the catalog.");
}

#endif
