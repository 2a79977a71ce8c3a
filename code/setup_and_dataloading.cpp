#include "setup_and_dataloading.h"


#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <list>
#include <optional>
#include <sqlite3.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#define BOOST_BIND_GLOBAL_PLACEHOLDERS
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

using namespace std;
namespace bpt = boost::property_tree;


#include "components.h"
#include "dispatch_logic.h"
#include "global.h"
#include "helper.h"
#include "network.h"
#include "tariff.h"



//
// enum translation
//
global::SolveMode configld::parse_solve_mode(const string& value) {
    string selection = to_lower_trimmed(value);
    if (selection == "auto")
        return global::SolveMode::Auto;
    else if (selection == "lp")
        return global::SolveMode::LP;
    else if (selection == "milp")
        return global::SolveMode::MILP;
    cerr << "Parameter 'solve mode' is defined as '" << value << "', but this value is unknown." << endl;
    throw runtime_error("Parameter 'solve mode' is unknown.");
}

global::SOCBoundaryPolicy configld::parse_soc_boundary_policy(const string& value) {
    string selection = to_lower_trimmed(value);
    if (selection == "cyclic")
        return global::SOCBoundaryPolicy::Cyclic;
    else if (selection == "fixed initial")
        return global::SOCBoundaryPolicy::FixedInitial;
    cerr << "Parameter 'storage SOC boundary' is defined as '" << value << "', but this value is unknown." << endl;
    throw runtime_error("Parameter 'storage SOC boundary' is unknown.");
}

global::SolverBackend configld::parse_solver_backend(const string& value) {
    string selection = to_lower_trimmed(value);
    if (selection == "or-tools" || selection == "ortools")
        return global::SolverBackend::ORTools;
    else if (selection == "gurobi")
        return global::SolverBackend::Gurobi;
    cerr << "Parameter 'solver backend' is defined as '" << value << "', but this value is unknown." << endl;
    throw runtime_error("Parameter 'solver backend' is unknown.");
}


namespace {

    /*
     * Parses one element that belongs to the solve options.
     * Returns false, if the element name is not a solve option.
     */
    bool parse_solve_option(const string& element_name, const bpt::ptree& node, dispatch::SolveOptions& opt) {
        if      ( element_name.compare("solver backend")            == 0 )
        {
            opt.backend = configld::parse_solver_backend( node.get_value<string>() );
        }
        else if ( element_name.compare("LP solver")                 == 0 )
        {
            opt.lp_solver = node.get_value<string>();
        }
        else if ( element_name.compare("MILP solver")               == 0 )
        {
            opt.milp_solver = node.get_value<string>();
        }
        else if ( element_name.compare("solve mode")                == 0 )
        {
            opt.mode = configld::parse_solve_mode( node.get_value<string>() );
        }
        else if ( element_name.compare("storage SOC boundary")      == 0 )
        {
            opt.soc_boundary = configld::parse_soc_boundary_policy( node.get_value<string>() );
        }
        else if ( element_name.compare("solver time limit in s")    == 0 )
        {
            double value = node.get_value<double>();
            if (value < 0.0)
                throw runtime_error("Parameter 'solver time limit in s' must not be negative.");
            opt.time_limit_s = value;
        }
        else if ( element_name.compare("relative MIP gap")          == 0 )
        {
            double value = node.get_value<double>();
            if (value < 0.0)
                throw runtime_error("Parameter 'relative MIP gap' must not be negative.");
            opt.relative_mip_gap = value;
        }
        else if ( element_name.compare("diagnose infeasibility")    == 0 )
        {
            opt.diagnose_infeasibility = node.get_value<bool>();
        }
        else if ( element_name.compare("operating state threshold in kW") == 0 )
        {
            double value = node.get_value<double>();
            if (value < 0.0)
                throw runtime_error("Parameter 'operating state threshold in kW' must not be negative.");
            opt.state_threshold_kW = value;
        }
        else
        {
            return false;
        }
        return true;
    }

    bool is_ignored_element(const string& element_name) {
        return element_name.starts_with("comment") || element_name.starts_with("__disabled ");
    }

    filesystem::path resolve_relative_to(const filesystem::path& base_dir, const string& value) {
        filesystem::path p(value);
        if (p.is_relative())
            p = base_dir / p;
        return p;
    }

}



//
// loads the global config file
//
bool configld::load_config_file(const string& filepath) {
    //
    // parse json
    bpt::ptree tree_root;
    try {
        bpt::read_json(filepath, tree_root);
    } catch (bpt::json_parser_error& j) {
        cerr << "Error when reading json file: " << j.what() << endl;
        return false;
    }
    try {
        dispatch::SolveOptions opt = dispatch::default_solve_options_from_global();
        for (auto& settings_element : tree_root.get_child("Settings")) {
            const string& element_name = settings_element.first;
            if (parse_solve_option(element_name, settings_element.second, opt))
                continue;
            if      ( element_name.compare("output path")        == 0 )
            {
                Global::set_output_path( settings_element.second.get_value<string>() );
            }
            else if ( element_name.compare("number of threads")  == 0 )
            {
                Global::set_n_threads( settings_element.second.get_value<unsigned int>() );
            }
            else if ( is_ignored_element(element_name) )
            {}
            else
            {
                cout << "Unknown config parameter " << element_name << endl;
            }
        }
        Global::set_solver_backend( opt.backend );
        Global::set_lp_solver_name( opt.lp_solver );
        Global::set_milp_solver_name( opt.milp_solver );
        Global::set_solve_mode( opt.mode );
        Global::set_soc_boundary_policy( opt.soc_boundary );
        Global::set_solver_time_limit_s( opt.time_limit_s );
        Global::set_relative_mip_gap( opt.relative_mip_gap );
        Global::set_diagnose_infeasibility( opt.diagnose_infeasibility );
        Global::set_operating_state_threshold_kW( opt.state_threshold_kW );
    } catch (bpt::ptree_bad_path& j) {
        cerr << "Error when parsing json file: " << j.what() << endl;
        return false;
    } catch (bpt::ptree_bad_data& j) {
        cerr << "Error when parsing json file (wrong data type): " << j.what() << endl;
        return false;
    }
    return true;
}


//
// loads the scenario entries of the config file
//
bool configld::load_dispatch_jobs(const string& filepath, const vector<unsigned long>& scenario_ids, vector<DispatchJob>& jobs) {
    bpt::ptree tree_root;
    try {
        bpt::read_json(filepath, tree_root);
    } catch (bpt::json_parser_error& j) {
        cerr << "Error when reading json file: " << j.what() << endl;
        return false;
    }
    const filesystem::path config_dir = filesystem::path(filepath).parent_path();

    try {
        const bpt::ptree& scenario_list = tree_root.get_child("Scenarios");
        //
        // search a scenario entry by id
        auto find_scenario_entry = [&](unsigned long id_to_find) -> const bpt::ptree* {
            for (auto& scenario_dict_all : scenario_list) {
                if (scenario_dict_all.second.get<unsigned long>("id") == id_to_find)
                    return &(scenario_dict_all.second);
            }
            return NULL;
        };
        //
        // if no ids are given, load all entries
        vector<unsigned long> ids_to_load = scenario_ids;
        if (ids_to_load.empty()) {
            for (auto& scenario_dict_all : scenario_list)
                ids_to_load.push_back( scenario_dict_all.second.get<unsigned long>("id") );
        }

        for (unsigned long scenario_id : ids_to_load) {
            //
            // get all scenario IDs from which the selected one inherits
            list<unsigned long> scenarios_to_load;
            scenarios_to_load.push_front(scenario_id);
            unsigned long current_search_scenario_id = scenario_id;
            while (true) {
                const bpt::ptree* entry = find_scenario_entry(current_search_scenario_id);
                if (entry == NULL) {
                    cerr << "Scenario " << current_search_scenario_id << " was not found in the config file!" << endl;
                    return false;
                }
                auto e = entry->get_optional<unsigned long>("inherits from");
                if (!e.is_initialized())
                    break;
                unsigned long upper_scenario = e.get();
                if (find(scenarios_to_load.begin(), scenarios_to_load.end(), upper_scenario) != scenarios_to_load.end()) {
                    cerr << "Error in config file: Ring closure in the inheritance for scenario ID " << upper_scenario << "!" << endl;
                    return false;
                }
                scenarios_to_load.push_front(upper_scenario);
                current_search_scenario_id = upper_scenario;
            }
            //
            // parse all entries, the inheriting entries overwrite the values of their parents
            DispatchJob job;
            job.id = scenario_id;
            job.name = "";
            job.request.options = dispatch::default_solve_options_from_global();
            optional<filesystem::path> scenario_file;
            optional<filesystem::path> database_file;
            optional<unsigned long>    database_scenario_id;
            for (unsigned long s : scenarios_to_load) {
                for (auto& element : *find_scenario_entry(s)) {
                    const string& element_name = element.first;
                    if (parse_solve_option(element_name, element.second, job.request.options))
                        continue;
                    if      ( element_name.compare("name")                  == 0 )
                    {
                        job.name = element.second.get_value<string>();
                    }
                    else if ( element_name.compare("scenario file")         == 0 )
                    {
                        scenario_file = resolve_relative_to(config_dir, element.second.get_value<string>());
                    }
                    else if ( element_name.compare("database")              == 0 )
                    {
                        database_file = resolve_relative_to(config_dir, element.second.get_value<string>());
                    }
                    else if ( element_name.compare("database scenario id")  == 0 )
                    {
                        database_scenario_id = element.second.get_value<unsigned long>();
                    }
                    else if ( element_name.compare("id")            == 0 ||
                              element_name.compare("inherits from") == 0 ||
                              is_ignored_element(element_name) )
                    {}
                    else
                    {
                        cout << "Unknown config parameter " << element_name << " in scenario " << s << endl;
                    }
                }
            }
            //
            // load the scenario data
            if (scenario_file.has_value()) {
                if (!load_scenario_file(scenario_file.value().string(), job.request))
                    return false;
            } else if (database_file.has_value()) {
                if (!database_scenario_id.has_value()) {
                    cerr << "Scenario " << scenario_id << " references a database, but no 'database scenario id' is given!" << endl;
                    return false;
                }
                if (!load_scenario_from_database(database_file.value().string(), database_scenario_id.value(), job.request))
                    return false;
            } else {
                cerr << "Scenario " << scenario_id << " has neither a 'scenario file' nor a 'database'!" << endl;
                return false;
            }
            jobs.push_back(std::move(job));
        }

    } catch (bpt::ptree_bad_path& j) {
        cerr << "Error when parsing json file: " << j.what() << endl;
        return false;
    } catch (bpt::ptree_bad_data& j) {
        cerr << "Error when parsing json file (wrong data type): " << j.what() << endl;
        return false;
    }
    return true;
}


//
// loads a scenario json file
//
bool configld::load_scenario_file(const string& filepath, dispatch::DispatchRequest& request) {
    if (! filesystem::exists( filesystem::path(filepath) ) ) {
        cerr << "Scenario file " << filepath << " not found!" << endl;
        return false;
    }
    bpt::ptree tree_root;
    try {
        bpt::read_json(filepath, tree_root);
    } catch (bpt::json_parser_error& j) {
        cerr << "Error when reading json file: " << j.what() << endl;
        return false;
    }
    auto read_series = [](const bpt::ptree& node) -> vector<double> {
        vector<double> values;
        for (auto& v : node)
            values.push_back( v.second.get_value<double>() );
        return values;
    };

    try {
        Scenario& scenario = request.scenario;
        scenario = Scenario();
        request.devices.clear();
        optional<long> horizon;
        for (auto& element : tree_root) {
            const string& element_name = element.first;
            if      ( element_name.compare("horizon steps")          == 0 )
            {
                horizon = element.second.get_value<long>();
                if (horizon.value() <= 0)
                    throw ConfigurationError("Scenario file " + filepath + ": 'horizon steps' must be a positive number of time steps.");
            }
            else if ( element_name.compare("time step size in h")    == 0 )
            {
                scenario.timestep_hours = element.second.get_value<double>();
            }
            else if ( element_name.compare("start hour")             == 0 )
            {
                scenario.start_hour = element.second.get_value<double>();
            }
            else if ( element_name.compare("electrical load")        == 0 )
            {
                scenario.electrical_load = read_series(element.second);
            }
            else if ( element_name.compare("heat load")              == 0 )
            {
                scenario.heat_load = read_series(element.second);
            }
            else if ( element_name.compare("cooling load")           == 0 )
            {
                scenario.cooling_load = read_series(element.second);
            }
            else if ( element_name.compare("hydrogen load")          == 0 )
            {
                scenario.hydrogen_load = read_series(element.second);
            }
            else if ( element_name.compare("pv availability")        == 0 )
            {
                scenario.pv_availability = read_series(element.second);
            }
            else if ( element_name.compare("tariff")                 == 0 )
            {
                for (auto& band : element.second) {
                    scenario.tou_bands.push_back({
                        band.second.get<double>("start"),
                        band.second.get<double>("end"),
                        band.second.get<double>("buy"),
                        band.second.get<double>("sell")
                    });
                }
            }
            else if ( element_name.compare("devices")                == 0 )
            {
                for (auto& dev : element.second) {
                    DeviceSpec spec;
                    spec.type = dev.second.get<string>("type");
                    spec.id   = dev.second.get<string>("id", "");
                    auto params = dev.second.get_child_optional("parameters");
                    if (params) {
                        for (auto& p : params.get()) {
                            // flags like "investment" may be given as json booleans
                            auto as_double = p.second.get_value_optional<double>();
                            if (as_double)
                                spec.parameters[p.first] = as_double.get();
                            else
                                spec.parameters[p.first] = p.second.get_value<bool>() ? 1.0 : 0.0;
                        }
                    }
                    request.devices.push_back(std::move(spec));
                }
            }
            else if ( is_ignored_element(element_name) )
            {}
            else
            {
                cout << "Unknown scenario parameter " << element_name << " in " << filepath << endl;
            }
        }
        //
        // without explicit horizon, the length of the first given series defines it
        if (horizon.has_value()) {
            scenario.horizon_steps = (size_t) horizon.value();
        } else {
            for (const vector<double>* series : {&scenario.electrical_load, &scenario.heat_load, &scenario.cooling_load, &scenario.hydrogen_load, &scenario.pv_availability}) {
                if (!series->empty()) {
                    scenario.horizon_steps = series->size();
                    break;
                }
            }
        }
    } catch (bpt::ptree_bad_path& j) {
        cerr << "Error when parsing scenario file " << filepath << ": " << j.what() << endl;
        return false;
    } catch (bpt::ptree_bad_data& j) {
        cerr << "Error when parsing scenario file " << filepath << " (wrong data type): " << j.what() << endl;
        return false;
    }
    return true;
}



//
// Switch off unused parameter warning for the following block,
// as the parameter "colName" is ignored
//
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-parameter"

namespace {

    struct DBScenarioHeader {
        bool   found = false;
        long   horizon_steps = 0;
        double timestep_hours = 1.0;
        double start_hour = 0.0;
    };

    struct DBTimeseries {
        size_t next_timestep = 0;
        vector<double> values[5];   ///< electrical, heat, cooling, hydrogen load and PV availability
        bool any_value_set[5] = {false, false, false, false, false};
    };

    int callback_scenario_header(void* data, int argc, char** argv, char** colName) {
        /*
         * This is the callback function for reading the scenario header
         * (horizon, time step size and start hour)
         */
        if (argc != 3) {
            cerr << "Number of arguments not equal to 3 for one row (in scenario header callback)!" << endl;
            return 1;
        }
        DBScenarioHeader* header = (DBScenarioHeader*) data;
        try {
            header->horizon_steps  = stol(argv[0]);
            header->timestep_hours = (argv[1] != NULL) ? stod(argv[1]) : 1.0;
            header->start_hour     = (argv[2] != NULL) ? stod(argv[2]) : 0.0;
        } catch (exception& e) {
            cerr << "An error happened during the parsing of the scenario header: " << e.what() << endl;
            return 1;
        }
        header->found = true;
        return 0;
    }

    int callback_timeseries(void* data, int argc, char** argv, char** colName) {
        /*
         * This is the callback function for reading the time series of a scenario.
         * Columns: Timestep, electrical_load, heat_load, cooling_load, hydrogen_load, pv_availability
         */
        if (argc != 6) {
            cerr << "Number of arguments not equal to 6 for one row (in time series callback)!" << endl;
            return 1;
        }
        DBTimeseries* ts = (DBTimeseries*) data;
        try {
            if (argv[0] == NULL || stoul(argv[0]) != ts->next_timestep) {
                cerr << "Wrong ordering, duplicated or missing items in the scenario time series!" << endl;
                return 1;
            }
            for (int i = 0; i < 5; i++) {
                if (argv[i + 1] != NULL) {
                    ts->values[i].push_back(stod(argv[i + 1]));
                    ts->any_value_set[i] = true;
                } else {
                    ts->values[i].push_back(0.0);
                }
            }
        } catch (exception& e) {
            cerr << "An error happened during the parsing of the scenario time series at time step " << ts->next_timestep << ": " << e.what() << endl;
            return 1;
        }
        ts->next_timestep++;
        return 0;
    }

    int callback_tariff_bands(void* data, int argc, char** argv, char** colName) {
        if (argc != 4) {
            cerr << "Number of arguments not equal to 4 for one row (in tariff callback)!" << endl;
            return 1;
        }
        try {
            ((vector<TariffBand>*) data)->push_back({stod(argv[0]), stod(argv[1]), stod(argv[2]), stod(argv[3])});
        } catch (exception& e) {
            cerr << "An error happened during the parsing of the tariff bands: " << e.what() << endl;
            return 1;
        }
        return 0;
    }

    int callback_devices(void* data, int argc, char** argv, char** colName) {
        if (argc != 2 || argv[1] == NULL) {
            cerr << "Invalid row in table scenario_devices!" << endl;
            return 1;
        }
        DeviceSpec spec;
        spec.id   = (argv[0] != NULL) ? argv[0] : "";
        spec.type = argv[1];
        ((vector<DeviceSpec>*) data)->push_back(std::move(spec));
        return 0;
    }

    int callback_device_parameters(void* data, int argc, char** argv, char** colName) {
        /*
         * Columns: DeviceID, Parameter, Value
         * The devices must have been loaded before.
         */
        if (argc != 3 || argv[0] == NULL || argv[1] == NULL || argv[2] == NULL) {
            cerr << "Invalid row in table scenario_device_parameters!" << endl;
            return 1;
        }
        vector<DeviceSpec>* devices = (vector<DeviceSpec>*) data;
        const string device_id(argv[0]);
        for (DeviceSpec& spec : *devices) {
            if (spec.id == device_id) {
                try {
                    spec.parameters[argv[1]] = stod(argv[2]);
                } catch (exception& e) {
                    cerr << "An error happened during the parsing of parameter " << argv[1] << " of device " << device_id << ": " << e.what() << endl;
                    return 1;
                }
                return 0;
            }
        }
        cerr << "Parameter " << argv[1] << " is given for the unknown device " << device_id << "!" << endl;
        return 1;
    }

    bool execute_query(sqlite3* dbcon, const string& sql_query, int (*callback)(void*, int, char**, char**), void* data) {
        char* sqlErrorMsg = NULL;
        int ret_val = sqlite3_exec(dbcon, sql_query.c_str(), callback, data, &sqlErrorMsg);
        if (ret_val != SQLITE_OK) {
            cerr << "Error when executing command '" << sql_query << "': " << (sqlErrorMsg != NULL ? sqlErrorMsg : "unknown error") << endl;
            sqlite3_free(sqlErrorMsg);
            return false;
        }
        return true;
    }

    bool load_scenario_from_open_database(sqlite3* dbcon, unsigned long db_scenario_id, dispatch::DispatchRequest& request) {
        const string id_str = to_string(db_scenario_id);
        //
        // 1. header
        DBScenarioHeader header;
        if (!execute_query(dbcon, "SELECT horizon_steps, timestep_hours, start_hour FROM scenarios WHERE ScenarioID = " + id_str + ";",
                           callback_scenario_header, &header))
            return false;
        if (!header.found) {
            cerr << "Scenario " << db_scenario_id << " not found in the scenario database!" << endl;
            return false;
        }
        if (header.horizon_steps <= 0)
            throw ConfigurationError("Scenario " + id_str + " of the scenario database: horizon_steps must be a positive number of time steps.");
        //
        // 2. time series
        DBTimeseries ts;
        if (!execute_query(dbcon, "SELECT Timestep, electrical_load, heat_load, cooling_load, hydrogen_load, pv_availability FROM scenario_timeseries WHERE ScenarioID = " + id_str + " ORDER BY Timestep;",
                           callback_timeseries, &ts))
            return false;
        //
        // 3. tariff
        vector<TariffBand> bands;
        if (!execute_query(dbcon, "SELECT start_hour, end_hour, buy_price, sell_price FROM scenario_tariff_bands WHERE ScenarioID = " + id_str + " ORDER BY start_hour;",
                           callback_tariff_bands, &bands))
            return false;
        //
        // 4. devices and their parameters
        vector<DeviceSpec> devices;
        if (!execute_query(dbcon, "SELECT DeviceID, DeviceType FROM scenario_devices WHERE ScenarioID = " + id_str + " ORDER BY rowid;",
                           callback_devices, &devices))
            return false;
        if (!execute_query(dbcon, "SELECT DeviceID, Parameter, Value FROM scenario_device_parameters WHERE ScenarioID = " + id_str + ";",
                           callback_device_parameters, &devices))
            return false;

        Scenario scenario;
        scenario.horizon_steps  = (size_t) header.horizon_steps;
        scenario.timestep_hours = header.timestep_hours;
        scenario.start_hour     = header.start_hour;
        // columns without any value are treated as "not given"
        vector<double>* targets[5] = {&scenario.electrical_load, &scenario.heat_load, &scenario.cooling_load, &scenario.hydrogen_load, &scenario.pv_availability};
        for (int i = 0; i < 5; i++) {
            if (ts.any_value_set[i])
                *targets[i] = std::move(ts.values[i]);
        }
        scenario.tou_bands = std::move(bands);
        request.scenario = std::move(scenario);
        request.devices  = std::move(devices);
        return true;
    }

}

#pragma GCC diagnostic pop


bool configld::load_scenario_from_database(const string& filepath, unsigned long db_scenario_id, dispatch::DispatchRequest& request) {
    if (! filesystem::exists( filesystem::path(filepath) ) ) {
        cerr << "Scenario database file " << filepath << " not found!" << endl;
        return false;
    }

    sqlite3* dbcon = NULL;
    int rc = sqlite3_open_v2(filepath.c_str(), &dbcon, SQLITE_OPEN_READONLY, NULL);
    if (rc != SQLITE_OK) {
        cerr << "Error opening the scenario database " << filepath << ": " << sqlite3_errmsg(dbcon) << endl;
        sqlite3_close(dbcon);
        return false;
    }
    cout << "Loading scenario " << db_scenario_id << " from database " << filepath << " ..." << endl;
    bool success = false;
    try {
        success = load_scenario_from_open_database(dbcon, db_scenario_id, request);
    } catch (const ConfigurationError&) {
        sqlite3_close(dbcon);
        throw;
    }
    sqlite3_close(dbcon);
    return success;
}



//
// Macros for printing variables
//
#define PRINT_VAR(varname) current_outstream << "    " << std::setw(44) << std::left << #varname << " = " << varname << "\n"
#define PRINT_ENUM_VAR(varname, name_func) current_outstream << "    " << std::setw(44) << std::left << #varname << " = " << name_func(varname) << "\n"

//
// Implementation of configld::output_variable_values()
//
void configld::output_variable_values(ostream& current_outstream) {
    current_outstream << "Dispatch optimization information:\n";
    current_outstream << "    Program build at " << __DATE__ << " " << __TIME__ <<  "\n";
    #ifdef __GNUC__
    current_outstream << "    GCC was used as compiler.\n    GCC Version = " << __GNUC__ << "." << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
    #endif
    #ifdef __VERSION__
    current_outstream << "    Compiler version = " << __VERSION__ << "\n";
    #endif
    #ifdef __OPTIMIZE__
    current_outstream << "    Optimization was enabled during compile time.\n";
    #endif
    #ifdef USE_GUROBI
    current_outstream << "    Gurobi support was enabled during compile time.\n";
    #endif
    current_outstream << "    C++ standard = " << __cplusplus << "\n\n";
    current_outstream << "List of parameter settings:\n";
    // Solver settings
    current_outstream << "  Solver settings:\n";
    PRINT_ENUM_VAR(Global::get_solver_backend(), global::solver_backend_name);
    PRINT_VAR(Global::get_lp_solver_name());
    PRINT_VAR(Global::get_milp_solver_name());
    PRINT_ENUM_VAR(Global::get_solve_mode(), global::solve_mode_name);
    PRINT_VAR(Global::get_solver_time_limit_s());
    PRINT_VAR(Global::get_relative_mip_gap());
    PRINT_VAR(Global::get_diagnose_infeasibility());
    // Model settings
    current_outstream << "  Model settings:\n";
    PRINT_ENUM_VAR(Global::get_soc_boundary_policy(), global::soc_boundary_policy_name);
    PRINT_VAR(Global::get_operating_state_threshold_kW());
    // Run settings
    current_outstream << "  Run settings:\n";
    PRINT_VAR(Global::get_n_threads());
    PRINT_VAR(Global::get_output_path());
    current_outstream << global::output_section_delimiter << "\n";
}
