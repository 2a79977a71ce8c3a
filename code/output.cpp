#include "output.h"

#include <cmath>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include "components.h"
#include "device_catalog.h"
#include "dispatch_logic.h"
#include "global.h"
#include "result_extraction.h"
#include "setup_and_dataloading.h"

using namespace std;
using namespace output;


bool output::initializeDirectories() {
    //
    // create the output folder, if it does not exist
    filesystem::path dirpath = Global::get_output_path();
    try {
        if (!filesystem::is_directory(dirpath)) {
            filesystem::create_directories(dirpath);
        }
    } catch (filesystem::filesystem_error& e) {
        cerr << "Output directory " << dirpath << " cannot be created: " << e.what() << endl;
        return false;
    }
    global::current_output_dir = dirpath;
    //
    // output build information
    ofstream build_info_output( dirpath / "build_and_run_info.txt", std::ofstream::out );
    build_info_output << "Program build at " << __DATE__ << " " << __TIME__ <<  "\n";
    #ifdef __GNUC__
    build_info_output << "GCC was used as compiler.\nGCC Version = " << __GNUC__ << "." << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
    #endif
    #ifdef __VERSION__
    build_info_output << "Compiler version = " << __VERSION__ << "\n";
    #endif
    #ifdef __OPTIMIZE__
    build_info_output << "Optimization was enabled during compile time.\n";
    #endif
    build_info_output << "C++ standard = " << __cplusplus << "\n\n";
    //
    time_t current_time = time(nullptr);
    build_info_output << "Time of run start = " << put_time(localtime(&current_time), "%F %T") << "\n";
    build_info_output.close();
    //
    // output the parameter settings
    ofstream param_output( dirpath / "parameter-settings-general.txt", std::ofstream::out );
    configld::output_variable_values(param_output);
    param_output.close();
    return true;
}


string output::scenarioFileName(unsigned long scenario_id, const char* suffix) {
    stringstream fname;
    fname << setw(4) << setfill('0') << scenario_id << "-" << suffix;
    return fname.str();
}


void output::writeDispatchTable(ostream& out, const DispatchResult& result) {
    //
    // header
    out << "Timestep";
    for (const DeviceDispatch& dd : result.devices) {
        for (const auto& [carrier, series] : dd.injection_kW)
            out << "," << dd.device_id << " " << carrier_name(carrier) << " [kW]";
        for (const LinkModeDispatch& lmd : dd.modes) {
            out << "," << dd.device_id << " " << lmd.name << " input [kW]";
            if (!lmd.on.empty())
                out << "," << dd.device_id << " " << lmd.name << " on";
        }
    }
    out << "\n";
    //
    // one row per time step
    for (size_t t = 0; t < result.horizon; t++) {
        out << t;
        for (const DeviceDispatch& dd : result.devices) {
            for (const auto& [carrier, series] : dd.injection_kW)
                out << "," << series[t];
            for (const LinkModeDispatch& lmd : dd.modes) {
                out << "," << lmd.flow_kW[t];
                if (!lmd.on.empty())
                    out << "," << (lmd.on[t] ? 1 : 0);
            }
        }
        out << "\n";
    }
}

void output::writeSOCTable(ostream& out, const DispatchResult& result) {
    out << "SOC point";
    for (const DeviceDispatch& dd : result.devices) {
        if (dd.capability == DeviceCapability::Storage)
            out << "," << dd.device_id << " [kWh]";
    }
    out << "\n";
    for (size_t t = 0; t <= result.horizon; t++) {
        out << t;
        for (const DeviceDispatch& dd : result.devices) {
            if (dd.capability == DeviceCapability::Storage)
                out << "," << dd.soc_kWh[t];
        }
        out << "\n";
    }
}

void output::writeBusBalanceTable(ostream& out, const DispatchResult& result) {
    out << "Timestep";
    for (const BusBalanceSeries& bbs : result.buses) {
        const char* cname = carrier_name(bbs.carrier);
        out << "," << cname << " supply [kW]," << cname << " consumption [kW]," << cname << " demand [kW]," << cname << " residual [kW]";
    }
    out << "\n";
    for (size_t t = 0; t < result.horizon; t++) {
        out << t;
        for (const BusBalanceSeries& bbs : result.buses)
            out << "," << bbs.supply_kW[t] << "," << bbs.consumption_kW[t] << "," << bbs.demand_kW[t] << "," << bbs.residual_kW[t];
        out << "\n";
    }
}

void output::writeOperatingStatesTable(ostream& out, const DispatchResult& result) {
    out << "Timestep";
    for (const DeviceDispatch& dd : result.devices)
        out << "," << dd.device_id;
    out << "\n";
    for (size_t t = 0; t < result.horizon; t++) {
        out << t;
        for (const DeviceDispatch& dd : result.devices)
            out << "," << operating_state_name(dd.states[t]);
        out << "\n";
    }
}

void output::writeSummary(ostream& out, const string& scenario_name, const DispatchResult& result) {
    out << "Scenario name     = " << scenario_name << "\n";
    out << "Status            = optimal\n";
    out << "Problem class     = " << global::problem_class_name(result.problem_class) << "\n";
    out << "Solver            = " << result.solver_name << "\n";
    out << "Solve time [s]    = " << result.solve_time_s << "\n";
    out << "Horizon           = " << result.horizon << " x " << result.timestep_hours << " h\n";
    out << "Objective value   = " << result.objective_value << "\n";
    out << global::output_section_delimiter << "\n";
    out << "Cost breakdown:\n";
    out << "    Fuel cost       = " << result.costs.fuel_cost << "\n";
    out << "    Grid cost       = " << result.costs.grid_cost << "\n";
    out << "    Cycling penalty = " << result.costs.cycling_penalty << "\n";
    out << "    Total           = " << result.costs.total << "\n";
    out << "Cost per device:\n";
    for (const DeviceDispatch& dd : result.devices) {
        out << "    " << std::setw(24) << std::left << dd.device_id << " (" << dd.device_type << ", " << capability_name(dd.capability) << ") = " << dd.cost << "\n";
    }
}

void output::writeFailure(ostream& out, const string& scenario_name, const dispatch::SolveFailure& failure) {
    out << "Scenario name     = " << scenario_name << "\n";
    out << "Status            = " << dispatch::failure_kind_name(failure.kind) << "\n";
    out << "Reason            = " << failure.reason << "\n";
    if (!failure.violations.empty()) {
        out << global::output_section_delimiter << "\n";
        out << "Bus balance violations (positive = shortfall, negative = surplus):\n";
        out << "Carrier,Timestep,Amount [kW]\n";
        for (const dispatch::BalanceViolation& v : failure.violations)
            out << carrier_name(v.carrier) << "," << v.timestep << "," << v.amount_kW << "\n";
    }
}


void output::outputDispatchResult(unsigned long scenario_id, const string& scenario_name, const DispatchResult& result) {
    const filesystem::path& dirpath = global::current_output_dir;
    ofstream ofs_dispatch( dirpath / scenarioFileName(scenario_id, "dispatch.csv"), std::ofstream::out );
    writeDispatchTable(ofs_dispatch, result);
    ofs_dispatch.close();
    ofstream ofs_soc( dirpath / scenarioFileName(scenario_id, "soc.csv"), std::ofstream::out );
    writeSOCTable(ofs_soc, result);
    ofs_soc.close();
    ofstream ofs_balance( dirpath / scenarioFileName(scenario_id, "bus-balance.csv"), std::ofstream::out );
    writeBusBalanceTable(ofs_balance, result);
    ofs_balance.close();
    ofstream ofs_states( dirpath / scenarioFileName(scenario_id, "operating-states.csv"), std::ofstream::out );
    writeOperatingStatesTable(ofs_states, result);
    ofs_states.close();
    ofstream ofs_summary( dirpath / scenarioFileName(scenario_id, "summary.txt"), std::ofstream::out );
    writeSummary(ofs_summary, scenario_name, result);
    ofs_summary.close();
}

void output::outputDispatchFailure(unsigned long scenario_id, const string& scenario_name, const dispatch::SolveFailure& failure) {
    ofstream ofs( global::current_output_dir / scenarioFileName(scenario_id, "failure.txt"), std::ofstream::out );
    writeFailure(ofs, scenario_name, failure);
    ofs.close();
}


void output::outputRuntimeInformation(long seconds_setup, long seconds_main_run) {
    ofstream ofs( global::current_output_dir / "build_and_run_info.txt", std::ofstream::app );
    ofs << "Duration of setup and data loading [s] = " << seconds_setup << "\n";
    ofs << "Duration of all solves [s]             = " << seconds_main_run << "\n";
    ofs.close();
}


void output::printDeviceCatalog(ostream& out) {
    const DeviceCatalog& catalog = DeviceCatalog::GetInstance();
    out << "Available device types:\n";
    for (const DeviceArchetype& arch : catalog.get_archetypes()) {
        out << "  " << arch.type_name << " (" << arch.display_name << ", " << capability_name(arch.capability) << ")\n";
        for (const ParameterSchema& ps : arch.parameters) {
            out << "    " << std::setw(22) << std::left << ps.name << " default = " << std::setw(8) << ps.default_value;
            out << " range = " << (ps.min_exclusive ? "(" : "[") << ps.min_value << ", " << ps.max_value;
            out << ((std::isinf(ps.max_value) && !ps.infinite_allowed) ? ")" : "]");
            out << " " << ps.unit << "   " << ps.description << "\n";
        }
    }
    out << "  heat_pump (alias, parameter 'mode_family':";
    for (HeatPumpFamily family : {HeatPumpFamily::AirSource, HeatPumpFamily::ShallowGroundSource, HeatPumpFamily::DeepGroundSource})
        out << " " << static_cast<int>(family) << " = " << heat_pump_family_name(family) << (family != HeatPumpFamily::DeepGroundSource ? "," : ")\n");
}
