#include "problem_formulator.h"

#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "components.h"
#include "constraint_generator.h"
#include "global.h"
#include "network.h"
#include "optimization_problem.h"

using namespace std;


global::ProblemClass decide_problem_class(const Network& net, global::SolveMode mode) {
    const bool needs_binaries = net.requires_mode_exclusivity();
    switch (mode) {
        case global::SolveMode::MILP:
            return global::ProblemClass::MILP;
        case global::SolveMode::LP:
            if (needs_binaries) {
                cerr << "Warning: LP requested, but the network contains devices with exclusive operating modes. Solving as MILP." << endl;
                return global::ProblemClass::MILP;
            }
            return global::ProblemClass::LP;
        case global::SolveMode::Auto:
            break;
    }
    return needs_binaries ? global::ProblemClass::MILP : global::ProblemClass::LP;
}


namespace {

    /*!
     * Creates the variables of one device together with their bounds and objective coefficients.
     */
    struct VariableCreator {
        const Device& device;
        const Network& net;
        const vector<double>& buy;   ///< Buy price per time step (empty without tariff)
        const vector<double>& sell;  ///< Sell price per time step (empty without tariff)
        LinearProblem& problem;
        DeviceVariables& vars;

        void operator()(const GeneratorUnit& gen) const {
            const size_t T  = net.get_horizon();
            const double dt = net.get_timestep_hours();
            vars.output.resize(T);
            for (size_t t = 0; t < T; t++) {
                const string tstr = to_string(t);
                double avail = gen.availability.empty() ? 1.0 : gen.availability[t];
                // avoid inf * 0
                double upper = (avail <= 0.0) ? 0.0 : gen.capacity_kW * avail;
                double cost  = device.marginal_cost;
                if (gen.tariff_priced)
                    cost += buy[t];
                vars.output[t] = problem.add_variable(device.id + (gen.tariff_priced ? "_import_" : "_output_") + tstr, 0.0, upper, cost * dt);
            }
            if (gen.tariff_priced && gen.export_capacity_kW > 0.0) {
                vars.grid_export.resize(T);
                for (size_t t = 0; t < T; t++) {
                    vars.grid_export[t] = problem.add_variable(device.id + "_export_" + to_string(t), 0.0, gen.export_capacity_kW, -sell[t] * dt);
                }
            }
        }

        void operator()(const StorageUnit& st) const {
            const size_t T  = net.get_horizon();
            const double dt = net.get_timestep_hours();
            vars.charge.resize(T);
            vars.discharge.resize(T);
            vars.soc.resize(T + 1);
            for (size_t t = 0; t < T; t++) {
                const string tstr = to_string(t);
                vars.charge[t]    = problem.add_variable(device.id + "_charge_"    + tstr, 0.0, st.power_capacity_kW);
                vars.discharge[t] = problem.add_variable(device.id + "_discharge_" + tstr, 0.0, st.power_capacity_kW, device.marginal_cost * dt);
            }
            const double soc_lb = st.soc_min_fraction * st.energy_capacity_kWh;
            const double soc_ub = st.soc_max_fraction * st.energy_capacity_kWh;
            for (size_t t = 0; t <= T; t++) {
                vars.soc[t] = problem.add_variable(device.id + "_soc_" + to_string(t), soc_lb, soc_ub);
            }
        }

        void operator()(const LinkUnit& link) const {
            const size_t T  = net.get_horizon();
            const double dt = net.get_timestep_hours();
            vars.mode_flow.assign(link.modes.size(), vector<size_t>(T, NO_INDEX));
            for (size_t m = 0; m < link.modes.size(); m++) {
                for (size_t t = 0; t < T; t++) {
                    vars.mode_flow[m][t] = problem.add_variable(device.id + "_" + link.modes[m].name + "_" + to_string(t), 0.0, link.capacity_kW, device.marginal_cost * dt);
                }
            }
        }
    };

}


FormulatedProblem formulate(const Network& net, global::SolveMode mode, global::SOCBoundaryPolicy soc_boundary) {
    FormulatedProblem fp;
    fp.problem_class = decide_problem_class(net, mode);

    vector<double> buy;
    vector<double> sell;
    if (net.get_tariff().has_value()) {
        buy  = net.get_tariff()->buy_prices (net.get_horizon(), net.get_timestep_hours(), net.get_start_hour());
        sell = net.get_tariff()->sell_prices(net.get_horizon(), net.get_timestep_hours(), net.get_start_hour());
    }

    //
    // 1. variables (and objective)
    const vector<Device>& devices = net.get_devices();
    fp.layout.devices.resize(devices.size());
    for (size_t devIdx = 0; devIdx < devices.size(); devIdx++) {
        visit(VariableCreator{devices[devIdx], net, buy, sell, fp.problem, fp.layout.devices[devIdx]}, devices[devIdx].unit);
    }

    //
    // 2. rows
    if (fp.problem_class == global::ProblemClass::MILP) {
        constraints::add_mode_exclusivity(net, fp.problem, fp.layout);
    }
    constraints::add_storage_continuity(net, fp.problem, fp.layout, soc_boundary);
    constraints::add_bus_balances(net, fp.problem, fp.layout);

    return fp;
}
