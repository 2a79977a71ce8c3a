#include "constraint_generator.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "components.h"
#include "global.h"
#include "network.h"
#include "optimization_problem.h"

using namespace std;


namespace {

    /*!
     * Contribution of one device to the balance of one bus at one time step.
     * Injections are positive, withdrawals are negative.
     */
    struct BalanceContribution {
        Carrier carrier;
        size_t t;
        const DeviceVariables& vars;
        vector<pair<size_t, double>>& terms;

        void operator()(const GeneratorUnit& gen) const {
            if (gen.bus != carrier)
                return;
            terms.emplace_back(vars.output[t], 1.0);
            if (!vars.grid_export.empty())
                terms.emplace_back(vars.grid_export[t], -1.0);
        }
        void operator()(const StorageUnit& st) const {
            if (st.bus != carrier)
                return;
            terms.emplace_back(vars.discharge[t], 1.0);
            terms.emplace_back(vars.charge[t],   -1.0);
        }
        void operator()(const LinkUnit& link) const {
            for (size_t m = 0; m < link.modes.size(); m++) {
                size_t flow = vars.mode_flow[m][t];
                if (link.input == carrier)
                    terms.emplace_back(flow, -1.0);
                for (const LinkOutput& out : link.modes[m].outputs) {
                    if (out.carrier == carrier)
                        terms.emplace_back(flow, out.efficiency);
                }
            }
        }
    };

}


void constraints::add_mode_exclusivity(const Network& net, LinearProblem& problem, VariableLayout& layout) {
    const size_t T = net.get_horizon();
    const vector<Device>& devices = net.get_devices();
    for (size_t devIdx = 0; devIdx < devices.size(); devIdx++) {
        const Device& d = devices[devIdx];
        const LinkUnit* link = get_if<LinkUnit>(&d.unit);
        if (link == NULL || !link->has_mode_exclusivity())
            continue;
        DeviceVariables& vars = layout.devices[devIdx];
        const size_t n_modes = link->modes.size();
        vars.mode_on.assign(n_modes, vector<size_t>(T, NO_INDEX));
        for (size_t t = 0; t < T; t++) {
            const string tstr = to_string(t);
            for (size_t m = 0; m < n_modes; m++) {
                vars.mode_on[m][t] = problem.add_variable(d.id + "_" + link->modes[m].name + "_on_" + tstr, 0.0, 1.0, 0.0, VariableType::Binary);
            }
            // at most one mode per time step
            size_t r_excl = problem.add_row("Mode exclusivity " + d.id + " " + tstr, -LinearProblem::infinity(), 1.0,
                                            {RowKind::ModeExclusivity, d.id, link->input, t});
            for (size_t m = 0; m < n_modes; m++)
                problem.add_to_coefficient(r_excl, vars.mode_on[m][t], 1.0);
            // a mode can only carry a flow if its indicator is set
            for (size_t m = 0; m < n_modes; m++) {
                size_t r_link = problem.add_row("Mode indicator " + d.id + " " + link->modes[m].name + " " + tstr, -LinearProblem::infinity(), 0.0,
                                                {RowKind::ModeIndicatorLink, d.id, link->input, t});
                problem.add_to_coefficient(r_link, vars.mode_flow[m][t], 1.0);
                problem.add_to_coefficient(r_link, vars.mode_on[m][t],  -link->capacity_kW);
            }
            // all modes share the capacity
            size_t r_share = problem.add_row("Capacity sharing " + d.id + " " + tstr, -LinearProblem::infinity(), link->capacity_kW,
                                             {RowKind::CapacitySharing, d.id, link->input, t});
            for (size_t m = 0; m < n_modes; m++)
                problem.add_to_coefficient(r_share, vars.mode_flow[m][t], 1.0);
        }
    }
}


void constraints::add_storage_continuity(const Network& net, LinearProblem& problem, const VariableLayout& layout, global::SOCBoundaryPolicy policy) {
    const size_t T   = net.get_horizon();
    const double dt  = net.get_timestep_hours();
    const vector<Device>& devices = net.get_devices();
    for (size_t devIdx = 0; devIdx < devices.size(); devIdx++) {
        const Device& d = devices[devIdx];
        const StorageUnit* st = get_if<StorageUnit>(&d.unit);
        if (st == NULL)
            continue;
        const DeviceVariables& vars = layout.devices[devIdx];
        for (size_t t = 0; t < T; t++) {
            /*
             soc[t + 1] == soc[t] * (1.0 - self_discharge * dt) +
                           charge[t]    * dt * eta_c -
                           discharge[t] * dt / eta_d
             */
            size_t r = problem.add_row("SOC continuity " + d.id + " " + to_string(t), 0.0, 0.0,
                                       {RowKind::StorageContinuity, d.id, st->bus, t});
            problem.add_to_coefficient(r, vars.soc[t + 1], -1.0);
            problem.add_to_coefficient(r, vars.soc[t],      1.0 - st->self_discharge_per_h * dt);
            problem.add_to_coefficient(r, vars.charge[t],    dt * st->charge_efficiency);
            problem.add_to_coefficient(r, vars.discharge[t],-dt / st->discharge_efficiency);
        }
        if (policy == global::SOCBoundaryPolicy::Cyclic) {
            size_t r = problem.add_row("SOC cyclic " + d.id, 0.0, 0.0, {RowKind::StorageBoundary, d.id, st->bus, T});
            problem.add_to_coefficient(r, vars.soc[T],  1.0);
            problem.add_to_coefficient(r, vars.soc[0], -1.0);
        } else {
            const double e_init = st->initial_soc_fraction * st->energy_capacity_kWh;
            size_t r = problem.add_row("SOC initial " + d.id, e_init, e_init, {RowKind::StorageBoundary, d.id, st->bus, 0});
            problem.add_to_coefficient(r, vars.soc[0], 1.0);
        }
    }
}


void constraints::add_bus_balances(const Network& net, LinearProblem& problem, VariableLayout& layout) {
    const size_t T = net.get_horizon();
    const vector<Device>& devices = net.get_devices();
    const vector<Bus>& buses = net.get_buses();
    //
    // check of the wiring: every carrier of a device needs a bus
    // and the device must be registered at this bus
    for (size_t devIdx = 0; devIdx < devices.size(); devIdx++) {
        for (Carrier c : devices[devIdx].get_connected_carriers()) {
            const Bus& bus = buses[net.get_bus_index(c)];
            if (find(bus.devices.begin(), bus.devices.end(), devIdx) == bus.devices.end()) {
                throw logic_error("Device '" + devices[devIdx].id + "' is not attached to the " + carrier_name(c) + " bus.");
            }
        }
    }
    //
    // one balance row per bus and time step
    layout.balance_rows.assign(buses.size(), vector<size_t>(T, NO_INDEX));
    vector<pair<size_t, double>> terms;
    for (size_t busIdx = 0; busIdx < buses.size(); busIdx++) {
        const Bus& bus = buses[busIdx];
        for (size_t t = 0; t < T; t++) {
            const double demand = bus.demand_kW[t];
            size_t r = problem.add_row(string("Balance ") + carrier_name(bus.carrier) + " " + to_string(t), demand, demand,
                                       {RowKind::BusBalance, carrier_name(bus.carrier), bus.carrier, t});
            terms.clear();
            for (size_t devIdx : bus.devices) {
                visit(BalanceContribution{bus.carrier, t, layout.devices[devIdx], terms}, devices[devIdx].unit);
            }
            for (const auto& [var, coeff] : terms)
                problem.add_to_coefficient(r, var, coeff);
            layout.balance_rows[busIdx][t] = r;
        }
    }
}
