#include "result_extraction.h"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "components.h"
#include "helper.h"
#include "network.h"
#include "optimization_problem.h"
#include "problem_formulator.h"

using namespace std;


const char* operating_state_name(OperatingState state) {
    switch (state) {
        case OperatingState::Stopped:     return "stopped";
        case OperatingState::Running:     return "running";
        case OperatingState::Charging:    return "charging";
        case OperatingState::Discharging: return "discharging";
        case OperatingState::Idle:        return "idle";
    }
    return "";
}

const DeviceDispatch* DispatchResult::find_device(const string& device_id) const {
    for (const DeviceDispatch& d : devices) {
        if (d.device_id == device_id)
            return &d;
    }
    return NULL;
}

const BusBalanceSeries* DispatchResult::find_bus(Carrier c) const {
    for (const BusBalanceSeries& b : buses) {
        if (b.carrier == c)
            return &b;
    }
    return NULL;
}


namespace {

    // removes numerical noise of the solver, e.g. -1e-12
    double clean(double value) {
        return fabs(value) < 1e-9 ? 0.0 : value;
    }

    vector<double> read_series(const vector<size_t>& indices, const vector<double>& values) {
        vector<double> series(indices.size());
        for (size_t t = 0; t < indices.size(); t++)
            series[t] = clean(values[indices[t]]);
        return series;
    }

}


DispatchResult extract_results(const Network& net, const FormulatedProblem& fp, const vector<double>& values, double objective_value, double state_threshold_kW) {
    if (values.size() != fp.problem.n_variables()) {
        throw logic_error("Number of variable values (" + to_string(values.size()) + ") does not match the number of problem variables (" + to_string(fp.problem.n_variables()) + ").");
    }
    const size_t T  = net.get_horizon();
    const double dt = net.get_timestep_hours();

    DispatchResult result;
    result.problem_class   = fp.problem_class;
    result.objective_value = objective_value;
    result.horizon         = T;
    result.timestep_hours  = dt;

    vector<double> buy;
    vector<double> sell;
    if (net.get_tariff().has_value()) {
        buy  = net.get_tariff()->buy_prices (T, dt, net.get_start_hour());
        sell = net.get_tariff()->sell_prices(T, dt, net.get_start_hour());
    }

    //
    // bus balance series, filled while walking over the devices
    const vector<Bus>& buses = net.get_buses();
    for (const Bus& bus : buses) {
        BusBalanceSeries bbs;
        bbs.carrier = bus.carrier;
        bbs.supply_kW.assign(T, 0.0);
        bbs.consumption_kW.assign(T, 0.0);
        bbs.demand_kW = bus.demand_kW;
        result.buses.push_back(std::move(bbs));
    }
    auto book = [&](DeviceDispatch& dd, Carrier c, size_t t, double value) {
        // positive values are injections, negative ones withdrawals
        dd.injection_kW[c][t] += value;
        BusBalanceSeries& bbs = result.buses[net.get_bus_index(c)];
        if (value >= 0.0)
            bbs.supply_kW[t] += value;
        else
            bbs.consumption_kW[t] -= value;
    };

    //
    // device series, states and costs
    const vector<Device>& devices = net.get_devices();
    for (size_t devIdx = 0; devIdx < devices.size(); devIdx++) {
        const Device& d = devices[devIdx];
        const DeviceVariables& vars = fp.layout.devices[devIdx];
        DeviceDispatch dd;
        dd.device_id   = d.id;
        dd.device_type = d.type;
        dd.capability  = d.get_capability();
        for (Carrier c : d.get_connected_carriers())
            dd.injection_kW[c].assign(T, 0.0);

        if (const GeneratorUnit* gen = get_if<GeneratorUnit>(&d.unit)) {
            dd.output_kW = read_series(vars.output, values);
            dd.input_kW  = vars.grid_export.empty() ? vector<double>(T, 0.0) : read_series(vars.grid_export, values);
            for (size_t t = 0; t < T; t++) {
                book(dd, gen->bus, t,  dd.output_kW[t]);
                book(dd, gen->bus, t, -dd.input_kW[t]);
                double step_cost = d.marginal_cost * dd.output_kW[t] * dt;
                if (gen->tariff_priced) {
                    step_cost += (buy[t] * dd.output_kW[t] - sell[t] * dd.input_kW[t]) * dt;
                    result.costs.grid_cost += step_cost;
                } else {
                    result.costs.fuel_cost += step_cost;
                }
                dd.cost += step_cost;
                bool running = dd.output_kW[t] > state_threshold_kW || dd.input_kW[t] > state_threshold_kW;
                dd.states.push_back(running ? OperatingState::Running : OperatingState::Stopped);
            }

        } else if (const StorageUnit* st = get_if<StorageUnit>(&d.unit)) {
            dd.charge_kW    = read_series(vars.charge, values);
            dd.discharge_kW = read_series(vars.discharge, values);
            dd.soc_kWh      = read_series(vars.soc, values);
            dd.output_kW    = dd.discharge_kW;
            dd.input_kW     = dd.charge_kW;
            for (size_t t = 0; t < T; t++) {
                book(dd, st->bus, t,  dd.discharge_kW[t]);
                book(dd, st->bus, t, -dd.charge_kW[t]);
                double step_cost = d.marginal_cost * dd.discharge_kW[t] * dt;
                result.costs.cycling_penalty += step_cost;
                dd.cost += step_cost;
                if (dd.charge_kW[t] > state_threshold_kW && dd.charge_kW[t] >= dd.discharge_kW[t])
                    dd.states.push_back(OperatingState::Charging);
                else if (dd.discharge_kW[t] > state_threshold_kW)
                    dd.states.push_back(OperatingState::Discharging);
                else
                    dd.states.push_back(OperatingState::Idle);
            }

        } else if (const LinkUnit* link = get_if<LinkUnit>(&d.unit)) {
            dd.output_kW.assign(T, 0.0);
            dd.input_kW.assign(T, 0.0);
            for (size_t m = 0; m < link->modes.size(); m++) {
                LinkModeDispatch lmd;
                lmd.name    = link->modes[m].name;
                lmd.flow_kW = read_series(vars.mode_flow[m], values);
                if (!vars.mode_on.empty()) {
                    for (size_t t = 0; t < T; t++)
                        lmd.on.push_back(values[vars.mode_on[m][t]] > 0.5);
                }
                for (size_t t = 0; t < T; t++) {
                    const double flow = lmd.flow_kW[t];
                    dd.input_kW[t] += flow;
                    book(dd, link->input, t, -flow);
                    for (const LinkOutput& out : link->modes[m].outputs) {
                        dd.output_kW[t] += flow * out.efficiency;
                        book(dd, out.carrier, t, flow * out.efficiency);
                    }
                }
                dd.modes.push_back(std::move(lmd));
            }
            for (size_t t = 0; t < T; t++) {
                double step_cost = d.marginal_cost * dd.input_kW[t] * dt;
                result.costs.fuel_cost += step_cost;
                dd.cost += step_cost;
                dd.states.push_back(dd.input_kW[t] > state_threshold_kW ? OperatingState::Running : OperatingState::Stopped);
            }
        }
        result.devices.push_back(std::move(dd));
    }

    for (BusBalanceSeries& bbs : result.buses) {
        bbs.residual_kW.resize(T);
        for (size_t t = 0; t < T; t++)
            bbs.residual_kW[t] = clean(bbs.supply_kW[t] - bbs.consumption_kW[t] - bbs.demand_kW[t]);
    }

    result.costs.total = result.costs.fuel_cost + result.costs.grid_cost + result.costs.cycling_penalty;
    if (!is_approx_equal(result.costs.total, objective_value, 1e-4, 1e-6)) {
        cerr << "Warning: Total cost of the extracted dispatch (" << result.costs.total;
        cerr << ") differs from the solver objective (" << objective_value << ")." << endl;
    }
    return result;
}
