/*
 * result_extraction.h
 *
 * Converts the raw variable values of a solved dispatch problem into
 * dispatch series, SOC trajectories, bus balances, operating states
 * and the cost breakdown.
 *
 */

#ifndef RESULT_EXTRACTION_H
#define RESULT_EXTRACTION_H

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "components.h"
#include "global.h"
#include "network.h"
#include "problem_formulator.h"


/*!
 * Operating state of a device in one time step
 */
enum struct OperatingState : short {
    Stopped,    ///< Generator or link without output
    Running,    ///< Generator or link with output above the threshold
    Charging,
    Discharging,
    Idle        ///< Storage unit neither charging nor discharging
};

const char* operating_state_name(OperatingState state);

struct LinkModeDispatch {
    std::string name;
    std::vector<double> flow_kW; ///< Input flow of this mode per time step
    std::vector<bool> on;        ///< Mode indicator per time step (only for links with exclusive modes, empty otherwise)
};

/*!
 * Dispatch of one device. Only the series that fit to the capability of the device are filled.
 */
struct DeviceDispatch {
    std::string device_id;
    std::string device_type;
    DeviceCapability capability;
    std::map<Carrier, std::vector<double>> injection_kW; ///< Net injection onto every connected bus (positive = supply, negative = consumption)
    std::vector<double> output_kW;    ///< Generator output (grid import), sum of all link outputs or storage discharge
    std::vector<double> input_kW;     ///< Grid export, link input or storage charge
    std::vector<double> charge_kW;    ///< Storage only
    std::vector<double> discharge_kW; ///< Storage only
    std::vector<double> soc_kWh;      ///< Storage only, T+1 values
    std::vector<LinkModeDispatch> modes; ///< Links only
    std::vector<OperatingState> states;
    double cost = 0.0;                ///< Contribution of this device to the total cost
};

struct BusBalanceSeries {
    Carrier carrier;
    std::vector<double> supply_kW;      ///< Sum of all injections
    std::vector<double> consumption_kW; ///< Sum of all withdrawals by devices (without demand)
    std::vector<double> demand_kW;
    std::vector<double> residual_kW;    ///< supply - consumption - demand, zero within the solver tolerance
};

struct CostBreakdown {
    double fuel_cost = 0.0;       ///< Generators except the grid connection plus links
    double grid_cost = 0.0;       ///< Grid import cost minus export revenue
    double cycling_penalty = 0.0; ///< Storage discharge cost
    double total = 0.0;
};

/*!
 * The result of a successful dispatch solve.
 */
struct DispatchResult {
    global::ProblemClass problem_class;
    std::string solver_name;
    double solve_time_s = 0.0;
    double objective_value = 0.0;
    std::size_t horizon = 0;
    double timestep_hours = 1.0;
    CostBreakdown costs;
    std::vector<DeviceDispatch> devices; ///< Same order as the devices of the network
    std::vector<BusBalanceSeries> buses; ///< Same order as the buses of the network

    const DeviceDispatch* find_device(const std::string& device_id) const;
    const BusBalanceSeries* find_bus(Carrier c) const;
};


/**
 * Extracts the dispatch result from the raw variable values.
 * The total cost is recomputed from the dispatch series. If it differs from objective_value,
 * a warning is written to stderr.
 *
 * @param net: The network the problem was formulated for
 * @param fp: The formulated problem
 * @param values: Variable values in the order of the problem variables
 * @param objective_value: The objective value as reported by the solver
 * @param state_threshold_kW: Minimal power for a device to count as running, charging or discharging
 *
 * @throws std::logic_error: If the number of values does not fit to the problem
 */
DispatchResult extract_results(const Network& net, const FormulatedProblem& fp, const std::vector<double>& values, double objective_value, double state_threshold_kW);

#endif
