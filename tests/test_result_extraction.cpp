#include <catch2/catch.hpp>

#include <cstddef>
#include <stdexcept>
#include <vector>

#include "components.h"
#include "global.h"
#include "network.h"
#include "problem_formulator.h"
#include "result_extraction.h"
#include "test_helpers.hpp"

using namespace testhelper;

TEST_CASE("Extraction of a synthetic solution", "[extraction]") {
    // two hours, 10 kW load, PV, grid with export and a battery
    Scenario s = electric_scenario(2, 10.0, flat_bands(0.5, 0.1));
    s.pv_availability = {1.0, 0.0};
    Network net = build_network({ device("grid", "grid", {{"export_capacity", 10.0}}),
                                  device("pv", "pv", {{"capacity", 20.0}, {"cost", 0.02}}),
                                  device("battery", "bat", {{"capacity", 5.0}, {"max_hours", 2.0}, {"cost", 0.01},
                                                            {"charge_efficiency", 1.0}, {"discharge_efficiency", 1.0}}) }, s);
    FormulatedProblem fp = formulate(net, global::SolveMode::Auto, global::SOCBoundaryPolicy::Cyclic);
    const DeviceVariables& grid = fp.layout.devices[0];
    const DeviceVariables& pv   = fp.layout.devices[1];
    const DeviceVariables& bat  = fp.layout.devices[2];

    // t=0: PV 20 kW, 5 kW into the battery, 5 kW export
    // t=1: battery 5 kW, grid 5 kW
    std::vector<double> values(fp.problem.n_variables(), 0.0);
    values[pv.output[0]]        = 20.0;
    values[bat.charge[0]]       = 5.0;
    values[grid.grid_export[0]] = 5.0;
    values[bat.discharge[1]]    = 5.0;
    values[grid.output[1]]      = 5.0;
    values[bat.soc[0]]          = 0.0;
    values[bat.soc[1]]          = 5.0;
    values[bat.soc[2]]          = 1e-12;  // solver noise

    const double objective = fp.problem.evaluate_objective(values);
    DispatchResult r = extract_results(net, fp, values, objective, 0.1);

    CHECK(r.problem_class == global::ProblemClass::LP);
    CHECK(r.horizon == 2);
    REQUIRE(r.devices.size() == 3);
    REQUIRE(r.buses.size() == 1);

    SECTION("cost breakdown") {
        // grid: 5 * 0.5 - 5 * 0.1, PV: 20 * 0.02, battery: 5 * 0.01
        CHECK(r.costs.grid_cost == Approx(2.0));
        CHECK(r.costs.fuel_cost == Approx(0.4));
        CHECK(r.costs.cycling_penalty == Approx(0.05));
        CHECK(r.costs.total == Approx(2.45));
        CHECK(r.costs.total == Approx(objective));
        CHECK(r.find_device("grid")->cost == Approx(2.0));
        CHECK(r.find_device("pv")->cost == Approx(0.4));
        CHECK(r.find_device("bat")->cost == Approx(0.05));
    }

    SECTION("device series") {
        const DeviceDispatch* g = r.find_device("grid");
        REQUIRE(g != NULL);
        CHECK(g->output_kW == std::vector<double>{0.0, 5.0});
        CHECK(g->input_kW  == std::vector<double>{5.0, 0.0});
        CHECK(g->injection_kW.at(Carrier::Electricity)[0] == Approx(-5.0));
        CHECK(g->injection_kW.at(Carrier::Electricity)[1] == Approx(5.0));

        const DeviceDispatch* b = r.find_device("bat");
        REQUIRE(b != NULL);
        CHECK(b->capability == DeviceCapability::Storage);
        REQUIRE(b->soc_kWh.size() == 3);
        CHECK(b->soc_kWh[1] == Approx(5.0));
        CHECK(b->soc_kWh[2] == 0.0);
        CHECK(b->states[0] == OperatingState::Charging);
        CHECK(b->states[1] == OperatingState::Discharging);

        const DeviceDispatch* p = r.find_device("pv");
        REQUIRE(p != NULL);
        CHECK(p->states[0] == OperatingState::Running);
        CHECK(p->states[1] == OperatingState::Stopped);
        CHECK(r.find_device("wind") == NULL);
    }

    SECTION("bus balance") {
        const BusBalanceSeries* bus = r.find_bus(Carrier::Electricity);
        REQUIRE(bus != NULL);
        CHECK(bus->supply_kW[0] == Approx(20.0));
        CHECK(bus->consumption_kW[0] == Approx(10.0));
        CHECK(bus->supply_kW[1] == Approx(10.0));
        CHECK(bus->consumption_kW[1] == Approx(0.0));
        CHECK(bus->residual_kW[0] == Approx(0.0).margin(1e-9));
        CHECK(bus->residual_kW[1] == Approx(0.0).margin(1e-9));
        CHECK(r.find_bus(Carrier::Heat) == NULL);
    }
}

TEST_CASE("Extraction of mode indicators", "[extraction]") {
    Scenario s = electric_scenario(2, 0.0, flat_bands(0.2));
    s.electrical_load.clear();
    s.heat_load    = {3.0, 0.0};
    s.cooling_load = {0.0, 3.5};
    Network net = build_network({ device("grid", "grid", {{"export_capacity", 0.0}}), device("ashp", "hp", {{"capacity", 5.0}}) }, s);
    FormulatedProblem fp = formulate(net, global::SolveMode::Auto, global::SOCBoundaryPolicy::Cyclic);
    const DeviceVariables& grid = fp.layout.devices[0];
    const DeviceVariables& hp   = fp.layout.devices[1];

    std::vector<double> values(fp.problem.n_variables(), 0.0);
    values[hp.mode_flow[0][0]] = 1.0;
    values[hp.mode_on[0][0]]   = 1.0;
    values[hp.mode_flow[1][1]] = 1.0;
    values[hp.mode_on[1][1]]   = 0.9999999;
    values[grid.output[0]]     = 1.0;
    values[grid.output[1]]     = 1.0;

    DispatchResult r = extract_results(net, fp, values, fp.problem.evaluate_objective(values), 0.1);
    const DeviceDispatch* d = r.find_device("hp");
    REQUIRE(d != NULL);
    REQUIRE(d->modes.size() == 2);
    CHECK(d->modes[0].name == "heating");
    CHECK(d->modes[0].on == std::vector<bool>{true, false});
    CHECK(d->modes[1].on == std::vector<bool>{false, true});
    CHECK(d->injection_kW.at(Carrier::Heat)[0] == Approx(3.0));
    CHECK(d->injection_kW.at(Carrier::Cooling)[1] == Approx(3.5));
    CHECK(d->injection_kW.at(Carrier::Electricity)[1] == Approx(-1.0));
    CHECK(d->input_kW == std::vector<double>{1.0, 1.0});
    CHECK(r.costs.grid_cost == Approx(0.4));
}

TEST_CASE("Extraction rejects a wrong number of values", "[extraction]") {
    Scenario s = electric_scenario(2, 1.0, flat_bands(0.2));
    Network net = build_network({ device("grid", "grid") }, s);
    FormulatedProblem fp = formulate(net, global::SolveMode::Auto, global::SOCBoundaryPolicy::Cyclic);
    CHECK_THROWS_AS(extract_results(net, fp, std::vector<double>(1, 0.0), 0.0, 0.1), std::logic_error);
}
