#include <catch2/catch.hpp>

#include <cstddef>
#include <vector>

#include "components.h"
#include "global.h"
#include "network.h"
#include "optimization_problem.h"
#include "problem_formulator.h"
#include "test_helpers.hpp"

using namespace testhelper;

namespace {

    double coefficient_of(const ProblemRow& row, std::size_t var) {
        double sum = 0.0;
        for (const auto& [idx, value] : row.coefficients) {
            if (idx == var)
                sum += value;
        }
        return sum;
    }

    Network grid_battery_network(std::size_t T, double dt = 1.0) {
        Scenario s = electric_scenario(T, 10.0, valley_peak_bands(0.2, 0.8));
        s.timestep_hours = dt;
        return build_network({ device("grid", "grid", {{"export_capacity", 5.0}, {"cost", 0.05}}),
                               device("battery", "bat", {{"capacity", 4.0}, {"max_hours", 2.0}, {"cost", 0.01}}) }, s);
    }

}

TEST_CASE("Problem class selection", "[formulator]") {
    Network lp_net = grid_battery_network(3);
    CHECK(decide_problem_class(lp_net, global::SolveMode::Auto) == global::ProblemClass::LP);
    CHECK(decide_problem_class(lp_net, global::SolveMode::LP)   == global::ProblemClass::LP);
    CHECK(decide_problem_class(lp_net, global::SolveMode::MILP) == global::ProblemClass::MILP);

    Scenario s = electric_scenario(3, 0.0, flat_bands(0.3));
    s.heat_load = {2.0, 2.0, 2.0};
    Network hp_net = build_network({ device("grid", "grid"), device("ashp", "hp") }, s);
    CHECK(decide_problem_class(hp_net, global::SolveMode::Auto) == global::ProblemClass::MILP);
    // LP requests are promoted
    CHECK(decide_problem_class(hp_net, global::SolveMode::LP)   == global::ProblemClass::MILP);
}

TEST_CASE("LP formulation of grid and battery", "[formulator]") {
    const std::size_t T = 3;
    Network net = grid_battery_network(T);
    FormulatedProblem fp = formulate(net, global::SolveMode::Auto, global::SOCBoundaryPolicy::Cyclic);
    const LinearProblem& p = fp.problem;

    CHECK(fp.problem_class == global::ProblemClass::LP);
    // grid: import + export, battery: charge + discharge + T+1 SOC points
    CHECK(p.n_variables() == 2 * T + 2 * T + (T + 1));
    CHECK(p.n_binary_variables() == 0);
    // T SOC recurrences + cyclic boundary + T balance rows
    CHECK(p.n_rows() == T + 1 + T);
    CHECK(p.find_rows(RowKind::BusBalance).size() == T);
    CHECK(p.find_rows(RowKind::StorageContinuity).size() == T);
    CHECK(p.find_rows(RowKind::StorageBoundary).size() == 1);

    const DeviceVariables& grid = fp.layout.devices[0];
    const DeviceVariables& bat  = fp.layout.devices[1];
    REQUIRE(grid.output.size() == T);
    REQUIRE(grid.grid_export.size() == T);
    REQUIRE(bat.soc.size() == T + 1);

    SECTION("objective coefficients") {
        // (buy price + marginal cost) * dt for the import, -sell * dt for the export
        CHECK(p.get_variables()[grid.output[0]].objective == Approx(0.2 + 0.05));
        CHECK(p.get_variables()[grid.grid_export[0]].objective == Approx(0.0));
        CHECK(p.get_variables()[bat.discharge[1]].objective == Approx(0.01));
        CHECK(p.get_variables()[bat.charge[1]].objective == Approx(0.0));
        CHECK(p.get_variables()[bat.soc[2]].objective == Approx(0.0));
    }

    SECTION("bounds") {
        CHECK(p.get_variables()[grid.grid_export[0]].upper == Approx(5.0));
        CHECK(p.get_variables()[bat.charge[0]].upper == Approx(4.0));
        CHECK(p.get_variables()[bat.soc[T]].upper == Approx(8.0));
        CHECK(p.get_variables()[bat.soc[T]].lower == Approx(0.0));
    }

    SECTION("balance rows") {
        const ProblemRow& row = p.get_rows()[fp.layout.balance_rows[0][1]];
        CHECK(row.lower == Approx(10.0));
        CHECK(row.upper == Approx(10.0));
        CHECK(row.tag.carrier == Carrier::Electricity);
        CHECK(row.tag.timestep == 1);
        CHECK(coefficient_of(row, grid.output[1])      == Approx(1.0));
        CHECK(coefficient_of(row, grid.grid_export[1]) == Approx(-1.0));
        CHECK(coefficient_of(row, bat.discharge[1])    == Approx(1.0));
        CHECK(coefficient_of(row, bat.charge[1])       == Approx(-1.0));
        CHECK(coefficient_of(row, grid.output[0])      == Approx(0.0));
    }

    SECTION("SOC recurrence rows") {
        const ProblemRow& row = p.get_rows()[p.find_rows(RowKind::StorageContinuity)[0]];
        CHECK(coefficient_of(row, bat.soc[1])       == Approx(-1.0));
        CHECK(coefficient_of(row, bat.soc[0])       == Approx(1.0));
        CHECK(coefficient_of(row, bat.charge[0])    == Approx(0.9));
        CHECK(coefficient_of(row, bat.discharge[0]) == Approx(-1.0 / 0.9));
    }
}

TEST_CASE("Time step size scales the objective", "[formulator]") {
    Network net = grid_battery_network(4, 0.5);
    FormulatedProblem fp = formulate(net, global::SolveMode::LP, global::SOCBoundaryPolicy::Cyclic);
    const DeviceVariables& grid = fp.layout.devices[0];
    CHECK(fp.problem.get_variables()[grid.output[0]].objective == Approx((0.2 + 0.05) * 0.5));
}

TEST_CASE("Fixed initial SOC boundary", "[formulator]") {
    Network net = grid_battery_network(3);
    FormulatedProblem fp = formulate(net, global::SolveMode::LP, global::SOCBoundaryPolicy::FixedInitial);
    std::vector<std::size_t> boundary = fp.problem.find_rows(RowKind::StorageBoundary);
    REQUIRE(boundary.size() == 1);
    const ProblemRow& row = fp.problem.get_rows()[boundary[0]];
    // default initial SOC 0.5 of 8 kWh
    CHECK(row.lower == Approx(4.0));
    CHECK(row.upper == Approx(4.0));
    REQUIRE(row.coefficients.size() == 1);
    CHECK(row.coefficients[0].first == fp.layout.devices[1].soc[0]);
}

TEST_CASE("MILP formulation with a heat pump", "[formulator]") {
    const std::size_t T = 3;
    Scenario s = electric_scenario(T, 0.0, flat_bands(0.3));
    s.electrical_load.clear();
    s.heat_load = {2.0, 0.0, 1.0};
    s.cooling_load = {0.0, 3.0, 0.0};
    Network net = build_network({ device("grid", "grid", {{"export_capacity", 0.0}}),
                                  device("battery", "bat"),
                                  device("ashp", "hp", {{"capacity", 5.0}}) }, s);
    FormulatedProblem fp = formulate(net, global::SolveMode::Auto, global::SOCBoundaryPolicy::Cyclic);
    const LinearProblem& p = fp.problem;

    CHECK(fp.problem_class == global::ProblemClass::MILP);
    // grid import only, battery, 2 mode flows and 2 indicators per step
    CHECK(p.n_variables() == T + (2 * T + T + 1) + 2 * T + 2 * T);
    CHECK(p.n_binary_variables() == 2 * T);
    CHECK(p.find_rows(RowKind::ModeExclusivity).size() == T);
    CHECK(p.find_rows(RowKind::ModeIndicatorLink).size() == 2 * T);
    CHECK(p.find_rows(RowKind::CapacitySharing).size() == T);
    // electricity, heat and cooling balance
    CHECK(p.find_rows(RowKind::BusBalance).size() == 3 * T);

    const DeviceVariables& hp = fp.layout.devices[2];
    REQUIRE(hp.mode_on.size() == 2);
    REQUIRE(hp.mode_flow.size() == 2);
    const ProblemRow& indicator = p.get_rows()[p.find_rows(RowKind::ModeIndicatorLink)[0]];
    CHECK(indicator.upper == Approx(0.0));
    CHECK(coefficient_of(indicator, hp.mode_flow[0][0]) == Approx(1.0));
    CHECK(coefficient_of(indicator, hp.mode_on[0][0])   == Approx(-5.0));
    const ProblemRow& excl = p.get_rows()[p.find_rows(RowKind::ModeExclusivity)[0]];
    CHECK(excl.upper == Approx(1.0));
    CHECK(excl.coefficients.size() == 2);

    // heat balance: COP as coefficient of the heating flow
    const ProblemRow& heat = p.get_rows()[fp.layout.balance_rows[net.get_bus_index(Carrier::Heat)][0]];
    CHECK(coefficient_of(heat, hp.mode_flow[0][0]) == Approx(3.0));
    CHECK(coefficient_of(heat, hp.mode_flow[1][0]) == Approx(0.0));
    const ProblemRow& elec = p.get_rows()[fp.layout.balance_rows[net.get_bus_index(Carrier::Electricity)][0]];
    CHECK(coefficient_of(elec, hp.mode_flow[0][0]) == Approx(-1.0));
    CHECK(coefficient_of(elec, hp.mode_flow[1][0]) == Approx(-1.0));
}
