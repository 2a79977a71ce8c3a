#include <catch2/catch.hpp>

#include <sstream>
#include <string>
#include <vector>

#include "components.h"
#include "dispatch_logic.h"
#include "global.h"
#include "network.h"
#include "output.h"
#include "problem_formulator.h"
#include "result_extraction.h"
#include "test_helpers.hpp"

using namespace testhelper;

namespace {

    std::vector<std::string> lines_of(const std::string& text) {
        std::vector<std::string> lines;
        std::stringstream strstr(text);
        std::string line;
        while (std::getline(strstr, line))
            lines.push_back(line);
        return lines;
    }

    DispatchResult small_result() {
        Scenario s = electric_scenario(2, 4.0, flat_bands(0.5));
        s.heat_load    = {1.0, 0.0};
        s.cooling_load = {0.0, 1.0};
        Network net = build_network({ device("grid", "grid", {{"export_capacity", 0.0}}),
                                      device("battery", "bat", {{"capacity", 2.0}}),
                                      device("ashp", "hp", {{"capacity", 3.0}}) }, s);
        FormulatedProblem fp = formulate(net, global::SolveMode::Auto, global::SOCBoundaryPolicy::Cyclic);
        std::vector<double> values(fp.problem.n_variables(), 0.0);
        const DeviceVariables& grid = fp.layout.devices[0];
        const DeviceVariables& hp   = fp.layout.devices[2];
        values[grid.output[0]] = 4.0 + 1.0 / 3.0;
        values[grid.output[1]] = 4.0 + 1.0 / 3.5;
        values[hp.mode_flow[0][0]] = 1.0 / 3.0;
        values[hp.mode_on[0][0]]   = 1.0;
        values[hp.mode_flow[1][1]] = 1.0 / 3.5;
        values[hp.mode_on[1][1]]   = 1.0;
        DispatchResult r = extract_results(net, fp, values, fp.problem.evaluate_objective(values), 0.1);
        r.solver_name = "or-tools:SCIP";
        return r;
    }

}

TEST_CASE("Scenario file names", "[output]") {
    CHECK(output::scenarioFileName(7, "dispatch.csv") == "0007-dispatch.csv");
    CHECK(output::scenarioFileName(12345, "soc.csv") == "12345-soc.csv");
}

TEST_CASE("Result tables", "[output]") {
    DispatchResult r = small_result();

    SECTION("dispatch table") {
        std::stringstream out;
        output::writeDispatchTable(out, r);
        std::vector<std::string> lines = lines_of(out.str());
        REQUIRE(lines.size() == 3);
        CHECK(lines[0].rfind("Timestep,grid electricity [kW],bat electricity [kW]", 0) == 0);
        CHECK(lines[0].find("hp heating input [kW],hp heating on") != std::string::npos);
        CHECK(lines[0].find("hp cooling on") != std::string::npos);
        CHECK(lines[1].rfind("0,", 0) == 0);
        CHECK(lines[2].rfind("1,", 0) == 0);
    }
    SECTION("SOC table has one row per SOC point") {
        std::stringstream out;
        output::writeSOCTable(out, r);
        std::vector<std::string> lines = lines_of(out.str());
        REQUIRE(lines.size() == 4);
        CHECK(lines[0] == "SOC point,bat [kWh]");
        CHECK(lines[3] == "2,0");
    }
    SECTION("bus balance table") {
        std::stringstream out;
        output::writeBusBalanceTable(out, r);
        std::vector<std::string> lines = lines_of(out.str());
        REQUIRE(lines.size() == 3);
        CHECK(lines[0].find("heat supply [kW],heat consumption [kW],heat demand [kW],heat residual [kW]") != std::string::npos);
    }
    SECTION("operating states") {
        std::stringstream out;
        output::writeOperatingStatesTable(out, r);
        std::vector<std::string> lines = lines_of(out.str());
        REQUIRE(lines.size() == 3);
        CHECK(lines[0] == "Timestep,grid,bat,hp");
        CHECK(lines[1] == "0,running,idle,running");
    }
    SECTION("summary") {
        std::stringstream out;
        output::writeSummary(out, "test run", r);
        const std::string text = out.str();
        CHECK(text.find("Scenario name     = test run") != std::string::npos);
        CHECK(text.find("Status            = optimal") != std::string::npos);
        CHECK(text.find("Problem class     = MILP") != std::string::npos);
        CHECK(text.find("Solver            = or-tools:SCIP") != std::string::npos);
        CHECK(text.find("Cycling penalty") != std::string::npos);
    }
}

TEST_CASE("Failure report", "[output]") {
    dispatch::SolveFailure failure{dispatch::FailureKind::Infeasible, "energy balance cannot be met on 1 bus time step(s)",
                                   { dispatch::BalanceViolation{Carrier::Heat, 3, 2.5} }};
    std::stringstream out;
    output::writeFailure(out, "cold winter", failure);
    const std::string text = out.str();
    CHECK(text.find("Status            = infeasible") != std::string::npos);
    CHECK(text.find("Carrier,Timestep,Amount [kW]\nheat,3,2.5\n") != std::string::npos);

    std::stringstream timeout_out;
    output::writeFailure(timeout_out, "slow", dispatch::SolveFailure{dispatch::FailureKind::SolverError, "timeout", {}});
    CHECK(timeout_out.str().find("Reason            = timeout") != std::string::npos);
    CHECK(timeout_out.str().find("Carrier,Timestep") == std::string::npos);
}

TEST_CASE("The device catalog listing names all types", "[output]") {
    std::stringstream out;
    output::printDeviceCatalog(out);
    const std::string text = out.str();
    for (const char* type : {"pv", "grid", "battery", "gshp_deep", "fuel_cell", "heat_pump"})
        CHECK(text.find(type) != std::string::npos);
}
