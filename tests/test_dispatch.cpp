#include <catch2/catch.hpp>

#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

#include "components.h"
#include "dispatch_logic.h"
#include "global.h"
#include "network.h"
#include "optimization_problem.h"
#include "optimization_unit_general.hpp"
#include "optimization_unit_or_tools.hpp"
#include "problem_formulator.h"
#include "result_extraction.h"
#include "test_helpers.hpp"

using namespace testhelper;
using dispatch::DispatchOutcome;
using dispatch::DispatchRequest;
using dispatch::FailureKind;

namespace {

    DispatchRequest make_request(const std::vector<DeviceSpec>& devices, const Scenario& scenario) {
        DispatchRequest req;
        req.devices  = devices;
        req.scenario = scenario;
        return req;
    }

    void check_balances_hold(const DispatchResult& r) {
        for (const BusBalanceSeries& bus : r.buses) {
            for (std::size_t t = 0; t < r.horizon; t++) {
                INFO("carrier " << carrier_name(bus.carrier) << " time step " << t);
                CHECK(bus.residual_kW[t] == Approx(0.0).margin(1e-5));
            }
        }
    }

    /*
     * Adapter returning a fixed status without solving anything
     */
    class FixedStatusAdapter : public BaseSolverAdapter {
        public:
            explicit FixedStatusAdapter(SolveStatus s) : status(s) {}
            RawSolution solve(const LinearProblem& problem, const SolverSettings& settings) override {
                n_calls++;
                last_settings = settings;
                RawSolution sol;
                sol.status  = status;
                sol.message = "fixed status";
                sol.values.assign(problem.n_variables(), 0.0);
                return sol;
            }
            const char* get_backend_name() const override { return "fixed"; }

            SolveStatus status;
            unsigned int n_calls = 0;
            SolverSettings last_settings;
    };

}


TEST_CASE("Grid only time-of-use example", "[dispatch][or-tools]") {
    // 10 kW for 24 hours: 8 h at 0.5 and 16 h at 1.5
    DispatchRequest req = make_request({ device("grid", "grid") }, electric_scenario(24, 10.0, valley_peak_bands(0.5, 1.5)));
    DispatchOutcome out = dispatch::run_dispatch(req);
    REQUIRE(out.succeeded());
    const DispatchResult& r = *out.result;
    CHECK(r.problem_class == global::ProblemClass::LP);
    CHECK(r.costs.total == Approx(280.0).epsilon(1e-6));
    CHECK(r.objective_value == Approx(280.0).epsilon(1e-6));
    CHECK(r.costs.grid_cost == Approx(280.0).epsilon(1e-6));
    CHECK(r.solver_name == "or-tools:GLOP");
    check_balances_hold(r);
}

TEST_CASE("Heat pump switches between heating and cooling", "[dispatch][or-tools]") {
    Scenario s;
    s.horizon_steps = 2;
    s.heat_load    = {3.0, 0.0};
    s.cooling_load = {0.0, 3.0};
    s.tou_bands    = flat_bands(0.2);
    DispatchRequest req = make_request({ device("grid", "grid"), device("ashp", "hp", {{"capacity", 5.0}}) }, s);
    DispatchOutcome out = dispatch::run_dispatch(req);
    REQUIRE(out.succeeded());
    const DispatchResult& r = *out.result;
    CHECK(r.problem_class == global::ProblemClass::MILP);
    CHECK(r.solver_name == "or-tools:SCIP");

    const DeviceDispatch* hp = r.find_device("hp");
    REQUIRE(hp != NULL);
    REQUIRE(hp->modes.size() == 2);
    const LinkModeDispatch& heating = hp->modes[0];
    const LinkModeDispatch& cooling = hp->modes[1];
    REQUIRE(heating.on.size() == 2);
    CHECK(heating.on[0]);
    CHECK_FALSE(cooling.on[0]);
    CHECK_FALSE(heating.on[1]);
    CHECK(cooling.on[1]);
    for (std::size_t t = 0; t < 2; t++) {
        CHECK((int) heating.on[t] + (int) cooling.on[t] <= 1);
        if (!heating.on[t]) CHECK(heating.flow_kW[t] == Approx(0.0).margin(1e-6));
        if (!cooling.on[t]) CHECK(cooling.flow_kW[t] == Approx(0.0).margin(1e-6));
    }
    CHECK(hp->injection_kW.at(Carrier::Heat)[0]    == Approx(3.0).margin(1e-6));
    CHECK(hp->injection_kW.at(Carrier::Cooling)[1] == Approx(3.0).margin(1e-6));
    check_balances_hold(r);
}

TEST_CASE("A heat pump cannot heat and cool in the same time step", "[dispatch][or-tools]") {
    Scenario s;
    s.horizon_steps = 1;
    s.heat_load    = {3.0};
    s.cooling_load = {3.0};
    s.tou_bands    = flat_bands(0.2);
    DispatchRequest req = make_request({ device("grid", "grid"), device("ashp", "hp", {{"capacity", 10.0}}) }, s);

    DispatchOutcome out = dispatch::run_dispatch(req);
    REQUIRE_FALSE(out.succeeded());
    REQUIRE(out.failure.has_value());
    CHECK(out.failure->kind == FailureKind::Infeasible);
    // one of both demands stays uncovered
    REQUIRE(out.failure->violations.size() == 1);
    const dispatch::BalanceViolation& v = out.failure->violations[0];
    CHECK((v.carrier == Carrier::Heat || v.carrier == Carrier::Cooling));
    CHECK(v.timestep == 0);
    CHECK(v.amount_kW == Approx(3.0).epsilon(1e-6));

    SECTION("the relaxation without integrality is feasible") {
        Network net = build_network(req.devices, s);
        FormulatedProblem fp = formulate(net, global::SolveMode::Auto, global::SOCBoundaryPolicy::Cyclic);
        REQUIRE(fp.problem_class == global::ProblemClass::MILP);
        LinearProblem relaxed;
        for (const ProblemVariable& var : fp.problem.get_variables())
            relaxed.add_variable(var.name, var.lower, var.upper, var.objective, VariableType::Continuous);
        for (const ProblemRow& row : fp.problem.get_rows()) {
            const std::size_t r = relaxed.add_row(row.name, row.lower, row.upper, row.tag);
            for (const auto& [var, coeff] : row.coefficients)
                relaxed.add_to_coefficient(r, var, coeff);
        }
        CHECK_FALSE(relaxed.has_integer_variables());
        ORToolsSolverAdapter adapter;
        SolverSettings settings;
        settings.solver_name = "GLOP";
        RawSolution sol = adapter.solve(relaxed, settings);
        CHECK(sol.status == SolveStatus::Optimal);
    }
}

TEST_CASE("Insufficient supply is infeasible and diagnosed", "[dispatch][or-tools]") {
    Scenario s;
    s.horizon_steps   = 3;
    s.electrical_load = {100.0, 100.0, 5.0};
    s.pv_availability = {1.0, 1.0, 1.0};
    DispatchRequest req = make_request({ device("pv", "pv", {{"capacity", 10.0}}) }, s);

    DispatchOutcome out = dispatch::run_dispatch(req);
    REQUIRE_FALSE(out.succeeded());
    REQUIRE(out.failure.has_value());
    CHECK(out.failure->kind == FailureKind::Infeasible);
    REQUIRE(out.failure->violations.size() == 2);
    for (std::size_t i = 0; i < 2; i++) {
        CHECK(out.failure->violations[i].carrier == Carrier::Electricity);
        CHECK(out.failure->violations[i].timestep == i);
        CHECK(out.failure->violations[i].amount_kW == Approx(90.0).epsilon(1e-6));
    }
    CHECK(out.failure->reason.find("2 bus time step") != std::string::npos);

    SECTION("without diagnosis") {
        req.options.diagnose_infeasibility = false;
        DispatchOutcome plain = dispatch::run_dispatch(req);
        REQUIRE(plain.failure.has_value());
        CHECK(plain.failure->kind == FailureKind::Infeasible);
        CHECK(plain.failure->violations.empty());
    }
}

TEST_CASE("Storage dispatch follows the SOC recurrence", "[dispatch][or-tools]") {
    const std::size_t T = 24;
    Scenario s = electric_scenario(T, 10.0, valley_peak_bands(0.2, 1.0));
    const double eta_c = 0.95, eta_d = 0.9, sd = 0.01;
    DispatchRequest req = make_request({ device("grid", "grid", {{"export_capacity", 0.0}}),
                                         device("battery", "bat", {{"capacity", 5.0}, {"max_hours", 4.0},
                                                                   {"charge_efficiency", eta_c}, {"discharge_efficiency", eta_d},
                                                                   {"self_discharge", sd}, {"soc_min", 0.1}, {"soc_max", 0.9}}) }, s);

    SECTION("cyclic boundary") {
        DispatchOutcome out = dispatch::run_dispatch(req);
        REQUIRE(out.succeeded());
        const DeviceDispatch* bat = out.result->find_device("bat");
        REQUIRE(bat != NULL);
        REQUIRE(bat->soc_kWh.size() == T + 1);
        for (std::size_t t = 0; t < T; t++) {
            double expected = bat->soc_kWh[t] * (1.0 - sd) + bat->charge_kW[t] * eta_c - bat->discharge_kW[t] / eta_d;
            CHECK(bat->soc_kWh[t + 1] == Approx(expected).margin(1e-5));
        }
        for (double soc : bat->soc_kWh) {
            CHECK(soc >= 2.0 - 1e-6);
            CHECK(soc <= 18.0 + 1e-6);
        }
        CHECK(bat->soc_kWh[T] == Approx(bat->soc_kWh[0]).margin(1e-5));
        // the cheap valley is used to charge
        double charged = 0.0;
        for (std::size_t t = 0; t < 8; t++)
            charged += bat->charge_kW[t];
        CHECK(charged > 1.0);
        check_balances_hold(*out.result);
    }

    SECTION("fixed initial boundary") {
        req.options.soc_boundary = global::SOCBoundaryPolicy::FixedInitial;
        req.devices[1].parameters["initial_soc"] = 0.2;
        DispatchOutcome out = dispatch::run_dispatch(req);
        REQUIRE(out.succeeded());
        const DeviceDispatch* bat = out.result->find_device("bat");
        REQUIRE(bat != NULL);
        CHECK(bat->soc_kWh[0] == Approx(0.2 * 20.0).margin(1e-6));
    }
}

TEST_CASE("Flat tariff equals time-of-use with equal rates", "[dispatch][or-tools]") {
    const std::size_t T = 24;
    Scenario flat = electric_scenario(T, 12.0, flat_bands(0.6, 0.1));
    flat.pv_availability = pv_day_profile(T);
    Scenario tou = flat;
    tou.tou_bands = { TariffBand{0.0, 7.0, 0.6, 0.1}, TariffBand{7.0, 19.0, 0.6, 0.1}, TariffBand{19.0, 24.0, 0.6, 0.1} };
    std::vector<DeviceSpec> devices = { device("grid", "grid", {{"export_capacity", 20.0}}),
                                        device("pv", "pv", {{"capacity", 30.0}}),
                                        device("battery", "bat", {{"capacity", 5.0}}) };

    DispatchOutcome out_flat = dispatch::run_dispatch(make_request(devices, flat));
    DispatchOutcome out_tou  = dispatch::run_dispatch(make_request(devices, tou));
    REQUIRE(out_flat.succeeded());
    REQUIRE(out_tou.succeeded());
    CHECK(out_flat.result->costs.total == Approx(out_tou.result->costs.total).epsilon(1e-6));
}

TEST_CASE("Repeated solves give the same cost", "[dispatch][or-tools]") {
    Scenario s = electric_scenario(24, 8.0, valley_peak_bands(0.3, 0.9, 0.05));
    s.heat_load = std::vector<double>(24, 4.0);
    s.pv_availability = pv_day_profile(24);
    DispatchRequest req = make_request({ device("grid", "grid"), device("pv", "pv", {{"capacity", 15.0}}),
                                         device("battery", "bat"), device("electric_boiler", "boiler") }, s);
    DispatchOutcome first  = dispatch::run_dispatch(req);
    DispatchOutcome second = dispatch::run_dispatch(req);
    REQUIRE(first.succeeded());
    REQUIRE(second.succeeded());
    CHECK(first.result->costs.total == Approx(second.result->costs.total).epsilon(1e-9));
    check_balances_hold(*first.result);
}

TEST_CASE("Hydrogen chain", "[dispatch][or-tools]") {
    Scenario s = electric_scenario(12, 5.0, flat_bands(0.4));
    s.hydrogen_load = std::vector<double>(12, 2.0);
    s.heat_load     = std::vector<double>(12, 1.0);
    DispatchRequest req = make_request({ device("grid", "grid", {{"export_capacity", 0.0}}),
                                         device("electrolyzer", "ely", {{"capacity", 10.0}}),
                                         device("h2_storage", "tank", {{"capacity", 5.0}}),
                                         device("electric_boiler", "boiler", {{"capacity", 5.0}}) }, s);
    DispatchOutcome out = dispatch::run_dispatch(req);
    REQUIRE(out.succeeded());
    CHECK(out.result->buses.size() == 3);
    check_balances_hold(*out.result);
}

TEST_CASE("A generous time limit does not change the result", "[dispatch][or-tools]") {
    DispatchRequest req = make_request({ device("grid", "grid"), device("battery", "bat") },
                                       electric_scenario(48, 10.0, valley_peak_bands(0.2, 1.0)));
    DispatchOutcome unlimited = dispatch::run_dispatch(req);
    req.options.time_limit_s = 30.0;
    DispatchOutcome limited = dispatch::run_dispatch(req);
    REQUIRE(unlimited.succeeded());
    REQUIRE(limited.succeeded());
    CHECK(limited.result->costs.total == Approx(unlimited.result->costs.total).epsilon(1e-6));
}

TEST_CASE("Mapping of OR-Tools result states", "[dispatch][or-tools]") {
    using operations_research::MPSolver;
    CHECK(ORToolsSolverAdapter::map_result_status(MPSolver::OPTIMAL, false)    == SolveStatus::Optimal);
    CHECK(ORToolsSolverAdapter::map_result_status(MPSolver::INFEASIBLE, false) == SolveStatus::Infeasible);
    CHECK(ORToolsSolverAdapter::map_result_status(MPSolver::UNBOUNDED, false)  == SolveStatus::Unbounded);
    CHECK(ORToolsSolverAdapter::map_result_status(MPSolver::FEASIBLE, true)    == SolveStatus::Timeout);
    CHECK(ORToolsSolverAdapter::map_result_status(MPSolver::NOT_SOLVED, true)  == SolveStatus::Timeout);
    CHECK(ORToolsSolverAdapter::map_result_status(MPSolver::FEASIBLE, false)   == SolveStatus::Error);
    CHECK(ORToolsSolverAdapter::map_result_status(MPSolver::ABNORMAL, true)    == SolveStatus::Error);
}

TEST_CASE("Unknown OR-Tools solver names are reported as solver error", "[dispatch][or-tools]") {
    DispatchRequest req = make_request({ device("grid", "grid") }, electric_scenario(2, 1.0, flat_bands(0.3)));
    req.options.lp_solver = "NO_SUCH_SOLVER";
    DispatchOutcome out = dispatch::run_dispatch(req);
    REQUIRE(out.failure.has_value());
    CHECK(out.failure->kind == FailureKind::SolverError);
}

TEST_CASE("Solver states are translated into failures", "[dispatch]") {
    DispatchRequest req = make_request({ device("grid", "grid") }, electric_scenario(2, 1.0, flat_bands(0.3)));
    req.options.time_limit_s = 5.0;
    req.options.lp_solver = "CLP";

    SECTION("timeout") {
        FixedStatusAdapter adapter(SolveStatus::Timeout);
        DispatchOutcome out = dispatch::run_dispatch(req, adapter);
        REQUIRE(out.failure.has_value());
        CHECK(out.failure->kind == FailureKind::SolverError);
        CHECK(out.failure->reason == "timeout");
        CHECK(adapter.last_settings.solver_name == "CLP");
        CHECK(adapter.last_settings.time_limit_s == Approx(5.0));
    }
    SECTION("unbounded") {
        FixedStatusAdapter adapter(SolveStatus::Unbounded);
        DispatchOutcome out = dispatch::run_dispatch(req, adapter);
        REQUIRE(out.failure.has_value());
        CHECK(out.failure->kind == FailureKind::Unbounded);
    }
    SECTION("error") {
        FixedStatusAdapter adapter(SolveStatus::Error);
        DispatchOutcome out = dispatch::run_dispatch(req, adapter);
        REQUIRE(out.failure.has_value());
        CHECK(out.failure->kind == FailureKind::SolverError);
        CHECK(out.failure->reason == "fixed status");
    }
    SECTION("infeasible, diagnosis fails as well") {
        FixedStatusAdapter adapter(SolveStatus::Infeasible);
        DispatchOutcome out = dispatch::run_dispatch(req, adapter);
        REQUIRE(out.failure.has_value());
        CHECK(out.failure->kind == FailureKind::Infeasible);
        CHECK(out.failure->violations.empty());
        // original solve plus the elastic problem
        CHECK(adapter.n_calls == 2);
    }
    SECTION("invalid input is thrown") {
        FixedStatusAdapter adapter(SolveStatus::Optimal);
        req.devices.push_back(device("battery", "bat", {{"capacity", -1.0}}));
        CHECK_THROWS_AS(dispatch::run_dispatch(req, adapter), ConfigurationError);
        CHECK(adapter.n_calls == 0);
    }
}

TEST_CASE("Solver settings depend on the problem class", "[dispatch]") {
    dispatch::SolveOptions opt;
    opt.lp_solver   = "GLOP";
    opt.milp_solver = "CBC";
    opt.relative_mip_gap = 0.01;
    CHECK(dispatch::make_solver_settings(opt, global::ProblemClass::LP).solver_name   == "GLOP");
    SolverSettings milp = dispatch::make_solver_settings(opt, global::ProblemClass::MILP);
    CHECK(milp.solver_name == "CBC");
    CHECK(milp.relative_mip_gap == Approx(0.01));
}
