#include <catch2/catch.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <variant>
#include <vector>

#include "components.h"
#include "device_catalog.h"

TEST_CASE("The catalog lists all archetypes", "[catalog]") {
    const DeviceCatalog& catalog = DeviceCatalog::GetInstance();
    std::vector<std::string> types = catalog.list_types();
    for (const char* expected : {"pv", "grid", "electric_boiler", "ashp", "gshp_shallow", "gshp_deep",
                                 "electrolyzer", "fuel_cell", "battery", "h2_storage"}) {
        CHECK(std::find(types.begin(), types.end(), expected) != types.end());
    }
    CHECK(catalog.find("steam_turbine") == NULL);
    CHECK_THROWS_AS(catalog.get("steam_turbine"), ConfigurationError);
}

TEST_CASE("Missing parameters are taken from the defaults", "[catalog]") {
    const DeviceCatalog& catalog = DeviceCatalog::GetInstance();
    ParameterValues values = catalog.resolve_parameters("battery", {{"capacity", 10.0}}, "bat");
    CHECK(values.at("capacity") == Approx(10.0));
    CHECK(values.at("max_hours") == Approx(4.0));
    CHECK(values.at("charge_efficiency") == Approx(0.9));
    CHECK(values.at("soc_max") == Approx(1.0));

    Device bat = catalog.instantiate(DeviceSpec{"battery", "bat", {{"capacity", 10.0}, {"max_hours", 2.0}}}, "bat");
    REQUIRE(bat.get_capability() == DeviceCapability::Storage);
    const StorageUnit& st = std::get<StorageUnit>(bat.unit);
    CHECK(st.bus == Carrier::Electricity);
    CHECK(st.power_capacity_kW == Approx(10.0));
    CHECK(st.energy_capacity_kWh == Approx(20.0));

    Device grid = catalog.instantiate(DeviceSpec{"grid", "grid", {}}, "grid");
    CHECK(grid.is_grid_tie());
    CHECK(std::isinf(std::get<GeneratorUnit>(grid.unit).capacity_kW));
}

TEST_CASE("Invalid parameters are rejected", "[catalog]") {
    const DeviceCatalog& catalog = DeviceCatalog::GetInstance();

    SECTION("unknown parameter name") {
        CHECK_THROWS_AS(catalog.resolve_parameters("pv", {{"tilt", 30.0}}, "pv"), ConfigurationError);
    }
    SECTION("values outside of the valid range") {
        CHECK_THROWS_AS(catalog.resolve_parameters("pv", {{"capacity", 0.0}}, "pv"), ConfigurationError);
        CHECK_THROWS_AS(catalog.resolve_parameters("pv", {{"capacity", -5.0}}, "pv"), ConfigurationError);
        CHECK_THROWS_AS(catalog.resolve_parameters("battery", {{"charge_efficiency", 1.2}}, "bat"), ConfigurationError);
        CHECK_THROWS_AS(catalog.resolve_parameters("pv", {{"cost", std::nan("")}}, "pv"), ConfigurationError);
    }
    SECTION("only the grid limits may be unlimited") {
        const double inf = std::numeric_limits<double>::infinity();
        CHECK_THROWS_AS(catalog.resolve_parameters("battery", {{"capacity", inf}}, "bat"), ConfigurationError);
        CHECK_THROWS_AS(catalog.resolve_parameters("battery", {{"max_hours", inf}}, "bat"), ConfigurationError);
        CHECK_THROWS_AS(catalog.resolve_parameters("ashp", {{"capacity", inf}}, "hp"), ConfigurationError);
        CHECK_THROWS_AS(catalog.instantiate(DeviceSpec{"heat_pump", "hp", {{"capacity", inf}}}, "hp"), ConfigurationError);
        CHECK_THROWS_AS(catalog.resolve_parameters("pv", {{"cost", inf}}, "pv"), ConfigurationError);
        ParameterValues grid = catalog.resolve_parameters("grid", {{"capacity", inf}, {"export_capacity", inf}}, "grid");
        CHECK(std::isinf(grid.at("capacity")));
        CHECK(std::isinf(grid.at("export_capacity")));
    }
    SECTION("parameter combinations") {
        CHECK_THROWS_AS(catalog.resolve_parameters("battery", {{"soc_min", 0.8}, {"soc_max", 0.5}, {"initial_soc", 0.6}}, "bat"), ConfigurationError);
        CHECK_THROWS_AS(catalog.resolve_parameters("battery", {{"soc_min", 0.3}, {"initial_soc", 0.1}}, "bat"), ConfigurationError);
        CHECK_THROWS_AS(catalog.resolve_parameters("fuel_cell", {{"efficiency", 0.7}, {"heat_efficiency", 0.5}}, "fc"), ConfigurationError);
    }
    SECTION("the error message names the device") {
        try {
            catalog.resolve_parameters("battery", {{"capacity", -1.0}}, "basement_battery");
            FAIL("no exception thrown");
        } catch (const ConfigurationError& e) {
            CHECK(std::string(e.what()).find("basement_battery") != std::string::npos);
        }
    }
}

TEST_CASE("Heat pumps have two exclusive modes", "[catalog]") {
    const DeviceCatalog& catalog = DeviceCatalog::GetInstance();

    Device hp = catalog.instantiate(DeviceSpec{"gshp_deep", "hp", {{"capacity", 5.0}}}, "hp");
    const LinkUnit& link = std::get<LinkUnit>(hp.unit);
    CHECK(link.input == Carrier::Electricity);
    CHECK(link.has_mode_exclusivity());
    REQUIRE(link.modes.size() == 2);
    CHECK(link.modes[0].name == "heating");
    CHECK(link.modes[0].outputs[0].carrier == Carrier::Heat);
    CHECK(link.modes[1].name == "cooling");
    CHECK(link.modes[1].outputs[0].carrier == Carrier::Cooling);
    REQUIRE(link.heat_pump_family.has_value());
    CHECK(link.heat_pump_family.value() == HeatPumpFamily::DeepGroundSource);

    SECTION("the generic heat pump type selects the family") {
        CHECK(catalog.resolve_spec(DeviceSpec{"heat_pump", "hp", {}}).type == "ashp");
        DeviceSpec resolved = catalog.resolve_spec(DeviceSpec{"heat_pump", "hp", {{"mode_family", 1.0}, {"capacity", 8.0}}});
        CHECK(resolved.type == "gshp_shallow");
        CHECK(resolved.parameters.count("mode_family") == 0);
        CHECK(resolved.parameters.at("capacity") == Approx(8.0));
        CHECK_THROWS_AS(catalog.resolve_spec(DeviceSpec{"heat_pump", "hp", {{"mode_family", 3.0}}}), ConfigurationError);
    }

    SECTION("single mode links need no exclusivity") {
        Device boiler = catalog.instantiate(DeviceSpec{"electric_boiler", "boiler", {}}, "boiler");
        CHECK_FALSE(std::get<LinkUnit>(boiler.unit).has_mode_exclusivity());
        Device fc = catalog.instantiate(DeviceSpec{"fuel_cell", "fc", {}}, "fc");
        std::vector<Carrier> injected = fc.get_injected_carriers();
        CHECK(injected.size() == 2);
        CHECK(fc.get_withdrawn_carriers() == std::vector<Carrier>{Carrier::Hydrogen});
    }
}
