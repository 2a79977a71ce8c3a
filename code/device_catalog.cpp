#include "device_catalog.h"

#include <cmath>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include "components.h"

using namespace std;


namespace {

    const double INF = numeric_limits<double>::infinity();

    ParameterSchema capacity_param(double def, const string& description) {
        return {"capacity", def, 0.0, INF, true, "kW", description};
    }
    ParameterSchema efficiency_param(const string& name, double def, const string& description) {
        return {name, def, 0.0, 1.0, true, "-", description};
    }
    ParameterSchema cop_param(const string& name, double def, const string& description) {
        return {name, def, 0.0, 20.0, true, "-", description};
    }
    ParameterSchema cost_param(double def) {
        return {"cost", def, 0.0, INF, false, "currency/kWh", "Marginal cost per kWh of the primary flow"};
    }
    ParameterSchema investment_param() {
        return {"investment", 0.0, 0.0, 1.0, false, "-", "Investment flag (0 or 1), not used for dispatch"};
    }
    vector<ParameterSchema> storage_params(double capacity, double max_hours, double eff, double cost) {
        return {
            capacity_param(capacity, "Maximal charging and discharging power"),
            {"max_hours", max_hours, 0.0, INF, true, "h", "Energy capacity divided by power capacity"},
            efficiency_param("charge_efficiency",    eff, "Efficiency when charging"),
            efficiency_param("discharge_efficiency", eff, "Efficiency when discharging"),
            {"self_discharge", 0.0, 0.0, 1.0, false, "1/h", "Fraction of the stored energy lost per hour"},
            {"soc_min",     0.0, 0.0, 1.0, false, "-", "Minimal state of charge as fraction of the energy capacity"},
            {"soc_max",     1.0, 0.0, 1.0, true,  "-", "Maximal state of charge as fraction of the energy capacity"},
            {"initial_soc", 0.5, 0.0, 1.0, false, "-", "State of charge at the start of the horizon (boundary policy 'fixed initial' only)"},
            cost_param(cost),
            investment_param()
        };
    }
    vector<ParameterSchema> heat_pump_params(double cop_h, double cop_c) {
        return {
            capacity_param(40.0, "Rated electric input power, shared by heating and cooling"),
            cop_param("cop_heating", cop_h, "Coefficient of performance in heating mode"),
            cop_param("cop_cooling", cop_c, "Energy efficiency ratio in cooling mode"),
            cost_param(0.0),
            investment_param()
        };
    }

    //
    // functions creating the device variants
    //
    DeviceVariant make_pv(const ParameterValues& v) {
        return GeneratorUnit{Carrier::Electricity, v.at("capacity"), true, {}, false, 0.0};
    }
    DeviceVariant make_grid(const ParameterValues& v) {
        return GeneratorUnit{Carrier::Electricity, v.at("capacity"), false, {}, true, v.at("export_capacity")};
    }
    DeviceVariant make_electric_boiler(const ParameterValues& v) {
        LinkUnit link{Carrier::Electricity, v.at("capacity"), {}, nullopt};
        link.modes.push_back(LinkMode{"heating", {{Carrier::Heat, v.at("efficiency")}}});
        return link;
    }
    DeviceVariant make_heat_pump(const ParameterValues& v, HeatPumpFamily family) {
        LinkUnit link{Carrier::Electricity, v.at("capacity"), {}, family};
        link.modes.push_back(LinkMode{"heating", {{Carrier::Heat,    v.at("cop_heating")}}});
        link.modes.push_back(LinkMode{"cooling", {{Carrier::Cooling, v.at("cop_cooling")}}});
        return link;
    }
    DeviceVariant make_ashp(const ParameterValues& v)         { return make_heat_pump(v, HeatPumpFamily::AirSource); }
    DeviceVariant make_gshp_shallow(const ParameterValues& v) { return make_heat_pump(v, HeatPumpFamily::ShallowGroundSource); }
    DeviceVariant make_gshp_deep(const ParameterValues& v)    { return make_heat_pump(v, HeatPumpFamily::DeepGroundSource); }
    DeviceVariant make_electrolyzer(const ParameterValues& v) {
        LinkUnit link{Carrier::Electricity, v.at("capacity"), {}, nullopt};
        link.modes.push_back(LinkMode{"electrolysis", {{Carrier::Hydrogen, v.at("efficiency")}}});
        return link;
    }
    DeviceVariant make_fuel_cell(const ParameterValues& v) {
        LinkUnit link{Carrier::Hydrogen, v.at("capacity"), {}, nullopt};
        LinkMode mode{"generation", {{Carrier::Electricity, v.at("efficiency")}}};
        if (v.at("heat_efficiency") > 0.0)
            mode.outputs.push_back({Carrier::Heat, v.at("heat_efficiency")});
        link.modes.push_back(mode);
        return link;
    }
    DeviceVariant make_storage(const ParameterValues& v, Carrier bus) {
        return StorageUnit{
            bus,
            v.at("capacity"),
            v.at("capacity") * v.at("max_hours"),
            v.at("charge_efficiency"),
            v.at("discharge_efficiency"),
            v.at("self_discharge"),
            v.at("soc_min"),
            v.at("soc_max"),
            v.at("initial_soc")
        };
    }
    DeviceVariant make_battery(const ParameterValues& v)    { return make_storage(v, Carrier::Electricity); }
    DeviceVariant make_h2_storage(const ParameterValues& v) { return make_storage(v, Carrier::Hydrogen); }

    //
    // checks of parameter combinations
    //
    void check_fuel_cell(const string& device_id, const ParameterValues& v) {
        if (v.at("efficiency") + v.at("heat_efficiency") > 1.0 + 1e-9) {
            throw ConfigurationError("Device '" + device_id + "': the sum of electric and heat efficiency of a fuel cell must not exceed 1.");
        }
    }
    void check_storage(const string& device_id, const ParameterValues& v) {
        if (v.at("soc_min") > v.at("soc_max")) {
            throw ConfigurationError("Device '" + device_id + "': soc_min must not be greater than soc_max.");
        }
        if (v.at("initial_soc") < v.at("soc_min") || v.at("initial_soc") > v.at("soc_max")) {
            throw ConfigurationError("Device '" + device_id + "': initial_soc must be inside [soc_min, soc_max].");
        }
    }

    string format_range(const ParameterSchema& p) {
        stringstream strstr;
        strstr << (p.min_exclusive ? "(" : "[") << p.min_value << ", " << p.max_value;
        strstr << ((std::isinf(p.max_value) && !p.infinite_allowed) ? ")" : "]");
        return strstr.str();
    }

}



// ----------------------------- //
//      Implementation of        //
//   ParameterSchema and         //
//   DeviceArchetype             //
// ----------------------------- //

bool ParameterSchema::is_within_range(double value) const {
    if (std::isnan(value))
        return false;
    if (std::isinf(value) && !infinite_allowed)
        return false;
    if (min_exclusive ? !(value > min_value) : !(value >= min_value))
        return false;
    return value <= max_value;
}

const ParameterSchema* DeviceArchetype::find_parameter(const string& name) const {
    for (const ParameterSchema& p : parameters) {
        if (p.name == name)
            return &p;
    }
    return NULL;
}



// ----------------------------- //
//      Implementation of        //
//        DeviceCatalog          //
// ----------------------------- //

DeviceCatalog::DeviceCatalog() {
    archetypes.push_back({
        "pv", "Photovoltaics", DeviceCapability::Generator,
        {
            capacity_param(100.0, "Peak power, scaled by the PV availability profile"),
            cost_param(0.01),
            investment_param()
        },
        NULL, &make_pv
    });
    archetypes.push_back({
        "grid", "Grid connection", DeviceCapability::Generator,
        {
            {"capacity", INF, 0.0, INF, true, "kW", "Maximal import power", true},
            {"export_capacity", INF, 0.0, INF, false, "kW", "Maximal export power, 0 disables export", true},
            cost_param(0.0),
            investment_param()
        },
        NULL, &make_grid
    });
    archetypes.push_back({
        "electric_boiler", "Electric boiler", DeviceCapability::Link,
        {
            capacity_param(20.0, "Rated electric input power"),
            efficiency_param("efficiency", 0.98, "Heat output per unit of electricity"),
            cost_param(0.0),
            investment_param()
        },
        NULL, &make_electric_boiler
    });
    archetypes.push_back({
        "ashp", "Air source heat pump", DeviceCapability::Link,
        heat_pump_params(3.0, 3.5), NULL, &make_ashp
    });
    archetypes.push_back({
        "gshp_shallow", "Shallow ground source heat pump", DeviceCapability::Link,
        heat_pump_params(4.0, 4.5), NULL, &make_gshp_shallow
    });
    archetypes.push_back({
        "gshp_deep", "Deep ground source heat pump", DeviceCapability::Link,
        heat_pump_params(5.0, 5.5), NULL, &make_gshp_deep
    });
    archetypes.push_back({
        "electrolyzer", "Electrolyzer", DeviceCapability::Link,
        {
            capacity_param(50.0, "Rated electric input power"),
            efficiency_param("efficiency", 0.75, "Hydrogen output per unit of electricity"),
            cost_param(0.0),
            investment_param()
        },
        NULL, &make_electrolyzer
    });
    archetypes.push_back({
        "fuel_cell", "Fuel cell", DeviceCapability::Link,
        {
            capacity_param(50.0, "Rated hydrogen input power"),
            efficiency_param("efficiency", 0.45, "Electricity output per unit of hydrogen"),
            {"heat_efficiency", 0.40, 0.0, 1.0, false, "-", "Heat output per unit of hydrogen"},
            cost_param(0.0),
            investment_param()
        },
        &check_fuel_cell, &make_fuel_cell
    });
    archetypes.push_back({
        "battery", "Battery storage", DeviceCapability::Storage,
        storage_params(30.0, 4.0, 0.9, 0.01), &check_storage, &make_battery
    });
    archetypes.push_back({
        "h2_storage", "Hydrogen storage", DeviceCapability::Storage,
        storage_params(100.0, 20.0, 0.98, 0.005), &check_storage, &make_h2_storage
    });
}

const DeviceArchetype* DeviceCatalog::find(const string& type_name) const {
    for (const DeviceArchetype& a : archetypes) {
        if (a.type_name == type_name)
            return &a;
    }
    return NULL;
}

const DeviceArchetype& DeviceCatalog::get(const string& type_name) const {
    const DeviceArchetype* a = find(type_name);
    if (a == NULL) {
        throw ConfigurationError("Unknown device type '" + type_name + "'.");
    }
    return *a;
}

vector<string> DeviceCatalog::list_types() const {
    vector<string> types;
    for (const DeviceArchetype& a : archetypes)
        types.push_back(a.type_name);
    return types;
}

DeviceSpec DeviceCatalog::resolve_spec(const DeviceSpec& spec) const {
    if (spec.type != "heat_pump")
        return spec;
    DeviceSpec resolved = spec;
    double family = 0.0;
    auto it = resolved.parameters.find("mode_family");
    if (it != resolved.parameters.end()) {
        family = it->second;
        resolved.parameters.erase(it);
    }
    if (family == 0.0) {
        resolved.type = "ashp";
    } else if (family == 1.0) {
        resolved.type = "gshp_shallow";
    } else if (family == 2.0) {
        resolved.type = "gshp_deep";
    } else {
        throw ConfigurationError("Device '" + spec.id + "': parameter 'mode_family' must be 0 (air source), 1 (shallow ground source) or 2 (deep ground source).");
    }
    return resolved;
}

ParameterValues DeviceCatalog::resolve_parameters(const string& type_name, const ParameterValues& given, const string& device_id) const {
    const DeviceArchetype& archetype = get(type_name);
    // reject unknown parameter names
    for (const auto& [name, value] : given) {
        if (archetype.find_parameter(name) == NULL) {
            throw ConfigurationError("Device '" + device_id + "': unknown parameter '" + name + "' for device type '" + type_name + "'.");
        }
    }
    ParameterValues values;
    for (const ParameterSchema& p : archetype.parameters) {
        auto it = given.find(p.name);
        double value = (it != given.end()) ? it->second : p.default_value;
        if (!p.is_within_range(value)) {
            stringstream strstr;
            strstr << "Device '" << device_id << "': parameter '" << p.name << "' = " << value
                   << " is outside of the valid range " << format_range(p) << ".";
            throw ConfigurationError(strstr.str());
        }
        values[p.name] = value;
    }
    if (archetype.check_parameter_combination != NULL)
        archetype.check_parameter_combination(device_id, values);
    return values;
}

Device DeviceCatalog::instantiate(const DeviceSpec& spec, const string& device_id) const {
    DeviceSpec resolved = resolve_spec(spec);
    const DeviceArchetype& archetype = get(resolved.type);
    ParameterValues values = resolve_parameters(resolved.type, resolved.parameters, device_id);
    return Device{
        device_id,
        resolved.type,
        values.at("cost"),
        values.at("investment") > 0.5,
        archetype.make_unit(values)
    };
}
