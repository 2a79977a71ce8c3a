#include "network.h"

#include <cmath>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "components.h"
#include "device_catalog.h"
#include "tariff.h"

using namespace std;



// ----------------------------- //
//      Implementation of        //
//           Scenario            //
// ----------------------------- //

const vector<double>& Scenario::get_load(Carrier c) const {
    switch (c) {
        case Carrier::Electricity: return electrical_load;
        case Carrier::Heat:        return heat_load;
        case Carrier::Cooling:     return cooling_load;
        case Carrier::Hydrogen:    return hydrogen_load;
    }
    return electrical_load;
}

bool Scenario::has_demand(Carrier c) const {
    for (double v : get_load(c)) {
        if (v != 0.0)
            return true;
    }
    return false;
}

void Scenario::validate() const {
    if (horizon_steps == 0) {
        throw ConfigurationError("The scenario horizon must contain at least one time step.");
    }
    if (!isfinite(timestep_hours) || timestep_hours <= 0.0) {
        throw ConfigurationError("The time step size must be greater than 0 hours.");
    }
    if (!isfinite(start_hour) || start_hour < 0.0 || start_hour >= 24.0) {
        throw ConfigurationError("The start hour must be inside [0, 24).");
    }
    auto check_series = [&](const vector<double>& series, const string& name, double max_value) {
        if (series.empty())
            return;
        if (series.size() != horizon_steps) {
            stringstream strstr;
            strstr << "Scenario series '" << name << "' has " << series.size() << " values, but the horizon has " << horizon_steps << " time steps.";
            throw ConfigurationError(strstr.str());
        }
        for (size_t t = 0; t < series.size(); t++) {
            if (!isfinite(series[t]) || series[t] < 0.0 || series[t] > max_value) {
                stringstream strstr;
                strstr << "Scenario series '" << name << "' has the invalid value " << series[t] << " at time step " << t << ".";
                throw ConfigurationError(strstr.str());
            }
        }
    };
    const double inf = numeric_limits<double>::infinity();
    check_series(electrical_load, "electrical load", inf);
    check_series(heat_load,       "heat load",       inf);
    check_series(cooling_load,    "cooling load",    inf);
    check_series(hydrogen_load,   "hydrogen load",   inf);
    check_series(pv_availability, "pv availability", 1.0);
}



// ----------------------------- //
//      Implementation of        //
//           Network             //
// ----------------------------- //

const Bus* Network::find_bus(Carrier c) const {
    for (const Bus& b : buses) {
        if (b.carrier == c)
            return &b;
    }
    return NULL;
}

size_t Network::get_bus_index(Carrier c) const {
    for (size_t idx = 0; idx < buses.size(); idx++) {
        if (buses[idx].carrier == c)
            return idx;
    }
    throw logic_error(string("Network contains no bus for carrier ") + carrier_name(c) + ".");
}

bool Network::requires_mode_exclusivity() const {
    for (const Device& d : devices) {
        const LinkUnit* link = get_if<LinkUnit>(&d.unit);
        if (link != NULL && link->has_mode_exclusivity())
            return true;
    }
    return false;
}

const Device* Network::find_device(const string& device_id) const {
    for (const Device& d : devices) {
        if (d.id == device_id)
            return &d;
    }
    return NULL;
}



// ----------------------------- //
//      Implementation of        //
//        build_network          //
// ----------------------------- //

Network build_network(const vector<DeviceSpec>& selected_devices, const Scenario& scenario) {
    scenario.validate();

    Network net;
    net.horizon        = scenario.horizon_steps;
    net.timestep_hours = scenario.timestep_hours;
    net.start_hour     = scenario.start_hour;
    if (!scenario.tou_bands.empty()) {
        net.tariff.emplace(scenario.tou_bands);
    }

    //
    // instantiate all devices
    const DeviceCatalog& catalog = DeviceCatalog::GetInstance();
    set<string> used_ids;
    for (const DeviceSpec& spec : selected_devices) {
        string device_id = spec.id;
        if (device_id.empty()) {
            // generate an id from the type name: pv, pv_2, pv_3, ...
            device_id = spec.type;
            for (unsigned int counter = 2; used_ids.contains(device_id); counter++)
                device_id = spec.type + "_" + to_string(counter);
        } else if (used_ids.contains(device_id)) {
            throw ConfigurationError("Device id '" + device_id + "' is used more than once.");
        }
        used_ids.insert(device_id);

        Device device = catalog.instantiate(spec, device_id);
        if (GeneratorUnit* gen = get_if<GeneratorUnit>(&device.unit)) {
            if (gen->uses_pv_availability) {
                if (scenario.pv_availability.empty()) {
                    throw ConfigurationError("Device '" + device_id + "' requires a PV availability profile, but the scenario contains none.");
                }
                gen->availability = scenario.pv_availability;
            }
            if (gen->tariff_priced && !net.tariff.has_value()) {
                throw ConfigurationError("Device '" + device_id + "' is a grid connection, but the scenario contains no time-of-use bands.");
            }
        }
        net.devices.push_back(std::move(device));
    }

    //
    // create one bus per carrier in use
    for (Carrier c : all_carriers) {
        bool referenced = scenario.has_demand(c);
        for (const Device& d : net.devices) {
            for (Carrier dc : d.get_connected_carriers()) {
                if (dc == c)
                    referenced = true;
            }
        }
        if (!referenced)
            continue;
        Bus bus;
        bus.carrier = c;
        const vector<double>& load = scenario.get_load(c);
        bus.demand_kW = load.empty() ? vector<double>(scenario.horizon_steps, 0.0) : load;
        net.buses.push_back(std::move(bus));
    }

    //
    // attach the devices to their buses
    for (size_t devIdx = 0; devIdx < net.devices.size(); devIdx++) {
        for (Carrier c : net.devices[devIdx].get_connected_carriers()) {
            net.buses[net.get_bus_index(c)].devices.push_back(devIdx);
        }
    }

    //
    // consistency checks
    //   a) every demand must have a possible supplier
    for (const Bus& bus : net.buses) {
        if (!scenario.has_demand(bus.carrier))
            continue;
        bool supplied = false;
        for (size_t devIdx : bus.devices) {
            for (Carrier c : net.devices[devIdx].get_injected_carriers()) {
                if (c == bus.carrier)
                    supplied = true;
            }
        }
        if (!supplied) {
            throw ConfigurationError(string("There is a ") + carrier_name(bus.carrier) + " demand, but no selected device can supply " + carrier_name(bus.carrier) + ".");
        }
    }
    //   b) every device must have a meaningful bus context
    auto has_sink = [&](Carrier c, size_t except_devIdx) -> bool {
        if (scenario.has_demand(c))
            return true;
        for (size_t devIdx = 0; devIdx < net.devices.size(); devIdx++) {
            if (devIdx == except_devIdx)
                continue;
            for (Carrier wc : net.devices[devIdx].get_withdrawn_carriers()) {
                if (wc == c)
                    return true;
            }
        }
        return false;
    };
    for (size_t devIdx = 0; devIdx < net.devices.size(); devIdx++) {
        const Device& d = net.devices[devIdx];
        if (const GeneratorUnit* gen = get_if<GeneratorUnit>(&d.unit)) {
            if (!has_sink(gen->bus, devIdx)) {
                throw ConfigurationError("Device '" + d.id + "' supplies " + carrier_name(gen->bus) + ", but there is neither a " + carrier_name(gen->bus) + " demand nor a device consuming it.");
            }
        } else if (const StorageUnit* st = get_if<StorageUnit>(&d.unit)) {
            const Bus* bus = net.find_bus(st->bus);
            if (!scenario.has_demand(st->bus) && bus->devices.size() < 2) {
                throw ConfigurationError("Device '" + d.id + "' stores " + carrier_name(st->bus) + ", but there is neither a " + carrier_name(st->bus) + " demand nor another device using it.");
            }
        } else if (const LinkUnit* link = get_if<LinkUnit>(&d.unit)) {
            bool any_sink = false;
            for (Carrier c : d.get_injected_carriers()) {
                if (c != link->input && has_sink(c, devIdx))
                    any_sink = true;
            }
            if (!any_sink) {
                throw ConfigurationError("Device '" + d.id + "' converts " + carrier_name(link->input) + ", but none of its output carriers has a demand or a consuming device.");
            }
        }
    }

    return net;
}
