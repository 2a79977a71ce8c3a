#include "components.h"

#include <algorithm>
#include <string>
#include <variant>
#include <vector>


using namespace std;


const char* carrier_name(Carrier c) {
    switch (c) {
        case Carrier::Electricity: return "electricity";
        case Carrier::Heat:        return "heat";
        case Carrier::Cooling:     return "cooling";
        case Carrier::Hydrogen:    return "hydrogen";
    }
    return "";
}

const char* heat_pump_family_name(HeatPumpFamily family) {
    switch (family) {
        case HeatPumpFamily::AirSource:           return "air source";
        case HeatPumpFamily::ShallowGroundSource: return "shallow ground source";
        case HeatPumpFamily::DeepGroundSource:    return "deep ground source";
    }
    return "";
}

const char* capability_name(DeviceCapability capability) {
    switch (capability) {
        case DeviceCapability::Generator: return "generator";
        case DeviceCapability::Storage:   return "storage";
        case DeviceCapability::Link:      return "link";
    }
    return "";
}



// ----------------------------- //
//      Implementation of        //
//            Device             //
// ----------------------------- //

DeviceCapability Device::get_capability() const {
    if (holds_alternative<GeneratorUnit>(unit))
        return DeviceCapability::Generator;
    else if (holds_alternative<StorageUnit>(unit))
        return DeviceCapability::Storage;
    return DeviceCapability::Link;
}

vector<Carrier> Device::get_connected_carriers() const {
    vector<Carrier> carriers = get_withdrawn_carriers();
    for (Carrier c : get_injected_carriers()) {
        if (find(carriers.begin(), carriers.end(), c) == carriers.end())
            carriers.push_back(c);
    }
    return carriers;
}

vector<Carrier> Device::get_injected_carriers() const {
    vector<Carrier> carriers;
    if (const GeneratorUnit* gen = get_if<GeneratorUnit>(&unit)) {
        carriers.push_back(gen->bus);
    } else if (const StorageUnit* st = get_if<StorageUnit>(&unit)) {
        carriers.push_back(st->bus);
    } else if (const LinkUnit* link = get_if<LinkUnit>(&unit)) {
        for (const LinkMode& mode : link->modes) {
            for (const LinkOutput& out : mode.outputs) {
                if (find(carriers.begin(), carriers.end(), out.carrier) == carriers.end())
                    carriers.push_back(out.carrier);
            }
        }
    }
    return carriers;
}

vector<Carrier> Device::get_withdrawn_carriers() const {
    vector<Carrier> carriers;
    if (const GeneratorUnit* gen = get_if<GeneratorUnit>(&unit)) {
        if (gen->tariff_priced && gen->export_capacity_kW > 0.0)
            carriers.push_back(gen->bus);
    } else if (const StorageUnit* st = get_if<StorageUnit>(&unit)) {
        carriers.push_back(st->bus);
    } else if (const LinkUnit* link = get_if<LinkUnit>(&unit)) {
        carriers.push_back(link->input);
    }
    return carriers;
}

bool Device::is_grid_tie() const {
    const GeneratorUnit* gen = get_if<GeneratorUnit>(&unit);
    return gen != NULL && gen->tariff_priced;
}
