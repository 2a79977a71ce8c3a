/*
 * components.h
 *
 * It contains the energy carriers, the device variant (generator,
 * storage unit, link) and the error types shared by all parts
 * of the dispatch optimization.
 *
 */

#ifndef COMPONENTS_H
#define COMPONENTS_H

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>


/*!
 * The energy carriers. Every carrier in use is balanced on its own bus.
 */
enum struct Carrier : short {
    Electricity,
    Heat,
    Cooling,
    Hydrogen
};

/*!
 * List of all carriers in the order of their enum values
 */
const Carrier all_carriers[] = { Carrier::Electricity, Carrier::Heat, Carrier::Cooling, Carrier::Hydrogen };

const char* carrier_name(Carrier c); ///< Returns the lower case name of a carrier, e.g. "electricity"

/*!
 * Invalid device or scenario parameters. The caller must fix
 * the input before requesting a new solve.
 */
class ConfigurationError : public std::runtime_error {
    public:
        explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
};

/*!
 * Malformed time-of-use schedule (gap, overlap, invalid hours or prices).
 */
class TariffConfigError : public std::runtime_error {
    public:
        explicit TariffConfigError(const std::string& msg) : std::runtime_error(msg) {}
};


typedef std::map<std::string, double> ParameterValues; ///< (parameter name, value)

/*!
 * A device as selected by the user: a catalog type plus parameter values.
 * Parameters that are not given are taken from the catalog defaults.
 */
struct DeviceSpec {
    std::string type;           ///< Catalog type name, e.g. "battery" or "gshp_deep"
    std::string id;             ///< Unique id inside one request. If empty, the type name (plus a counter if required) is used.
    ParameterValues parameters;
};

enum struct HeatPumpFamily : short {
    AirSource,
    ShallowGroundSource,
    DeepGroundSource
};

const char* heat_pump_family_name(HeatPumpFamily family);

/*!
 * Produces onto exactly one bus.
 * Output is bounded by capacity_kW * availability[t].
 */
struct GeneratorUnit {
    Carrier bus;
    double capacity_kW;
    bool   uses_pv_availability;   ///< If true, the output is bounded by the scenario PV availability profile
    std::vector<double> availability; ///< Per unit availability per time step, empty means always 1.0
    bool   tariff_priced;          ///< True for the grid tie: energy is bought at the time-of-use buy price
    double export_capacity_kW;     ///< Grid tie only: maximal power that can be sold back, 0.0 disables export
};

/*!
 * Charges and discharges on exactly one bus.
 * SOC[t+1] = SOC[t] * (1 - self_discharge_per_h * dt) + charge[t] * eta_c * dt - discharge[t] / eta_d * dt
 */
struct StorageUnit {
    Carrier bus;
    double power_capacity_kW;
    double energy_capacity_kWh;
    double charge_efficiency;
    double discharge_efficiency;
    double self_discharge_per_h; ///< Fraction of the stored energy that is lost per hour
    double soc_min_fraction;
    double soc_max_fraction;
    double initial_soc_fraction; ///< Only used for the boundary policy FixedInitial
};

struct LinkOutput {
    Carrier carrier;
    double  efficiency; ///< Output per unit of input (a COP for heat pumps)
};

/*!
 * One operating mode of a link. Every mode has its own input flow.
 */
struct LinkMode {
    std::string name;
    std::vector<LinkOutput> outputs;
};

/*!
 * Converts a flow of the input carrier into flows of one or more output carriers.
 * A link with more than one mode can only operate in one mode per time step (mode exclusivity),
 * and all modes share the input capacity.
 */
struct LinkUnit {
    Carrier input;
    double  capacity_kW; ///< Maximal input flow (i.e. rated electric input for a heat pump)
    std::vector<LinkMode> modes;
    std::optional<HeatPumpFamily> heat_pump_family;

    bool has_mode_exclusivity() const { return modes.size() > 1; }
};

typedef std::variant<GeneratorUnit, StorageUnit, LinkUnit> DeviceVariant;

/*!
 * The capability set of a device, i.e. the active alternative of DeviceVariant
 */
enum struct DeviceCapability : short {
    Generator,
    Storage,
    Link
};

const char* capability_name(DeviceCapability capability);

/*!
 * A device wired into a network.
 */
struct Device {
    std::string id;
    std::string type;       ///< Catalog type name
    double marginal_cost;   ///< Cost per kWh of the primary flow (generator output, link input, storage discharge)
    bool   investment;      ///< Investment flag, carried but not used for dispatch
    DeviceVariant unit;

    DeviceCapability get_capability() const;
    std::vector<Carrier> get_connected_carriers() const; ///< All carriers the device is attached to
    std::vector<Carrier> get_injected_carriers() const;  ///< Carriers onto which the device can inject energy
    std::vector<Carrier> get_withdrawn_carriers() const; ///< Carriers from which the device can draw energy
    bool is_grid_tie() const;
};

#endif
