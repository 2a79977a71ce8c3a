/*
 * network.h
 *
 * It contains the scenario definition, the buses and the network
 * (i.e. buses plus wired devices) as well as the network builder.
 *
 */

#ifndef NETWORK_H
#define NETWORK_H

#include <cstddef>
#include <optional>
#include <vector>

#include "components.h"
#include "tariff.h"


/*!
 * All time dependent input of one dispatch run.
 * A scenario is created once per run and is not modified during the solve.
 */
struct Scenario {
    std::size_t horizon_steps = 0;
    double timestep_hours = 1.0; ///< Length of one time step in hours
    double start_hour = 0.0;     ///< Hour of the day at the start of time step 0
    std::vector<double> electrical_load; ///< Average demand in kW per time step, empty means no demand
    std::vector<double> heat_load;
    std::vector<double> cooling_load;
    std::vector<double> hydrogen_load;
    std::vector<double> pv_availability; ///< Per unit availability in [0, 1], may only be empty if no PV is selected
    std::vector<TariffBand> tou_bands;   ///< Time-of-use bands for the grid connection

    /**
     * Returns the demand series of a carrier (may be empty)
     */
    const std::vector<double>& get_load(Carrier c) const;
    bool has_demand(Carrier c) const; ///< True, if any demand value of the carrier is non-zero

    /**
     * Checks horizon, series lengths and value ranges.
     * @throws ConfigurationError
     */
    void validate() const;
};


/*!
 * Aggregation point enforcing supply = demand at every time step for one carrier.
 */
struct Bus {
    Carrier carrier;
    std::vector<double> demand_kW;      ///< Demand per time step (always of horizon length)
    std::vector<std::size_t> devices;   ///< Indices of all attached devices in Network::get_devices()
};


/*!
 * A wired network: one bus per carrier in use plus all devices.
 * Instances are created by build_network() and are read-only afterwards.
 */
class Network {
    public:
        const std::vector<Bus>& get_buses() const       { return buses; }
        const std::vector<Device>& get_devices() const  { return devices; }
        const Bus* find_bus(Carrier c) const; ///< Returns NULL, if no bus exists for the carrier
        bool has_bus(Carrier c) const { return find_bus(c) != NULL; }
        std::size_t get_bus_index(Carrier c) const; ///< Throws std::logic_error if there is no such bus

        std::size_t get_horizon() const          { return horizon; }
        double get_timestep_hours() const        { return timestep_hours; }
        double get_start_hour() const            { return start_hour; }
        const std::optional<TariffSchedule>& get_tariff() const { return tariff; }

        /**
         * True, if at least one device has more than one exclusive operating mode (i.e. a heat pump).
         * In this case, binary mode indicators are required.
         */
        bool requires_mode_exclusivity() const;
        const Device* find_device(const std::string& device_id) const;

    private:
        friend Network build_network(const std::vector<DeviceSpec>& selected_devices, const Scenario& scenario);
        Network() = default;
        std::vector<Bus> buses;
        std::vector<Device> devices;
        std::size_t horizon = 0;
        double timestep_hours = 1.0;
        double start_hour = 0.0;
        std::optional<TariffSchedule> tariff;
};


/**
 * Builds a fully wired network from the selected devices and the scenario.
 *
 * One bus is created for every carrier referenced by a device or by a non-zero scenario demand.
 * Heat pumps are attached as dual-mode links to the electricity, heat and cooling buses.
 *
 * @param selected_devices: The devices as selected by the user
 * @param scenario: The scenario (horizon, demand, availability and tariff)
 *
 * @return: The new network
 * @throws ConfigurationError: On invalid parameters or scenario data, or if a device or a demand cannot be connected meaningfully
 * @throws TariffConfigError: On an invalid time-of-use schedule
 */
Network build_network(const std::vector<DeviceSpec>& selected_devices, const Scenario& scenario);

#endif
