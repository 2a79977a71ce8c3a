/*
 * device_catalog.h
 *
 * Static registry of all device archetypes with their parameter schemas.
 *
 */

#ifndef DEVICE_CATALOG_H
#define DEVICE_CATALOG_H

#include <string>
#include <vector>

#include "components.h"


/*!
 * Schema of one device parameter: default value and valid range.
 */
struct ParameterSchema {
    std::string name;
    double default_value;
    double min_value;
    double max_value;
    bool   min_exclusive; ///< If true, the value must be strictly greater than min_value
    std::string unit;
    std::string description;
    bool infinite_allowed = false; ///< Only parameters that become variable bounds may be unlimited

    bool is_within_range(double value) const;
};

/*!
 * One archetype of the catalog, e.g. "battery".
 */
struct DeviceArchetype {
    std::string type_name;
    std::string display_name;
    DeviceCapability capability;
    std::vector<ParameterSchema> parameters;
    /**
     * Additional checks involving more than one parameter.
     * Throws ConfigurationError. Can be NULL.
     */
    void (*check_parameter_combination)(const std::string& device_id, const ParameterValues& values);
    /**
     * Creates the device variant from a complete and validated parameter set.
     */
    DeviceVariant (*make_unit)(const ParameterValues& values);

    const ParameterSchema* find_parameter(const std::string& name) const;
};


/*!
 * The catalog of device archetypes.
 *
 * The catalog is created on first use and is read-only afterwards,
 * therefore it can be used from concurrent solves without locking.
 */
class DeviceCatalog {
    public:
        DeviceCatalog(DeviceCatalog const&) = delete;
        void operator=(DeviceCatalog const&) = delete;

        /**
         * Returns the process-wide catalog instance.
         */
        static const DeviceCatalog& GetInstance() {
            static DeviceCatalog instance_;  // thread-safe since C++11, instantiated on first use
            return instance_;
        }

        /**
         * Returns the archetype for a type name or NULL, if the type is unknown.
         * Aliases like "heat_pump" are not resolved here, see DeviceCatalog::resolve_spec().
         */
        const DeviceArchetype* find(const std::string& type_name) const;
        /**
         * Returns the archetype for a type name, throws ConfigurationError if the type is unknown.
         */
        const DeviceArchetype& get(const std::string& type_name) const;
        /**
         * Returns all type names in catalog order.
         */
        std::vector<std::string> list_types() const;
        const std::vector<DeviceArchetype>& get_archetypes() const { return archetypes; }

        /**
         * Resolves the type aliases of a device specification and returns a specification with
         * a canonical type name. The generic type "heat_pump" selects the heat pump archetype
         * using the numeric parameter 'mode_family' (0 = air source, 1 = shallow ground source,
         * 2 = deep ground source).
         */
        DeviceSpec resolve_spec(const DeviceSpec& spec) const;

        /**
         * Merges the given parameter values with the defaults of the archetype
         * and validates the result.
         *
         * @param type_name: Canonical type name
         * @param given: Parameters given by the user
         * @param device_id: Device id, only used for error messages
         *
         * @return: The complete parameter set
         * @throws ConfigurationError: On unknown parameters, values out of range and invalid combinations
         */
        ParameterValues resolve_parameters(const std::string& type_name, const ParameterValues& given, const std::string& device_id) const;

        /**
         * Creates a device from a specification (aliases, defaults and validation included).
         * Scenario dependent data (like availability profiles) is not set.
         */
        Device instantiate(const DeviceSpec& spec, const std::string& device_id) const;

    private:
        DeviceCatalog();
        std::vector<DeviceArchetype> archetypes;
};

#endif
