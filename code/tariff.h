/*
 * tariff.h
 *
 * Time-of-use tariffs for the grid connection.
 *
 */

#ifndef TARIFF_H
#define TARIFF_H

#include <cstddef>
#include <vector>

#include "components.h"


/*!
 * One time-of-use band, e.g. a valley, flat or peak period.
 * The band covers the hours [start_hour, end_hour) of each day.
 * If end_hour < start_hour, the band wraps around midnight.
 */
struct TariffBand {
    double start_hour; ///< In [0, 24)
    double end_hour;   ///< In [0, 24]
    double buy_price;  ///< Price per kWh for grid import
    double sell_price; ///< Revenue per kWh for grid export
};

struct TariffPrice {
    double buy;
    double sell;
};


/*!
 * A validated time-of-use schedule.
 *
 * The bands must partition the 24 hour cycle without gaps or overlaps,
 * the schedule is tiled over the whole horizon.
 */
class TariffSchedule {
    public:
        /**
         * Creates and validates a new schedule.
         * @throws TariffConfigError: If the list is empty, hours are invalid, bands overlap, leave gaps, or if a sell price is higher than the corresponding buy price
         */
        explicit TariffSchedule(const std::vector<TariffBand>& bands);

        /**
         * Creates a flat tariff, i.e. a single band covering the complete day.
         */
        static TariffSchedule Flat(double buy_price, double sell_price);

        TariffPrice price_at_hour(double hour_of_day) const;
        /**
         * Returns the prices valid at time step t.
         * @param t: Time step index, starting at 0
         * @param timestep_hours: Length of one time step in hours
         * @param start_hour: Hour of the day at the start of time step 0
         */
        TariffPrice price_at(std::size_t t, double timestep_hours = 1.0, double start_hour = 0.0) const;

        std::vector<double> buy_prices(std::size_t horizon, double timestep_hours = 1.0, double start_hour = 0.0) const;
        std::vector<double> sell_prices(std::size_t horizon, double timestep_hours = 1.0, double start_hour = 0.0) const;

    private:
        struct Segment {
            double start;
            double end;
            std::size_t band_index;
        };
        std::vector<TariffBand> bands;  ///< Bands as given by the user
        std::vector<Segment> segments;  ///< Non-wrapping segments, sorted by start hour
};

#endif
