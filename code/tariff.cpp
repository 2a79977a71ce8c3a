#include "tariff.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>
#include <vector>

#include "helper.h"

using namespace std;


namespace {
    const double HOUR_EPS = 1e-9;

    string band_to_string(const TariffBand& b) {
        stringstream strstr;
        strstr << "[" << b.start_hour << "h, " << b.end_hour << "h)";
        return strstr.str();
    }
}


TariffSchedule::TariffSchedule(const vector<TariffBand>& bands_) : bands(bands_) {
    if (bands.empty()) {
        throw TariffConfigError("Time-of-use schedule contains no bands.");
    }
    //
    // check every band on its own and split wrapping bands
    for (size_t idx = 0; idx < bands.size(); idx++) {
        const TariffBand& b = bands[idx];
        if (!isfinite(b.start_hour) || !isfinite(b.end_hour) || b.start_hour < 0.0 || b.start_hour >= 24.0 || b.end_hour < 0.0 || b.end_hour > 24.0) {
            throw TariffConfigError("Tariff band " + band_to_string(b) + ": start hour must be inside [0, 24), end hour inside [0, 24].");
        }
        if (fabs(b.end_hour - b.start_hour) < HOUR_EPS) {
            throw TariffConfigError("Tariff band " + band_to_string(b) + " has zero length.");
        }
        if (!isfinite(b.buy_price) || !isfinite(b.sell_price)) {
            throw TariffConfigError("Tariff band " + band_to_string(b) + ": prices must be finite.");
        }
        if (b.sell_price > b.buy_price) {
            throw TariffConfigError("Tariff band " + band_to_string(b) + ": sell price must not exceed the buy price.");
        }
        if (b.start_hour < b.end_hour) {
            segments.push_back({b.start_hour, b.end_hour, idx});
        } else {
            // wraps around midnight
            segments.push_back({b.start_hour, 24.0, idx});
            if (b.end_hour > 0.0)
                segments.push_back({0.0, b.end_hour, idx});
        }
    }
    //
    // check that the segments partition the day
    sort(segments.begin(), segments.end(),
         [](const Segment& a, const Segment& b) { return a.start < b.start; });
    double covered_until = 0.0;
    for (const Segment& s : segments) {
        if (s.start > covered_until + HOUR_EPS) {
            stringstream strstr;
            strstr << "Time-of-use schedule has a gap between " << covered_until << "h and " << s.start << "h.";
            throw TariffConfigError(strstr.str());
        }
        if (s.start < covered_until - HOUR_EPS) {
            throw TariffConfigError("Tariff band " + band_to_string(bands[s.band_index]) + " overlaps with another band.");
        }
        covered_until = s.end;
    }
    if (covered_until < 24.0 - HOUR_EPS) {
        stringstream strstr;
        strstr << "Time-of-use schedule has a gap between " << covered_until << "h and 24h.";
        throw TariffConfigError(strstr.str());
    }
}

TariffSchedule TariffSchedule::Flat(double buy_price, double sell_price) {
    return TariffSchedule({ TariffBand{0.0, 24.0, buy_price, sell_price} });
}

TariffPrice TariffSchedule::price_at_hour(double hour_of_day) const {
    double h = fmod(hour_of_day, 24.0);
    if (h < 0.0)
        h += 24.0;
    for (const Segment& s : segments) {
        if (h >= s.start - HOUR_EPS && h < s.end - HOUR_EPS) {
            const TariffBand& b = bands[s.band_index];
            return {b.buy_price, b.sell_price};
        }
    }
    // only reachable for h very close to 24.0
    const TariffBand& b = bands[segments.back().band_index];
    return {b.buy_price, b.sell_price};
}

TariffPrice TariffSchedule::price_at(size_t t, double timestep_hours, double start_hour) const {
    return price_at_hour(hour_of_day_at_step(t, timestep_hours, start_hour));
}

vector<double> TariffSchedule::buy_prices(size_t horizon, double timestep_hours, double start_hour) const {
    vector<double> prices(horizon);
    for (size_t t = 0; t < horizon; t++)
        prices[t] = price_at(t, timestep_hours, start_hour).buy;
    return prices;
}

vector<double> TariffSchedule::sell_prices(size_t horizon, double timestep_hours, double start_hour) const {
    vector<double> prices(horizon);
    for (size_t t = 0; t < horizon; t++)
        prices[t] = price_at(t, timestep_hours, start_hour).sell;
    return prices;
}
