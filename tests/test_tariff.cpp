#include <catch2/catch.hpp>

#include <vector>

#include "components.h"
#include "tariff.h"

TEST_CASE("Valid time-of-use schedules", "[tariff]") {

    SECTION("flat tariff covers the whole day") {
        TariffSchedule flat = TariffSchedule::Flat(0.4, 0.1);
        for (double h : {0.0, 7.5, 12.0, 23.99}) {
            CHECK(flat.price_at_hour(h).buy  == Approx(0.4));
            CHECK(flat.price_at_hour(h).sell == Approx(0.1));
        }
    }

    SECTION("bands are looked up by the start of the time step") {
        TariffSchedule tou({ {0.0, 8.0, 0.3, 0.0}, {8.0, 18.0, 1.0, 0.0}, {18.0, 24.0, 0.6, 0.0} });
        CHECK(tou.price_at(0).buy  == Approx(0.3));
        CHECK(tou.price_at(7).buy  == Approx(0.3));
        CHECK(tou.price_at(8).buy  == Approx(1.0));
        CHECK(tou.price_at(17).buy == Approx(1.0));
        CHECK(tou.price_at(18).buy == Approx(0.6));
        CHECK(tou.price_at(23).buy == Approx(0.6));
        // the schedule is tiled over days
        CHECK(tou.price_at(24).buy == Approx(0.3));
        CHECK(tou.price_at(32).buy == Approx(1.0));
    }

    SECTION("time step size and start hour shift the lookup") {
        TariffSchedule tou({ {0.0, 8.0, 0.3, 0.0}, {8.0, 24.0, 1.0, 0.0} });
        // 15 minute steps: step 32 starts at 8:00
        CHECK(tou.price_at(31, 0.25).buy == Approx(0.3));
        CHECK(tou.price_at(32, 0.25).buy == Approx(1.0));
        // start at 20:00: step 4 starts at midnight
        CHECK(tou.price_at(3, 1.0, 20.0).buy == Approx(1.0));
        CHECK(tou.price_at(4, 1.0, 20.0).buy == Approx(0.3));
    }

    SECTION("a band may wrap around midnight") {
        TariffSchedule tou({ {22.0, 6.0, 0.2, 0.05}, {6.0, 22.0, 0.8, 0.05} });
        CHECK(tou.price_at_hour(23.0).buy == Approx(0.2));
        CHECK(tou.price_at_hour(0.0).buy  == Approx(0.2));
        CHECK(tou.price_at_hour(5.5).buy  == Approx(0.2));
        CHECK(tou.price_at_hour(6.0).buy  == Approx(0.8));
        CHECK(tou.price_at_hour(21.9).buy == Approx(0.8));
    }

    SECTION("price vectors have horizon length") {
        TariffSchedule tou({ {0.0, 12.0, 0.3, 0.1}, {12.0, 24.0, 0.9, 0.2} });
        std::vector<double> buy  = tou.buy_prices(48);
        std::vector<double> sell = tou.sell_prices(48);
        REQUIRE(buy.size()  == 48);
        REQUIRE(sell.size() == 48);
        CHECK(buy[11]  == Approx(0.3));
        CHECK(buy[12]  == Approx(0.9));
        CHECK(sell[36] == Approx(0.1));
        CHECK(sell[47] == Approx(0.2));
    }
}

TEST_CASE("Malformed time-of-use schedules are rejected", "[tariff]") {
    CHECK_THROWS_AS(TariffSchedule(std::vector<TariffBand>{}), TariffConfigError);
    // gap between 8 and 9
    CHECK_THROWS_AS(TariffSchedule({ {0.0, 8.0, 0.3, 0.0}, {9.0, 24.0, 1.0, 0.0} }), TariffConfigError);
    // gap at the end of the day
    CHECK_THROWS_AS(TariffSchedule({ {0.0, 20.0, 0.3, 0.0} }), TariffConfigError);
    // overlap
    CHECK_THROWS_AS(TariffSchedule({ {0.0, 10.0, 0.3, 0.0}, {8.0, 24.0, 1.0, 0.0} }), TariffConfigError);
    // a wrapping band overlapping a normal band
    CHECK_THROWS_AS(TariffSchedule({ {22.0, 6.0, 0.2, 0.0}, {4.0, 22.0, 0.8, 0.0} }), TariffConfigError);
    // invalid hours
    CHECK_THROWS_AS(TariffSchedule({ {-1.0, 24.0, 0.3, 0.0} }), TariffConfigError);
    CHECK_THROWS_AS(TariffSchedule({ {0.0, 25.0, 0.3, 0.0} }), TariffConfigError);
    CHECK_THROWS_WITH(TariffSchedule({ {24.0, 8.0, 0.3, 0.0} }), Catch::Contains("start hour must be inside [0, 24), end hour inside [0, 24]"));
    CHECK_NOTHROW(TariffSchedule({ {0.0, 24.0, 0.3, 0.0} }));
    CHECK_NOTHROW(TariffSchedule({ {8.0, 0.0, 0.3, 0.0}, {0.0, 8.0, 0.1, 0.0} }));
    // zero length
    CHECK_THROWS_AS(TariffSchedule({ {0.0, 0.0, 0.3, 0.0}, {0.0, 24.0, 0.3, 0.0} }), TariffConfigError);
    // selling must not be more expensive than buying
    CHECK_THROWS_AS(TariffSchedule::Flat(0.2, 0.3), TariffConfigError);
}
