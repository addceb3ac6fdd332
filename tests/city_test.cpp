#include <gtest/gtest.h>

#include "city.hpp"
#include "geo.hpp"
#include "textutil.hpp"

namespace citysuggest {

TEST(CityTest, FullName) {
    City c("London", "ON", "Canada", 42.98339, -81.23304, 346765);
    ASSERT_EQ(c.full_name(), "London, ON, Canada");
}

TEST(CityTest, DistanceFrom) {
    City a("a", "b", "c", 27.0, 35.0, 1);
    City b("a", "b", "c", -27.0, 90.0, 1);

    ASSERT_NEAR(a.distance_from(a), 0.0, 0.01);
    ASSERT_NEAR(a.distance_from(b), b.distance_from(a), 0.01);
}

TEST(CityTest, KnownDistances) {
    // Toronto -> Montreal, roughly 504 km
    ASSERT_NEAR(great_circle_km(43.70011, -79.4163, 45.50884, -73.58781), 504.0, 5.0);

    // Quarter of the equator
    ASSERT_NEAR(great_circle_km(0.0, 0.0, 0.0, 90.0), PI * AVG_EARTH_RADIUS_KM / 2.0, 1e-6);

    // Antipodes
    ASSERT_NEAR(great_circle_km(10.0, 20.0, -10.0, -160.0), PI * AVG_EARTH_RADIUS_KM, 1e-6);
}

TEST(CityTest, EqualityToleratesSmallMoves) {
    City a("Paris", "TX", "USA", 33.66094, -95.55551, 25171);
    City moved("Paris", "TX", "USA", 33.66100, -95.55560, 25000);
    City far("Paris", "TX", "USA", 34.0, -95.0, 25171);
    City other_state("Paris", "TN", "USA", 33.66094, -95.55551, 25171);

    ASSERT_TRUE(a == moved);
    ASSERT_FALSE(a == far);
    ASSERT_TRUE(a != other_state);
}

TEST(CityTest, SameCityComparesPointees) {
    auto a = std::make_shared<const City>("Paris", "TX", "USA", 33.66094, -95.55551, 25171);
    auto b = std::make_shared<const City>(*a);
    CityPtr none;

    SameCity eq;
    ASSERT_TRUE(eq(a, b));
    ASSERT_TRUE(eq(none, none));
    ASSERT_FALSE(eq(a, none));
}

TEST(CityTest, ValidCoordinates) {
    ASSERT_TRUE(valid_coordinates(90.0, -180.0));
    ASSERT_TRUE(valid_coordinates(-90.0, 180.0));
    ASSERT_FALSE(valid_coordinates(90.5, 0.0));
    ASSERT_FALSE(valid_coordinates(0.0, -180.01));
}

TEST(NumberParseTest, WholeStringOnly) {
    double d = -1.0;
    ASSERT_TRUE(parse_finite_double("43.70011", d));
    ASSERT_DOUBLE_EQ(d, 43.70011);
    ASSERT_TRUE(parse_finite_double("-1e2", d));
    ASSERT_DOUBLE_EQ(d, -100.0);

    d = 7.0;
    ASSERT_FALSE(parse_finite_double("43.7abc", d));
    ASSERT_FALSE(parse_finite_double("nan", d));
    ASSERT_FALSE(parse_finite_double("-inf", d));
    ASSERT_FALSE(parse_finite_double("", d));
    ASSERT_FALSE(parse_finite_double("1e999", d));
    ASSERT_DOUBLE_EQ(d, 7.0);

    int64_t n = 3;
    ASSERT_TRUE(parse_int64("346765", n));
    ASSERT_EQ(n, 346765);
    ASSERT_FALSE(parse_int64("5000xyz", n));
    ASSERT_FALSE(parse_int64("12.5", n));
    ASSERT_FALSE(parse_int64("99999999999999999999", n));
    ASSERT_EQ(n, 346765);
}

} // namespace citysuggest
