#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace citysuggest {

// Two cities with the same name, province and country closer than this
// (in km) are treated as the same city.
constexpr double CITY_EQ_DISTANCE_KM = 1.0;

struct City {
    std::string name;
    std::string province; // province or state code, e.g. "ON"
    std::string country;
    double latitude = 0.0;  // degrees
    double longitude = 0.0; // degrees
    int64_t population = 0;

    City() = default;
    City(std::string name, std::string province, std::string country,
         double latitude, double longitude, int64_t population);

    // "name, province, country"
    std::string full_name() const;

    // Great-circle distance in km to a position / another city.
    double distance_from(double lat, double lon) const;
    double distance_from(const City& other) const;
};

// Equality tolerates small position differences, so it is not transitive.
bool operator==(const City& a, const City& b);
bool operator!=(const City& a, const City& b);

using CityPtr = std::shared_ptr<const City>;

// Compares the pointed-to cities, for use as the radix tree's Equal.
struct SameCity {
    bool operator()(const CityPtr& a, const CityPtr& b) const {
        if (a == b) return true;
        if (!a || !b) return false;
        return *a == *b;
    }
};

} // namespace citysuggest
