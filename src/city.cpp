#include "city.hpp"

#include <utility>

#include "geo.hpp"

namespace citysuggest {

City::City(std::string name, std::string province, std::string country,
           double latitude, double longitude, int64_t population)
    : name(std::move(name)),
      province(std::move(province)),
      country(std::move(country)),
      latitude(latitude),
      longitude(longitude),
      population(population) {}

std::string City::full_name() const {
    return name + ", " + province + ", " + country;
}

double City::distance_from(double lat, double lon) const {
    return great_circle_km(latitude, longitude, lat, lon);
}

double City::distance_from(const City& other) const {
    return distance_from(other.latitude, other.longitude);
}

bool operator==(const City& a, const City& b) {
    if (&a == &b) return true;
    return a.name == b.name &&
           a.province == b.province &&
           a.country == b.country &&
           a.distance_from(b) < CITY_EQ_DISTANCE_KM;
}

bool operator!=(const City& a, const City& b) {
    return !(a == b);
}

} // namespace citysuggest
