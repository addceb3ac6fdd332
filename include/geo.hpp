#pragma once

#include <algorithm>
#include <cmath>

namespace citysuggest {

constexpr double AVG_EARTH_RADIUS_KM = 6371.0;
constexpr double PI = 3.14159265358979323846;

inline double deg_to_rad(double degrees) {
    return degrees * (PI / 180.0);
}

inline double haversine(double radians) {
    double s = std::sin(radians / 2.0);
    return s * s;
}

// Latitude within [-90, 90] and longitude within [-180, 180].
inline bool valid_coordinates(double latitude, double longitude) {
    return std::fabs(latitude) <= 90.0 && std::fabs(longitude) <= 180.0;
}

// Great-circle distance in km between two (latitude, longitude) pairs
// given in degrees, using the haversine formula.
inline double great_circle_km(double lat1, double lon1, double lat2, double lon2) {
    double phi1 = deg_to_rad(lat1);
    double phi2 = deg_to_rad(lat2);
    double d_phi = phi2 - phi1;
    double d_lambda = deg_to_rad(lon2 - lon1);

    double h = haversine(d_phi) + std::cos(phi1) * std::cos(phi2) * haversine(d_lambda);

    // h can drift just above 1.0 for antipodal points
    return AVG_EARTH_RADIUS_KM * 2.0 * std::asin(std::min(1.0, std::sqrt(h)));
}

} // namespace citysuggest
