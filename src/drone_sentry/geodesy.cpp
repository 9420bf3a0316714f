#include "drone_sentry/geodesy.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace drone_sentry {

namespace {

constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

constexpr double radians_to_degrees(double radians) {
    return radians * 180.0 / std::numbers::pi;
}

}  // namespace

double haversine_distance_m(const GeodeticCoordinate& from, const GeodeticCoordinate& to) {
    const double lat1 = degrees_to_radians(from.latitude_deg);
    const double lat2 = degrees_to_radians(to.latitude_deg);
    const double delta_lat = lat2 - lat1;
    const double delta_lon = degrees_to_radians(to.longitude_deg - from.longitude_deg);

    const double a = std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(delta_lon / 2.0), 2);
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(std::max(0.0, 1.0 - a)));
    return k_earth_radius_m * c;
}

double initial_bearing_deg(const GeodeticCoordinate& from, const GeodeticCoordinate& to) {
    const double lat1 = degrees_to_radians(from.latitude_deg);
    const double lat2 = degrees_to_radians(to.latitude_deg);
    const double delta_lon = degrees_to_radians(to.longitude_deg - from.longitude_deg);

    const double y = std::sin(delta_lon) * std::cos(lat2);
    const double x = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(delta_lon);
    const double bearing_rad = std::atan2(y, x);
    return std::fmod(radians_to_degrees(bearing_rad) + 360.0, 360.0);
}

GeodeticCoordinate advance_coordinate(const GeodeticCoordinate& start, double distance_m, double bearing_deg) {
    const double angular_distance = distance_m / k_earth_radius_m;
    const double bearing_rad = degrees_to_radians(bearing_deg);
    const double lat_rad = degrees_to_radians(start.latitude_deg);
    const double lon_rad = degrees_to_radians(start.longitude_deg);

    const double new_lat = std::asin(
        std::sin(lat_rad) * std::cos(angular_distance) + std::cos(lat_rad) * std::sin(angular_distance) * std::cos(bearing_rad)
    );

    const double new_lon = lon_rad
        + std::atan2(
            std::sin(bearing_rad) * std::sin(angular_distance) * std::cos(lat_rad),
            std::cos(angular_distance) - std::sin(lat_rad) * std::sin(new_lat)
        );

    return GeodeticCoordinate{radians_to_degrees(new_lat), radians_to_degrees(new_lon), start.altitude_m};
}

}  // namespace drone_sentry
