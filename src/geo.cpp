#include "geoarea/geo.hpp"
#include "geoarea/log.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>
#include <string>

namespace geoarea {

namespace {
struct SpeedBand {
    double from_km;
    double max_speed_kmh;
};

// Each band is valid from its distance up to the next band's distance.
constexpr std::array<SpeedBand, 11> CROW_FLIGHT_SPEED_TABLE = {{
    {0, 15},
    {1, 20},
    {2, 30},
    {3, 35},
    {4, 40},
    {6, 45},
    {10, 50},
    {15, 60},
    {25, 65},
    {50, 70},
    {100, 90},
}};

double round_half_up(double value) {
    return std::floor(value + 0.5);
}
}

double degrees_lat_to_meters(double lat_degrees) {
    return lat_degrees * METERS_PER_DEGREE_LAT;
}

double meters_to_degrees_lat(double north_meters) {
    return north_meters / METERS_PER_DEGREE_LAT;
}

double degrees_lon_to_meters_at_lat(double lon_degrees, double lat) {
    return lon_degrees * METERS_PER_DEGREE_LON_EQUATOR * std::cos(deg2rad(lat));
}

double meters_to_degrees_lon_at_lat(double east_meters, double lat) {
    return (east_meters / METERS_PER_DEGREE_LON_EQUATOR) / std::cos(deg2rad(lat));
}

double distance_in_meters(const Point& p1, const Point& p2) {
    double delta_lon;
    if (p1.lon() > p2.lon()) {
        delta_lon = 360.0 - (p1.lon() - p2.lon());
    } else {
        delta_lon = p2.lon() - p1.lon();
    }
    if (delta_lon > 180.0) delta_lon = 360.0 - delta_lon;

    double delta_lat = std::abs(p1.lat() - p2.lat());
    double mid_lat = p1.lat() + (p2.lat() - p1.lat()) / 2.0;

    double dx = degrees_lon_to_meters_at_lat(delta_lon, mid_lat);
    double dy = degrees_lat_to_meters(delta_lat);
    double dz = 0.0;
    if (p1.elevation() && p2.elevation()) dz = *p1.elevation() - *p2.elevation();

    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

std::chrono::seconds estimated_min_travel_time(const Point& from, const Point& to,
                                               int round_to_meters) {
    if (round_to_meters < 0) {
        throw std::invalid_argument("round_to_meters must be >= 0: " +
                                    std::to_string(round_to_meters));
    }
    double unit = (round_to_meters == 0) ? 1.0 : static_cast<double>(round_to_meters);
    double distance = round_half_up(distance_in_meters(from, to) / unit) * unit;
    double rounded = distance;

    double total_secs = 0.0;
    for (size_t i = 0; i < CROW_FLIGHT_SPEED_TABLE.size() && distance > 0; i++) {
        const auto& band = CROW_FLIGHT_SPEED_TABLE[i];
        double band_m = std::numeric_limits<double>::infinity();
        if (i + 1 < CROW_FLIGHT_SPEED_TABLE.size()) {
            band_m = (CROW_FLIGHT_SPEED_TABLE[i + 1].from_km - band.from_km) * 1000.0;
        }
        double meters_per_sec = band.max_speed_kmh * 1000.0 / 3600.0;
        total_secs += std::min(distance, band_m) / meters_per_sec;
        distance -= band_m;
    }
    logger()->trace("Travel time for {}m: {}s", rounded, total_secs);
    return std::chrono::seconds(static_cast<long long>(round_half_up(total_secs)));
}

} // namespace geoarea
