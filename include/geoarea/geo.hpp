#pragma once

#include "geoarea/geo_point.hpp"

#include <chrono>
#include <cmath>

namespace geoarea {

// WGS84 radii.
constexpr double EARTH_RADIUS_X_METERS = 6378137.0;
constexpr double EARTH_RADIUS_Y_METERS = 6356752.3142;

constexpr double EARTH_CIRCUMFERENCE_X = EARTH_RADIUS_X_METERS * 2.0 * M_PI;
constexpr double EARTH_CIRCUMFERENCE_Y = EARTH_RADIUS_Y_METERS * 2.0 * M_PI;

// Meters per degree latitude is fixed; per degree longitude it must be
// multiplied by cos(lat).
constexpr double METERS_PER_DEGREE_LAT = EARTH_CIRCUMFERENCE_Y / 360.0;
constexpr double METERS_PER_DEGREE_LON_EQUATOR = EARTH_CIRCUMFERENCE_X / 360.0;

// Largest longitude that does not wrap to -180.
constexpr double LON180 = 179.999999999999;

double degrees_lat_to_meters(double lat_degrees);
double meters_to_degrees_lat(double north_meters);
double degrees_lon_to_meters_at_lat(double lon_degrees, double lat);
double meters_to_degrees_lon_at_lat(double east_meters, double lat);

// Planar approximation, fine up to ~200km. Includes elevation difference
// when both points have one.
double distance_in_meters(const Point& p1, const Point& p2);

// Crow-flight travel time estimate; the distance is first rounded to the
// nearest multiple of round_to_meters (0 means 1).
std::chrono::seconds estimated_min_travel_time(const Point& from, const Point& to,
                                               int round_to_meters = 1);

// Translates any geo object by a distance in meters, converted to degrees
// at the latitude of the object's origin.
template <typename T>
T translate_meters(const T& object, double northing_meters, double easting_meters,
                   double elevation_meters = 0.0) {
    double lat = object.origin().lat();
    return object.translate(Vector(meters_to_degrees_lat(northing_meters),
                                   meters_to_degrees_lon_at_lat(easting_meters, lat),
                                   elevation_meters));
}

// Inline utility
inline double deg2rad(double deg) { return deg * M_PI / 180.0; }

} // namespace geoarea
