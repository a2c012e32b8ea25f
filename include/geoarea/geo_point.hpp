#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>

namespace geoarea {

// Wraps any longitude into [-180, 180).
double map_to_lon(double value);

// Clamps a latitude to [-90, 90].
double map_to_lat(double value);

class Vector {
public:
    Vector(double northing, double easting, double elevation = 0.0);

    double northing() const { return northing_; }
    double easting() const { return easting_; }
    double elevation() const { return elevation_; }

    bool operator==(const Vector& other) const;
    bool operator!=(const Vector& other) const { return !(*this == other); }
    size_t hash() const;

private:
    double northing_;
    double easting_;
    double elevation_;
};

class Point {
public:
    // Latitude must be in [-90, 90]; longitude is wrapped into [-180, 180).
    // A NaN elevation is treated as absent.
    Point(double lat, double lon, std::optional<double> elevation = std::nullopt);

    double lat() const { return lat_; }
    double lon() const { return lon_; }
    const std::optional<double>& elevation() const { return elevation_; }
    bool has_elevation() const { return elevation_.has_value(); }

    Point with_lat(double lat) const;
    Point with_lon(double lon) const;
    Point with_elevation(std::optional<double> elevation) const;

    Point translate(const Vector& vector) const;
    Point move_to(const Point& origin) const { return origin; }
    const Point& origin() const { return *this; }
    const Point& center() const { return *this; }

    bool operator==(const Point& other) const;
    bool operator!=(const Point& other) const { return !(*this == other); }
    size_t hash() const;

private:
    double lat_;
    double lon_;
    std::optional<double> elevation_;
};

std::ostream& operator<<(std::ostream& os, const Vector& vector);
std::ostream& operator<<(std::ostream& os, const Point& point);

namespace detail {
inline void hash_combine(size_t& seed, size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

// Corners of a span ordered by latitude; longitudes stay where they were given.
inline Point lower_left(const Point& sw, const Point& ne) {
    return (sw.lat() <= ne.lat()) ? sw : sw.with_lat(ne.lat());
}

inline Point upper_right(const Point& sw, const Point& ne) {
    return (sw.lat() <= ne.lat()) ? ne : ne.with_lat(sw.lat());
}
}

} // namespace geoarea

namespace std {
template <>
struct hash<geoarea::Point> {
    size_t operator()(const geoarea::Point& point) const { return point.hash(); }
};

template <>
struct hash<geoarea::Vector> {
    size_t operator()(const geoarea::Vector& vector) const { return vector.hash(); }
};
} // namespace std
