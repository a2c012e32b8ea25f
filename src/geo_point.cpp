#include "geoarea/geo_point.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

namespace geoarea {

namespace {
std::string to_text(double value) {
    std::ostringstream os;
    os << value;
    return os.str();
}

std::optional<double> normalize_elevation(std::optional<double> elevation) {
    if (elevation && std::isnan(*elevation)) return std::nullopt;
    return elevation;
}
}

double map_to_lon(double value) {
    double sign = (value >= 0) ? 1.0 : -1.0;
    double lon = (std::fmod(std::abs(value) + 180.0, 360.0) - 180.0) * sign;
    if (lon == 180.0) lon = -180.0;
    return lon;
}

double map_to_lat(double value) {
    return std::clamp(value, -90.0, 90.0);
}

Vector::Vector(double northing, double easting, double elevation)
    : northing_(northing)
    , easting_(easting)
    , elevation_(elevation) {
    if (!(northing >= -180.0 && northing <= 180.0)) {
        throw std::invalid_argument("Northing not in [-180, 180]: " + to_text(northing));
    }
    if (!(easting >= -360.0 && easting <= 360.0)) {
        throw std::invalid_argument("Easting not in [-360, 360]: " + to_text(easting));
    }
    if (!std::isfinite(elevation)) {
        throw std::invalid_argument("Elevation must be finite: " + to_text(elevation));
    }
}

bool Vector::operator==(const Vector& other) const {
    return northing_ == other.northing_ &&
           easting_ == other.easting_ &&
           elevation_ == other.elevation_;
}

size_t Vector::hash() const {
    size_t seed = std::hash<double>{}(northing_);
    detail::hash_combine(seed, std::hash<double>{}(easting_));
    detail::hash_combine(seed, std::hash<double>{}(elevation_));
    return seed;
}

Point::Point(double lat, double lon, std::optional<double> elevation)
    : lat_(lat)
    , lon_(0.0)
    , elevation_(normalize_elevation(elevation)) {
    if (!(lat >= -90.0 && lat <= 90.0)) {
        throw std::invalid_argument("Latitude not in [-90, 90]: " + to_text(lat));
    }
    if (!std::isfinite(lon)) {
        throw std::invalid_argument("Longitude must be finite: " + to_text(lon));
    }
    lon_ = map_to_lon(lon);
}

Point Point::with_lat(double lat) const {
    return Point(lat, lon_, elevation_);
}

Point Point::with_lon(double lon) const {
    return Point(lat_, lon, elevation_);
}

Point Point::with_elevation(std::optional<double> elevation) const {
    return Point(lat_, lon_, elevation);
}

Point Point::translate(const Vector& vector) const {
    double new_lat = map_to_lat(lat_ + vector.northing());
    double new_lon = lon_ + vector.easting();
    if (new_lon < -180.0) {
        new_lon += 360.0;
    } else if (new_lon >= 180.0) {
        new_lon -= 360.0;
    }
    std::optional<double> new_elevation;
    if (elevation_) new_elevation = *elevation_ + vector.elevation();
    return Point(new_lat, new_lon, new_elevation);
}

bool Point::operator==(const Point& other) const {
    return lat_ == other.lat_ && lon_ == other.lon_ && elevation_ == other.elevation_;
}

size_t Point::hash() const {
    size_t seed = std::hash<double>{}(lat_);
    detail::hash_combine(seed, std::hash<double>{}(lon_));
    detail::hash_combine(seed, elevation_ ? std::hash<double>{}(*elevation_) : 0);
    return seed;
}

std::ostream& operator<<(std::ostream& os, const Vector& vector) {
    return os << "Vector(" << vector.northing() << ", " << vector.easting() << ", "
              << vector.elevation() << ")";
}

std::ostream& operator<<(std::ostream& os, const Point& point) {
    os << "Point(" << point.lat() << ", " << point.lon();
    if (point.elevation()) os << ", " << *point.elevation();
    return os << ")";
}

} // namespace geoarea
