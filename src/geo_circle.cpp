#include "geoarea/geo_circle.hpp"
#include "geoarea/geo.hpp"
#include "geoarea/log.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

namespace geoarea {

namespace {
// Half the side of a square inscribed in a unit circle.
constexpr double COS_45 = 0.707106781186548;

double checked_radius(double radius_meters) {
    if (!(radius_meters >= 0.0)) {
        std::ostringstream os;
        os << "Radius must be >= 0: " << radius_meters;
        throw std::invalid_argument(os.str());
    }
    return radius_meters;
}

// Radius lies in the surface plane; elevation does not count.
double radius_between(const Point& center, const Point& point) {
    return distance_in_meters(center.with_elevation(std::nullopt),
                              point.with_elevation(std::nullopt));
}
}

Circle::Circle(const Point& center, double radius_meters)
    : center_(center)
    , radius_meters_(checked_radius(radius_meters)) {}

Circle::Circle(const Point& center, const Point& point_on_circle)
    : center_(center)
    , radius_meters_(radius_between(center, point_on_circle)) {}

Circle Circle::with_center(const Point& center) const {
    return Circle(center, radius_meters_);
}

Circle Circle::with_radius_meters(double radius_meters) const {
    return Circle(center_, radius_meters);
}

Rectangle Circle::scaled_box(double factor) const {
    double meters = radius_meters_ * factor;
    double delta_lat = meters_to_degrees_lat(meters);
    double delta_lon = meters_to_degrees_lon_at_lat(meters, center_.lat());

    double south = map_to_lat(center_.lat() - delta_lat);
    double north = map_to_lat(center_.lat() + delta_lat);
    if (!(delta_lon < 180.0)) {
        // Wider than the Earth at this latitude.
        logger()->debug("Circle of {}m at lat {} spans all longitudes", meters, center_.lat());
        return Rectangle(Point(south, -180.0), Point(north, LON180));
    }
    return Rectangle(Point(south, center_.lon() - delta_lon),
                     Point(north, center_.lon() + delta_lon));
}

Rectangle Circle::bounding_box() const {
    return scaled_box(1.0);
}

Rectangle Circle::inner_bounding_box() const {
    return scaled_box(COS_45);
}

bool Circle::overlaps(const Circle& other) const {
    return bounding_box().overlaps(other.bounding_box());
}

bool Circle::contains(const Circle& other) const {
    return bounding_box().contains(other.bounding_box());
}

bool Circle::contains(const Point& point) const {
    return bounding_box().contains(point);
}

Circle Circle::translate(const Vector& vector) const {
    return Circle(center_.translate(vector), radius_meters_);
}

Circle Circle::move_to(const Point& origin) const {
    return Circle(origin, radius_meters_);
}

bool Circle::operator==(const Circle& other) const {
    return center_ == other.center_ && radius_meters_ == other.radius_meters_;
}

size_t Circle::hash() const {
    size_t seed = center_.hash();
    detail::hash_combine(seed, std::hash<double>{}(radius_meters_));
    return seed;
}

std::ostream& operator<<(std::ostream& os, const Circle& circle) {
    return os << "Circle(" << circle.center() << ", " << circle.radius_meters() << "m)";
}

} // namespace geoarea
