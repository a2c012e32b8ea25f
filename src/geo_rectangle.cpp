#include "geoarea/geo_rectangle.hpp"
#include "geoarea/geo.hpp"
#include "geoarea/geo_line.hpp"

#include <algorithm>

namespace geoarea {

namespace {
// East halves stop at LON180 but cover everything up to 180 itself. Compare
// against the mapped value, which is what a Point stores.
double east_bound(const Rectangle& rect) {
    static const double east_edge = map_to_lon(LON180);
    return (rect.north_east().lon() >= east_edge) ? 180.0 : rect.north_east().lon();
}

// Both rectangles must be non-wrapped.
bool simple_overlaps(const Rectangle& a, const Rectangle& b) {
    return !(a.south_west().lat() > b.north_east().lat() ||
             a.north_east().lat() < b.south_west().lat() ||
             a.south_west().lon() > east_bound(b) ||
             east_bound(a) < b.south_west().lon());
}

bool simple_contains(const Rectangle& a, const Rectangle& b) {
    return a.south_west().lat() <= b.south_west().lat() &&
           a.north_east().lat() >= b.north_east().lat() &&
           a.south_west().lon() <= b.south_west().lon() &&
           east_bound(a) >= b.north_east().lon();
}
}

Rectangle::Rectangle(const Point& south_west, const Point& north_east)
    : south_west_(detail::lower_left(south_west, north_east))
    , north_east_(detail::upper_right(south_west, north_east)) {}

Rectangle Rectangle::world() {
    return Rectangle(Point(-90.0, -180.0), Point(90.0, LON180));
}

Point Rectangle::center() const {
    std::optional<double> elevation;
    if (south_west_.elevation() && north_east_.elevation()) {
        elevation = (*south_west_.elevation() + *north_east_.elevation()) / 2.0;
    }
    double lat = (south_west_.lat() + north_east_.lat()) / 2.0;
    double lon = Line(Point(0.0, south_west_.lon()), Point(0.0, north_east_.lon())).center().lon();
    return Point(lat, lon, elevation);
}

Rectangle Rectangle::with_south_west(const Point& south_west) const {
    return Rectangle(south_west, north_east_);
}

Rectangle Rectangle::with_north_east(const Point& north_east) const {
    return Rectangle(south_west_, north_east);
}

double Rectangle::northing() const {
    return std::abs(north_east_.lat() - south_west_.lat());
}

double Rectangle::easting() const {
    if (south_west_.lon() <= north_east_.lon()) {
        return north_east_.lon() - south_west_.lon();
    }
    return 360.0 - (south_west_.lon() - north_east_.lon());
}

bool Rectangle::overlaps(const Rectangle& other) const {
    for (const auto& mine : pixelate()) {
        for (const auto& theirs : other.pixelate()) {
            if (simple_overlaps(mine, theirs)) return true;
        }
    }
    return false;
}

bool Rectangle::contains(const Rectangle& other) const {
    auto mine = pixelate();
    for (const auto& theirs : other.pixelate()) {
        bool inside = std::any_of(mine.begin(), mine.end(), [&](const Rectangle& rect) {
            return simple_contains(rect, theirs);
        });
        if (!inside) return false;
    }
    return true;
}

bool Rectangle::contains(const Point& point) const {
    return contains(Rectangle(point, point));
}

Rectangle Rectangle::grow(const Point& point) const {
    double new_sw_lat = std::min(south_west_.lat(), point.lat());
    double new_ne_lat = std::max(north_east_.lat(), point.lat());

    // There are two ways to grow in longitude; try both.
    double sw_lon1, ne_lon1, sw_lon2, ne_lon2;
    if (is_wrapped()) {
        sw_lon1 = std::min(south_west_.lon(), point.lon());
        ne_lon1 = std::min(north_east_.lon(), point.lon());
        sw_lon2 = std::max(south_west_.lon(), point.lon());
        ne_lon2 = std::max(north_east_.lon(), point.lon());
    } else {
        sw_lon1 = std::min(south_west_.lon(), point.lon());
        ne_lon1 = std::max(north_east_.lon(), point.lon());
        sw_lon2 = std::max(south_west_.lon(), point.lon());
        ne_lon2 = std::min(north_east_.lon(), point.lon());
    }

    Rectangle rect1(Point(new_sw_lat, sw_lon1), Point(new_ne_lat, ne_lon1));
    Rectangle rect2(Point(new_sw_lat, sw_lon2), Point(new_ne_lat, ne_lon2));
    Rectangle rect3(south_west_.with_lat(new_sw_lat), north_east_.with_lat(new_ne_lat));

    // Take the narrowest candidate, unless the point was already covered in
    // longitude; then only the latitude needs stretching.
    const Rectangle& narrowest = (rect1.easting() <= rect2.easting()) ? rect1 : rect2;
    return (narrowest.easting() > easting()) ? narrowest : rect3;
}

Rectangle Rectangle::grow(const Rectangle& other) const {
    // Corners alone miss a rectangle that wraps the long way round, so the
    // result must be checked against both inputs.
    auto covers_both = [&](const Rectangle& candidate) {
        return candidate.contains(*this) && candidate.contains(other);
    };
    Rectangle forward = grow(other.south_west()).grow(other.north_east());
    Rectangle backward = other.grow(south_west_).grow(north_east_);
    bool forward_ok = covers_both(forward);
    bool backward_ok = covers_both(backward);
    if (forward_ok && (!backward_ok || forward.easting() <= backward.easting())) return forward;
    if (backward_ok) return backward;

    double sw_lat = std::min(south_west_.lat(), other.south_west().lat());
    double ne_lat = std::max(north_east_.lat(), other.north_east().lat());
    return Rectangle(south_west_.with_lat(sw_lat).with_lon(-180.0),
                     north_east_.with_lat(ne_lat).with_lon(LON180));
}

Rectangle Rectangle::expand(double meters) const {
    double lat_delta = meters_to_degrees_lat(meters);
    double south_lon_delta = meters_to_degrees_lon_at_lat(meters, south_west_.lat());
    double north_lon_delta = meters_to_degrees_lon_at_lat(meters, north_east_.lat());
    return Rectangle(Point(map_to_lat(south_west_.lat() - lat_delta),
                           south_west_.lon() - south_lon_delta, south_west_.elevation()),
                     Point(map_to_lat(north_east_.lat() + lat_delta),
                           north_east_.lon() + north_lon_delta, north_east_.elevation()));
}

std::vector<Rectangle> Rectangle::pixelate() const {
    if (!is_wrapped()) return {*this};
    return {Rectangle(south_west_.with_lon(-180.0), north_east_),
            Rectangle(south_west_, north_east_.with_lon(LON180))};
}

Rectangle Rectangle::translate(const Vector& vector) const {
    return Rectangle(south_west_.translate(vector), north_east_.translate(vector));
}

Rectangle Rectangle::move_to(const Point& origin) const {
    return Rectangle(origin, origin.translate(Vector(northing(), easting())));
}

bool Rectangle::operator==(const Rectangle& other) const {
    return south_west_ == other.south_west_ && north_east_ == other.north_east_;
}

size_t Rectangle::hash() const {
    size_t seed = south_west_.hash();
    detail::hash_combine(seed, north_east_.hash());
    return seed;
}

std::ostream& operator<<(std::ostream& os, const Rectangle& rectangle) {
    return os << "Rectangle(" << rectangle.south_west() << ", " << rectangle.north_east() << ")";
}

} // namespace geoarea
