#include "geoarea/geo_line.hpp"
#include "geoarea/geo.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace geoarea {

Line::Line(const Point& south_west, const Point& north_east)
    : south_west_(detail::lower_left(south_west, north_east))
    , north_east_(detail::upper_right(south_west, north_east)) {}

Point Line::center() const {
    double lat = (south_west_.lat() + north_east_.lat()) / 2.0;
    double east = (north_east_.lon() >= south_west_.lon()) ? north_east_.lon()
                                                            : north_east_.lon() + 360.0;
    return Point(lat, (east + south_west_.lon()) / 2.0);
}

Line Line::with_south_west(const Point& south_west) const {
    return Line(south_west, north_east_);
}

Line Line::with_north_east(const Point& north_east) const {
    return Line(south_west_, north_east);
}

double Line::northing() const {
    return north_east_.lat() - south_west_.lat();
}

double Line::easting() const {
    if (north_east_.lon() >= south_west_.lon()) {
        return north_east_.lon() - south_west_.lon();
    }
    return 360.0 + (north_east_.lon() - south_west_.lon());
}

double Line::length_meters() const {
    return distance_in_meters(south_west_, north_east_);
}

Line Line::translate(const Vector& vector) const {
    return Line(south_west_.translate(vector), north_east_.translate(vector));
}

Line Line::move_to(const Point& origin) const {
    return Line(origin, origin.translate(Vector(northing(), easting())));
}

bool Line::operator==(const Line& other) const {
    return south_west_ == other.south_west_ && north_east_ == other.north_east_;
}

size_t Line::hash() const {
    size_t seed = south_west_.hash();
    detail::hash_combine(seed, north_east_.hash());
    return seed;
}

Line shortest_line(const Point& from, const Point& to) {
    Line shortest(from, to);
    if (shortest.is_wrapped_on_long_side()) {
        shortest = Line(to, from);
    }
    return shortest;
}

PolyLine::PolyLine(std::vector<Point> points) : points_(std::move(points)) {
    if (points_.size() < 2) {
        throw std::invalid_argument("PolyLine needs at least 2 points, got " +
                                    std::to_string(points_.size()));
    }
}

const Point& PolyLine::at(size_t i) const {
    if (i >= points_.size()) {
        throw std::out_of_range("PolyLine point index out of range: " + std::to_string(i));
    }
    return points_[i];
}

Line PolyLine::line(size_t i) const {
    if (i + 1 >= points_.size()) {
        throw std::out_of_range("PolyLine line index out of range: " + std::to_string(i));
    }
    return Line(points_[i], points_[i + 1]);
}

std::vector<Line> PolyLine::as_lines() const {
    std::vector<Line> lines;
    lines.reserve(points_.size() - 1);
    for (size_t i = 1; i < points_.size(); i++) {
        lines.emplace_back(points_[i - 1], points_[i]);
    }
    return lines;
}

double PolyLine::length_meters() const {
    double meters = 0.0;
    for (size_t i = 1; i < points_.size(); i++) {
        meters += Line(points_[i - 1], points_[i]).length_meters();
    }
    return meters;
}

Point PolyLine::center() const {
    Point south_west = points_.front();
    Point north_east = points_.front();
    for (const auto& point : points_) {
        if (Line(south_west, point).is_wrapped_on_long_side()) {
            south_west = south_west.with_lon(point.lon());
        } else if (!Line(north_east, point).is_wrapped_on_long_side()) {
            north_east = north_east.with_lon(point.lon());
        }
        if (point.lat() < south_west.lat()) {
            south_west = south_west.with_lat(point.lat());
        } else if (point.lat() > north_east.lat()) {
            north_east = north_east.with_lat(point.lat());
        }
    }
    double east = (north_east.lon() >= south_west.lon()) ? north_east.lon()
                                                          : north_east.lon() + 360.0;
    return Point((south_west.lat() + north_east.lat()) / 2.0,
                 (south_west.lon() + east) / 2.0);
}

PolyLine PolyLine::translate(const Vector& vector) const {
    std::vector<Point> translated;
    translated.reserve(points_.size());
    for (const auto& point : points_) {
        translated.push_back(point.translate(vector));
    }
    return PolyLine(std::move(translated));
}

PolyLine PolyLine::move_to(const Point& origin) const {
    const Point& first = points_.front();
    Line line(first, origin);
    double northing = (origin.lat() >= first.lat()) ? line.northing() : -line.northing();
    return translate(Vector(northing, line.easting()));
}

size_t PolyLine::hash() const {
    size_t seed = points_.size();
    for (const auto& point : points_) {
        detail::hash_combine(seed, point.hash());
    }
    return seed;
}

std::ostream& operator<<(std::ostream& os, const Line& line) {
    return os << "Line(" << line.south_west() << ", " << line.north_east() << ")";
}

std::ostream& operator<<(std::ostream& os, const PolyLine& poly_line) {
    os << "PolyLine(";
    for (size_t i = 0; i < poly_line.size(); i++) {
        if (i > 0) os << ", ";
        os << poly_line.points()[i];
    }
    return os << ")";
}

} // namespace geoarea
