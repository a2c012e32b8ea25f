#pragma once

#include "geoarea/geo_point.hpp"

#include <vector>

namespace geoarea {

// A line from south-west to north-east. Latitudes are swapped on
// construction if needed; longitudes are kept, so a line may run east
// across the antimeridian.
class Line {
public:
    Line(const Point& south_west, const Point& north_east);

    const Point& south_west() const { return south_west_; }
    const Point& north_east() const { return north_east_; }
    const Point& origin() const { return south_west_; }
    Point center() const;

    Line with_south_west(const Point& south_west) const;
    Line with_north_east(const Point& north_east) const;

    double northing() const;
    double easting() const;
    double length_meters() const;
    bool is_wrapped_on_long_side() const { return easting() >= 180.0; }

    Line translate(const Vector& vector) const;
    Line move_to(const Point& origin) const;

    bool operator==(const Line& other) const;
    bool operator!=(const Line& other) const { return !(*this == other); }
    size_t hash() const;

private:
    Point south_west_;
    Point north_east_;
};

// Returns the line between two points that does not cross the long side
// of the Earth.
Line shortest_line(const Point& from, const Point& to);

class PolyLine {
public:
    // Needs at least 2 points.
    explicit PolyLine(std::vector<Point> points);

    size_t size() const { return points_.size(); }
    const Point& at(size_t i) const;
    const std::vector<Point>& points() const { return points_; }

    Line line(size_t i) const;
    std::vector<Line> as_lines() const;
    double length_meters() const;

    const Point& origin() const { return points_.front(); }
    Point center() const;

    PolyLine translate(const Vector& vector) const;
    PolyLine move_to(const Point& origin) const;

    bool operator==(const PolyLine& other) const { return points_ == other.points_; }
    bool operator!=(const PolyLine& other) const { return !(*this == other); }
    size_t hash() const;

private:
    std::vector<Point> points_;
};

std::ostream& operator<<(std::ostream& os, const Line& line);
std::ostream& operator<<(std::ostream& os, const PolyLine& poly_line);

} // namespace geoarea

namespace std {
template <>
struct hash<geoarea::Line> {
    size_t operator()(const geoarea::Line& line) const { return line.hash(); }
};
} // namespace std
