#pragma once

#include "geoarea/geo_point.hpp"

#include <vector>

namespace geoarea {

// Axis-aligned area between a south-west and a north-east corner. If the
// south-west longitude is larger than the north-east one, the rectangle
// wraps across the antimeridian.
class Rectangle {
public:
    Rectangle(const Point& south_west, const Point& north_east);

    static Rectangle world();

    const Point& south_west() const { return south_west_; }
    const Point& north_east() const { return north_east_; }
    const Point& origin() const { return south_west_; }
    Point center() const;

    Rectangle with_south_west(const Point& south_west) const;
    Rectangle with_north_east(const Point& north_east) const;

    double northing() const;
    double easting() const;
    double surface() const { return northing() * easting(); }
    bool is_wrapped() const { return south_west_.lon() > north_east_.lon(); }

    bool overlaps(const Rectangle& other) const;
    bool contains(const Rectangle& other) const;
    bool contains(const Point& point) const;

    // Smallest rectangle containing this one and the point (or rectangle).
    Rectangle grow(const Point& point) const;
    Rectangle grow(const Rectangle& other) const;

    // Grows the rectangle by a number of meters on every side.
    Rectangle expand(double meters) const;

    // Never wrapped; a wrapped rectangle is split at the antimeridian.
    std::vector<Rectangle> pixelate() const;

    Rectangle translate(const Vector& vector) const;
    Rectangle move_to(const Point& origin) const;

    bool operator==(const Rectangle& other) const;
    bool operator!=(const Rectangle& other) const { return !(*this == other); }
    size_t hash() const;

private:
    Point south_west_;
    Point north_east_;
};

std::ostream& operator<<(std::ostream& os, const Rectangle& rectangle);

} // namespace geoarea

namespace std {
template <>
struct hash<geoarea::Rectangle> {
    size_t operator()(const geoarea::Rectangle& rectangle) const { return rectangle.hash(); }
};
} // namespace std
