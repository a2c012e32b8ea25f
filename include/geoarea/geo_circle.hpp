#pragma once

#include "geoarea/geo_rectangle.hpp"

namespace geoarea {

class Circle {
public:
    // Radius must be >= 0.
    Circle(const Point& center, double radius_meters);

    // Circle around center passing through point_on_circle.
    Circle(const Point& center, const Point& point_on_circle);

    const Point& center() const { return center_; }
    const Point& origin() const { return center_; }
    double radius_meters() const { return radius_meters_; }

    Circle with_center(const Point& center) const;
    Circle with_radius_meters(double radius_meters) const;

    Rectangle bounding_box() const;

    // Largest rectangle that fits inside the circle.
    Rectangle inner_bounding_box() const;

    bool overlaps(const Circle& other) const;
    bool contains(const Circle& other) const;
    bool contains(const Point& point) const;

    Circle translate(const Vector& vector) const;
    Circle move_to(const Point& origin) const;

    bool operator==(const Circle& other) const;
    bool operator!=(const Circle& other) const { return !(*this == other); }
    size_t hash() const;

private:
    Rectangle scaled_box(double factor) const;

    Point center_;
    double radius_meters_;
};

std::ostream& operator<<(std::ostream& os, const Circle& circle);

} // namespace geoarea

namespace std {
template <>
struct hash<geoarea::Circle> {
    size_t operator()(const geoarea::Circle& circle) const { return circle.hash(); }
};
} // namespace std
