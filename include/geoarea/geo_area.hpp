#pragma once

#include "geoarea/geo_circle.hpp"
#include "geoarea/geo_rectangle.hpp"

#include <memory>
#include <variant>
#include <vector>

namespace geoarea {

class Area;

// Complement of an area.
class Inverse {
public:
    explicit Inverse(Area area);

    const Area& area() const;

    bool operator==(const Inverse& other) const;
    bool operator!=(const Inverse& other) const { return !(*this == other); }
    size_t hash() const;

private:
    std::shared_ptr<const Area> area_;
};

class BinaryExpr {
public:
    BinaryExpr(Area left, Area right);

    const Area& left() const;
    const Area& right() const;

protected:
    bool same_operands(const BinaryExpr& other) const;
    size_t operands_hash() const;

private:
    std::shared_ptr<const Area> left_;
    std::shared_ptr<const Area> right_;
};

class Union : public BinaryExpr {
public:
    using BinaryExpr::BinaryExpr;

    bool operator==(const Union& other) const { return same_operands(other); }
    bool operator!=(const Union& other) const { return !(*this == other); }
    size_t hash() const { return operands_hash(); }
};

// Left minus right.
class Difference : public BinaryExpr {
public:
    using BinaryExpr::BinaryExpr;

    bool operator==(const Difference& other) const { return same_operands(other); }
    bool operator!=(const Difference& other) const { return !(*this == other); }
    size_t hash() const { return operands_hash(); }
};

class Intersection : public BinaryExpr {
public:
    using BinaryExpr::BinaryExpr;

    bool operator==(const Intersection& other) const { return same_operands(other); }
    bool operator!=(const Intersection& other) const { return !(*this == other); }
    size_t hash() const { return operands_hash(); }
};

// An immutable area expression: a rectangle or circle, or one of the
// set operations over other areas. Operands are shared, so copies are
// cheap.
//
// overlaps() and contains() are approximations based on bounding boxes,
// they may report overlap where there is none.
class Area {
public:
    using Node = std::variant<Rectangle, Circle, Inverse, Union, Difference, Intersection>;

    Area(Rectangle rectangle) : node_(std::move(rectangle)) {}
    Area(Circle circle) : node_(std::move(circle)) {}
    Area(Inverse inverse) : node_(std::move(inverse)) {}
    Area(Union expr) : node_(std::move(expr)) {}
    Area(Difference expr) : node_(std::move(expr)) {}
    Area(Intersection expr) : node_(std::move(expr)) {}

    // Union of all areas, optimized after every step. Needs at least one.
    static Area from_areas(const std::vector<Area>& areas);

    const Node& node() const { return node_; }

    template <typename T>
    const T* get_if() const { return std::get_if<T>(&node_); }

    // False for rectangles and circles.
    bool is_compound() const;

    // Symmetric: a.overlaps(b) == b.overlaps(a).
    bool overlaps(const Area& other) const;
    bool contains(const Area& other) const;
    bool contains(const Point& point) const;

    Rectangle bounding_box() const;

    // Covers the area with non-wrapped rectangles. Never empty; the
    // rectangles may overlap.
    std::vector<Rectangle> pixelate() const;

    // South-west corner of the bounding box.
    Point origin() const;
    Point center() const;

    Area translate(const Vector& vector) const;
    Area move_to(const Point& origin) const;

    // Drops operands made redundant by containment. Not a canonical form.
    Area optimize() const;

    Area add(const Area& other) const;
    Area subtract(const Area& other) const;
    Area intersect(const Area& other) const;
    Area invert() const;

    bool operator==(const Area& other) const { return node_ == other.node_; }
    bool operator!=(const Area& other) const { return !(*this == other); }
    size_t hash() const;

private:
    Node node_;
};

std::ostream& operator<<(std::ostream& os, const Area& area);

} // namespace geoarea

namespace std {
template <>
struct hash<geoarea::Area> {
    size_t operator()(const geoarea::Area& area) const { return area.hash(); }
};
} // namespace std
