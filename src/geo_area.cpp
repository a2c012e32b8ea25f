#include "geoarea/geo_area.hpp"
#include "geoarea/log.hpp"

#include <algorithm>
#include <stdexcept>

namespace geoarea {

namespace {
std::vector<Rectangle> intersect_pixels(const std::vector<Rectangle>& a,
                                        const std::vector<Rectangle>& b) {
    std::vector<Rectangle> pixels;
    for (const auto& p : a) {
        for (const auto& q : b) {
            if (!p.overlaps(q)) continue;
            Point south_west(std::max(p.south_west().lat(), q.south_west().lat()),
                             std::max(p.south_west().lon(), q.south_west().lon()));
            Point north_east(std::min(p.north_east().lat(), q.north_east().lat()),
                             std::min(p.north_east().lon(), q.north_east().lon()));
            pixels.emplace_back(south_west, north_east);
        }
    }
    return pixels;
}

// One half of overlaps(); the caller checks both directions.
struct OverlapsTowards {
    const Area& other;

    bool operator()(const Rectangle& rectangle) const {
        return rectangle.overlaps(other.bounding_box());
    }
    bool operator()(const Circle& circle) const {
        return circle.bounding_box().overlaps(other.bounding_box());
    }
    bool operator()(const Inverse& inverse) const {
        return !inverse.area().contains(other);
    }
    bool operator()(const Union& expr) const {
        return expr.left().overlaps(other) || expr.right().overlaps(other);
    }
    bool operator()(const Difference& expr) const {
        return expr.left().overlaps(other) &&
               !expr.right().contains(other) &&
               !expr.right().contains(expr.left());
    }
    bool operator()(const Intersection& expr) const {
        return expr.left().overlaps(expr.right()) &&
               expr.left().overlaps(other) &&
               expr.right().overlaps(other);
    }
};

struct Contains {
    const Area& other;

    bool operator()(const Rectangle& rectangle) const {
        return rectangle.contains(other.bounding_box());
    }
    bool operator()(const Circle& circle) const {
        return circle.bounding_box().contains(other.bounding_box());
    }
    bool operator()(const Inverse& inverse) const {
        return !inverse.area().overlaps(other);
    }
    bool operator()(const Union& expr) const {
        if (expr.left().overlaps(expr.right())) {
            // Touching operands: use the combined bounding box.
            return expr.left().bounding_box().grow(expr.right().bounding_box()).contains(
                other.bounding_box());
        }
        return expr.left().contains(other) || expr.right().contains(other);
    }
    bool operator()(const Difference& expr) const {
        return expr.left().contains(other) && !expr.right().overlaps(other);
    }
    bool operator()(const Intersection& expr) const {
        return expr.left().contains(other) && expr.right().contains(other);
    }
};

struct BoundingBox {
    Rectangle operator()(const Rectangle& rectangle) const { return rectangle; }
    Rectangle operator()(const Circle& circle) const { return circle.bounding_box(); }
    Rectangle operator()(const Inverse&) const { return Rectangle::world(); }
    Rectangle operator()(const Union& expr) const {
        return expr.left().bounding_box().grow(expr.right().bounding_box());
    }
    Rectangle operator()(const Difference& expr) const { return expr.left().bounding_box(); }
    Rectangle operator()(const Intersection& expr) const {
        Rectangle left = expr.left().bounding_box();
        auto pixels = intersect_pixels(left.pixelate(), expr.right().bounding_box().pixelate());
        if (pixels.empty()) {
            logger()->debug("Intersection of disjoint areas, using left bounding box");
            return left;
        }
        Rectangle box = pixels.front();
        for (size_t i = 1; i < pixels.size(); i++) {
            box = box.grow(pixels[i]);
        }
        return box;
    }
};

struct Pixelate {
    std::vector<Rectangle> operator()(const Rectangle& rectangle) const {
        return rectangle.pixelate();
    }
    std::vector<Rectangle> operator()(const Circle& circle) const {
        return circle.bounding_box().pixelate();
    }
    std::vector<Rectangle> operator()(const Inverse&) const {
        return {Rectangle::world()};
    }
    std::vector<Rectangle> operator()(const Union& expr) const {
        auto pixels = expr.left().pixelate();
        auto right = expr.right().pixelate();
        pixels.insert(pixels.end(), right.begin(), right.end());
        return pixels;
    }
    std::vector<Rectangle> operator()(const Difference& expr) const {
        return expr.left().pixelate();
    }
    std::vector<Rectangle> operator()(const Intersection& expr) const {
        auto pixels = intersect_pixels(expr.left().pixelate(), expr.right().pixelate());
        if (pixels.empty()) return BoundingBox{}(expr).pixelate();
        return pixels;
    }
};

struct Translate {
    const Vector& vector;

    Area operator()(const Rectangle& rectangle) const { return rectangle.translate(vector); }
    Area operator()(const Circle& circle) const { return circle.translate(vector); }
    Area operator()(const Inverse& inverse) const {
        return Inverse(inverse.area().translate(vector));
    }
    Area operator()(const Union& expr) const {
        return Union(expr.left().translate(vector), expr.right().translate(vector));
    }
    Area operator()(const Difference& expr) const {
        return Difference(expr.left().translate(vector), expr.right().translate(vector));
    }
    Area operator()(const Intersection& expr) const {
        return Intersection(expr.left().translate(vector), expr.right().translate(vector));
    }
};

struct Optimize {
    Area operator()(const Rectangle& rectangle) const { return rectangle; }
    Area operator()(const Circle& circle) const { return circle; }
    Area operator()(const Inverse& inverse) const {
        if (auto inner = inverse.area().get_if<Inverse>()) {
            logger()->trace("Dropped double inverse");
            return inner->area().optimize();
        }
        return inverse;
    }
    Area operator()(const Union& expr) const {
        if (expr.left().contains(expr.right())) return collapse("Union", expr.left());
        if (expr.right().contains(expr.left())) return collapse("Union", expr.right());
        return expr;
    }
    Area operator()(const Difference& expr) const {
        if (!expr.left().overlaps(expr.right())) return collapse("Difference", expr.left());
        return expr;
    }
    Area operator()(const Intersection& expr) const {
        if (expr.left().contains(expr.right())) return collapse("Intersection", expr.right());
        if (expr.right().contains(expr.left())) return collapse("Intersection", expr.left());
        return expr;
    }

    static Area collapse(const char* name, const Area& kept) {
        logger()->trace("{} collapsed to one operand", name);
        return kept.optimize();
    }
};

const BinaryExpr* binary_expr(const Area& area) {
    if (auto expr = area.get_if<Union>()) return expr;
    if (auto expr = area.get_if<Difference>()) return expr;
    if (auto expr = area.get_if<Intersection>()) return expr;
    return nullptr;
}

const char* node_name(const Area::Node& node) {
    static const char* const names[] = {"Rectangle", "Circle", "Inverse",
                                        "Union", "Difference", "Intersection"};
    return names[node.index()];
}
}

Inverse::Inverse(Area area) : area_(std::make_shared<const Area>(std::move(area))) {}

const Area& Inverse::area() const {
    return *area_;
}

bool Inverse::operator==(const Inverse& other) const {
    return area_ == other.area_ || *area_ == *other.area_;
}

size_t Inverse::hash() const {
    return area_->hash();
}

BinaryExpr::BinaryExpr(Area left, Area right)
    : left_(std::make_shared<const Area>(std::move(left)))
    , right_(std::make_shared<const Area>(std::move(right))) {}

const Area& BinaryExpr::left() const {
    return *left_;
}

const Area& BinaryExpr::right() const {
    return *right_;
}

bool BinaryExpr::same_operands(const BinaryExpr& other) const {
    return *left_ == *other.left_ && *right_ == *other.right_;
}

size_t BinaryExpr::operands_hash() const {
    size_t seed = left_->hash();
    detail::hash_combine(seed, right_->hash());
    return seed;
}

Area Area::from_areas(const std::vector<Area>& areas) {
    if (areas.empty()) {
        throw std::invalid_argument("Cannot create an area from an empty list");
    }
    logger()->trace("Building area from {} areas", areas.size());
    Area result = areas.front();
    for (size_t i = 1; i < areas.size(); i++) {
        result = result.add(areas[i]);
    }
    return result;
}

bool Area::is_compound() const {
    return !std::holds_alternative<Rectangle>(node_) && !std::holds_alternative<Circle>(node_);
}

bool Area::overlaps(const Area& other) const {
    return std::visit(OverlapsTowards{other}, node_) &&
           std::visit(OverlapsTowards{*this}, other.node_);
}

bool Area::contains(const Area& other) const {
    // Every area contains itself, even one whose bounding box overstates it.
    if (*this == other) return true;
    return std::visit(Contains{other}, node_);
}

bool Area::contains(const Point& point) const {
    return contains(Area(Rectangle(point, point)));
}

Rectangle Area::bounding_box() const {
    return std::visit(BoundingBox{}, node_);
}

std::vector<Rectangle> Area::pixelate() const {
    return std::visit(Pixelate{}, node_);
}

Point Area::origin() const {
    return bounding_box().south_west();
}

Point Area::center() const {
    return bounding_box().center();
}

Area Area::translate(const Vector& vector) const {
    return std::visit(Translate{vector}, node_);
}

Area Area::move_to(const Point& target) const {
    if (auto rectangle = get_if<Rectangle>()) return rectangle->move_to(target);
    if (auto circle = get_if<Circle>()) return circle->move_to(target);
    if (auto inverse = get_if<Inverse>()) return Inverse(inverse->area().move_to(target));

    // Compound areas move all operands along the same vector.
    Point south_west = origin();
    return translate(Vector(target.lat() - south_west.lat(), target.lon() - south_west.lon()));
}

Area Area::optimize() const {
    return std::visit(Optimize{}, node_);
}

Area Area::add(const Area& other) const {
    return Area(Union(*this, other)).optimize();
}

Area Area::subtract(const Area& other) const {
    return Area(Difference(*this, other)).optimize();
}

Area Area::intersect(const Area& other) const {
    return Area(Intersection(*this, other)).optimize();
}

Area Area::invert() const {
    return Area(Inverse(*this)).optimize();
}

size_t Area::hash() const {
    size_t seed = node_.index();
    detail::hash_combine(seed, std::visit([](const auto& node) { return node.hash(); }, node_));
    return seed;
}

std::ostream& operator<<(std::ostream& os, const Area& area) {
    if (auto rectangle = area.get_if<Rectangle>()) return os << *rectangle;
    if (auto circle = area.get_if<Circle>()) return os << *circle;
    if (auto inverse = area.get_if<Inverse>()) return os << "Inverse(" << inverse->area() << ")";
    if (auto expr = binary_expr(area)) {
        os << node_name(area.node()) << "(" << expr->left() << ", " << expr->right() << ")";
    }
    return os;
}

} // namespace geoarea
