#include <gtest/gtest.h>
#include "geoarea/geo.hpp"
#include "geoarea/geo_area.hpp"
#include <sstream>
#include <unordered_set>
#include <vector>

using geoarea::Area;
using geoarea::Circle;
using geoarea::Difference;
using geoarea::Intersection;
using geoarea::Inverse;
using geoarea::Point;
using geoarea::Rectangle;
using geoarea::Union;

namespace {
Rectangle rect(double sw_lat, double sw_lon, double ne_lat, double ne_lon) {
    return Rectangle(Point(sw_lat, sw_lon), Point(ne_lat, ne_lon));
}
}

class GeoAreaTest : public ::testing::Test {
protected:
    Rectangle big = rect(0.0, 0.0, 10.0, 10.0);
    Rectangle inner = rect(2.0, 2.0, 4.0, 4.0);
    Rectangle distant = rect(20.0, 20.0, 30.0, 30.0);
    Rectangle side = rect(5.0, 5.0, 15.0, 15.0);

    // Inside big, away from inner
    Rectangle corner = rect(6.0, 6.0, 7.0, 7.0);
    // Inside inner
    Rectangle hole = rect(2.5, 2.5, 3.0, 3.0);
    // Between inner and distant
    Rectangle gap = rect(5.0, 5.0, 6.0, 6.0);
};

TEST_F(GeoAreaTest, Pixelate) {
    Rectangle r1 = rect(0.0, 0.0, 1.0, 1.0);
    Rectangle r2 = rect(1.0, 0.0, 2.0, 1.0);
    auto pixels = Area(r1).add(r2).pixelate();

    ASSERT_FALSE(pixels.empty());
    bool has_r1 = false;
    bool has_r2 = false;
    for (const auto& pixel : pixels) {
        has_r1 = has_r1 || pixel.contains(r1);
        has_r2 = has_r2 || pixel.contains(r2);
    }
    EXPECT_TRUE(has_r1);
    EXPECT_TRUE(has_r2);
}

TEST_F(GeoAreaTest, PixelateSplitsAtAntimeridian) {
    Rectangle wrapped = rect(0.0, 160.0, 2.0, -160.0);
    auto pixels = Area(Union(wrapped, distant)).pixelate();

    ASSERT_EQ(pixels.size(), 3u);
    for (const auto& pixel : pixels) {
        EXPECT_FALSE(pixel.is_wrapped());
    }

    auto circle_pixels = Area(Circle(Point(0.0, 0.0), 1000.0)).pixelate();
    ASSERT_EQ(circle_pixels.size(), 1u);
    EXPECT_EQ(circle_pixels[0], Circle(Point(0.0, 0.0), 1000.0).bounding_box());
}

TEST_F(GeoAreaTest, FromAreas) {
    Rectangle r1 = rect(0.0, 0.0, 1.0, 1.0);
    Rectangle r2 = rect(1.0, 0.0, 2.0, 1.0);
    Area area = Area::from_areas({r1, r2});

    EXPECT_TRUE(area.contains(r1));
    EXPECT_TRUE(area.contains(r2));
    EXPECT_THROW(Area::from_areas({}), std::invalid_argument);
}

TEST_F(GeoAreaTest, FromAreasOptimizes) {
    Area area = Area::from_areas({inner, big, distant});
    EXPECT_EQ(area, Area(Union(big, distant)));
    EXPECT_EQ(Area::from_areas({inner}), Area(inner));
}

TEST_F(GeoAreaTest, TranslateInMeters) {
    Rectangle r = rect(10.0, 10.0, 12.0, 112.0);
    double northing = geoarea::meters_to_degrees_lat(20.0);
    double easting = geoarea::meters_to_degrees_lon_at_lat(20.0, 10.0);

    EXPECT_EQ(geoarea::translate_meters(Area(r), 20.0, 20.0),
              Area(r.translate(geoarea::Vector(northing, easting))));
}

TEST_F(GeoAreaTest, UnionOverlaps) {
    Area a = rect(1.0, 2.0, 3.0, 4.0);
    EXPECT_TRUE(a.overlaps(rect(2.5, 3.5, 3.5, 4.5)));
    EXPECT_FALSE(a.overlaps(rect(0.0, 0.0, 0.5, 0.5)));
    EXPECT_FALSE(a.overlaps(rect(3.5, 4.5, 4.0, 5.0)));

    // The gap between the operands is not part of the union
    Area u = Union(inner, distant);
    EXPECT_FALSE(u.overlaps(gap));
    EXPECT_FALSE(Area(gap).overlaps(u));
    EXPECT_TRUE(u.overlaps(hole));
    EXPECT_TRUE(Area(hole).overlaps(u));
}

TEST_F(GeoAreaTest, UnionContains) {
    Area circle = Circle(Point(1.0, 1.0), 2.0);
    Rectangle r = rect(1.0, -1.0, 4.0, 3.0);
    Area u = Union(circle, r);
    EXPECT_TRUE(u.contains(circle));
    EXPECT_TRUE(u.contains(r));

    Area apart = Union(inner, distant);
    EXPECT_TRUE(apart.contains(hole));
    EXPECT_FALSE(apart.contains(gap));
    EXPECT_TRUE(apart.contains(Point(25.0, 25.0)));
    EXPECT_FALSE(apart.contains(Point(10.0, 10.0)));
}

TEST_F(GeoAreaTest, UnionWithOperandWrappingTheLongWay) {
    Rectangle plain = rect(0.0, -10.0, 10.0, 10.0);
    Rectangle wrapped = rect(0.0, 5.0, 10.0, -5.0);
    Area u = Union(plain, wrapped);

    Rectangle box = u.bounding_box();
    EXPECT_TRUE(box.contains(plain));
    EXPECT_TRUE(box.contains(wrapped));
    EXPECT_EQ(box, Area(Union(wrapped, plain)).bounding_box());

    EXPECT_TRUE(u.contains(rect(2.0, 100.0, 3.0, 101.0)));
    EXPECT_TRUE(u.contains(Point(5.0, 0.0)));
    EXPECT_FALSE(u.contains(rect(20.0, 100.0, 30.0, 101.0)));
}

TEST_F(GeoAreaTest, UnionBoundingBox) {
    Circle circle(Point(1.0, 1.0), geoarea::meters_to_degrees_lon_at_lat(2.0, 1.0));
    Rectangle r = rect(-1.0, -1.0, 3.0, 3.0);
    EXPECT_EQ(Area(Union(circle, r)).bounding_box(), r);
}

TEST_F(GeoAreaTest, UnionOrigin) {
    Circle circle(Point(1.0, 1.0), geoarea::meters_to_degrees_lon_at_lat(2.0, 1.0));
    Rectangle r = rect(-2.0, -2.0, 3.0, 3.0);
    EXPECT_EQ(Area(Union(circle, r)).origin(), Point(-2.0, -2.0));
}

TEST_F(GeoAreaTest, AddKeepsContainingOperand) {
    EXPECT_EQ(Area(Union(big, big)).optimize(), Area(big));
    EXPECT_EQ(Area(big).add(inner), Area(big));
    EXPECT_EQ(Area(inner).add(big), Area(big));
    EXPECT_EQ(Area(big).add(distant), Area(Union(big, distant)));
}

TEST_F(GeoAreaTest, InverseOverlapsAndContains) {
    Area inverse = Area(inner).invert();
    ASSERT_NE(inverse.get_if<Inverse>(), nullptr);

    EXPECT_TRUE(inverse.overlaps(distant));
    EXPECT_TRUE(Area(distant).overlaps(inverse));
    EXPECT_FALSE(inverse.overlaps(hole));
    EXPECT_FALSE(Area(hole).overlaps(inverse));

    EXPECT_TRUE(inverse.contains(distant));
    EXPECT_FALSE(inverse.contains(big));
    EXPECT_TRUE(inverse.contains(Point(50.0, 50.0)));
    EXPECT_FALSE(inverse.contains(Point(3.0, 3.0)));
}

TEST_F(GeoAreaTest, InverseOfInverse) {
    Area twice = Area(inner).invert().invert();
    EXPECT_EQ(twice, Area(inner));
}

TEST_F(GeoAreaTest, InverseCoversWorld) {
    Area inverse = Inverse(inner);
    EXPECT_EQ(inverse.bounding_box(), Rectangle::world());
    auto pixels = inverse.pixelate();
    ASSERT_EQ(pixels.size(), 1u);
    EXPECT_EQ(pixels[0], Rectangle::world());
}

TEST_F(GeoAreaTest, DifferenceOverlapsAndContains) {
    Area diff = Area(big).subtract(inner);
    ASSERT_NE(diff.get_if<Difference>(), nullptr);

    EXPECT_EQ(diff.bounding_box(), big);
    EXPECT_FALSE(diff.overlaps(distant));
    EXPECT_FALSE(diff.overlaps(hole));
    EXPECT_FALSE(Area(hole).overlaps(diff));
    EXPECT_TRUE(diff.overlaps(side));
    EXPECT_TRUE(Area(side).overlaps(diff));

    EXPECT_TRUE(diff.contains(corner));
    EXPECT_FALSE(diff.contains(rect(3.0, 3.0, 5.0, 5.0)));
    EXPECT_FALSE(diff.contains(Point(3.0, 3.0)));
    EXPECT_TRUE(diff.contains(Point(8.0, 8.0)));
}

TEST_F(GeoAreaTest, DifferenceOfDisjointAreas) {
    EXPECT_EQ(Area(big).subtract(distant), Area(big));

    // Nothing is left when the subtracted area covers everything
    Area empty = Difference(inner, big);
    EXPECT_FALSE(empty.overlaps(inner));
    EXPECT_FALSE(empty.overlaps(hole));
}

TEST_F(GeoAreaTest, IntersectionOverlapsAndContains) {
    Area both = Area(big).intersect(side);
    ASSERT_NE(both.get_if<Intersection>(), nullptr);

    EXPECT_EQ(both.bounding_box(), rect(5.0, 5.0, 10.0, 10.0));
    EXPECT_TRUE(both.overlaps(corner));
    EXPECT_FALSE(both.overlaps(rect(1.0, 1.0, 2.0, 2.0)));
    EXPECT_FALSE(Area(rect(1.0, 1.0, 2.0, 2.0)).overlaps(both));
    EXPECT_TRUE(both.contains(corner));
    EXPECT_FALSE(both.contains(inner));

    auto pixels = both.pixelate();
    ASSERT_EQ(pixels.size(), 1u);
    EXPECT_EQ(pixels[0], rect(5.0, 5.0, 10.0, 10.0));
}

TEST_F(GeoAreaTest, IntersectionKeepsContainedOperand) {
    EXPECT_EQ(Area(big).intersect(inner), Area(inner));
    EXPECT_EQ(Area(inner).intersect(big), Area(inner));

    Area none = Area(big).intersect(distant);
    EXPECT_FALSE(none.overlaps(big));
    EXPECT_FALSE(none.overlaps(distant));
    EXPECT_EQ(none.bounding_box(), big);
}

TEST_F(GeoAreaTest, IntersectionAcrossAntimeridian) {
    Rectangle b1 = rect(0.0, 160.0, 2.0, -160.0);
    Rectangle b4 = rect(0.0, 159.0, 2.0, -159.0);

    Area both = Intersection(b1, b4);
    EXPECT_EQ(both.bounding_box(), b1);
    EXPECT_EQ(both.pixelate().size(), 2u);

    Area east = Intersection(b1, rect(0.0, 150.0, 5.0, 170.0));
    EXPECT_EQ(east.bounding_box(), rect(0.0, 160.0, 2.0, 170.0));
}

TEST_F(GeoAreaTest, MoveToMovesAllOperands) {
    Area u = Union(inner, distant);
    Area moved = u.move_to(Point(12.0, 12.0));

    EXPECT_EQ(moved, Area(Union(rect(12.0, 12.0, 14.0, 14.0), rect(30.0, 30.0, 40.0, 40.0))));
    EXPECT_EQ(moved.origin(), Point(12.0, 12.0));

    Area circle = Circle(Point(1.0, 1.0), 100.0);
    EXPECT_EQ(circle.move_to(Point(5.0, 5.0)), Area(Circle(Point(5.0, 5.0), 100.0)));

    Area inverse = Inverse(inner);
    EXPECT_EQ(inverse.move_to(Point(0.0, 0.0)), Area(Inverse(rect(0.0, 0.0, 2.0, 2.0))));
}

TEST_F(GeoAreaTest, TranslateRecurses) {
    geoarea::Vector v(1.0, 1.0);
    Area diff = Difference(big, inner);
    EXPECT_EQ(diff.translate(v), Area(Difference(big.translate(v), inner.translate(v))));

    Area inverse = Inverse(Union(inner, distant));
    EXPECT_EQ(inverse.translate(v), Area(Inverse(Union(inner.translate(v), distant.translate(v)))));
}

TEST_F(GeoAreaTest, Center) {
    Area u = Union(inner, distant);
    EXPECT_EQ(u.center(), Point(16.0, 16.0));
}

TEST_F(GeoAreaTest, IsCompound) {
    EXPECT_FALSE(Area(big).is_compound());
    EXPECT_FALSE(Area(Circle(Point(0.0, 0.0), 1.0)).is_compound());
    EXPECT_TRUE(Area(Inverse(big)).is_compound());
    EXPECT_TRUE(Area(Union(big, distant)).is_compound());
    EXPECT_TRUE(Area(Difference(big, inner)).is_compound());
    EXPECT_TRUE(Area(Intersection(big, side)).is_compound());
}

TEST_F(GeoAreaTest, EqualityAndHash) {
    EXPECT_EQ(Area(Union(big, distant)), Area(Union(big, distant)));
    EXPECT_NE(Area(Union(big, distant)), Area(Union(distant, big)));
    EXPECT_NE(Area(Union(big, inner)), Area(Difference(big, inner)));
    EXPECT_NE(Area(big), Area(Inverse(big)));

    std::unordered_set<Area> areas;
    areas.insert(Area(Union(big, distant)));
    areas.insert(Area(Union(big, distant)));
    areas.insert(Area(Intersection(big, distant)));
    areas.insert(Area(Inverse(big)));
    EXPECT_EQ(areas.size(), 3u);
}

TEST_F(GeoAreaTest, Printable) {
    std::ostringstream os;
    os << Area(Inverse(Union(rect(0.0, 0.0, 1.0, 1.0), rect(2.0, 2.0, 3.0, 3.0))));
    EXPECT_EQ(os.str(),
              "Inverse(Union(Rectangle(Point(0, 0), Point(1, 1)), "
              "Rectangle(Point(2, 2), Point(3, 3))))");
}

TEST_F(GeoAreaTest, ContainmentBothWaysOnlyForEqualAreas) {
    std::vector<Area> areas{
        big,
        inner,
        distant,
        side,
        rect(0.0, 160.0, 2.0, -160.0),
        Circle(Point(40.0, -40.0), 100000.0),
        Union(inner, distant),
        Union(big, rect(0.0, 160.0, 2.0, -160.0)),
        Difference(big, inner),
        Intersection(big, side),
        Inverse(inner),
    };

    for (size_t i = 0; i < areas.size(); i++) {
        for (size_t j = 0; j < areas.size(); j++) {
            bool both_ways = areas[i].contains(areas[j]) && areas[j].contains(areas[i]);
            EXPECT_EQ(both_ways, i == j) << areas[i] << " and " << areas[j];
        }
    }
}

TEST_F(GeoAreaTest, ContainmentIgnoresElevation) {
    Area flat = rect(0.0, 0.0, 1.0, 1.0);
    Area raised = Rectangle(Point(0.0, 0.0, 50.0), Point(1.0, 1.0, 50.0));

    EXPECT_TRUE(flat.contains(raised));
    EXPECT_TRUE(raised.contains(flat));
    EXPECT_NE(flat, raised);
}
