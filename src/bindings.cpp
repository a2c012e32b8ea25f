#include <pybind11/pybind11.h>
#include <pybind11/chrono.h>
#include <pybind11/operators.h>
#include <pybind11/stl.h>

#include "geoarea/geoarea.hpp"

#include <sstream>

namespace py = pybind11;

namespace {
template <typename T>
std::string repr(const T& value) {
    std::ostringstream os;
    os << value;
    return os.str();
}
}

PYBIND11_MODULE(_geoarea_cpp, m) {
    m.doc() = "GeoArea C++ backend for geographic area algebra and geohashes";
    m.attr("__version__") = geoarea::VERSION;

    m.def("set_log_level", py::overload_cast<const std::string&>(&geoarea::set_log_level),
          py::arg("level"));

    m.def("map_to_lon", &geoarea::map_to_lon);
    m.def("map_to_lat", &geoarea::map_to_lat);
    m.def("degrees_lat_to_meters", &geoarea::degrees_lat_to_meters);
    m.def("meters_to_degrees_lat", &geoarea::meters_to_degrees_lat);
    m.def("degrees_lon_to_meters_at_lat", &geoarea::degrees_lon_to_meters_at_lat);
    m.def("meters_to_degrees_lon_at_lat", &geoarea::meters_to_degrees_lon_at_lat);
    m.def("distance_in_meters", &geoarea::distance_in_meters);
    m.def("estimated_min_travel_time", &geoarea::estimated_min_travel_time,
          py::arg("from_point"), py::arg("to_point"), py::arg("round_to_meters") = 1);

    py::class_<geoarea::Vector>(m, "Vector")
        .def(py::init<double, double, double>(),
             py::arg("northing"), py::arg("easting"), py::arg("elevation") = 0.0)
        .def_property_readonly("northing", &geoarea::Vector::northing)
        .def_property_readonly("easting", &geoarea::Vector::easting)
        .def_property_readonly("elevation", &geoarea::Vector::elevation)
        .def(py::self == py::self)
        .def("__hash__", &geoarea::Vector::hash)
        .def("__repr__", &repr<geoarea::Vector>);

    py::class_<geoarea::Point>(m, "Point")
        .def(py::init<double, double, std::optional<double>>(),
             py::arg("lat"), py::arg("lon"), py::arg("elevation") = py::none())
        .def_property_readonly("lat", &geoarea::Point::lat)
        .def_property_readonly("lon", &geoarea::Point::lon)
        .def_property_readonly("elevation", &geoarea::Point::elevation)
        .def("with_lat", &geoarea::Point::with_lat)
        .def("with_lon", &geoarea::Point::with_lon)
        .def("with_elevation", &geoarea::Point::with_elevation)
        .def("translate", &geoarea::Point::translate)
        .def(py::self == py::self)
        .def("__hash__", &geoarea::Point::hash)
        .def("__repr__", &repr<geoarea::Point>);

    py::class_<geoarea::Line>(m, "Line")
        .def(py::init<const geoarea::Point&, const geoarea::Point&>(),
             py::arg("south_west"), py::arg("north_east"))
        .def_property_readonly("south_west", &geoarea::Line::south_west)
        .def_property_readonly("north_east", &geoarea::Line::north_east)
        .def_property_readonly("northing", &geoarea::Line::northing)
        .def_property_readonly("easting", &geoarea::Line::easting)
        .def("center", &geoarea::Line::center)
        .def("length_meters", &geoarea::Line::length_meters)
        .def("is_wrapped_on_long_side", &geoarea::Line::is_wrapped_on_long_side)
        .def("translate", &geoarea::Line::translate)
        .def("move_to", &geoarea::Line::move_to)
        .def(py::self == py::self)
        .def("__hash__", &geoarea::Line::hash)
        .def("__repr__", &repr<geoarea::Line>);
    m.def("shortest_line", &geoarea::shortest_line);

    py::class_<geoarea::PolyLine>(m, "PolyLine")
        .def(py::init<std::vector<geoarea::Point>>(), py::arg("points"))
        .def_property_readonly("points", &geoarea::PolyLine::points)
        .def("__len__", &geoarea::PolyLine::size)
        .def("line", &geoarea::PolyLine::line)
        .def("as_lines", &geoarea::PolyLine::as_lines)
        .def("length_meters", &geoarea::PolyLine::length_meters)
        .def("center", &geoarea::PolyLine::center)
        .def("translate", &geoarea::PolyLine::translate)
        .def("move_to", &geoarea::PolyLine::move_to)
        .def(py::self == py::self)
        .def("__hash__", &geoarea::PolyLine::hash)
        .def("__repr__", &repr<geoarea::PolyLine>);

    py::class_<geoarea::Rectangle>(m, "Rectangle")
        .def(py::init<const geoarea::Point&, const geoarea::Point&>(),
             py::arg("south_west"), py::arg("north_east"))
        .def_static("world", &geoarea::Rectangle::world)
        .def_property_readonly("south_west", &geoarea::Rectangle::south_west)
        .def_property_readonly("north_east", &geoarea::Rectangle::north_east)
        .def_property_readonly("northing", &geoarea::Rectangle::northing)
        .def_property_readonly("easting", &geoarea::Rectangle::easting)
        .def("center", &geoarea::Rectangle::center)
        .def("surface", &geoarea::Rectangle::surface)
        .def("is_wrapped", &geoarea::Rectangle::is_wrapped)
        .def("grow", py::overload_cast<const geoarea::Point&>(&geoarea::Rectangle::grow, py::const_))
        .def("grow", py::overload_cast<const geoarea::Rectangle&>(&geoarea::Rectangle::grow, py::const_))
        .def("expand", &geoarea::Rectangle::expand, py::arg("meters"))
        .def("pixelate", &geoarea::Rectangle::pixelate)
        .def(py::self == py::self)
        .def("__hash__", &geoarea::Rectangle::hash)
        .def("__repr__", &repr<geoarea::Rectangle>);

    py::class_<geoarea::Circle>(m, "Circle")
        .def(py::init<const geoarea::Point&, double>(),
             py::arg("center"), py::arg("radius_meters"))
        .def(py::init<const geoarea::Point&, const geoarea::Point&>(),
             py::arg("center"), py::arg("point_on_circle"))
        .def_property_readonly("center", &geoarea::Circle::center)
        .def_property_readonly("radius_meters", &geoarea::Circle::radius_meters)
        .def("with_center", &geoarea::Circle::with_center)
        .def("with_radius_meters", &geoarea::Circle::with_radius_meters)
        .def("bounding_box", &geoarea::Circle::bounding_box)
        .def("inner_bounding_box", &geoarea::Circle::inner_bounding_box)
        .def(py::self == py::self)
        .def("__hash__", &geoarea::Circle::hash)
        .def("__repr__", &repr<geoarea::Circle>);

    py::class_<geoarea::Area>(m, "Area")
        .def(py::init<geoarea::Rectangle>(), py::arg("rectangle"))
        .def(py::init<geoarea::Circle>(), py::arg("circle"))
        .def_static("from_areas", &geoarea::Area::from_areas, py::arg("areas"))
        .def("is_compound", &geoarea::Area::is_compound)
        .def("overlaps", &geoarea::Area::overlaps)
        .def("contains", py::overload_cast<const geoarea::Area&>(&geoarea::Area::contains, py::const_))
        .def("contains", py::overload_cast<const geoarea::Point&>(&geoarea::Area::contains, py::const_))
        .def("bounding_box", &geoarea::Area::bounding_box)
        .def("pixelate", &geoarea::Area::pixelate)
        .def("origin", &geoarea::Area::origin)
        .def("center", &geoarea::Area::center)
        .def("translate", &geoarea::Area::translate)
        .def("move_to", &geoarea::Area::move_to)
        .def("add", &geoarea::Area::add)
        .def("subtract", &geoarea::Area::subtract)
        .def("intersect", &geoarea::Area::intersect)
        .def("invert", &geoarea::Area::invert)
        .def(py::self == py::self)
        .def("__hash__", &geoarea::Area::hash)
        .def("__repr__", &repr<geoarea::Area>);
    py::implicitly_convertible<geoarea::Rectangle, geoarea::Area>();
    py::implicitly_convertible<geoarea::Circle, geoarea::Area>();

    py::class_<geoarea::GeoHash>(m, "GeoHash")
        .def(py::init<std::string>(), py::arg("hash"))
        .def(py::init<const geoarea::Point&>(), py::arg("point"))
        .def_property_readonly("hash", &geoarea::GeoHash::hash)
        .def_property_readonly("point", &geoarea::GeoHash::point)
        .def("__len__", &geoarea::GeoHash::length)
        .def("contains", &geoarea::GeoHash::contains)
        .def("decrease_resolution", &geoarea::GeoHash::decrease_resolution, py::arg("chars") = 1)
        .def("set_resolution", &geoarea::GeoHash::set_resolution, py::arg("length"))
        .def("use_resolution", &geoarea::GeoHash::use_resolution)
        .def("move_to", &geoarea::GeoHash::move_to)
        .def_static("is_valid", &geoarea::GeoHash::is_valid)
        .def_static("encode", &geoarea::GeoHash::encode,
                    py::arg("lat"), py::arg("lon"), py::arg("bits_per_axis") = 30)
        .def_static("decode", &geoarea::GeoHash::decode)
        .def(py::self == py::self)
        .def("__hash__", &geoarea::GeoHash::hash_value)
        .def("__repr__", &repr<geoarea::GeoHash>);
}
