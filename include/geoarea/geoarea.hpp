#pragma once

#include "geoarea/geo.hpp"
#include "geoarea/geo_area.hpp"
#include "geoarea/geo_circle.hpp"
#include "geoarea/geo_hash.hpp"
#include "geoarea/geo_line.hpp"
#include "geoarea/geo_point.hpp"
#include "geoarea/geo_rectangle.hpp"
#include "geoarea/log.hpp"

namespace geoarea {

constexpr const char* VERSION = "0.1.0";

} // namespace geoarea
