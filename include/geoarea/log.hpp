#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace geoarea {

constexpr const char* LOGGER_NAME = "geoarea";

// Library logger, writing to stderr. Registered with spdlog under
// LOGGER_NAME; if the host registered a logger under that name first,
// that one is used. Starts at warn level.
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

// Accepts spdlog level names ("trace", "debug", "info", "warn", "error",
// "critical", "off").
void set_log_level(const std::string& level);

} // namespace geoarea
