#include "geoarea/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <stdexcept>

namespace geoarea {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(LOGGER_NAME)) return existing;
        auto created = spdlog::stderr_color_mt(LOGGER_NAME);
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

void set_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && level != "off") {
        throw std::invalid_argument("Unknown log level: " + level);
    }
    set_log_level(parsed);
}

} // namespace geoarea
