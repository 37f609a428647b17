#include "schedexpr/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <stdexcept>

namespace schedexpr::logging {

static constexpr const char* kLoggerName = "schedexpr";

Logger get() {
    static Logger logger = [] {
        if (auto existing = spdlog::get(kLoggerName)) return existing;
        return spdlog::stderr_color_mt(kLoggerName);
    }();
    return logger;
}

std::optional<spdlog::level::level_enum> parse_level(const std::string& name) {
    // from_str maps unknown names to off
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") return std::nullopt;
    return level;
}

void set_level(spdlog::level::level_enum level) { get()->set_level(level); }

void set_level(const std::string& name) {
    auto level = parse_level(name);
    if (!level) throw std::invalid_argument("unknown log level: " + name);
    set_level(*level);
}

} // namespace schedexpr::logging
