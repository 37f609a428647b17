#pragma once

#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace schedexpr::logging {

using Logger = std::shared_ptr<spdlog::logger>;

/// The library's "schedexpr" logger (stderr), created on first use.
Logger get();

// "trace", "debug", "info", "warn", "error", "critical" or "off".
std::optional<spdlog::level::level_enum> parse_level(const std::string& name);

void set_level(spdlog::level::level_enum level);

/// Same, by name. Throws std::invalid_argument for an unknown level name.
void set_level(const std::string& name);

} // namespace schedexpr::logging
