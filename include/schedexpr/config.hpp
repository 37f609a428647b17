#pragma once

#include <stdexcept>
#include <string>

#include <spdlog/common.h>
#include <yaml-cpp/yaml.h>

#include "schedexpr/catalog.hpp"

namespace schedexpr {

struct ConfigError : std::runtime_error { using std::runtime_error::runtime_error; };

struct Config {
    spdlog::level::level_enum log_level{spdlog::level::info};
    Catalog catalog;
};

// Accepted layout:
//
//   log_level: info                  # optional
//   schedules:                       # sequence of statements...
//     - "wednesday = days(wed) & hours(6, 12) & minutes(0)"
//     - "pricing = wednesday | thursday"
//   schedules:                       # ...or a map of name: expression
//     wednesday: "days(wed) & hours(6, 12) & minutes(0)"
//
// All problems are reported as ConfigError naming the offending entry.
Config parse_config(const YAML::Node& root, const std::string& origin);
Config parse_config(const std::string& yaml_text);
Config load_config(const std::string& path);

} // namespace schedexpr
