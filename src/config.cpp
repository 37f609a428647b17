#include "schedexpr/config.hpp"
#include "schedexpr/logging.hpp"

namespace schedexpr {

static std::string scalar(const YAML::Node& node, const std::string& where) {
    if (!node.IsScalar()) throw ConfigError(where + ": expected a string");
    return node.as<std::string>();
}

Config parse_config(const YAML::Node& root, const std::string& origin) {
    if (!root.IsMap()) throw ConfigError(origin + ": top level must be a map");

    Config cfg;

    if (const auto level = root["log_level"]) {
        std::string name = scalar(level, origin + ": log_level");
        auto parsed = logging::parse_level(name);
        if (!parsed) throw ConfigError(origin + ": unknown log_level '" + name + "'");
        cfg.log_level = *parsed;
    }

    const auto schedules = root["schedules"];
    if (!schedules) throw ConfigError(origin + ": missing 'schedules'");

    if (schedules.IsSequence()) {
        for (std::size_t i = 0; i < schedules.size(); ++i) {
            const std::string where = origin + ": schedules[" + std::to_string(i) + "]";
            std::string statement = scalar(schedules[i], where);
            try {
                cfg.catalog.define(statement);
            } catch (const std::runtime_error& e) {
                throw ConfigError(where + ": " + e.what());
            }
        }
    } else if (schedules.IsMap()) {
        for (const auto& entry : schedules) {
            std::string name = scalar(entry.first, origin + ": schedules key");
            const std::string where = origin + ": schedules." + name;
            std::string expression = scalar(entry.second, where);
            try {
                cfg.catalog.define(name, expression);
            } catch (const std::runtime_error& e) {
                throw ConfigError(where + ": " + e.what());
            }
        }
    } else if (!schedules.IsNull()) {
        throw ConfigError(origin + ": 'schedules' must be a sequence or a map");
    }

    return cfg;
}

Config parse_config(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("<string>: ") + e.what());
    }
    return parse_config(root, "<string>");
}

Config load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError(path + ": " + e.what());
    }

    Config cfg = parse_config(root, path);
    logging::get()->info("loaded {} schedule(s) from {}", cfg.catalog.size(), path);
    return cfg;
}

} // namespace schedexpr
