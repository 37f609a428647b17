// Report which configured schedules fire at a given time.
//
//   schedexpr_check --config pricing.yaml --at "2024-05-01 06:00"
//
// Exit status: 0 if any reported schedule fires, 1 if none does,
// 2 on usage, configuration or evaluation errors.

#include <schedexpr/config.hpp>
#include <schedexpr/logging.hpp>

#include <boost/program_options.hpp>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

constexpr int kFired = 0;
constexpr int kNoneFired = 1;
constexpr int kError = 2;

po::options_description options() {
    po::options_description desc("schedexpr_check options");
    // clang-format off
    desc.add_options()
        ("help,h", "Show this help")
        ("config,c", po::value<std::string>()->required(), "YAML file declaring the schedules")
        ("at", po::value<std::string>(), "Time to evaluate, \"YYYY-MM-DD HH:MM\" (default: now)")
        ("schedule,s", po::value<std::vector<std::string>>(), "Only report this schedule (repeatable)")
        ("print,p", "Also print each schedule's expression")
        ("log-level", po::value<std::string>(), "Override the configured log level")
    ;
    // clang-format on
    return desc;
}

} // namespace

int main(int argc, char** argv) {
    auto logger = schedexpr::logging::get();
    const auto desc = options();

    po::variables_map opts;
    try {
        po::store(po::parse_command_line(argc, argv, desc), opts);
        if (opts.count("help")) {
            std::cout << desc << "\n";
            return kFired;
        }
        po::notify(opts);
    } catch (const po::error& e) {
        std::cerr << e.what() << "\n" << desc << "\n";
        return kError;
    }

    const bool level_override = opts.count("log-level") > 0;
    try {
        if (level_override) schedexpr::logging::set_level(opts["log-level"].as<std::string>());
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return kError;
    }

    try {
        auto config = schedexpr::load_config(opts["config"].as<std::string>());
        if (!level_override) schedexpr::logging::set_level(config.log_level);

        const schedexpr::TimePoint t = opts.count("at") ? schedexpr::parse_time_point(opts["at"].as<std::string>())
                                                        : schedexpr::now_time_point();
        logger->debug("evaluating at {}", schedexpr::to_string(t));

        std::vector<std::string> names = opts.count("schedule") ? opts["schedule"].as<std::vector<std::string>>()
                                                                : config.catalog.names();
        std::vector<schedexpr::Schedule> schedules;
        for (const auto& name : names) schedules.push_back(config.catalog.at(name));

        schedexpr::EvalContext ctx;
        const std::vector<bool> fired = ctx.matches_each(schedules, t);

        bool any = false;
        for (std::size_t i = 0; i < names.size(); ++i) {
            any = any || fired[i];
            std::cout << names[i] << "\t" << (fired[i] ? "fire" : "skip");
            if (opts.count("print")) std::cout << "\t" << schedules[i];
            std::cout << "\n";
        }
        return any ? kFired : kNoneFired;
    } catch (const std::runtime_error& e) {
        logger->error("{}", e.what());
        return kError;
    }
}
