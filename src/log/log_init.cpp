//! # Log Initialization from CLI
//!
//! Turns logging command-line arguments and the SIDL_LOG environment
//! variable into a LogConfig.

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <optional>
#include <string>

namespace sidl::log {

namespace {

/// Matches -v, -vv, -vvv and returns the number of v's (0 otherwise).
auto verbosity_count(std::string_view arg) -> int {
    if (arg.size() < 2 || arg[0] != '-') {
        return 0;
    }
    auto flags = arg.substr(1);
    if (flags.find_first_not_of('v') != std::string_view::npos) {
        return 0;
    }
    return static_cast<int>(flags.size());
}

/// Returns the text after `prefix` when `arg` starts with it.
auto option_value(std::string_view arg, std::string_view prefix)
    -> std::optional<std::string_view> {
    if (!arg.starts_with(prefix)) {
        return std::nullopt;
    }
    return arg.substr(prefix.size());
}

auto level_for_verbosity(int count) -> LogLevel {
    switch (count) {
    case 1:
        return LogLevel::Info;
    case 2:
        return LogLevel::Debug;
    default:
        return LogLevel::Trace;
    }
}

} // namespace

auto is_log_option(std::string_view arg) -> bool {
    if (arg == "-q" || arg == "--quiet" || arg == "--verbose") {
        return true;
    }
    for (std::string_view prefix : {"--log-level=", "--log-filter=", "--log-file="}) {
        if (arg.starts_with(prefix)) {
            return true;
        }
    }
    return verbosity_count(arg) > 0;
}

auto parse_log_options(int argc, char* argv[]) -> LogConfig {
    LogConfig config;
    std::optional<LogLevel> explicit_level;
    bool has_filter = false;
    int verbosity = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (auto value = option_value(arg, "--log-level=")) {
            explicit_level = parse_level(*value);
        } else if (auto value = option_value(arg, "--log-filter=")) {
            config.filter_spec = std::string(*value);
            has_filter = true;
        } else if (auto value = option_value(arg, "--log-file=")) {
            config.log_file = std::string(*value);
        } else if (arg == "-q" || arg == "--quiet") {
            explicit_level = LogLevel::Error;
        } else if (arg == "--verbose") {
            verbosity = std::max(verbosity, 1);
        } else {
            verbosity = std::max(verbosity, verbosity_count(arg));
        }
    }

    if (explicit_level) {
        config.level = *explicit_level;
        return config;
    }
    if (verbosity > 0) {
        config.level = level_for_verbosity(verbosity);
        return config;
    }
    if (has_filter) {
        return config;
    }

    // SIDL_LOG holds either a filter spec or a single level name
    const char* env = std::getenv("SIDL_LOG");
    std::string_view env_value = env != nullptr ? env : "";
    if (env_value.find_first_of("=,") != std::string_view::npos) {
        config.filter_spec = std::string(env_value);
    } else if (!env_value.empty()) {
        config.level = parse_level(env_value);
    }
    return config;
}

} // namespace sidl::log
