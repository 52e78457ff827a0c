/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <limits>
#include <string>

namespace taskpipe {

namespace {

/// Optional `section.key` as an unsigned 32-bit count; values that would
/// wrap are rejected.
template <typename View>
Result<uint32_t> read_count(View table, std::string_view section, std::string_view key,
                            uint32_t fallback) {
    auto node = table[key];
    if (!node) return fallback;

    auto value = node.template value<int64_t>();
    if (!value || *value < 0
        || *value > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        return Error{ErrorKind::Config, std::string{section} + "." + std::string{key}
                                        + " must be an integer in [0, "
                                        + std::to_string(std::numeric_limits<uint32_t>::max())
                                        + "]"};
    }
    return static_cast<uint32_t>(*value);
}

Result<Config> from_table(const toml::table& tbl) {
    Config config;

    // [executor]
    if (auto executor = tbl["executor"]; executor.is_table()) {
        auto workers = read_count(executor, "executor", "worker_threads", 0);
        if (!workers) return workers.error();
        config.executor.worker_threads = *workers;

        auto units = read_count(executor, "executor", "unit_threads", 0);
        if (!units) return units.error();
        config.executor.unit_threads = *units;
    }

    // [logging]
    if (auto logging = tbl["logging"]; logging.is_table()) {
        config.logging.level = logging["level"].value_or(std::string{"info"});
        config.logging.sink = logging["sink"].value_or(std::string{"stdout"});
        config.logging.log_dir = logging["log_dir"].value_or(std::string{"./logs"});

        auto max_size = read_count(logging, "logging", "max_file_size_mb", 50);
        if (!max_size) return max_size.error();
        config.logging.max_file_size_mb = *max_size;

        auto rotate = read_count(logging, "logging", "rotate_count", 5);
        if (!rotate) return rotate.error();
        config.logging.rotate_count = *rotate;
    }

    if (!parse_log_level(config.logging.level)) {
        return Error{ErrorKind::Config, "unknown logging.level '" + config.logging.level + "'"};
    }
    if (config.logging.sink != "stdout" && config.logging.sink != "file"
        && config.logging.sink != "null") {
        return Error{ErrorKind::Config, "unknown logging.sink '" + config.logging.sink + "'"};
    }

    // [telemetry]
    if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
        config.telemetry.enabled = telemetry["enabled"].value_or(false);
        config.telemetry.dir = telemetry["dir"].value_or(std::string{"./telemetry"});
    }

    // [resources]
    if (const auto* resources = tbl["resources"].as_table()) {
        for (const auto& [key, node] : *resources) {
            auto count = node.value<int64_t>();
            if (!count || *count < 0) {
                return Error{ErrorKind::Config,
                             "resources." + std::string{key.str()} + " must be a non-negative integer"};
            }
            config.resources[std::string{key.str()}] = *count;
        }
    }

    // [options]
    if (const auto* options = tbl["options"].as_table()) {
        for (const auto& [key, node] : *options) {
            std::string name{key.str()};
            if (auto b = node.value_exact<bool>()) {
                config.options[name] = *b;
            } else if (auto i = node.value_exact<int64_t>()) {
                config.options[name] = *i;
            } else if (auto d = node.value_exact<double>()) {
                config.options[name] = *d;
            } else if (auto s = node.value_exact<std::string>()) {
                config.options[name] = *s;
            } else {
                return Error{ErrorKind::Config, "options." + name + " must be a scalar"};
            }
        }
    }

    return config;
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::Config, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

RunOptions make_run_options(const Config& config) {
    RunOptions options;
    for (const auto& [name, value] : config.options) {
        std::visit([&options, &name](const auto& v) { options.set(name, v); }, value);
    }
    return options;
}

}  // namespace taskpipe
