/**
 * @file config.hpp
 * @brief Runner configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <variant>

#include "core/result.hpp"
#include "core/run_options.hpp"

namespace taskpipe {

struct ExecutorConfig {
    uint32_t worker_threads = 0;        ///< 0 = hardware_concurrency
    uint32_t unit_threads = 0;          ///< Scheduler units; 0 = library default
};

struct LoggingConfig {
    std::string level = "info";         ///< "debug", "info", "warn", "error"
    std::string sink = "stdout";        ///< "stdout", "file", "null"
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

struct TelemetryConfig {
    bool enabled = false;
    std::filesystem::path dir = "./telemetry";
};

/// Scalar option value as it can appear in a TOML [options] table.
using OptionValue = std::variant<bool, int64_t, double, std::string>;

/**
 * @brief Top-level configuration of a pipeline run.
 */
struct Config {
    ExecutorConfig executor;
    LoggingConfig logging;
    TelemetryConfig telemetry;
    std::map<std::string, int64_t> resources;       ///< [resources] name = count
    std::map<std::string, OptionValue> options;     ///< [options] forwarded verbatim
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text.
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Convert the [options] table into forwarded run options.
 *
 * Integers are stored as int64_t, floats as double, strings as std::string.
 */
RunOptions make_run_options(const Config& config);

}  // namespace taskpipe
