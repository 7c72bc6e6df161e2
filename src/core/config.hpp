/**
 * @file config.hpp
 * @brief Engine configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "core/logger.hpp"
#include "core/result.hpp"

namespace placement_engine {

/**
 * @brief What a placement's decision becomes while its tolerations are invalid.
 */
enum class InvalidTolerationPolicy : uint8_t {
    KeepPrevious,     ///< Prior outcome stays in effect; reject all if there is none
    RejectAll         ///< Every cluster is rejected until the placement is fixed
};

[[nodiscard]] constexpr std::string_view to_string(InvalidTolerationPolicy policy) noexcept {
    switch (policy) {
        case InvalidTolerationPolicy::KeepPrevious: return "keep_previous";
        case InvalidTolerationPolicy::RejectAll:    return "reject_all";
    }
    return "unknown";
}

Result<InvalidTolerationPolicy> parse_invalid_toleration_policy(std::string_view text);

struct ControllerConfig {
    uint32_t worker_count = 0;          ///< 0 = hardware_concurrency
    uint32_t resync_interval_s = 300;   ///< Full re-evaluation period, 0 disables
    uint32_t max_idle_wait_ms = 1000;   ///< Upper bound on one background sleep
};

struct EvictionConfig {
    InvalidTolerationPolicy invalid_toleration_policy = InvalidTolerationPolicy::KeepPrevious;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    LogLevel log_level = LogLevel::Info;
    std::string decisions_file = "decisions";   ///< NDJSON prefix for decision events, empty disables
};

/**
 * @brief Top-level engine configuration.
 */
struct Config {
    ControllerConfig controller;
    EvictionConfig eviction;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text.
 */
Result<Config> parse_config(std::string_view toml_text);

Config default_config();

}  // namespace placement_engine
