/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace placement_engine {

namespace {

Result<Config> from_table(const toml::table& tbl) {
    Config config;

    // [controller]
    if (auto controller = tbl["controller"]; controller.is_table()) {
        config.controller.worker_count = static_cast<uint32_t>(
            controller["worker_count"].value_or(int64_t{0}));
        config.controller.resync_interval_s = static_cast<uint32_t>(
            controller["resync_interval_s"].value_or(int64_t{300}));
        config.controller.max_idle_wait_ms = static_cast<uint32_t>(
            controller["max_idle_wait_ms"].value_or(int64_t{1000}));
    }

    // [eviction]
    if (auto eviction = tbl["eviction"]; eviction.is_table()) {
        auto policy = parse_invalid_toleration_policy(
            eviction["invalid_toleration_policy"].value_or(std::string{"keep_previous"}));
        if (!policy) return policy.error();
        config.eviction.invalid_toleration_policy = *policy;
    }

    // [telemetry]
    if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
        config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
        config.telemetry.max_file_size_mb = static_cast<uint32_t>(
            telemetry["max_file_size_mb"].value_or(int64_t{50}));
        config.telemetry.rotate_count = static_cast<uint32_t>(
            telemetry["rotate_count"].value_or(int64_t{5}));
        config.telemetry.decisions_file =
            telemetry["decisions_file"].value_or(std::string{"decisions"});

        auto level = parse_log_level(telemetry["log_level"].value_or(std::string{"info"}));
        if (!level) return level.error();
        config.telemetry.log_level = *level;
    }

    if (config.controller.max_idle_wait_ms == 0) {
        return Error{ErrorCode::InvalidArgument, "controller.max_idle_wait_ms must be positive"};
    }

    return config;
}

}  // namespace

Result<InvalidTolerationPolicy> parse_invalid_toleration_policy(std::string_view text) {
    if (text == "keep_previous") return InvalidTolerationPolicy::KeepPrevious;
    if (text == "reject_all") return InvalidTolerationPolicy::RejectAll;
    return Error{ErrorCode::InvalidArgument,
                 "Unknown invalid_toleration_policy: " + std::string{text}};
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ParseError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ParseError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace placement_engine
