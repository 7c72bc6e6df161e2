/**
 * @file taint.hpp
 * @brief Cluster taints and placement tolerations.
 * @author Dimitris Kafetzis
 *
 * A taint repels placements from a managed cluster; a toleration on a
 * placement cancels that effect for matching taints, optionally only for
 * a bounded number of seconds after the taint was added.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace placement_engine {

// ─────────────────────────────────────────────
// Effects and Operators
// ─────────────────────────────────────────────

enum class TaintEffect : uint8_t {
    NoSelect,          ///< Placements must tolerate the taint to select the cluster
    PreferNoSelect,    ///< Scoring hint only, never filters
    NoSelectIfNew      ///< Filters clusters not already in the placement's decision
};

enum class TolerationOperator : uint8_t {
    Equal,
    Exists
};

[[nodiscard]] constexpr std::string_view to_string(TaintEffect effect) noexcept {
    switch (effect) {
        case TaintEffect::NoSelect:       return "NoSelect";
        case TaintEffect::PreferNoSelect: return "PreferNoSelect";
        case TaintEffect::NoSelectIfNew:  return "NoSelectIfNew";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(TolerationOperator op) noexcept {
    switch (op) {
        case TolerationOperator::Equal:  return "Equal";
        case TolerationOperator::Exists: return "Exists";
    }
    return "unknown";
}

Result<TaintEffect> parse_taint_effect(std::string_view text);
Result<TolerationOperator> parse_toleration_operator(std::string_view text);

// ─────────────────────────────────────────────
// Taint
// ─────────────────────────────────────────────

struct Taint {
    std::string key;
    std::string value;
    TaintEffect effect = TaintEffect::NoSelect;
    std::optional<Timestamp> time_added;    ///< Stamped by the inventory when first observed

    /// Same identity (key, value, effect), ignoring time_added.
    [[nodiscard]] bool same_identity(const Taint& other) const noexcept {
        return key == other.key && value == other.value && effect == other.effect;
    }

    bool operator==(const Taint&) const = default;
};

// ─────────────────────────────────────────────
// Toleration
// ─────────────────────────────────────────────

struct Toleration {
    std::string key;                            ///< Empty matches every key (Exists only)
    TolerationOperator op = TolerationOperator::Equal;
    std::string value;
    std::optional<TaintEffect> effect;          ///< Unset matches every effect
    std::optional<int64_t> toleration_seconds;  ///< Unset tolerates forever

    bool operator==(const Toleration&) const = default;
};

/**
 * @brief Human-readable form used in log lines and error messages.
 */
std::string describe(const Taint& taint);
std::string describe(const Toleration& toleration);

}  // namespace placement_engine
