/**
 * @file inventory.cpp
 * @brief Inventory loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "model/inventory.hpp"

#include <toml++/toml.hpp>

#include <chrono>
#include <string_view>

namespace placement_engine {

namespace {

Timestamp to_timestamp(const toml::date_time& dt) {
    using namespace std::chrono;
    auto midnight = sys_days{year_month_day{year{dt.date.year},
                                            month{dt.date.month},
                                            day{dt.date.day}}};
    auto ts = time_point_cast<Timestamp::duration>(midnight)
        + hours{dt.time.hour} + minutes{dt.time.minute} + seconds{dt.time.second}
        + duration_cast<Timestamp::duration>(nanoseconds{dt.time.nanosecond});
    if (dt.offset) {
        ts -= minutes{dt.offset->minutes};
    }
    return ts;
}

Result<std::optional<Timestamp>> parse_time_added(toml::node_view<const toml::node> node,
                                                  const std::string& where) {
    if (!node) return std::optional<Timestamp>{};
    if (auto seconds = node.value<int64_t>(); seconds && node.is_integer()) {
        return std::optional<Timestamp>{from_unix_seconds(*seconds)};
    }
    if (auto dt = node.value<toml::date_time>()) {
        return std::optional<Timestamp>{to_timestamp(*dt)};
    }
    return Error{ErrorCode::ParseError,
                 where + ": time_added must be Unix seconds or an RFC 3339 date-time"};
}

/// Absent gives the fallback; present but not a string is an error.
Result<std::string> string_field(const toml::table& tbl, std::string_view field,
                                 const std::string& where, std::string fallback = {}) {
    auto node = tbl[field];
    if (!node) return fallback;
    if (!node.is_string()) {
        return Error{ErrorCode::ParseError,
                     where + ": " + std::string{field} + " must be a string"};
    }
    return *node.value<std::string>();
}

Result<Taint> parse_taint(const toml::table& tbl, const std::string& where) {
    Taint taint;
    auto key = string_field(tbl, "key", where);
    if (!key) return key.error();
    if (key->empty()) {
        return Error{ErrorCode::ParseError, where + ": taint key is required"};
    }
    taint.key = std::move(*key);

    auto value = string_field(tbl, "value", where);
    if (!value) return value.error();
    taint.value = std::move(*value);

    auto effect_text = string_field(tbl, "effect", where);
    if (!effect_text) return effect_text.error();
    auto effect = parse_taint_effect(*effect_text);
    if (!effect) return Error{ErrorCode::ParseError, where + ": " + effect.error().message};
    taint.effect = *effect;

    auto time_added = parse_time_added(tbl["time_added"], where);
    if (!time_added) return time_added.error();
    taint.time_added = *time_added;

    return taint;
}

Result<Toleration> parse_toleration(const toml::table& tbl, const std::string& where) {
    Toleration toleration;
    auto key = string_field(tbl, "key", where);
    if (!key) return key.error();
    toleration.key = std::move(*key);

    auto value = string_field(tbl, "value", where);
    if (!value) return value.error();
    toleration.value = std::move(*value);

    auto op_text = string_field(tbl, "operator", where);
    if (!op_text) return op_text.error();
    auto op = parse_toleration_operator(*op_text);
    if (!op) return Error{ErrorCode::ParseError, where + ": " + op.error().message};
    toleration.op = *op;

    auto effect_text = string_field(tbl, "effect", where);
    if (!effect_text) return effect_text.error();
    if (!effect_text->empty()) {
        auto effect = parse_taint_effect(*effect_text);
        if (!effect) return Error{ErrorCode::ParseError, where + ": " + effect.error().message};
        toleration.effect = *effect;
    }

    if (auto node = tbl["toleration_seconds"]) {
        if (!node.is_integer()) {
            return Error{ErrorCode::ParseError, where + ": toleration_seconds must be an integer"};
        }
        toleration.toleration_seconds = node.value<int64_t>();
    }

    return toleration;
}

Result<Inventory> from_table(const toml::table& root) {
    Inventory inventory;

    if (auto clusters = root["clusters"].as_array()) {
        for (size_t i = 0; i < clusters->size(); ++i) {
            auto where = "clusters[" + std::to_string(i) + "]";
            const auto* tbl = clusters->get(i)->as_table();
            if (!tbl) return Error{ErrorCode::ParseError, where + ": expected a table"};

            ManagedCluster cluster;
            auto name = string_field(*tbl, "name", where);
            if (!name) return name.error();
            cluster.name = std::move(*name);
            if (cluster.name.empty()) {
                return Error{ErrorCode::ParseError, where + ": name is required"};
            }

            if (auto taints = (*tbl)["taints"].as_array()) {
                for (size_t t = 0; t < taints->size(); ++t) {
                    auto taint_where = where + ".taints[" + std::to_string(t) + "]";
                    const auto* taint_tbl = taints->get(t)->as_table();
                    if (!taint_tbl) {
                        return Error{ErrorCode::ParseError, taint_where + ": expected a table"};
                    }
                    auto taint = parse_taint(*taint_tbl, taint_where);
                    if (!taint) return taint.error();
                    cluster.taints.push_back(std::move(*taint));
                }
            }
            inventory.clusters.push_back(std::move(cluster));
        }
    }

    if (auto placements = root["placements"].as_array()) {
        for (size_t i = 0; i < placements->size(); ++i) {
            auto where = "placements[" + std::to_string(i) + "]";
            const auto* tbl = placements->get(i)->as_table();
            if (!tbl) return Error{ErrorCode::ParseError, where + ": expected a table"};

            Placement placement;
            auto ns = string_field(*tbl, "namespace", where, "default");
            if (!ns) return ns.error();
            placement.ns = std::move(*ns);
            auto name = string_field(*tbl, "name", where);
            if (!name) return name.error();
            placement.name = std::move(*name);
            if (placement.name.empty()) {
                return Error{ErrorCode::ParseError, where + ": name is required"};
            }

            if (auto tolerations = (*tbl)["tolerations"].as_array()) {
                for (size_t t = 0; t < tolerations->size(); ++t) {
                    auto tol_where = where + ".tolerations[" + std::to_string(t) + "]";
                    const auto* tol_tbl = tolerations->get(t)->as_table();
                    if (!tol_tbl) {
                        return Error{ErrorCode::ParseError, tol_where + ": expected a table"};
                    }
                    auto toleration = parse_toleration(*tol_tbl, tol_where);
                    if (!toleration) return toleration.error();
                    placement.tolerations.push_back(std::move(*toleration));
                }
            }
            inventory.placements.push_back(std::move(placement));
        }
    }

    return inventory;
}

}  // namespace

Result<Inventory> load_inventory(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Inventory file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ParseError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Inventory> parse_inventory(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ParseError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

}  // namespace placement_engine
