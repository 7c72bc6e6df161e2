/**
 * @file inventory.hpp
 * @brief Cluster and placement definitions loaded from TOML.
 * @author Dimitris Kafetzis
 *
 * Format:
 *
 *   [[clusters]]
 *   name = "cluster-east"
 *     [[clusters.taints]]
 *     key = "cluster.open-cluster-management.io/unreachable"
 *     effect = "NoSelect"                 # optional, default NoSelect
 *     time_added = 2024-05-01T10:00:00Z   # optional, or Unix seconds
 *
 *   [[placements]]
 *   namespace = "default"                 # optional
 *   name = "web"
 *     [[placements.tolerations]]
 *     key = "cluster.open-cluster-management.io/unreachable"
 *     operator = "Exists"                 # optional, default Equal
 *     toleration_seconds = 300            # optional
 *
 * Array order is kept, so toleration precedence follows the file.
 */

#pragma once

#include "core/result.hpp"
#include "model/cluster.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace placement_engine {

struct Inventory {
    std::vector<ManagedCluster> clusters;
    std::vector<Placement> placements;
};

Result<Inventory> load_inventory(const std::filesystem::path& path);
Result<Inventory> parse_inventory(std::string_view toml_text);

}  // namespace placement_engine
