/**
 * @file test_inventory.cpp
 * @brief Unit tests for inventory TOML loading.
 * @author Dimitris Kafetzis
 */

#include "model/inventory.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace placement_engine;

TEST(InventoryTest, ParsesClustersAndPlacements) {
    auto result = parse_inventory(R"(
        [[clusters]]
        name = "cluster-east"
          [[clusters.taints]]
          key = "unreachable"
          time_added = 2024-05-01T10:00:00Z
          [[clusters.taints]]
          key = "gpu"
          value = "true"
          effect = "PreferNoSelect"

        [[clusters]]
        name = "cluster-west"

        [[placements]]
        namespace = "team-a"
        name = "web"
          [[placements.tolerations]]
          key = "unreachable"
          operator = "Exists"
          toleration_seconds = 90
          [[placements.tolerations]]
          key = "gpu"
          value = "true"
          effect = "PreferNoSelect"
    )");
    ASSERT_TRUE(result.has_value()) << result.error().message;

    const auto& inventory = *result;
    ASSERT_EQ(inventory.clusters.size(), 2u);
    const auto& east = inventory.clusters[0];
    EXPECT_EQ(east.name, "cluster-east");
    ASSERT_EQ(east.taints.size(), 2u);
    EXPECT_EQ(east.taints[0].key, "unreachable");
    EXPECT_EQ(east.taints[0].effect, TaintEffect::NoSelect);
    ASSERT_TRUE(east.taints[0].time_added.has_value());
    EXPECT_EQ(to_unix_seconds(*east.taints[0].time_added), 1714557600);
    EXPECT_EQ(east.taints[1].value, "true");
    EXPECT_EQ(east.taints[1].effect, TaintEffect::PreferNoSelect);
    EXPECT_FALSE(east.taints[1].time_added.has_value());
    EXPECT_TRUE(inventory.clusters[1].taints.empty());

    ASSERT_EQ(inventory.placements.size(), 1u);
    const auto& web = inventory.placements[0];
    EXPECT_EQ(web.id(), "team-a/web");
    ASSERT_EQ(web.tolerations.size(), 2u);
    EXPECT_EQ(web.tolerations[0].op, TolerationOperator::Exists);
    EXPECT_EQ(web.tolerations[0].toleration_seconds, 90);
    EXPECT_FALSE(web.tolerations[0].effect.has_value());
    EXPECT_EQ(web.tolerations[1].op, TolerationOperator::Equal);
    EXPECT_EQ(web.tolerations[1].effect, TaintEffect::PreferNoSelect);
    EXPECT_FALSE(web.tolerations[1].toleration_seconds.has_value());
}

TEST(InventoryTest, TolerationOrderFollowsFile) {
    auto result = parse_inventory(R"(
        [[placements]]
        name = "p"
          [[placements.tolerations]]
          key = "x"
          operator = "Exists"
          toleration_seconds = 10
          [[placements.tolerations]]
          key = "x"
          operator = "Exists"
          toleration_seconds = 600
    )");
    ASSERT_TRUE(result.has_value());
    const auto& tolerations = result->placements[0].tolerations;
    EXPECT_EQ(tolerations[0].toleration_seconds, 10);
    EXPECT_EQ(tolerations[1].toleration_seconds, 600);
    EXPECT_EQ(result->placements[0].ns, "default");
}

TEST(InventoryTest, TimeAddedAsUnixSeconds) {
    auto result = parse_inventory(R"(
        [[clusters]]
        name = "c"
          [[clusters.taints]]
          key = "k"
          time_added = 1714557630
    )");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->clusters[0].taints[0].time_added, from_unix_seconds(1714557630));
}

TEST(InventoryTest, TimeAddedWithOffset) {
    auto result = parse_inventory(R"(
        [[clusters]]
        name = "c"
          [[clusters.taints]]
          key = "k"
          time_added = 2024-05-01T12:00:00+02:00
    )");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->clusters[0].taints[0].time_added, from_unix_seconds(1714557600));
}

TEST(InventoryTest, EmptyDocument) {
    auto result = parse_inventory("");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->clusters.empty());
    EXPECT_TRUE(result->placements.empty());
}

// ─── Errors ──────────────────────────────────

TEST(InventoryErrorTest, ClusterNameRequired) {
    auto result = parse_inventory(R"(
        [[clusters]]
        taints = []
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ParseError);
    EXPECT_NE(result.error().message.find("clusters[0]"), std::string::npos);
}

TEST(InventoryErrorTest, TaintKeyRequired) {
    auto result = parse_inventory(R"(
        [[clusters]]
        name = "c"
          [[clusters.taints]]
          value = "v"
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("clusters[0].taints[0]"), std::string::npos);
}

TEST(InventoryErrorTest, UnknownOperator) {
    auto result = parse_inventory(R"(
        [[placements]]
        name = "p"
          [[placements.tolerations]]
          key = "k"
          operator = "In"
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ParseError);
}

TEST(InventoryErrorTest, UnknownEffect) {
    auto result = parse_inventory(R"(
        [[clusters]]
        name = "c"
          [[clusters.taints]]
          key = "k"
          effect = "NoExecute"
    )");
    EXPECT_FALSE(result.has_value());
}

TEST(InventoryErrorTest, TolerationSecondsMustBeInteger) {
    auto result = parse_inventory(R"(
        [[placements]]
        name = "p"
          [[placements.tolerations]]
          key = "k"
          operator = "Exists"
          toleration_seconds = "90"
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("toleration_seconds"), std::string::npos);
}

TEST(InventoryErrorTest, TolerationKeyMustBeString) {
    // An integer key would otherwise load as an empty Exists key and match every taint.
    auto result = parse_inventory(R"(
        [[placements]]
        name = "p"
          [[placements.tolerations]]
          key = 123
          operator = "Exists"
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ParseError);
    EXPECT_NE(result.error().message.find("placements[0].tolerations[0]: key must be a string"),
              std::string::npos);
}

TEST(InventoryErrorTest, TaintValueMustBeString) {
    auto result = parse_inventory(R"(
        [[clusters]]
        name = "c"
          [[clusters.taints]]
          key = "gpu"
          value = true
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ParseError);
    EXPECT_NE(result.error().message.find("clusters[0].taints[0]: value must be a string"),
              std::string::npos);
}

TEST(InventoryErrorTest, OperatorAndEffectMustBeStrings) {
    auto op = parse_inventory(R"(
        [[placements]]
        name = "p"
          [[placements.tolerations]]
          key = "k"
          operator = 1
    )");
    ASSERT_FALSE(op.has_value());
    EXPECT_NE(op.error().message.find("operator must be a string"), std::string::npos);

    auto effect = parse_inventory(R"(
        [[clusters]]
        name = "c"
          [[clusters.taints]]
          key = "k"
          effect = 2
    )");
    ASSERT_FALSE(effect.has_value());
    EXPECT_NE(effect.error().message.find("effect must be a string"), std::string::npos);

    auto toleration_effect = parse_inventory(R"(
        [[placements]]
        name = "p"
          [[placements.tolerations]]
          key = "k"
          effect = false
    )");
    ASSERT_FALSE(toleration_effect.has_value());
    EXPECT_NE(toleration_effect.error().message.find("effect must be a string"),
              std::string::npos);
}

TEST(InventoryErrorTest, NamesMustBeStrings) {
    auto cluster = parse_inventory(R"(
        [[clusters]]
        name = 7
    )");
    ASSERT_FALSE(cluster.has_value());
    EXPECT_NE(cluster.error().message.find("clusters[0]: name must be a string"),
              std::string::npos);

    auto ns = parse_inventory(R"(
        [[placements]]
        namespace = 1
        name = "p"
    )");
    ASSERT_FALSE(ns.has_value());
    EXPECT_NE(ns.error().message.find("placements[0]: namespace must be a string"),
              std::string::npos);

    auto name = parse_inventory(R"(
        [[placements]]
        name = ["p"]
    )");
    ASSERT_FALSE(name.has_value());
    EXPECT_NE(name.error().message.find("placements[0]: name must be a string"),
              std::string::npos);
}

TEST(InventoryErrorTest, MalformedToml) {
    auto result = parse_inventory("[[clusters]\nname = ");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ParseError);
}

TEST(InventoryErrorTest, MissingFile) {
    auto result = load_inventory("/nonexistent/inventory.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST(InventoryFileTest, LoadsFromDisk) {
    auto path = std::filesystem::temp_directory_path() / "pe_test_inventory.toml";
    {
        std::ofstream out(path);
        out << "[[clusters]]\nname = \"disk\"\n";
    }
    auto result = load_inventory(path);
    std::filesystem::remove(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->clusters[0].name, "disk");
}
