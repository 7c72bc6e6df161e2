/**
 * @file test_taint.cpp
 * @brief Unit tests for taint/toleration model helpers.
 * @author Dimitris Kafetzis
 */

#include "model/cluster.hpp"
#include "model/taint.hpp"

#include <gtest/gtest.h>

using namespace placement_engine;

TEST(TaintTest, Defaults) {
    Taint taint{.key = "gpu"};
    EXPECT_EQ(taint.effect, TaintEffect::NoSelect);
    EXPECT_TRUE(taint.value.empty());
    EXPECT_FALSE(taint.time_added.has_value());
}

TEST(TaintTest, SameIdentityIgnoresTimeAdded) {
    Taint a{.key = "k", .value = "v", .time_added = from_unix_seconds(1)};
    Taint b{.key = "k", .value = "v", .time_added = from_unix_seconds(2)};
    Taint c{.key = "k", .value = "v", .effect = TaintEffect::PreferNoSelect};
    EXPECT_TRUE(a.same_identity(b));
    EXPECT_FALSE(a == b);
    EXPECT_FALSE(a.same_identity(c));
}

TEST(TolerationTest, Defaults) {
    Toleration toleration;
    EXPECT_EQ(toleration.op, TolerationOperator::Equal);
    EXPECT_FALSE(toleration.effect.has_value());
    EXPECT_FALSE(toleration.toleration_seconds.has_value());
}

TEST(ParseTest, Effects) {
    EXPECT_EQ(*parse_taint_effect(""), TaintEffect::NoSelect);
    EXPECT_EQ(*parse_taint_effect("NoSelect"), TaintEffect::NoSelect);
    EXPECT_EQ(*parse_taint_effect("PreferNoSelect"), TaintEffect::PreferNoSelect);
    EXPECT_EQ(*parse_taint_effect("NoSelectIfNew"), TaintEffect::NoSelectIfNew);
    auto bad = parse_taint_effect("NoExecute");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::ParseError);
}

TEST(ParseTest, Operators) {
    EXPECT_EQ(*parse_toleration_operator(""), TolerationOperator::Equal);
    EXPECT_EQ(*parse_toleration_operator("Equal"), TolerationOperator::Equal);
    EXPECT_EQ(*parse_toleration_operator("Exists"), TolerationOperator::Exists);
    EXPECT_FALSE(parse_toleration_operator("In").has_value());
}

TEST(DescribeTest, Taint) {
    EXPECT_EQ(describe(Taint{.key = "gpu", .value = "true"}), "gpu=true:NoSelect");
    EXPECT_EQ(describe(Taint{.key = "unreachable", .effect = TaintEffect::NoSelectIfNew}),
              "unreachable:NoSelectIfNew");
}

TEST(DescribeTest, Toleration) {
    EXPECT_EQ(describe(Toleration{.key = "gpu", .value = "true"}), "gpu Equal \"true\"");
    EXPECT_EQ(describe(Toleration{.op = TolerationOperator::Exists, .toleration_seconds = 30}),
              "* Exists for 30s");
}

TEST(PlacementTest, IdJoinsNamespaceAndName) {
    Placement placement{.ns = "team-a", .name = "web"};
    EXPECT_EQ(placement.id(), "team-a/web");
}
