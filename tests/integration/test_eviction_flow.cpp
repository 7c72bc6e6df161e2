/**
 * @file test_eviction_flow.cpp
 * @brief End-to-end: inventory file → cache → controller → decision log.
 * @author Dimitris Kafetzis
 *
 * Drives the whole pipeline with a manual clock through a cluster going
 * unreachable, being tolerated for a grace period, and being evicted.
 */

#include "controller/inventory_cache.hpp"
#include "controller/placement_controller.hpp"
#include "core/clock.hpp"
#include "model/inventory.hpp"
#include "telemetry/decision_recorder.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

using namespace placement_engine;
using namespace std::chrono_literals;

namespace {

constexpr std::string_view kInventory = R"(
[[clusters]]
name = "cluster-east"
  [[clusters.taints]]
  key = "cluster.open-cluster-management.io/unreachable"
  time_added = 2024-05-01T10:00:00Z

[[clusters]]
name = "cluster-gpu"
  [[clusters.taints]]
  key = "gpu"
  value = "true"

[[clusters]]
name = "cluster-west"

[[placements]]
name = "web"
  [[placements.tolerations]]
  key = "cluster.open-cluster-management.io/unreachable"
  operator = "Exists"
  toleration_seconds = 90

[[placements]]
namespace = "ml"
name = "training"
  [[placements.tolerations]]
  key = "gpu"
  value = "true"
  [[placements.tolerations]]
  key = "cluster.open-cluster-management.io/unreachable"
  operator = "Exists"
)";

const Timestamp kT0 = from_unix_seconds(1714557600);   // 2024-05-01T10:00:00Z

size_t count_lines_containing(const std::filesystem::path& path, std::string_view needle) {
    std::ifstream in(path);
    size_t n = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (line.find(needle) != std::string::npos) ++n;
    }
    return n;
}

}  // namespace

class EvictionFlowTest : public ::testing::Test {
protected:
    std::filesystem::path log_dir_;
    ManualClock clock_{kT0 + 30s};
    InventoryCache cache_;

    void SetUp() override {
        log_dir_ = std::filesystem::temp_directory_path() / "pe_test_eviction_flow";
        std::filesystem::remove_all(log_dir_);

        auto inventory = parse_inventory(kInventory);
        ASSERT_TRUE(inventory.has_value()) << inventory.error().message;
        for (auto& cluster : inventory->clusters) {
            cache_.upsert_cluster(std::move(cluster), clock_.now());
        }
        for (auto& placement : inventory->placements) {
            cache_.upsert_placement(std::move(placement));
        }
    }

    void TearDown() override {
        std::filesystem::remove_all(log_dir_);
    }
};

TEST_F(EvictionFlowTest, UnreachableClusterEvictedAfterGracePeriod) {
    auto decisions = std::make_shared<JsonFileSink>(log_dir_, "decisions");
    auto log_sink = std::make_shared<MemorySink>();

    PlacementController::Options options;
    options.controller.worker_count = 2;
    options.controller.resync_interval_s = 0;

    {
        PlacementController controller(cache_, clock_, Logger(log_sink, LogLevel::Debug),
                                        options, std::make_shared<DecisionRecorder>(decisions));
        controller.enqueue_all();

        // t0 + 30s: east is within its 90s grace period.
        ASSERT_EQ(controller.sync_once(), 2u);
        auto web = controller.status("default/web");
        ASSERT_TRUE(web.has_value());
        EXPECT_EQ(web->outcome.admitted,
                  (std::vector<ClusterId>{"cluster-east", "cluster-west"}));
        EXPECT_EQ(web->outcome.rejected, std::vector<ClusterId>{"cluster-gpu"});
        EXPECT_EQ(web->outcome.requeue_after, 60s);

        auto training = controller.status("ml/training");
        ASSERT_TRUE(training.has_value());
        EXPECT_EQ(training->outcome.admitted.size(), 3u);
        EXPECT_FALSE(training->outcome.requeue);

        // Only web is waiting on an expiry.
        EXPECT_EQ(controller.queue().size(), 1u);
        EXPECT_EQ(controller.queue().next_due(), kT0 + 90s);

        // Clock walks to the requeue time; nothing happens before it.
        clock_.set(kT0 + 60s);
        EXPECT_EQ(controller.sync_once(), 0u);

        clock_.set(*controller.queue().next_due());
        EXPECT_EQ(controller.sync_once(), 1u);

        web = controller.status("default/web");
        EXPECT_EQ(web->outcome.admitted, std::vector<ClusterId>{"cluster-west"});
        EXPECT_EQ(web->outcome.verdict_for("cluster-east")->reason,
                  ClusterVerdict::Reason::TolerationExpired);
        EXPECT_TRUE(controller.queue().empty());

        // The training placement is untouched.
        EXPECT_EQ(controller.status("ml/training")->evaluations, 1u);
    }

    decisions->flush();
    auto path = decisions->current_path();
    EXPECT_EQ(count_lines_containing(path, R"("event":"schedule_outcome")"), 3u);
    EXPECT_EQ(count_lines_containing(path, R"("event":"cluster_evicted")"), 1u);
    EXPECT_EQ(count_lines_containing(path, R"("event":"requeue_scheduled")"), 1u);
}

TEST_F(EvictionFlowTest, TaintRemovedBeforeExpiryKeepsCluster) {
    PlacementController::Options options;
    options.controller.worker_count = 1;
    options.controller.resync_interval_s = 0;
    PlacementController controller(cache_, clock_, Logger(std::make_shared<NullSink>()), options);

    controller.enqueue("default/web");
    controller.sync_once();
    ASSERT_TRUE(controller.status("default/web")->outcome.is_admitted("cluster-east"));

    // The cluster recovers before the grace period ends.
    clock_.set(kT0 + 80s);
    cache_.upsert_cluster({.name = "cluster-east"}, clock_.now());
    controller.enqueue("default/web");
    controller.sync_once();

    auto web = controller.status("default/web");
    EXPECT_TRUE(web->outcome.is_admitted("cluster-east"));
    EXPECT_FALSE(web->outcome.requeue);

    // The stale requeue was coalesced into the on-change evaluation.
    clock_.set(kT0 + 90s);
    EXPECT_EQ(controller.sync_once(), 0u);
    EXPECT_TRUE(controller.status("default/web")->outcome.is_admitted("cluster-east"));
}

TEST_F(EvictionFlowTest, TaintWithoutTimeIsStampedOnObservation) {
    PlacementController::Options options;
    options.controller.worker_count = 1;
    options.controller.resync_interval_s = 0;
    PlacementController controller(cache_, clock_, Logger(std::make_shared<NullSink>()), options);

    // West becomes unreachable without a recorded time.
    cache_.upsert_cluster(
        {.name = "cluster-west",
         .taints = {Taint{.key = "cluster.open-cluster-management.io/unreachable"}}},
        clock_.now());
    controller.enqueue("default/web");
    controller.sync_once();

    auto web = controller.status("default/web");
    ASSERT_TRUE(web.has_value());
    EXPECT_TRUE(web->outcome.is_admitted("cluster-west"));
    EXPECT_EQ(web->outcome.verdict_for("cluster-west")->remaining, Duration{90s});
    // East (60s left) still sets the requeue.
    EXPECT_EQ(web->outcome.requeue_after, 60s);
}
