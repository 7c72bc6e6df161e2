/**
 * @file test_requeue_queue.cpp
 * @brief Unit tests for RequeueQueue.
 * @author Dimitris Kafetzis
 */

#include "controller/requeue_queue.hpp"

#include <gtest/gtest.h>

using namespace placement_engine;
using namespace std::chrono_literals;

namespace {
const Timestamp kT0 = from_unix_seconds(1714557600);
}  // namespace

TEST(RequeueQueueTest, EmptyQueue) {
    RequeueQueue queue;
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.next_due().has_value());
    EXPECT_TRUE(queue.pop_due(kT0 + 24h).empty());
}

TEST(RequeueQueueTest, PopsOnlyDueEntries) {
    RequeueQueue queue;
    queue.add("ns/a", kT0 + 10s);
    queue.add("ns/b", kT0 + 20s);

    EXPECT_TRUE(queue.pop_due(kT0 + 9s).empty());
    EXPECT_EQ(queue.pop_due(kT0 + 10s), std::vector<PlacementId>{"ns/a"});
    EXPECT_EQ(queue.size(), 1u);
    EXPECT_EQ(queue.next_due(), kT0 + 20s);
}

TEST(RequeueQueueTest, OrderedByTimeThenId) {
    RequeueQueue queue;
    queue.add("ns/c", kT0 + 5s);
    queue.add("ns/b", kT0 + 1s);
    queue.add("ns/a", kT0 + 5s);

    EXPECT_EQ(queue.pop_due(kT0 + 1min), (std::vector<PlacementId>{"ns/b", "ns/a", "ns/c"}));
    EXPECT_TRUE(queue.empty());
}

TEST(RequeueQueueTest, CoalescesToSoonerTime) {
    RequeueQueue queue;
    EXPECT_TRUE(queue.add("ns/a", kT0 + 60s));
    EXPECT_FALSE(queue.add("ns/a", kT0 + 90s));
    EXPECT_EQ(queue.due_at("ns/a"), kT0 + 60s);

    EXPECT_TRUE(queue.add("ns/a", kT0 + 30s));
    EXPECT_EQ(queue.due_at("ns/a"), kT0 + 30s);
    EXPECT_EQ(queue.size(), 1u);

    EXPECT_EQ(queue.pop_due(kT0 + 30s), std::vector<PlacementId>{"ns/a"});
    EXPECT_TRUE(queue.pop_due(kT0 + 60s).empty());
}

TEST(RequeueQueueTest, Remove) {
    RequeueQueue queue;
    queue.add("ns/a", kT0);
    EXPECT_TRUE(queue.remove("ns/a"));
    EXPECT_FALSE(queue.remove("ns/a"));
    EXPECT_TRUE(queue.pop_due(kT0).empty());
}

TEST(RequeueQueueTest, Clear) {
    RequeueQueue queue;
    queue.add("ns/a", kT0);
    queue.add("ns/b", kT0);
    queue.clear();
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.due_at("ns/a").has_value());
}
