/**
 * @file test_status_aggregator.cpp
 * @brief Merge semantics, fleet counts and the copy-feedback overlay.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>
#include <stdexcept>

#include "StatusAggregator.hpp"

using namespace std::chrono_literals;
using Results = std::unordered_map<std::string, ProbeResult>;

namespace {

    TargetRegistry three_targets() {
        return TargetRegistry({
            { "10.0.0.1", "first" },
            { "10.0.0.2", "second" },
            { "10.0.0.3", "third" }
        });
    }

    ProbeResult up() { return ProbeResult{ true, std::nullopt, "ok", std::nullopt }; }
    ProbeResult down(FailureKind kind = FailureKind::HostUnreachable) { return ProbeResult{ false, kind, "lost", std::nullopt }; }

    uint32_t count_online(const FleetSnapshot& snap) {
        uint32_t n{};
        for (const auto& s: snap.statuses) if (s.last_result.reachable) ++n;
        return n;
    }
}

TEST(StatusAggregator, StartsWithEveryTargetUnchecked) {
    auto reg = three_targets();
    StatusAggregator agg(reg);

    auto snap = agg.snapshot();
    ASSERT_TRUE(snap);
    EXPECT_EQ(snap->total_count, 3u);
    EXPECT_EQ(snap->online_count, 0u);
    EXPECT_EQ(snap->cycle, 0u);

    for (const auto& s: snap->statuses) {
        EXPECT_FALSE(s.checked());
        EXPECT_FALSE(s.troubleshooting);
    }
}

TEST(StatusAggregator, CountsOnlineInRegistryOrder) {
    auto reg = three_targets();
    StatusAggregator agg(reg);

    auto snap = agg.merge({ { "10.0.0.3", up() }, { "10.0.0.2", down() }, { "10.0.0.1", up() } }, std::chrono::system_clock::now());

    EXPECT_EQ(snap->online_count, 2u);
    EXPECT_EQ(snap->total_count, 3u);

    ASSERT_EQ(snap->statuses.size(), 3u);
    EXPECT_EQ(snap->statuses[0].target.address, "10.0.0.1");
    EXPECT_EQ(snap->statuses[1].target.address, "10.0.0.2");
    EXPECT_EQ(snap->statuses[2].target.address, "10.0.0.3");

    EXPECT_EQ(agg.snapshot(), snap);
}

TEST(StatusAggregator, OnlineCountMatchesReachableAfterEveryMerge) {
    auto reg = three_targets();
    StatusAggregator agg(reg);

    auto t = std::chrono::system_clock::now();
    std::vector<Results> batches {
        { { "10.0.0.1", up() }, { "10.0.0.2", up() }, { "10.0.0.3", up() } },
        { { "10.0.0.1", down() }, { "10.0.0.2", up() }, { "10.0.0.3", down(FailureKind::Unknown) } },
        { { "10.0.0.2", down() } },
        { { "10.0.0.1", down() }, { "10.0.0.2", down() }, { "10.0.0.3", down() } },
    };

    for (const auto& batch: batches) {
        t += 1s;
        auto snap = agg.merge(batch, t);
        EXPECT_EQ(snap->online_count, count_online(*snap));
    }

    EXPECT_EQ(agg.snapshot()->online_count, 0u);
    EXPECT_EQ(agg.snapshot()->cycle, batches.size());
}

TEST(StatusAggregator, OfflineTargetsCarryTroubleshootingText) {
    auto reg = three_targets();
    StatusAggregator agg(reg);

    auto snap = agg.merge({
        { "10.0.0.1", up() },
        { "10.0.0.2", down(FailureKind::HostUnreachable) },
        { "10.0.0.3", down(FailureKind::InvalidAddress) }
    }, std::chrono::system_clock::now());

    EXPECT_FALSE(snap->statuses[0].troubleshooting);
    ASSERT_TRUE(snap->statuses[1].troubleshooting);
    EXPECT_EQ(*snap->statuses[1].troubleshooting, troubleshooting_message(FailureKind::HostUnreachable));
    EXPECT_EQ(*snap->statuses[2].troubleshooting, "Invalid address format");
}

TEST(StatusAggregator, LastCheckedNeverMovesBackwards) {
    auto reg = three_targets();
    StatusAggregator agg(reg);

    auto t1 = std::chrono::system_clock::now();
    auto t0 = t1 - 5s;
    auto t2 = t1 + 5s;

    agg.merge({ { "10.0.0.1", up() } }, t1);
    auto late = agg.merge({ { "10.0.0.1", down() } }, t0);

    EXPECT_EQ(late->statuses[0].last_checked_at, t1);
    EXPECT_TRUE(late->statuses[0].online());

    auto next = agg.merge({ { "10.0.0.1", down() } }, t2);
    EXPECT_EQ(next->statuses[0].last_checked_at, t2);
    EXPECT_FALSE(next->statuses[0].online());
}

TEST(StatusAggregator, MergeLeavesCopyFeedbackAlone) {
    auto reg = three_targets();
    StatusAggregator agg(reg);

    agg.record_copy_feedback("10.0.0.2");

    auto snap = agg.merge({ { "10.0.0.1", up() }, { "10.0.0.2", up() }, { "10.0.0.3", up() } }, std::chrono::system_clock::now());

    EXPECT_TRUE(snap->statuses[1].copy_feedback_active);
    EXPECT_FALSE(snap->statuses[0].copy_feedback_active);
    EXPECT_EQ(agg.copy_feedback_active("10.0.0.2"), true);

    agg.clear_copy_feedback("10.0.0.2");
    EXPECT_EQ(agg.copy_feedback_active("10.0.0.2"), false);
    EXPECT_FALSE(agg.snapshot()->statuses[1].copy_feedback_active);

    // the poll fields survived the feedback writes
    EXPECT_TRUE(agg.snapshot()->statuses[1].online());
}

TEST(StatusAggregator, ConcurrentMergesNeverResetFeedback) {
    auto reg = three_targets();
    StatusAggregator agg(reg);

    std::atomic<bool> go{false};

    std::thread poller([&] {
        while (!go) std::this_thread::yield();
        for (int i = 0; i < 500; ++i) {
            agg.merge({ { "10.0.0.1", up() }, { "10.0.0.2", down() }, { "10.0.0.3", up() } }, std::chrono::system_clock::now());
        }
    });

    agg.record_copy_feedback("10.0.0.1");
    go = true;

    for (int i = 0; i < 500; ++i) {
        ASSERT_EQ(agg.copy_feedback_active("10.0.0.1"), true);
        ASSERT_TRUE(agg.snapshot()->statuses[0].copy_feedback_active);
    }

    poller.join();
    EXPECT_TRUE(agg.snapshot()->statuses[0].copy_feedback_active);
}

TEST(StatusAggregator, PublishedSnapshotsAreNotModified) {
    auto reg = three_targets();
    StatusAggregator agg(reg);

    auto first = agg.merge({ { "10.0.0.1", up() } }, std::chrono::system_clock::now());
    agg.record_copy_feedback("10.0.0.1");
    agg.merge({ { "10.0.0.1", down() } }, std::chrono::system_clock::now() + 1s);

    EXPECT_TRUE(first->statuses[0].online());
    EXPECT_FALSE(first->statuses[0].copy_feedback_active);
    EXPECT_EQ(first->cycle, 1u);
}

TEST(StatusAggregator, SubscribersSeeEveryPublish) {
    auto reg = three_targets();
    StatusAggregator agg(reg);

    std::vector<std::shared_ptr<const FleetSnapshot>> seen;
    agg.subscribe([&](std::shared_ptr<const FleetSnapshot> snap) { seen.push_back(std::move(snap)); });

    agg.merge({ { "10.0.0.1", up() } }, std::chrono::system_clock::now());
    agg.record_copy_feedback("10.0.0.3");
    agg.record_copy_feedback("10.0.0.3"); // already set, nothing new to publish
    agg.clear_copy_feedback("10.0.0.3");

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0]->online_count, 1u);
    EXPECT_TRUE(seen[1]->statuses[2].copy_feedback_active);
    EXPECT_FALSE(seen[2]->statuses[2].copy_feedback_active);
}

TEST(StatusAggregator, SubscribersSeePublishesInOrderAcrossThreads) {
    auto reg = three_targets();
    StatusAggregator agg(reg);

    std::vector<std::shared_ptr<const FleetSnapshot>> seen;
    agg.subscribe([&](std::shared_ptr<const FleetSnapshot> snap) { seen.push_back(std::move(snap)); });

    std::thread poller([&] {
        for (int i = 0; i < 300; ++i) agg.merge({ { "10.0.0.1", up() }, { "10.0.0.2", down() } }, std::chrono::system_clock::now());
    });

    std::thread copier([&] {
        for (int i = 0; i < 300; ++i) {
            agg.record_copy_feedback("10.0.0.3");
            agg.clear_copy_feedback("10.0.0.3");
        }
    });

    poller.join();
    copier.join();

    ASSERT_EQ(seen.size(), 900u);

    for (size_t i = 1; i < seen.size(); ++i) {
        ASSERT_GE(seen[i]->cycle, seen[i - 1]->cycle) << "delivery " << i;
    }

    // the last delivery is what the aggregator holds now
    EXPECT_EQ(seen.back(), agg.snapshot());
}

TEST(StatusAggregator, UnknownAddressesAreRejected) {
    auto reg = three_targets();
    StatusAggregator agg(reg);

    EXPECT_THROW(agg.record_copy_feedback("192.168.1.1"), std::out_of_range);
    EXPECT_THROW(agg.clear_copy_feedback("192.168.1.1"), std::out_of_range);
    EXPECT_THROW(agg.merge({ { "192.168.1.1", up() }, { "10.0.0.1", up() } }, std::chrono::system_clock::now()), std::out_of_range);

    // the rejected batch left nothing behind
    EXPECT_EQ(agg.snapshot()->cycle, 0u);
    EXPECT_FALSE(agg.snapshot()->statuses[0].checked());
    EXPECT_FALSE(agg.copy_feedback_active("192.168.1.1"));
}
