#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/monitor/completeness_checker.h"
#include "../../src/monitor/static_topology.h"
#include "fake_providers.h"

#include <atomic>
#include <chrono>
#include <map>
#include <thread>
#include <vector>

using namespace Completeness;
using ::testing::_;
using ::testing::Return;

class CompletenessCheckerTest : public ::testing::Test {
protected:
    void SetUp() override {
        topology_.SetPartitionCount("orders", 2);
        topology_.SetPartitionCount("clicks", 1);
        checker_ = std::make_unique<CompletenessChecker>(kMaxNumWindows);
    }

    // Feed every partition of the topology for `window` through the checker
    void UpdateWindow(Window window) {
        for (const TopicPartition& tp : AllPartitions()) {
            checker_->UpdatePartitionCompleteness(source_, window, tp);
        }
    }

    // Mark every partition valid in `window` and feed it
    void AddFullWindow(Window window) {
        for (const TopicPartition& tp : AllPartitions()) {
            source_.MarkValid(window, tp.topic, tp.partition);
        }
        UpdateWindow(window);
    }

    std::vector<TopicPartition> AllPartitions() const {
        return {{"orders", 0}, {"orders", 1}, {"clicks", 0}};
    }

    static constexpr int kMaxNumWindows = 5;
    static constexpr int kTotalPartitions = 3;
    StaticTopology topology_;
    FakeSampleSource source_;
    std::unique_ptr<CompletenessChecker> checker_;
    const ModelGeneration gen_{1, 1};
};

TEST_F(CompletenessCheckerTest, OrdersAndClicksScenario) {
    source_.MarkValid(100, "orders", 0);
    source_.MarkValid(100, "orders", 1);
    source_.MarkValid(100, "clicks", 0);
    source_.MarkValid(200, "orders", 0);
    source_.MarkValid(200, "clicks", 0);
    source_.SetActiveWindow(200);
    UpdateWindow(100);
    UpdateWindow(200);

    int raw = 0;
    ASSERT_TRUE(checker_->RawValidPartitions(200, "orders", raw));
    EXPECT_EQ(raw, 1);
    EXPECT_EQ(checker_->ActiveWindow(), 200);

    auto percentages = checker_->MonitoredPercentages(gen_, topology_, kTotalPartitions);
    ASSERT_EQ(percentages.size(), 2u);
    EXPECT_DOUBLE_EQ(percentages[100], 1.0);
    EXPECT_NEAR(percentages[200], 1.0 / 3, 1e-9);

    EXPECT_EQ(checker_->NumValidWindows(gen_, topology_, 0.9, kTotalPartitions), 1);
}

TEST_F(CompletenessCheckerTest, PartiallyCoveredTopicContributesNothing) {
    source_.MarkValid(100, "orders", 0);
    source_.MarkValid(100, "clicks", 0);
    UpdateWindow(100);

    auto percentages = checker_->MonitoredPercentages(gen_, topology_, kTotalPartitions);
    ASSERT_EQ(percentages.count(100), 1u);
    // Only clicks counts; the single valid orders partition gives no credit.
    EXPECT_NEAR(percentages[100], 1.0 / 3, 1e-9);
}

TEST_F(CompletenessCheckerTest, WindowWithoutCoverageReportsZero) {
    UpdateWindow(100);

    auto percentages = checker_->MonitoredPercentages(gen_, topology_, kTotalPartitions);
    ASSERT_EQ(percentages.count(100), 1u);
    EXPECT_DOUBLE_EQ(percentages[100], 0.0);
}

TEST_F(CompletenessCheckerTest, AggregateReusedForSameGeneration) {
    AddFullWindow(100);
    auto first = checker_->MonitoredPercentages(gen_, topology_, kTotalPartitions);
    auto second = checker_->MonitoredPercentages(gen_, topology_, kTotalPartitions);
    EXPECT_EQ(first, second);
    EXPECT_EQ(checker_->NumAggregateRebuilds(), 1u);
    EXPECT_TRUE(checker_->IsAggregateValidFor(gen_));

    // New raw facts are not visible until the generation moves.
    AddFullWindow(200);
    auto stale = checker_->MonitoredPercentages(gen_, topology_, kTotalPartitions);
    EXPECT_EQ(stale.count(200), 0u);

    const ModelGeneration next{1, 2};
    EXPECT_FALSE(checker_->IsAggregateValidFor(next));
    auto fresh = checker_->MonitoredPercentages(next, topology_, kTotalPartitions);
    EXPECT_EQ(fresh.count(200), 1u);
    EXPECT_EQ(checker_->NumAggregateRebuilds(), 2u);
}

TEST_F(CompletenessCheckerTest, RefreshInvalidatesAggregateWithUnchangedGeneration) {
    AddFullWindow(100);
    EXPECT_EQ(checker_->NumValidWindows(gen_, topology_, 1.0, kTotalPartitions), 1);

    FakeSampleSource refreshed;
    refreshed.MarkValid(300, "clicks", 0);
    checker_->RefreshAllPartitionCompleteness(refreshed, {300}, AllPartitions());
    EXPECT_FALSE(checker_->IsAggregateValidFor(gen_));

    auto percentages = checker_->MonitoredPercentages(gen_, topology_, kTotalPartitions);
    EXPECT_EQ(checker_->NumAggregateRebuilds(), 2u);
    ASSERT_EQ(percentages.size(), 1u);
    EXPECT_NEAR(percentages[300], 1.0 / 3, 1e-9);

    int raw = 0;
    EXPECT_FALSE(checker_->RawValidPartitions(100, "orders", raw));
}

TEST_F(CompletenessCheckerTest, RemovedWindowNeverReported) {
    AddFullWindow(100);
    AddFullWindow(200);
    AddFullWindow(300);
    ASSERT_EQ(checker_->MonitoredPercentages(gen_, topology_, kTotalPartitions).size(), 3u);

    checker_->RemoveWindow(100);

    auto cached = checker_->MonitoredPercentages(gen_, topology_, kTotalPartitions);
    EXPECT_EQ(cached.count(100), 0u);
    EXPECT_EQ(cached.size(), 2u);

    auto rebuilt = checker_->MonitoredPercentages(ModelGeneration{2, 0}, topology_, kTotalPartitions);
    EXPECT_EQ(rebuilt.count(100), 0u);
    EXPECT_EQ(rebuilt.size(), 2u);

    int raw = 0;
    EXPECT_FALSE(checker_->RawValidPartitions(100, "clicks", raw));
}

TEST_F(CompletenessCheckerTest, RemoveUnknownWindowIsNoOp) {
    AddFullWindow(100);
    auto before = checker_->MonitoredPercentages(gen_, topology_, kTotalPartitions);
    checker_->RemoveWindow(999);
    auto after = checker_->MonitoredPercentages(gen_, topology_, kTotalPartitions);
    EXPECT_EQ(before, after);
    EXPECT_TRUE(checker_->IsAggregateValidFor(gen_));
}

TEST_F(CompletenessCheckerTest, ValidWindowsMustBeContiguous) {
    AddFullWindow(100);
    AddFullWindow(200);
    // 300 misses orders-1 and breaks the run.
    source_.MarkValid(300, "orders", 0);
    source_.MarkValid(300, "clicks", 0);
    UpdateWindow(300);
    AddFullWindow(400);
    AddFullWindow(500);
    source_.SetActiveWindow(600);
    UpdateWindow(600);

    // 600 is active and skipped, 500 and 400 count, 300 stops the scan.
    EXPECT_EQ(checker_->NumValidWindows(gen_, topology_, 0.9, kTotalPartitions), 2);
}

TEST_F(CompletenessCheckerTest, ActiveWindowSkippedEvenWhenComplete) {
    source_.SetActiveWindow(200);
    AddFullWindow(100);
    AddFullWindow(200);
    EXPECT_EQ(checker_->ActiveWindow(), 200);
    EXPECT_DOUBLE_EQ(checker_->MonitoredPercentages(gen_, topology_, kTotalPartitions)[200], 1.0);

    EXPECT_EQ(checker_->NumValidWindows(gen_, topology_, 0.5, kTotalPartitions), 1);
}

TEST_F(CompletenessCheckerTest, ValidWindowCountCappedAtMaximum) {
    for (Window window = 100; window <= 800; window += 100) {
        AddFullWindow(window);
    }
    source_.SetActiveWindow(900);
    UpdateWindow(900);

    EXPECT_EQ(checker_->NumValidWindows(gen_, topology_, 1.0, kTotalPartitions), kMaxNumWindows);
    EXPECT_EQ(checker_->NumValidWindows(gen_, topology_, 0.0, kTotalPartitions), kMaxNumWindows);
}

TEST_F(CompletenessCheckerTest, LegacyExclusionComparesPartitionTotals) {
    CompletenessChecker legacy(kMaxNumWindows, ActiveWindowExclusion::kLegacyPartitionCount);
    source_.MarkValid(100, "orders", 0);
    source_.MarkValid(100, "orders", 1);
    source_.MarkValid(100, "clicks", 0);
    source_.MarkValid(200, "orders", 0);
    source_.MarkValid(200, "clicks", 0);
    source_.SetActiveWindow(200);
    for (Window window : {100, 200}) {
        for (const TopicPartition& tp : AllPartitions()) {
            legacy.UpdatePartitionCompleteness(source_, window, tp);
        }
    }
    // The active window is below threshold and ends the scan before 100.
    EXPECT_EQ(legacy.NumValidWindows(gen_, topology_, 0.9, kTotalPartitions), 0);

    // A window whose total equals the marker value is skipped.
    CompletenessChecker marker_matches_total(kMaxNumWindows, ActiveWindowExclusion::kLegacyPartitionCount);
    FakeSampleSource all_valid;
    all_valid.MarkAllValid(true);
    all_valid.SetActiveWindow(kTotalPartitions);
    for (Window window : {100, 200}) {
        for (const TopicPartition& tp : AllPartitions()) {
            marker_matches_total.UpdatePartitionCompleteness(all_valid, window, tp);
        }
    }
    EXPECT_EQ(marker_matches_total.NumValidWindows(gen_, topology_, 0.9, kTotalPartitions), 0);
}

TEST_F(CompletenessCheckerTest, NumWindowsExcludesMostRecent) {
    EXPECT_EQ(checker_->NumWindows(0, 1000), 0);

    AddFullWindow(100);
    AddFullWindow(200);
    AddFullWindow(300);

    EXPECT_EQ(checker_->NumWindows(0, 1000), 2);
    EXPECT_EQ(checker_->NumWindows(100, 200), 2);
    EXPECT_EQ(checker_->NumWindows(200, 300), 1);
    EXPECT_EQ(checker_->NumWindows(300, 300), 0);
    EXPECT_EQ(checker_->NumWindows(400, 500), 0);

    checker_->RemoveWindow(300);
    // 200 is now the most recent retained window.
    EXPECT_EQ(checker_->NumWindows(0, 1000), 1);
}

TEST_F(CompletenessCheckerTest, ZeroTotalPartitionsReportsZeroCoverage) {
    AddFullWindow(100);
    auto percentages = checker_->MonitoredPercentages(gen_, topology_, 0);
    ASSERT_EQ(percentages.count(100), 1u);
    EXPECT_DOUBLE_EQ(percentages[100], 0.0);
}

TEST_F(CompletenessCheckerTest, UpdateConsultsAggregatorOnce) {
    MockSampleValidityProvider aggregator;
    EXPECT_CALL(aggregator, IsValidPartition(100, TopicPartition("orders", 0)))
        .Times(1)
        .WillOnce(Return(true));
    EXPECT_CALL(aggregator, IsValidPartition(100, TopicPartition("orders", 1)))
        .Times(1)
        .WillOnce(Return(false));
    EXPECT_CALL(aggregator, ActiveWindow()).Times(2).WillRepeatedly(Return(100));

    checker_->UpdatePartitionCompleteness(aggregator, 100, {"orders", 0});
    checker_->UpdatePartitionCompleteness(aggregator, 100, {"orders", 1});

    int raw = 0;
    ASSERT_TRUE(checker_->RawValidPartitions(100, "orders", raw));
    EXPECT_EQ(raw, 1);
    EXPECT_EQ(checker_->ActiveWindow(), 100);
}

TEST_F(CompletenessCheckerTest, TopologyConsultedOnlyOnRebuild) {
    AddFullWindow(100);
    AddFullWindow(200);

    MockTopologyProvider topology;
    EXPECT_CALL(topology, PartitionCount("orders")).Times(2).WillRepeatedly(Return(2));
    EXPECT_CALL(topology, PartitionCount("clicks")).Times(2).WillRepeatedly(Return(1));

    checker_->MonitoredPercentages(gen_, topology, kTotalPartitions);
    checker_->NumValidWindows(gen_, topology, 0.5, kTotalPartitions);
    checker_->MonitoredPercentages(ModelGeneration{1, 2}, topology, kTotalPartitions);
}

TEST_F(CompletenessCheckerTest, TopologyChangeRegatesTopics) {
    AddFullWindow(100);
    auto before = checker_->MonitoredPercentages(gen_, topology_, kTotalPartitions);
    EXPECT_DOUBLE_EQ(before[100], 1.0);

    // orders grows to 3 partitions; its 2 valid partitions no longer cover it.
    topology_.SetPartitionCount("orders", 3);
    auto after = checker_->MonitoredPercentages(ModelGeneration{2, 1}, topology_, 4);
    EXPECT_DOUBLE_EQ(after[100], 0.25);
}

TEST_F(CompletenessCheckerTest, ConcurrentUpdatesLoseNoIncrements) {
    constexpr int kNumThreads = 8;
    constexpr int kUpdatesPerThread = 1000;
    FakeSampleSource all_valid;
    all_valid.MarkAllValid(true);
    all_valid.SetActiveWindow(1000);

    std::vector<std::thread> threads;
    for (int t = 0; t < kNumThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < kUpdatesPerThread; ++i) {
                // Every thread hits the shared key plus one of its own.
                checker_->UpdatePartitionCompleteness(all_valid, 100, {"shared", i});
                checker_->UpdatePartitionCompleteness(all_valid, 100 + t + 1, {"own", i});
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    int shared = 0;
    ASSERT_TRUE(checker_->RawValidPartitions(100, "shared", shared));
    EXPECT_EQ(shared, kNumThreads * kUpdatesPerThread);
    for (int t = 0; t < kNumThreads; ++t) {
        int own = 0;
        ASSERT_TRUE(checker_->RawValidPartitions(100 + t + 1, "own", own));
        EXPECT_EQ(own, kUpdatesPerThread);
    }
}

TEST_F(CompletenessCheckerTest, QueryWaitsForBulkRefresh) {
    AddFullWindow(100);
    ASSERT_EQ(checker_->MonitoredPercentages(gen_, topology_, kTotalPartitions).count(100), 1u);

    // Window 300 is replayed first, then the refresh parks inside window 400.
    BlockingSampleSource blocking(400);
    std::thread refresher([&]() {
        checker_->RefreshAllPartitionCompleteness(blocking, {300, 400}, AllPartitions());
    });
    blocking.Reached().WaitForNotification();

    std::atomic<bool> query_done{false};
    std::map<Window, double> percentages;
    std::thread reader([&]() {
        percentages = checker_->MonitoredPercentages(gen_, topology_, kTotalPartitions);
        query_done.store(true);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(query_done.load());

    blocking.Release();
    refresher.join();
    reader.join();

    ASSERT_TRUE(query_done.load());
    EXPECT_EQ(percentages.size(), 2u);
    EXPECT_EQ(percentages.count(100), 0u);
    EXPECT_DOUBLE_EQ(percentages[300], 1.0);
    EXPECT_DOUBLE_EQ(percentages[400], 1.0);
}

TEST_F(CompletenessCheckerTest, QueriesRunAlongsideWriters) {
    constexpr int kNumWriters = 4;
    constexpr int kUpdatesPerWriter = 500;
    FakeSampleSource all_valid;
    all_valid.MarkAllValid(true);
    all_valid.SetActiveWindow(-1);

    StaticTopology topology;
    topology.SetPartitionCount("events", kNumWriters * kUpdatesPerWriter);

    std::atomic<bool> done{false};
    std::thread reader([&]() {
        int generation = 0;
        while (!done.load()) {
            ModelGeneration gen{generation++, 0};
            int num_valid = checker_->NumValidWindows(gen, topology, 1.0, kNumWriters * kUpdatesPerWriter);
            EXPECT_LE(num_valid, kMaxNumWindows);
            checker_->MonitoredPercentages(gen, topology, kNumWriters * kUpdatesPerWriter);
        }
    });

    std::vector<std::thread> writers;
    for (int w = 0; w < kNumWriters; ++w) {
        writers.emplace_back([&, w]() {
            for (int i = 0; i < kUpdatesPerWriter; ++i) {
                checker_->UpdatePartitionCompleteness(all_valid, 100, {"events", w * kUpdatesPerWriter + i});
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    done.store(true);
    reader.join();

    auto percentages = checker_->MonitoredPercentages(ModelGeneration{-1, -1}, topology,
            kNumWriters * kUpdatesPerWriter);
    EXPECT_DOUBLE_EQ(percentages[100], 1.0);
    EXPECT_EQ(checker_->NumValidWindows(ModelGeneration{-1, -1}, topology, 1.0,
                kNumWriters * kUpdatesPerWriter), 1);
}
