#include <gtest/gtest.h>
#include "ops/operation_tracker.hpp"
#include <atomic>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace gv;

class OperationTrackerTest : public ::testing::Test {
protected:
    EdgeCaseConfig config;
    ManualClock clock;

    void SetUp() override {
        config.race_condition_timeout_ms = 5000;
        config.cleanup_delay_ms = 1000;
    }
};

// ==========================================
// Race Detection Tests
// ==========================================

TEST_F(OperationTrackerTest, DuplicatePendingIdIsRejected) {
    OperationTracker tracker(config, clock);

    std::vector<std::string> races;
    tracker.set_race_condition_handler([&](const TrackedOperation& op) { races.push_back(op.id); });

    EXPECT_TRUE(tracker.track_operation("op1", OperationType::Navigation));
    EXPECT_FALSE(tracker.track_operation("op1", OperationType::Navigation));

    EXPECT_EQ(races, std::vector<std::string>({"op1"}));
    EXPECT_EQ(tracker.status("op1"), OperationStatus::Pending);
    EXPECT_EQ(tracker.get_statistics()["race_conditions"], 1);
}

TEST_F(OperationTrackerTest, IdReusableOnceTerminal) {
    OperationTracker tracker(config, clock);

    EXPECT_TRUE(tracker.track_operation("op1", OperationType::DataFetch));
    EXPECT_TRUE(tracker.complete_operation("op1"));
    EXPECT_EQ(tracker.status("op1"), OperationStatus::Completed);

    EXPECT_TRUE(tracker.track_operation("op1", OperationType::DataFetch));
    EXPECT_EQ(tracker.status("op1"), OperationStatus::Pending);
}

// ==========================================
// Priority Tests
// ==========================================

TEST_F(OperationTrackerTest, HigherPriorityCancelsLower) {
    OperationTracker tracker(config, clock);

    ASSERT_TRUE(tracker.track_operation("low", OperationType::Navigation, 1));
    auto low_token = tracker.token("low");
    ASSERT_TRUE(low_token.has_value());

    std::vector<std::string> events;
    tracker.set_race_condition_handler([&](const TrackedOperation& op) { events.push_back(op.id); });

    EXPECT_TRUE(tracker.track_operation("high", OperationType::Navigation, 5));

    EXPECT_EQ(tracker.status("low"), OperationStatus::Cancelled);
    EXPECT_EQ(tracker.status("high"), OperationStatus::Pending);
    EXPECT_TRUE(low_token->is_cancelled());
    EXPECT_TRUE(tracker.get_operation("low")->finished_at.has_value());
    EXPECT_EQ(events, std::vector<std::string>({"low"}));

    // A cancelled operation cannot be completed afterwards
    EXPECT_FALSE(tracker.complete_operation("low"));
    EXPECT_EQ(tracker.status("low"), OperationStatus::Cancelled);
}

TEST_F(OperationTrackerTest, EqualPriorityCoexists) {
    OperationTracker tracker(config, clock);

    EXPECT_TRUE(tracker.track_operation("first", OperationType::Navigation, 3));
    EXPECT_TRUE(tracker.track_operation("second", OperationType::Navigation, 3));

    EXPECT_EQ(tracker.status("first"), OperationStatus::Pending);
    EXPECT_EQ(tracker.status("second"), OperationStatus::Pending);
    EXPECT_EQ(tracker.active_count(), 2);
}

TEST_F(OperationTrackerTest, LowerPriorityNewcomerLeavesIncumbent) {
    OperationTracker tracker(config, clock);

    tracker.track_operation("high", OperationType::Layout, 5);
    tracker.track_operation("low", OperationType::Layout, 1);

    EXPECT_EQ(tracker.status("high"), OperationStatus::Pending);
    EXPECT_EQ(tracker.status("low"), OperationStatus::Pending);
}

TEST_F(OperationTrackerTest, PreemptionStaysWithinType) {
    OperationTracker tracker(config, clock);

    tracker.track_operation("fetch", OperationType::DataFetch, 1);
    tracker.track_operation("render", OperationType::Render, 1);
    tracker.track_operation("nav", OperationType::Navigation, 9);

    EXPECT_EQ(tracker.status("fetch"), OperationStatus::Pending);
    EXPECT_EQ(tracker.status("render"), OperationStatus::Pending);
}

// ==========================================
// Timeout / Cleanup Tests
// ==========================================

TEST_F(OperationTrackerTest, PendingOperationTimesOut) {
    OperationTracker tracker(config, clock);

    std::vector<OperationStatus> seen;
    tracker.set_race_condition_handler([&](const TrackedOperation& op) { seen.push_back(op.status); });

    tracker.track_operation("slow", OperationType::DataFetch);
    auto token = tracker.token("slow");

    clock.advance(std::chrono::milliseconds(5000));
    EXPECT_EQ(tracker.status("slow"), OperationStatus::Pending);

    clock.advance(std::chrono::milliseconds(1));
    EXPECT_EQ(tracker.status("slow"), OperationStatus::Failed);
    EXPECT_TRUE(token->is_cancelled());
    EXPECT_EQ(seen, std::vector<OperationStatus>({OperationStatus::Failed}));

    // Record dropped after the cleanup delay
    clock.advance(std::chrono::milliseconds(1000));
    EXPECT_FALSE(tracker.get_operation("slow").has_value());
}

TEST_F(OperationTrackerTest, SweepCountsTimeouts) {
    OperationTracker tracker(config, clock);

    tracker.track_operation("a", OperationType::Navigation);
    tracker.track_operation("b", OperationType::DataFetch);
    tracker.track_operation("c", OperationType::Layout);
    tracker.complete_operation("c");

    clock.advance(std::chrono::seconds(6));
    EXPECT_EQ(tracker.sweep(), 2);
    EXPECT_EQ(tracker.sweep(), 0);
    EXPECT_EQ(tracker.active_count(), 0);
}

TEST_F(OperationTrackerTest, CompletedRecordsAreDroppedAfterDelay) {
    OperationTracker tracker(config, clock);

    tracker.track_operation("op", OperationType::Render);
    tracker.complete_operation("op", false);
    EXPECT_EQ(tracker.status("op"), OperationStatus::Failed);

    clock.advance(std::chrono::milliseconds(999));
    EXPECT_TRUE(tracker.get_operation("op").has_value());

    clock.advance(std::chrono::milliseconds(1));
    EXPECT_FALSE(tracker.get_operation("op").has_value());
    EXPECT_FALSE(tracker.complete_operation("op"));
}

TEST_F(OperationTrackerTest, StatisticsAndReset) {
    OperationTracker tracker(config, clock);

    tracker.track_operation("a", OperationType::Navigation, 1);
    tracker.track_operation("b", OperationType::Navigation, 2);   // cancels a
    tracker.track_operation("c", OperationType::Layout);
    tracker.complete_operation("c");

    auto stats = tracker.get_statistics();
    EXPECT_EQ(stats["active_operations"], 1);
    EXPECT_EQ(stats["tracked_operations"], 3);
    EXPECT_EQ(stats["cancelled"], 1);
    EXPECT_EQ(stats["completed"], 1);
    EXPECT_EQ(stats["queued_operations"], 0);

    auto token = tracker.token("b");
    tracker.reset();
    EXPECT_TRUE(token->is_cancelled());
    EXPECT_FALSE(tracker.status("b").has_value());
    EXPECT_EQ(tracker.get_statistics()["tracked_operations"], 0);
}

TEST(TrackedOperationTest, ToJsonAndNames) {
    TrackedOperation op;
    op.id = "navigate:a";
    op.type = OperationType::DataFetch;
    op.status = OperationStatus::Cancelled;
    op.priority = 4;

    auto j = op.to_json();
    EXPECT_EQ(j["type"], "data_fetch");
    EXPECT_EQ(j["status"], "cancelled");
    EXPECT_EQ(j["priority"], 4);
    EXPECT_TRUE(op.is_terminal());
    EXPECT_EQ(to_string(OperationType::Render), "render");
}

// ==========================================
// Queue Tests
// ==========================================

TEST_F(OperationTrackerTest, QueueReturnsResult) {
    OperationTracker tracker(config, clock);

    auto future = tracker.queue_operation("sum", [](const CancellationToken&) { return 40 + 2; });
    EXPECT_EQ(future.get(), 42);

    auto done = tracker.queue_operation("void", [](const CancellationToken&) {});
    EXPECT_NO_THROW(done.get());
}

TEST_F(OperationTrackerTest, QueueForwardsExceptions) {
    OperationTracker tracker(config, clock);

    auto future = tracker.queue_operation("boom", [](const CancellationToken&) -> int {
        throw std::runtime_error("layout failed");
    });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST_F(OperationTrackerTest, QueueRunsHighestPriorityFirst) {
    OperationTracker tracker(config, clock);

    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();

    auto blocker = tracker.queue_operation("blocker", [&](const CancellationToken&) {
        started.set_value();
        gate.wait();
    });
    started.get_future().wait();

    std::mutex order_mutex;
    std::vector<std::string> order;
    auto record = [&](const std::string& id) {
        return [&, id](const CancellationToken&) {
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(id);
        };
    };

    auto a = tracker.queue_operation("a", record("a"), 1);
    auto b = tracker.queue_operation("b", record("b"), 5);
    auto c = tracker.queue_operation("c", record("c"), 5);
    auto d = tracker.queue_operation("d", record("d"), 0);
    EXPECT_EQ(tracker.queued_count(), 4);

    release.set_value();
    blocker.get();
    a.get();
    b.get();
    c.get();
    d.get();

    EXPECT_EQ(order, std::vector<std::string>({"b", "c", "a", "d"}));
}

TEST_F(OperationTrackerTest, QueueTimeoutFailsFutureAndCancelsWork) {
    std::atomic<bool> saw_cancel{false};

    {
        OperationTracker tracker(config, clock);

        auto future = tracker.queue_operation(
            "stuck",
            [&](const CancellationToken& token) {
                while (!token.is_cancelled()) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
                saw_cancel = true;
            },
            0,
            std::chrono::milliseconds(100)
        );

        try {
            future.get();
            FAIL() << "Expected TimeoutError";
        } catch (const TimeoutError& e) {
            EXPECT_EQ(std::string(e.what()), "Operation timed out after 100ms");
        }

        // The dispatcher moves on to the next item
        auto next = tracker.queue_operation("next", [](const CancellationToken&) { return 7; });
        EXPECT_EQ(next.get(), 7);
    }

    // The tracker waited for the abandoned work on destruction
    EXPECT_TRUE(saw_cancel);
}

TEST_F(OperationTrackerTest, ResetFailsQueuedWork) {
    OperationTracker tracker(config, clock);

    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();

    auto blocker = tracker.queue_operation("blocker", [&](const CancellationToken&) {
        started.set_value();
        gate.wait();
    });
    started.get_future().wait();

    auto waiting = tracker.queue_operation("waiting", [](const CancellationToken&) { return 1; });
    tracker.reset();

    EXPECT_THROW(waiting.get(), CancelledError);
    EXPECT_EQ(tracker.queued_count(), 0);

    release.set_value();
    EXPECT_NO_THROW(blocker.get());
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
