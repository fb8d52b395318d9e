/**
 * @file push_listener_test.cpp
 * @brief Unit tests for the push listener reconnect state machine.
 *
 * Tests:
 * - backoff schedule doubles from the base
 * - consecutive failures back off, then give up without another reconnect
 * - a received event resets the retry counter
 * - stop() interrupts a backoff wait
 * - deltas for unknown devices are counted as dropped
 */

#include "sync/push_listener.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <limits>
#include <thread>

#include "mocks/mock_hub_client.hpp"

using namespace hubsync;
using namespace hubsync::sync;
using namespace hubsync::tests;
using namespace testing;

namespace {

ReconnectPolicy fast_policy(int max_retries = 5, int base_backoff_ms = 1) {
    ReconnectPolicy policy;
    policy.max_retries = max_retries;
    policy.base_backoff_ms = base_backoff_ms;
    policy.wait_ms = 10;
    return policy;
}

bool wait_until(const std::function<bool()> &predicate, int timeout_ms = 3000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return predicate();
}

}  // namespace

TEST(ReconnectPolicyTest, BackoffDoublesFromBase) {
    ReconnectPolicy policy;
    EXPECT_EQ(compute_backoff_ms(policy, 1), 1000);
    EXPECT_EQ(compute_backoff_ms(policy, 2), 2000);
    EXPECT_EQ(compute_backoff_ms(policy, 3), 4000);
    EXPECT_EQ(compute_backoff_ms(policy, 4), 8000);
}

TEST(ReconnectPolicyTest, BackoffEdgeCases) {
    ReconnectPolicy policy;
    EXPECT_EQ(compute_backoff_ms(policy, 0), 0);
    policy.base_backoff_ms = 0;
    EXPECT_EQ(compute_backoff_ms(policy, 3), 0);
}

TEST(ReconnectPolicyTest, BackoffIsCappedInsteadOfOverflowing) {
    ReconnectPolicy policy;
    policy.base_backoff_ms = 5000;
    // 5000 * 2^20 exceeds INT_MAX
    EXPECT_EQ(compute_backoff_ms(policy, 21), kMaxBackoffMs);
    EXPECT_EQ(compute_backoff_ms(policy, 1000), kMaxBackoffMs);

    policy.base_backoff_ms = std::numeric_limits<int>::max();
    EXPECT_EQ(compute_backoff_ms(policy, 2), kMaxBackoffMs);

    // Below the cap the schedule is exact
    EXPECT_EQ(compute_backoff_ms(ReconnectPolicy{}, 12), 1000 * 2048);
}

class PushListenerTest : public Test {
protected:
    NiceMock<MockHubClient> client;
    state::SnapshotStore store;

    void SetUp() override {
        ON_CALL(client, last_error()).WillByDefault(Return("stream closed"));
        ON_CALL(client, last_status_code()).WillByDefault(Return(bridge::v1::Status_Code_CODE_UNAVAILABLE));
    }
};

TEST_F(PushListenerTest, GivesUpAfterMaxRetriesWithoutFinalReconnect) {
    EXPECT_CALL(client, next_state_update(_, _)).Times(5).WillRepeatedly(Return(false));
    // Failures 1..4 back off; the 5th gives up without resetting again
    EXPECT_CALL(client, reset_connection()).Times(4);
    EXPECT_CALL(client, release_thread_state()).Times(1);

    std::atomic<int> give_ups{0};
    PushListener listener(client, store, fast_policy());
    listener.set_give_up_handler([&] { give_ups++; });

    ASSERT_TRUE(listener.start());
    ASSERT_TRUE(wait_until([&] { return !listener.is_running(); }));

    auto snap = listener.snapshot();
    EXPECT_EQ(give_ups.load(), 1);
    EXPECT_EQ(snap.state, PushListener::State::STOPPED);
    EXPECT_FALSE(snap.running);
    EXPECT_EQ(snap.retry_count, 5);
    EXPECT_EQ(snap.give_up_count, 1u);
    EXPECT_EQ(snap.reconnect_count, 4u);
    EXPECT_EQ(snap.last_backoff_ms, 8);  // 1, 2, 4, 8
    EXPECT_EQ(snap.last_error, "stream closed");
}

TEST_F(PushListenerTest, ReceivedEventResetsRetryCount) {
    store.merge_full({make_device("a", "A", {{"L1", 0}})});

    // Two failures, one event, then failures until give-up: the event restarts the count
    InSequence seq;
    EXPECT_CALL(client, next_state_update(_, _)).Times(2).WillRepeatedly(Return(false));
    EXPECT_CALL(client, next_state_update(_, _))
        .WillOnce(Invoke([](int, std::optional<bridge::v1::StateUpdate> &update) {
            update = make_update("a", "L1", 1);
            return true;
        }));
    EXPECT_CALL(client, next_state_update(_, _)).Times(5).WillRepeatedly(Return(false));

    PushListener listener(client, store, fast_policy());
    ASSERT_TRUE(listener.start());
    ASSERT_TRUE(wait_until([&] { return !listener.is_running(); }));

    auto snap = listener.snapshot();
    EXPECT_EQ(snap.events_received, 1u);
    EXPECT_EQ(snap.give_up_count, 1u);
    EXPECT_EQ(snap.reconnect_count, 6u);

    auto device = store.get_device("a");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->data().at("L1").v().number_value(), 1);
}

TEST_F(PushListenerTest, IdleWaitsAreNotFailures) {
    ON_CALL(client, next_state_update(_, _)).WillByDefault(Invoke([](int, std::optional<bridge::v1::StateUpdate> &u) {
        u.reset();
        return true;
    }));
    EXPECT_CALL(client, reset_connection()).Times(0);

    PushListener listener(client, store, fast_policy());
    ASSERT_TRUE(listener.start());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto snap = listener.snapshot();
    EXPECT_EQ(snap.state, PushListener::State::LISTENING);
    EXPECT_EQ(snap.retry_count, 0);
    EXPECT_TRUE(snap.running);

    listener.stop();
    EXPECT_FALSE(listener.is_running());
}

TEST_F(PushListenerTest, UnknownDeviceDeltaIsDropped) {
    store.merge_full({make_device("a")});

    std::atomic<int> handled{0};
    std::atomic<int> applied_count{0};
    bool sent = false;
    ON_CALL(client, next_state_update(_, _))
        .WillByDefault(Invoke([&sent](int, std::optional<bridge::v1::StateUpdate> &u) {
            if (!sent) {
                sent = true;
                u = make_update("ghost", "L1", 1);
            } else {
                u.reset();
            }
            return true;
        }));

    PushListener listener(client, store, fast_policy());
    listener.set_update_handler([&](const bridge::v1::StateUpdate &, bool applied) {
        handled++;
        if (applied) applied_count++;
    });
    ASSERT_TRUE(listener.start());
    ASSERT_TRUE(wait_until([&] { return handled.load() == 1; }));
    listener.stop();

    auto snap = listener.snapshot();
    EXPECT_EQ(snap.events_received, 1u);
    EXPECT_EQ(snap.events_dropped, 1u);
    EXPECT_EQ(applied_count.load(), 0);
    EXPECT_EQ(store.device_count(), 1u);
}

TEST_F(PushListenerTest, StopInterruptsBackoff) {
    ON_CALL(client, next_state_update(_, _)).WillByDefault(Return(false));

    // A one minute backoff would hang the test if stop() did not wake it
    PushListener listener(client, store, fast_policy(5, 60000));
    ASSERT_TRUE(listener.start());
    ASSERT_TRUE(wait_until([&] { return listener.snapshot().state == PushListener::State::BACKOFF; }));

    const auto begin = std::chrono::steady_clock::now();
    listener.stop();
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 2000);
    EXPECT_FALSE(listener.is_running());
    EXPECT_EQ(listener.snapshot().give_up_count, 0u);
}

TEST_F(PushListenerTest, StartTwiceIsRejected) {
    ON_CALL(client, next_state_update(_, _)).WillByDefault(Return(true));

    PushListener listener(client, store, fast_policy());
    EXPECT_TRUE(listener.start());
    EXPECT_FALSE(listener.start());
    listener.stop();
}

TEST_F(PushListenerTest, CanStartAgainAfterGivingUp) {
    ON_CALL(client, next_state_update(_, _)).WillByDefault(Return(false));

    PushListener listener(client, store, fast_policy(2));
    ASSERT_TRUE(listener.start());
    ASSERT_TRUE(wait_until([&] { return !listener.is_running(); }));
    EXPECT_EQ(listener.snapshot().give_up_count, 1u);

    ASSERT_TRUE(listener.start());
    ASSERT_TRUE(wait_until([&] { return listener.snapshot().give_up_count == 2u; }));
    listener.stop();
}

TEST_F(PushListenerTest, RestartLeavesBackoffWithFreshRetryCount) {
    // One failure, then an idle but healthy stream
    EXPECT_CALL(client, next_state_update(_, _)).WillOnce(Return(false)).WillRepeatedly(Return(true));

    PushListener listener(client, store, fast_policy(5, 60000));
    ASSERT_TRUE(listener.start());
    ASSERT_TRUE(wait_until([&] { return listener.snapshot().state == PushListener::State::BACKOFF; }));
    EXPECT_EQ(listener.snapshot().retry_count, 1);

    const auto begin = std::chrono::steady_clock::now();
    listener.restart();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(2));

    ASSERT_TRUE(wait_until([&] { return listener.snapshot().state == PushListener::State::LISTENING; }));
    auto snap = listener.snapshot();
    EXPECT_TRUE(snap.running);
    EXPECT_EQ(snap.retry_count, 0);
    EXPECT_EQ(snap.give_up_count, 0u);
    listener.stop();
}

TEST_F(PushListenerTest, RestartAfterGivingUpRunsAgain) {
    ON_CALL(client, next_state_update(_, _)).WillByDefault(Return(false));

    PushListener listener(client, store, fast_policy(2));
    ASSERT_TRUE(listener.start());
    ASSERT_TRUE(wait_until([&] { return !listener.is_running(); }));

    listener.restart();
    ASSERT_TRUE(wait_until([&] { return listener.snapshot().give_up_count == 2u; }));
    listener.stop();
    EXPECT_FALSE(listener.is_running());
}

TEST(PushListenerStateTest, StateNames) {
    EXPECT_STREQ(state_to_string(PushListener::State::STOPPED), "STOPPED");
    EXPECT_STREQ(state_to_string(PushListener::State::LISTENING), "LISTENING");
    EXPECT_STREQ(state_to_string(PushListener::State::GIVEN_UP), "GIVEN_UP");
}
