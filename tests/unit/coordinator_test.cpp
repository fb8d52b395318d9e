/**
 * @file coordinator_test.cpp
 * @brief Unit tests for the sync coordinator against a mocked hub client.
 *
 * Tests:
 * - refresh retry bound (timeouts only) and availability transitions
 * - command gating, hub rejection and command round-trip into the store
 * - single-flight detail queries that never write the store
 * - push listener give-up clears the snapshot and the next poll restarts it
 * - poll thread cadence, request_refresh wake-up and interruptible retries
 */

#include "sync/coordinator.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>
#include <variant>
#include <vector>

#include "events/event_emitter.hpp"
#include "mocks/mock_hub_client.hpp"

using namespace hubsync;
using namespace hubsync::sync;
using namespace hubsync::tests;
using namespace testing;

namespace {

constexpr auto kTimeout = bridge::v1::Status_Code_CODE_DEADLINE_EXCEEDED;
constexpr auto kUnavailable = bridge::v1::Status_Code_CODE_UNAVAILABLE;

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

auto ReturnDevices(std::vector<bridge::v1::Device> list) {
    return Invoke([list](std::vector<bridge::v1::Device> &devices, int) {
        devices = list;
        return true;
    });
}

hub::DeviceCommand make_command(const std::string &idx, double value) {
    hub::DeviceCommand command;
    command.idx = idx;
    command.type = "0x81";
    command.val.set_number_value(value);
    return command;
}

}  // namespace

class CoordinatorTest : public Test {
protected:
    NiceMock<MockHubClient> client;
    state::SnapshotStore store;
    runtime::PollingConfig polling;
    runtime::PushConfig push;
    runtime::QueryConfig query;
    std::shared_ptr<events::EventEmitter> emitter = std::make_shared<events::EventEmitter>();
    std::unique_ptr<events::Subscription> events;

    void SetUp() override {
        polling.interval_ms = 60000;
        polling.retry_delay_ms = 1;
        query.retry_delay_ms = 1;
        push.enabled = false;

        ON_CALL(client, last_error()).WillByDefault(Return("hub timeout"));
        ON_CALL(client, last_status_code()).WillByDefault(Return(kTimeout));

        events = emitter->subscribe();
    }

    std::unique_ptr<Coordinator> make_coordinator() {
        auto coordinator = std::make_unique<Coordinator>(client, store, polling, push, query);
        coordinator->set_event_emitter(emitter);
        return coordinator;
    }

    std::vector<events::Event> drain() {
        std::vector<events::Event> out;
        while (auto event = events->try_pop()) {
            out.push_back(*event);
        }
        return out;
    }

    template <typename T>
    std::vector<T> drain_of() {
        std::vector<T> out;
        for (const auto &event : drain()) {
            if (const auto *typed = std::get_if<T>(&event)) {
                out.push_back(*typed);
            }
        }
        return out;
    }
};

//=== Poll Loop

TEST_F(CoordinatorTest, RefreshPopulatesStore) {
    EXPECT_CALL(client, discover_devices(_, polling.attempt_timeout_ms))
        .WillOnce(ReturnDevices({make_device("a"), make_device("b")}));
    auto coordinator = make_coordinator();

    SyncResult result = coordinator->refresh();
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(result.device_count, 2u);
    EXPECT_TRUE(coordinator->available());
    EXPECT_EQ(coordinator->get_devices().size(), 2u);
    EXPECT_TRUE(coordinator->last_sync_result().success);

    auto snapshots = drain_of<events::SnapshotEvent>();
    ASSERT_EQ(snapshots.size(), 1u);
    EXPECT_EQ(snapshots[0].reason, "poll");
    EXPECT_EQ(snapshots[0].device_count, 2u);
}

TEST_F(CoordinatorTest, RefreshRetriesTimeoutsUpToMaxAttempts) {
    EXPECT_CALL(client, discover_devices(_, _)).Times(3).WillRepeatedly(Return(false));
    auto coordinator = make_coordinator();

    SyncResult result = coordinator->refresh();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.attempts, 3);
    EXPECT_EQ(result.status_code, kTimeout);
    EXPECT_EQ(result.error_message, "Timed out after 3 attempts");
    EXPECT_FALSE(coordinator->available());

    auto availability = drain_of<events::AvailabilityEvent>();
    ASSERT_EQ(availability.size(), 1u);
    EXPECT_FALSE(availability[0].available);
}

TEST_F(CoordinatorTest, RefreshSucceedsOnSecondAttempt) {
    EXPECT_CALL(client, discover_devices(_, _))
        .WillOnce(Return(false))
        .WillOnce(ReturnDevices({make_device("a")}));
    auto coordinator = make_coordinator();

    SyncResult result = coordinator->refresh();
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.attempts, 2);
    EXPECT_TRUE(coordinator->available());
}

TEST_F(CoordinatorTest, NonTimeoutErrorIsNotRetried) {
    ON_CALL(client, last_status_code()).WillByDefault(Return(kUnavailable));
    ON_CALL(client, last_error()).WillByDefault(Return("connection refused"));
    EXPECT_CALL(client, discover_devices(_, _)).Times(1).WillOnce(Return(false));
    auto coordinator = make_coordinator();

    SyncResult result = coordinator->refresh();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(result.status_code, kUnavailable);
    EXPECT_EQ(result.error_message, "connection refused");
    EXPECT_FALSE(coordinator->available());
}

TEST_F(CoordinatorTest, FailedRefreshKeepsLastSnapshot) {
    EXPECT_CALL(client, discover_devices(_, _))
        .WillOnce(ReturnDevices({make_device("a")}))
        .WillRepeatedly(Return(false));
    auto coordinator = make_coordinator();

    ASSERT_TRUE(coordinator->refresh().success);
    EXPECT_FALSE(coordinator->refresh().success);
    EXPECT_TRUE(coordinator->get_device("a").has_value());
}

TEST_F(CoordinatorTest, AvailabilityRecoversOnNextSuccessfulPoll) {
    EXPECT_CALL(client, discover_devices(_, _))
        .WillOnce(Return(false))
        .WillOnce(Return(false))
        .WillOnce(Return(false))
        .WillOnce(ReturnDevices({make_device("a")}));
    auto coordinator = make_coordinator();

    EXPECT_FALSE(coordinator->refresh().success);
    EXPECT_FALSE(coordinator->available());
    EXPECT_TRUE(coordinator->refresh().success);
    EXPECT_TRUE(coordinator->available());

    auto availability = drain_of<events::AvailabilityEvent>();
    ASSERT_EQ(availability.size(), 2u);
    EXPECT_FALSE(availability[0].available);
    EXPECT_TRUE(availability[1].available);
}

TEST_F(CoordinatorTest, PollThreadRefreshesOnInterval) {
    polling.interval_ms = 10;
    std::atomic<int> polls{0};
    ON_CALL(client, discover_devices(_, _)).WillByDefault(Invoke([&](std::vector<bridge::v1::Device> &devices, int) {
        polls++;
        devices = {make_device("a")};
        return true;
    }));
    auto coordinator = make_coordinator();

    coordinator->start();
    EXPECT_TRUE(wait_until([&] { return polls.load() >= 2; }));
    coordinator->stop();
    EXPECT_EQ(coordinator->device_count(), 1u);
}

TEST_F(CoordinatorTest, RequestRefreshWakesPollThread) {
    std::atomic<int> polls{0};
    ON_CALL(client, discover_devices(_, _)).WillByDefault(Invoke([&](std::vector<bridge::v1::Device> &, int) {
        polls++;
        return true;
    }));
    auto coordinator = make_coordinator();

    coordinator->start();
    coordinator->request_refresh();
    EXPECT_TRUE(wait_until([&] { return polls.load() == 1; }));
    coordinator->stop();
}

TEST_F(CoordinatorTest, StopInterruptsRetryDelay) {
    polling.retry_delay_ms = 60000;
    ON_CALL(client, discover_devices(_, _)).WillByDefault(Return(false));
    auto coordinator = make_coordinator();

    SyncResult result;
    std::thread worker([&] { result = coordinator->refresh(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    const auto begin = std::chrono::steady_clock::now();
    coordinator->stop();
    worker.join();
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 2000);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status_code, kUnavailable);
}

//=== Push Listener supervision

TEST_F(CoordinatorTest, ListenerSnapshotIdleWhenPushDisabled) {
    auto coordinator = make_coordinator();
    auto snap = coordinator->listener_snapshot();
    EXPECT_EQ(snap.state, PushListener::State::STOPPED);
    EXPECT_FALSE(snap.running);
    EXPECT_EQ(snap.max_retries, push.max_retries);
    EXPECT_FALSE(coordinator->push_enabled());
}

TEST_F(CoordinatorTest, PushUpdatesReachStoreAndSubscribers) {
    push.enabled = true;
    push.wait_ms = 10;

    std::atomic<bool> send{false};
    ON_CALL(client, discover_devices(_, _)).WillByDefault(ReturnDevices({make_device("a", "A", {{"L1", 0}})}));
    ON_CALL(client, next_state_update(_, _))
        .WillByDefault(Invoke([&](int, std::optional<bridge::v1::StateUpdate> &update) {
            update.reset();
            if (send.exchange(false)) {
                update = make_update("a", "L1", 1);
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
            }
            return true;
        }));
    auto coordinator = make_coordinator();
    ASSERT_TRUE(coordinator->refresh().success);
    drain();

    send = true;
    ASSERT_TRUE(wait_until([&] { return coordinator->listener_snapshot().events_received == 1u; }));
    coordinator->stop();

    auto device = coordinator->get_device("a");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->data().at("L1").v().number_value(), 1);

    auto updates = drain_of<events::ChannelUpdateEvent>();
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].device_id, "a");
    EXPECT_EQ(updates[0].channel, "L1");
    EXPECT_EQ(updates[0].source, "push");
}

TEST_F(CoordinatorTest, ListenerGiveUpClearsSnapshotAndNextPollRestartsIt) {
    push.enabled = true;
    push.max_retries = 2;
    push.base_backoff_ms = 1;
    push.wait_ms = 10;

    std::atomic<bool> fail_stream{false};
    ON_CALL(client, discover_devices(_, _)).WillByDefault(ReturnDevices({make_device("a"), make_device("b")}));
    ON_CALL(client, next_state_update(_, _))
        .WillByDefault(Invoke([&](int, std::optional<bridge::v1::StateUpdate> &update) {
            update.reset();
            if (fail_stream.load()) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            return true;
        }));
    auto coordinator = make_coordinator();

    ASSERT_TRUE(coordinator->refresh().success);
    EXPECT_TRUE(coordinator->listener_snapshot().running);
    EXPECT_EQ(coordinator->device_count(), 2u);
    drain();

    fail_stream = true;
    ASSERT_TRUE(wait_until([&] { return coordinator->listener_snapshot().give_up_count == 1u; }));
    ASSERT_TRUE(wait_until([&] { return !coordinator->listener_snapshot().running; }));

    EXPECT_EQ(coordinator->device_count(), 0u);
    EXPECT_FALSE(coordinator->get_device_info("a").has_value());
    EXPECT_TRUE(coordinator->available());

    auto snapshots = drain_of<events::SnapshotEvent>();
    ASSERT_EQ(snapshots.size(), 1u);
    EXPECT_EQ(snapshots[0].reason, "cleared");

    // The next poll repopulates the store and brings the listener back
    fail_stream = false;
    ASSERT_TRUE(coordinator->refresh().success);
    EXPECT_EQ(coordinator->device_count(), 2u);
    EXPECT_TRUE(coordinator->listener_snapshot().running);
    coordinator->stop();
}

//=== Command Path

TEST_F(CoordinatorTest, CommandRoundTripUpdatesStore) {
    ON_CALL(client, discover_devices(_, _)).WillByDefault(ReturnDevices({make_device("a", "A", {{"L1", 0}})}));
    EXPECT_CALL(client, set_device_state("a", _, kDefaultCommandTimeoutMs, _))
        .WillOnce(Invoke([](const std::string &, const hub::DeviceCommand &command, int, hub::CommandReply &reply) {
            EXPECT_EQ(command.idx, "L1");
            EXPECT_EQ(command.type, "0x81");
            reply.code = 0;
            return true;
        }));
    auto coordinator = make_coordinator();
    ASSERT_TRUE(coordinator->refresh().success);
    drain();

    CommandResult result = coordinator->set_device_state("a", make_command("L1", 1));
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.changed);
    EXPECT_EQ(result.hub_code, 0);

    auto device = coordinator->get_device("a");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->data().at("L1").v().number_value(), 1);

    auto updates = drain_of<events::ChannelUpdateEvent>();
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].source, "command");
    EXPECT_EQ(updates[0].device_id, "a");
}

TEST_F(CoordinatorTest, CommandTriggersRefresh) {
    std::atomic<int> polls{0};
    ON_CALL(client, discover_devices(_, _)).WillByDefault(Invoke([&](std::vector<bridge::v1::Device> &devices, int) {
        polls++;
        devices = {make_device("a")};
        return true;
    }));
    ON_CALL(client, set_device_state(_, _, _, _))
        .WillByDefault(Invoke([](const std::string &, const hub::DeviceCommand &, int, hub::CommandReply &reply) {
            reply.code = 0;
            return true;
        }));
    auto coordinator = make_coordinator();
    coordinator->start();

    ASSERT_TRUE(coordinator->set_device_state("a", make_command("L1", 1)).success);
    EXPECT_TRUE(wait_until([&] { return polls.load() >= 1; }));
    coordinator->stop();
}

TEST_F(CoordinatorTest, CommandSkippedWhileUnavailable) {
    EXPECT_CALL(client, discover_devices(_, _)).WillRepeatedly(Return(false));
    EXPECT_CALL(client, set_device_state(_, _, _, _)).Times(0);
    auto coordinator = make_coordinator();
    ASSERT_FALSE(coordinator->refresh().success);

    CommandResult result = coordinator->set_device_state("a", make_command("L1", 1));
    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.changed);
}

TEST_F(CoordinatorTest, CommandOnColdStartGoesToHub) {
    // Nothing polled yet: the hub is presumed reachable, the store has nothing to update
    EXPECT_CALL(client, set_device_state("a", _, _, _))
        .WillOnce(Invoke([](const std::string &, const hub::DeviceCommand &, int, hub::CommandReply &reply) {
            reply.code = 0;
            return true;
        }));
    auto coordinator = make_coordinator();

    CommandResult result = coordinator->set_device_state("a", make_command("L1", 1));
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.changed);
    EXPECT_EQ(coordinator->device_count(), 0u);
    EXPECT_TRUE(drain_of<events::ChannelUpdateEvent>().empty());
}

TEST_F(CoordinatorTest, CommandRejectedByHub) {
    ON_CALL(client, discover_devices(_, _)).WillByDefault(ReturnDevices({make_device("a", "A", {{"L1", 0}})}));
    EXPECT_CALL(client, set_device_state(_, _, _, _))
        .WillOnce(Invoke([](const std::string &, const hub::DeviceCommand &, int, hub::CommandReply &reply) {
            reply.code = 10005;
            reply.msg = "no permission";
            return true;
        }));
    auto coordinator = make_coordinator();
    ASSERT_TRUE(coordinator->refresh().success);

    CommandResult result = coordinator->set_device_state("a", make_command("L1", 1));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status_code, bridge::v1::Status_Code_CODE_FAILED_PRECONDITION);
    EXPECT_EQ(result.hub_code, 10005);
    EXPECT_EQ(result.hub_msg, "no permission");
    EXPECT_EQ(result.error_message, "Hub rejected command (code 10005): no permission");
    EXPECT_EQ(coordinator->get_device("a")->data().at("L1").v().number_value(), 0);
}

TEST_F(CoordinatorTest, CommandTimeoutSurfacesDeadline) {
    EXPECT_CALL(client, set_device_state(_, _, 500, _)).WillOnce(Return(false));
    auto coordinator = make_coordinator();

    CommandResult result = coordinator->set_device_state("a", make_command("L1", 1), 500);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status_code, kTimeout);
    EXPECT_EQ(result.error_message, "hub timeout");
}

TEST_F(CoordinatorTest, CommandRequiresDeviceAndChannel) {
    EXPECT_CALL(client, set_device_state(_, _, _, _)).Times(0);
    auto coordinator = make_coordinator();

    EXPECT_EQ(coordinator->set_device_state("", make_command("L1", 1)).status_code,
              bridge::v1::Status_Code_CODE_INVALID_ARGUMENT);
    EXPECT_EQ(coordinator->set_device_state("a", make_command("", 1)).status_code,
              bridge::v1::Status_Code_CODE_INVALID_ARGUMENT);
}

//=== Single-Flight Query Path

TEST_F(CoordinatorTest, QueryReturnsDevicesWithoutTouchingStore) {
    ON_CALL(client, discover_devices(_, _)).WillByDefault(ReturnDevices({make_device("a", "A", {{"L1", 0}})}));
    EXPECT_CALL(client, discover_device("a", query.timeout_ms, _))
        .WillOnce(Invoke([](const std::string &, int, std::vector<bridge::v1::Device> &devices) {
            bridge::v1::Device anonymous;
            devices = {make_device("a", "A", {{"L1", 1}}), anonymous};
            return true;
        }));
    auto coordinator = make_coordinator();
    ASSERT_TRUE(coordinator->refresh().success);
    const auto generation = coordinator->store_generation();

    DeviceQueryResult result = coordinator->get_device_data("a");
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.devices.size(), 1u);
    EXPECT_EQ(result.devices[0].data().at("L1").v().number_value(), 1);

    EXPECT_EQ(coordinator->store_generation(), generation);
    EXPECT_EQ(coordinator->get_device("a")->data().at("L1").v().number_value(), 0);
}

TEST_F(CoordinatorTest, QueryUsesCallerTimeout) {
    EXPECT_CALL(client, discover_device("a", 250, _)).WillOnce(Return(true));
    auto coordinator = make_coordinator();
    EXPECT_TRUE(coordinator->get_device_data("a", 250).success);
}

TEST_F(CoordinatorTest, QueryRetriesTimeouts) {
    EXPECT_CALL(client, discover_device(_, _, _)).Times(3).WillRepeatedly(Return(false));
    auto coordinator = make_coordinator();

    DeviceQueryResult result = coordinator->get_device_data("a");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status_code, kTimeout);
    EXPECT_EQ(result.error_message, "Timed out after 3 attempts");
    // Query failures do not flip availability
    EXPECT_TRUE(coordinator->available());
}

TEST_F(CoordinatorTest, QueriesAreSingleFlight) {
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
    ON_CALL(client, discover_device(_, _, _))
        .WillByDefault(Invoke([&](const std::string &, int, std::vector<bridge::v1::Device> &) {
            const int now = ++in_flight;
            int seen = max_in_flight.load();
            while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            --in_flight;
            return true;
        }));
    auto coordinator = make_coordinator();

    std::vector<std::thread> callers;
    for (int i = 0; i < 4; ++i) {
        callers.emplace_back([&coordinator, i] { coordinator->get_device_data("dev" + std::to_string(i)); });
    }
    for (auto &t : callers) {
        t.join();
    }

    EXPECT_EQ(max_in_flight.load(), 1);
}
