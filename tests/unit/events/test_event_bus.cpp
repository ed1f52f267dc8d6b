/**
 * @file test_event_bus.cpp
 * @brief Unit tests for event_bus
 */

#include "../../support/test_fixtures.h"

#include <kcenon/unified_fs/events/event_bus.h>

#include <atomic>
#include <stdexcept>

namespace kcenon::unified_fs::test {

namespace {

auto progress(std::size_t index) -> event {
    progress_event e;
    e.item_index = index;
    e.bytes_so_far = index;
    return e;
}

}  // namespace

class EventBusTest : public ::testing::Test {
protected:
    event_bus bus_;
};

TEST_F(EventBusTest, DeliversInPublishOrder) {
    event_recorder recorder;
    (void)bus_.subscribe(recorder.handler());

    for (std::size_t i = 0; i < 200; ++i) {
        bus_.publish(progress(i));
    }
    ASSERT_TRUE(bus_.flush());

    auto seen = recorder.of_type<progress_event>();
    ASSERT_EQ(seen.size(), 200u);
    for (std::size_t i = 0; i < seen.size(); ++i) {
        EXPECT_EQ(seen[i].item_index, i);
    }
}

TEST_F(EventBusTest, EverySubscriberSeesEveryEvent) {
    event_recorder first;
    event_recorder second;
    (void)bus_.subscribe(first.handler());
    (void)bus_.subscribe(second.handler());
    EXPECT_EQ(bus_.subscriber_count(), 2u);

    bus_.publish(progress(1));
    connectivity_event lost;
    lost.state = connection_state::degraded;
    bus_.publish(lost);
    ASSERT_TRUE(bus_.flush());

    EXPECT_EQ(first.size(), 2u);
    EXPECT_EQ(second.size(), 2u);
    ASSERT_EQ(second.of_type<connectivity_event>().size(), 1u);
    EXPECT_EQ(second.of_type<connectivity_event>()[0].state, connection_state::degraded);
}

TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
    event_recorder recorder;
    auto id = bus_.subscribe(recorder.handler());
    bus_.publish(progress(0));
    ASSERT_TRUE(bus_.flush());

    EXPECT_TRUE(bus_.unsubscribe(id));
    EXPECT_FALSE(bus_.unsubscribe(id));
    bus_.publish(progress(1));
    ASSERT_TRUE(bus_.flush());

    EXPECT_EQ(recorder.size(), 1u);
    EXPECT_EQ(bus_.subscriber_count(), 0u);
}

TEST_F(EventBusTest, DeliveryHappensOffThePublisherThread) {
    std::atomic<bool> other_thread{false};
    auto publisher = std::this_thread::get_id();
    (void)bus_.subscribe([&](const event&) {
        other_thread = std::this_thread::get_id() != publisher;
    });

    bus_.publish(progress(0));
    ASSERT_TRUE(bus_.flush());
    EXPECT_TRUE(other_thread.load());
}

TEST_F(EventBusTest, ThrowingSubscriberDoesNotStopOthers) {
    event_recorder recorder;
    (void)bus_.subscribe([](const event&) { throw std::runtime_error("subscriber failure"); });
    (void)bus_.subscribe(recorder.handler());

    bus_.publish(progress(0));
    bus_.publish(progress(1));
    ASSERT_TRUE(bus_.flush());
    EXPECT_EQ(recorder.size(), 2u);
}

TEST_F(EventBusTest, SlowSubscriberDoesNotBlockPublish) {
    std::mutex gate;
    std::unique_lock<std::mutex> held(gate);
    (void)bus_.subscribe([&](const event&) { std::lock_guard<std::mutex> wait(gate); });

    auto start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < 50; ++i) {
        bus_.publish(progress(i));
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{1});

    EXPECT_FALSE(bus_.flush(std::chrono::milliseconds{20}));
    held.unlock();
    EXPECT_TRUE(bus_.flush());
}

TEST_F(EventBusTest, PublishAfterStopIsDropped) {
    event_recorder recorder;
    (void)bus_.subscribe(recorder.handler());
    bus_.stop();
    bus_.publish(progress(0));
    EXPECT_EQ(recorder.size(), 0u);
}

TEST_F(EventBusTest, DecisionRespondsOnce) {
    decision_request_event request;
    request.channel = std::make_shared<decision_channel>();

    EXPECT_TRUE(request.respond(conflict_decision{conflict_action::overwrite, false}));
    EXPECT_FALSE(request.respond(conflict_decision{conflict_action::skip, false}));
    EXPECT_TRUE(request.channel->answered());

    auto decision = request.channel->wait_for(std::chrono::milliseconds{10});
    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->action, conflict_action::overwrite);
}

TEST_F(EventBusTest, DecisionWithoutChannelIsRejected) {
    decision_request_event request;
    EXPECT_FALSE(request.respond(conflict_decision{conflict_action::skip, true}));
}

}  // namespace kcenon::unified_fs::test
