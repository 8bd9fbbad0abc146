#include <qcloudsim/core/event_bus.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace qcloudsim::core;

TEST(EventBusTest, PublishWithoutSubscribersIsNoop) {
    EventBus bus;
    EXPECT_NO_THROW(bus.publish(device_events::start, DeviceEvent{"qpu0", 1, 0.0}));
    EXPECT_EQ(bus.subscriber_count(device_events::start), 0U);
}

TEST(EventBusTest, SubscribersRunInSubscriptionOrder) {
    EventBus bus;
    std::vector<std::string> calls;
    bus.subscribe(device_events::start, [&](const DeviceEvent& e) { calls.push_back("a:" + e.device_name); });
    bus.subscribe(device_events::start, [&](const DeviceEvent& e) { calls.push_back("b:" + e.device_name); });

    bus.publish(device_events::start, DeviceEvent{"cpu0", 7, 1.5});

    EXPECT_EQ(calls, (std::vector<std::string>{"a:cpu0", "b:cpu0"}));
    EXPECT_EQ(bus.subscriber_count(device_events::start), 2U);
}

TEST(EventBusTest, EventTypesAreIndependent) {
    EventBus bus;
    int starts = 0;
    int finishes = 0;
    bus.subscribe(device_events::start, [&](const DeviceEvent&) { ++starts; });
    bus.subscribe(device_events::finish, [&](const DeviceEvent&) { ++finishes; });

    bus.publish(device_events::finish, DeviceEvent{"qpu0", 3, 2.0});
    bus.publish("unknown", DeviceEvent{"qpu0", 3, 2.0});

    EXPECT_EQ(starts, 0);
    EXPECT_EQ(finishes, 1);
}

TEST(EventBusTest, PayloadIsDelivered) {
    EventBus bus;
    DeviceEvent seen;
    bus.subscribe("custom", [&](const DeviceEvent& e) { seen = e; });

    bus.publish("custom", DeviceEvent{"qpu3", 42, 12.3456});

    EXPECT_EQ(seen.device_name, "qpu3");
    EXPECT_EQ(seen.job_id, 42U);
    EXPECT_DOUBLE_EQ(seen.timestamp, 12.3456);
}
