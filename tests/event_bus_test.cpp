#include "event_bus.hpp"
#include "events.hpp"

#include <gtest/gtest.h>

using namespace cbzxl;

TEST(EventBusTest, DeliversOnlyToSubscribersOfTheType) {
    EventBus bus;
    std::vector<std::string> started;
    int errors = 0;
    bus.subscribe<ArchiveStartEvent>([&](const ArchiveStartEvent& e) { started.push_back(e.relative); });
    bus.subscribe<ArchiveErrorEvent>([&](const ArchiveErrorEvent&) { ++errors; });

    bus.publish(ArchiveStartEvent{"a.cbz", 1, 2});
    bus.publish(ArchiveStartEvent{"b.cbz", 2, 2});
    bus.publish(ArchiveSkippedEvent{"c.cbz", "already processed"});

    EXPECT_EQ(started, (std::vector<std::string>{"a.cbz", "b.cbz"}));
    EXPECT_EQ(errors, 0);
    EXPECT_EQ(bus.subscriber_count<ArchiveStartEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<ArchiveCompleteEvent>(), 0u);
}

TEST(EventBusTest, HandlerMayPublishAgain) {
    EventBus bus;
    std::vector<std::string> seen;
    bus.subscribe<ArchiveErrorEvent>([&](const ArchiveErrorEvent& e) {
        seen.push_back("error " + e.relative);
        bus.publish(ArchiveSkippedEvent{e.relative, "failed"});
    });
    bus.subscribe<ArchiveSkippedEvent>([&](const ArchiveSkippedEvent& e) {
        seen.push_back(e.reason + " " + e.relative);
    });

    bus.publish(ArchiveErrorEvent{"bad.cbz", "corrupt"});

    EXPECT_EQ(seen, (std::vector<std::string>{"error bad.cbz", "failed bad.cbz"}));
}
