#include <gtest/gtest.h>

#include "events.hpp"

#include <random>
#include <thread>
#include <vector>

using namespace pcdrop;

TEST(EventChannelTest, DrainReturnsEventsInOrder) {
    EventChannel channel(16, false);
    channel.info("one");
    channel.warning("two");
    channel.connections(3);

    std::vector<Event> events = channel.drain();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].message, "one");
    EXPECT_EQ(events[0].level, EventLevel::Info);
    EXPECT_EQ(events[1].level, EventLevel::Warning);
    EXPECT_EQ(events[2].type, Event::Type::Connections);
    EXPECT_EQ(events[2].connections, 3);
    EXPECT_GT(events[0].timestamp, 0);
    EXPECT_TRUE(channel.drain().empty());
}

TEST(EventChannelTest, DropsOldestPastCapacity) {
    EventChannel channel(2, false);
    channel.info("a");
    channel.info("b");
    channel.info("c");

    std::vector<Event> events = channel.drain();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].message, "b");
    EXPECT_EQ(events[1].message, "c");
    EXPECT_EQ(channel.dropped(), 1u);
}

TEST(EventChannelTest, ListenerSeesEveryEvent) {
    EventChannel channel(4, false);
    std::vector<std::string> seen;
    channel.setListener([&seen](const Event &event) { seen.push_back(event.message); });
    channel.success("done");
    channel.error("broken");
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[1], "broken");
    EXPECT_STREQ(level_name(EventLevel::Success), "success");
}

TEST(ConnectionCounterTest, ConcurrentConnectDisconnectEndsAtZero) {
    EventChannel channel(8, false);
    ConnectionCounter counter(&channel);
    std::vector<std::thread> clients;

    for (int t = 0; t < 16; ++t) {
        clients.emplace_back([&counter, t]() {
            std::mt19937 rng(static_cast<unsigned int>(t));
            for (int i = 0; i < 2000; ++i) {
                ConnectionGuard guard(counter);
                if (rng() % 8 == 0) {
                    std::this_thread::yield();
                }
            }
        });
    }
    for (auto &client : clients) {
        client.join();
    }
    EXPECT_EQ(counter.value(), 0);
}

TEST(ConnectionCounterTest, ResetPublishesZero) {
    EventChannel channel(8, false);
    ConnectionCounter counter(&channel);
    counter.increment();
    counter.increment();
    counter.reset();
    EXPECT_EQ(counter.value(), 0);

    std::vector<Event> events = channel.drain();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[1].connections, 2);
    EXPECT_EQ(events[2].connections, 0);
}
