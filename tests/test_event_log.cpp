#include <gtest/gtest.h>
#include "daemon/event_log.hpp"

TEST(EventLogTest, DropsOldestBeyondCapacity) {
    EventLog log(3);
    for (int i = 0; i < 5; ++i) log.add("info", "event " + std::to_string(i));

    EXPECT_EQ(log.size(), 3u);
    auto entries = log.recent(10);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries.front().message, "event 2");
    EXPECT_EQ(entries.back().message, "event 4");
}

TEST(EventLogTest, RecentLimitKeepsNewest) {
    EventLog log;
    for (int i = 0; i < 10; ++i) log.add("info", "event " + std::to_string(i));

    auto entries = log.recent(2);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].message, "event 8");
    EXPECT_EQ(entries[1].message, "event 9");
    EXPECT_TRUE(log.recent(0).empty());
}

TEST(EventLogTest, LevelFilter) {
    EventLog log;
    log.add("info", "a");
    log.add("error", "b");
    log.add("warning", "c");
    log.add("error", "d");

    auto errors = log.recent(50, "error");
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0].message, "b");
    EXPECT_EQ(errors[1].message, "d");
    EXPECT_TRUE(log.recent(50, "debug").empty());
}

TEST(EventLogTest, ZeroCapacityKeepsOne) {
    EventLog log(0);
    log.add("info", "a");
    log.add("info", "b");
    EXPECT_EQ(log.capacity(), 1u);
    EXPECT_EQ(log.size(), 1u);
}

TEST(EventLogTest, JsonShape) {
    EventLog log;
    log.add("warning", "push ignored", {{"branch", "dev"}});

    auto j = EventLog::to_json(log.recent(1).front());
    EXPECT_EQ(j["level"], "warning");
    EXPECT_EQ(j["message"], "push ignored");
    EXPECT_EQ(j["data"]["branch"], "dev");
    EXPECT_EQ(j["timestamp"].get<std::string>().size(), 19u);
}
