// tests/overlay_store_test.cpp
// Super properties, timers and metadata in the overlay store.

#include <gtest/gtest.h>
#include "overlay_store.hpp"
#include "temp_db.hpp"

using namespace datrack;

TEST(OverlayStoreTest, SetAndCurrent) {
    TempDb db;
    OverlayStore store(db.path());
    store.set_super_properties(Props().add("plan", "pro").add("level", 3), true);
    EXPECT_EQ(store.current(), Props().add("plan", "pro").add("level", 3));
}

TEST(OverlayStoreTest, OverwriteFlag) {
    TempDb db;
    OverlayStore store(db.path());
    store.set_super_properties(Props().add("plan", "free"), true);
    store.set_super_properties(Props().add("plan", "pro"), false);
    EXPECT_EQ(std::get<std::string>(*store.current().find("plan")), "free");
    store.set_super_properties(Props().add("plan", "pro"), true);
    EXPECT_EQ(std::get<std::string>(*store.current().find("plan")), "pro");
}

TEST(OverlayStoreTest, OnceWritesAbsentKeysOnly) {
    TempDb db;
    OverlayStore store(db.path());
    store.set_super_properties(Props().add("source", "ad"), true);
    store.set_super_properties_once(Props().add("source", "organic").add("first_seen", 1));
    auto props = store.current();
    EXPECT_EQ(std::get<std::string>(*props.find("source")), "ad");
    EXPECT_EQ(std::get<int64_t>(*props.find("first_seen")), 1);
}

TEST(OverlayStoreTest, OnceWithDefaultOverwritesSentinel) {
    TempDb db;
    OverlayStore store(db.path());
    store.set_super_properties(Props().add("channel", "unknown").add("region", "eu"), true);
    store.set_super_properties_once(Props().add("channel", "store").add("region", "us"),
                                    Value(std::string("unknown")));
    auto props = store.current();
    EXPECT_EQ(std::get<std::string>(*props.find("channel")), "store");
    EXPECT_EQ(std::get<std::string>(*props.find("region")), "eu");
}

TEST(OverlayStoreTest, OnceWithDefaultWritesAbsentKey) {
    TempDb db;
    OverlayStore store(db.path());
    store.set_super_properties_once(Props().add("channel", "store"), Value(std::string("unknown")));
    EXPECT_EQ(std::get<std::string>(*store.current().find("channel")), "store");
}

TEST(OverlayStoreTest, SentinelComparesByType) {
    TempDb db;
    OverlayStore store(db.path());
    store.set_super_properties(Props().add("count", 0), true);
    store.set_super_properties_once(Props().add("count", 5), Value(0.0));
    EXPECT_EQ(std::get<int64_t>(*store.current().find("count")), 0);
}

TEST(OverlayStoreTest, SnapshotIsNotLive) {
    TempDb db;
    OverlayStore store(db.path());
    store.set_super_properties(Props().add("plan", "free"), true);
    Props snapshot = store.current();
    store.set_super_properties(Props().add("plan", "pro"), true);
    store.unregister("plan");
    EXPECT_EQ(std::get<std::string>(*snapshot.find("plan")), "free");
}

TEST(OverlayStoreTest, UnregisterAndClear) {
    TempDb db;
    OverlayStore store(db.path());
    store.set_super_properties(Props().add("a", 1).add("b", 2), true);
    store.unregister("a");
    EXPECT_FALSE(store.current().contains("a"));
    EXPECT_TRUE(store.current().contains("b"));
    store.clear();
    EXPECT_TRUE(store.current().empty());
}

TEST(OverlayStoreTest, PersistsAcrossReopen) {
    TempDb db;
    {
        OverlayStore store(db.path());
        store.set_super_properties(Props()
            .add("s", "x")
            .add("i", int64_t(-7))
            .add("d", 2.5)
            .add("b", true)
            .add("t", Date{1706000000000}), true);
        store.unregister("s");
    }
    OverlayStore reopened(db.path());
    EXPECT_EQ(reopened.current(), Props()
        .add("i", int64_t(-7))
        .add("d", 2.5)
        .add("b", true)
        .add("t", Date{1706000000000}));
}

TEST(OverlayStoreTest, TimersAreOneShot) {
    TempDb db;
    OverlayStore store(db.path());
    store.start_timer("checkout", 1000);
    EXPECT_EQ(store.timer_count(), 1u);
    EXPECT_EQ(store.take_timer("checkout"), std::optional<uint64_t>(1000));
    EXPECT_FALSE(store.take_timer("checkout").has_value());
}

TEST(OverlayStoreTest, RestartingTimerResetsStart) {
    TempDb db;
    OverlayStore store(db.path());
    store.start_timer("checkout", 1000);
    store.start_timer("checkout", 4000);
    EXPECT_EQ(store.take_timer("checkout"), std::optional<uint64_t>(4000));
}

TEST(OverlayStoreTest, ClearTimers) {
    TempDb db;
    OverlayStore store(db.path());
    store.start_timer("a", 1);
    store.start_timer("b", 2);
    store.clear_timers();
    EXPECT_EQ(store.timer_count(), 0u);
}

TEST(OverlayStoreTest, TimersNotPersisted) {
    TempDb db;
    {
        OverlayStore store(db.path());
        store.start_timer("checkout", 1000);
    }
    OverlayStore reopened(db.path());
    EXPECT_EQ(reopened.timer_count(), 0u);
}

TEST(OverlayStoreTest, Metadata) {
    TempDb db;
    {
        OverlayStore store(db.path());
        EXPECT_FALSE(store.get_meta("device_id").has_value());
        store.set_meta("device_id", "abc");
        store.set_meta("login_user", "u1");
        store.erase_meta("login_user");
    }
    OverlayStore reopened(db.path());
    EXPECT_EQ(reopened.get_meta("device_id"), std::optional<std::string>("abc"));
    EXPECT_FALSE(reopened.get_meta("login_user").has_value());
}
