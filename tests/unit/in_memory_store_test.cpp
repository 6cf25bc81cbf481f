#include "store/in_memory_store.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace micsync::store;
using namespace std::chrono_literals;

class InMemoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        now = InMemoryStore::Clock::time_point{} + 1h;
        store = std::make_unique<InMemoryStore>([this] { return now; });
    }

    InMemoryStore::Clock::time_point now;
    std::unique_ptr<InMemoryStore> store;
};

TEST_F(InMemoryStoreTest, SetThenGetReturnsValue) {
    nlohmann::json value = {{"status", "running"}, {"items_total", 254}};
    ASSERT_EQ(store->set("discovery:status:shure-1", value, 0ms), StoreStatus::OK);

    nlohmann::json out;
    ASSERT_EQ(store->get("discovery:status:shure-1", out), StoreStatus::OK);
    EXPECT_EQ(out, value);
}

TEST_F(InMemoryStoreTest, MissingKeyIsNotFound) {
    nlohmann::json out;
    EXPECT_EQ(store->get("nope", out), StoreStatus::NOT_FOUND);
    EXPECT_EQ(store->erase("nope"), StoreStatus::NOT_FOUND);
}

TEST_F(InMemoryStoreTest, EntryExpiresAfterTtl) {
    ASSERT_EQ(store->set("k", 1, 100ms), StoreStatus::OK);

    nlohmann::json out;
    now += 99ms;
    EXPECT_EQ(store->get("k", out), StoreStatus::OK);

    now += 1ms;
    EXPECT_EQ(store->get("k", out), StoreStatus::NOT_FOUND);
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(InMemoryStoreTest, ZeroTtlNeverExpires) {
    ASSERT_EQ(store->set("k", 1, 0ms), StoreStatus::OK);
    now += 24h;

    nlohmann::json out;
    EXPECT_EQ(store->get("k", out), StoreStatus::OK);
}

TEST_F(InMemoryStoreTest, OverwriteRefreshesValueAndTtl) {
    store->set("k", 1, 100ms);
    now += 80ms;
    store->set("k", 2, 100ms);
    now += 80ms;

    nlohmann::json out;
    ASSERT_EQ(store->get("k", out), StoreStatus::OK);
    EXPECT_EQ(out, 2);
}

TEST_F(InMemoryStoreTest, PurgeExpiredDropsOnlyExpired) {
    store->set("short", 1, 10ms);
    store->set("long", 2, 10s);
    store->set("forever", 3, 0ms);
    now += 1s;

    EXPECT_EQ(store->purge_expired(), 1u);
    EXPECT_EQ(store->size(), 2u);
}

TEST_F(InMemoryStoreTest, UnavailableStoreRejectsEverything) {
    store->set("k", 1, 0ms);
    store->set_available(false);

    nlohmann::json out;
    EXPECT_EQ(store->get("k", out), StoreStatus::UNAVAILABLE);
    EXPECT_EQ(store->set("k", 2, 0ms), StoreStatus::UNAVAILABLE);
    EXPECT_EQ(store->erase("k"), StoreStatus::UNAVAILABLE);

    store->set_available(true);
    ASSERT_EQ(store->get("k", out), StoreStatus::OK);
    EXPECT_EQ(out, 1);
}
