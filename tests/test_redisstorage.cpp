// tests/test_redisstorage.cpp
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "Mocks.hpp"
#include "../src/errors/CacheErrors.hpp"
#include "../src/storage/RedisStorage.hpp"

using ::testing::NiceMock;

namespace {

std::string testServer() {
    if (const char* url = std::getenv("PERSISTCACHE_TEST_REDIS")) {
        return url;
    }
    return "redis://127.0.0.1:6379";
}

} // namespace

// --- Connection string parsing (no server needed) ---

TEST(RedisConnectionStringTest, FullUrl) {
    auto info = RedisStorage::parseConnectionString("redis://:secret@cache.local:6380/2");
    EXPECT_EQ(info.host, "cache.local");
    EXPECT_EQ(info.port, 6380);
    EXPECT_EQ(info.database, 2);
    EXPECT_EQ(info.password, "secret");
}

TEST(RedisConnectionStringTest, DefaultsPortAndDatabase) {
    auto info = RedisStorage::parseConnectionString("redis://127.0.0.1/");
    EXPECT_EQ(info.host, "127.0.0.1");
    EXPECT_EQ(info.port, 6379);
    EXPECT_EQ(info.database, 0);
    EXPECT_TRUE(info.password.empty());
}

TEST(RedisConnectionStringTest, BareHostAndPort) {
    auto info = RedisStorage::parseConnectionString("localhost:7000");
    EXPECT_EQ(info.host, "localhost");
    EXPECT_EQ(info.port, 7000);
}

TEST(RedisConnectionStringTest, RejectsMalformedInput) {
    EXPECT_THROW(RedisStorage::parseConnectionString(""), std::invalid_argument);
    EXPECT_THROW(RedisStorage::parseConnectionString("http://host:6379"), std::invalid_argument);
    EXPECT_THROW(RedisStorage::parseConnectionString("redis://host:notaport"), std::invalid_argument);
    EXPECT_THROW(RedisStorage::parseConnectionString("redis://host:70000"), std::invalid_argument);
}

TEST(RedisUnreachableTest, ConstructionFailsWithConnectionError) {
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    EXPECT_THROW(RedisStorage("redis://127.0.0.1:1", "pc", std::chrono::milliseconds(200),
                              std::chrono::milliseconds(200), logger),
                 ConnectionError);
}

// --- Against a live server; skipped when none is reachable ---
// Run locally with `redis-server --port 6379 &` and then
// `persistcache_tests --gtest_filter='RedisStorageTest.*'`, or set
// PERSISTCACHE_TEST_REDIS=redis://host:port/db to use another server.
// Keys under the pctest and pctest2 prefixes are removed before and after
// each test.

class RedisStorageTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockLogger>> logger = std::make_shared<NiceMock<MockLogger>>();
    std::unique_ptr<RedisStorage> storage;
    std::unique_ptr<RedisStorage> neighbour;

    void SetUp() override {
        try {
            storage = makeStorage("pctest");
            neighbour = makeStorage("pctest2");
        } catch (const ConnectionError& e) {
            GTEST_SKIP() << "Redis not reachable at " << testServer() << ": " << e.what();
        }
        storage->flushAll();
        neighbour->flushAll();
    }

    void TearDown() override {
        if (storage) storage->flushAll();
        if (neighbour) neighbour->flushAll();
    }

    std::unique_ptr<RedisStorage> makeStorage(const std::string& prefix) {
        return std::make_unique<RedisStorage>(testServer(), prefix, std::chrono::milliseconds(500),
                                              std::chrono::milliseconds(1000), logger);
    }
};

TEST_F(RedisStorageTest, SetThenGet) {
    storage->set("pctest::f::80", Bytes{1, 2, 3});
    auto value = storage->get("pctest::f::80");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, (Bytes{1, 2, 3}));
    EXPECT_TRUE(storage->isConnected());
}

TEST_F(RedisStorageTest, BinaryValuesAreKeptIntact) {
    Bytes value = {0x00, 0xff, 0x0d, 0x0a, 0x00, 0x24};
    storage->set("pctest::bin::80", value);
    EXPECT_EQ(*storage->get("pctest::bin::80"), value);
}

TEST_F(RedisStorageTest, MissingKey) {
    EXPECT_FALSE(storage->get("pctest::missing::80").has_value());
    EXPECT_FALSE(storage->contains("pctest::missing::80"));
}

TEST_F(RedisStorageTest, FlushRemovesOneKey) {
    storage->set("pctest::f::01", Bytes{1});
    storage->set("pctest::f::02", Bytes{2});
    storage->flush("pctest::f::01");
    storage->flush("pctest::f::03");

    EXPECT_FALSE(storage->contains("pctest::f::01"));
    EXPECT_TRUE(storage->contains("pctest::f::02"));
}

TEST_F(RedisStorageTest, FlushAllOnlyTouchesOwnPrefix) {
    storage->set("pctest::f::01", Bytes{1});
    storage->set("pctest::g::02", Bytes{2});
    neighbour->set("pctest2::f::01", Bytes{3});
    storage->set("pctest_unrelated", Bytes{4});

    storage->flushAll();

    EXPECT_FALSE(storage->contains("pctest::f::01"));
    EXPECT_FALSE(storage->contains("pctest::g::02"));
    EXPECT_TRUE(neighbour->contains("pctest2::f::01"));
    EXPECT_TRUE(storage->contains("pctest_unrelated"));

    storage->flush("pctest_unrelated");
}

TEST_F(RedisStorageTest, ManyKeysAreFlushedAcrossScanBatches) {
    for (int i = 0; i < 2500; ++i) {
        storage->set("pctest::bulk::" + std::to_string(i), Bytes{static_cast<std::uint8_t>(i % 256)});
    }
    storage->flushAll();
    EXPECT_FALSE(storage->contains("pctest::bulk::0"));
    EXPECT_FALSE(storage->contains("pctest::bulk::2499"));
}
