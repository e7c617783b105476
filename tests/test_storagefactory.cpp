// tests/test_storagefactory.cpp
#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "Mocks.hpp"
#include "../src/core/StorageFactory.hpp"
#include "../src/errors/CacheErrors.hpp"
#include "../src/storage/FileMemoryStorage.hpp"
#include "../src/storage/FileStorage.hpp"
#include "../src/storage/RedisStorage.hpp"

using ::testing::_;
using ::testing::AtLeast;
using ::testing::NiceMock;

class StorageFactoryTest : public ::testing::Test {
protected:
    TempDir dir;
    std::shared_ptr<NiceMock<MockLogger>> logger = std::make_shared<NiceMock<MockLogger>>();

    StorageConfig fileConfig(StorageKind kind) {
        StorageConfig config;
        config.kind = kind;
        config.root_directory = dir.str();
        config.key_prefix = "fac";
        config.lock_timeout = std::chrono::milliseconds(250);
        return config;
    }
};

TEST_F(StorageFactoryTest, CreatesFileStorage) {
    EXPECT_CALL(*logger, setup(_)).Times(AtLeast(1));
    auto storage = StorageFactory::create(fileConfig(StorageKind::File), logger);

    ASSERT_NE(std::dynamic_pointer_cast<FileStorage>(storage), nullptr);
    EXPECT_EQ(storage->prefix(), "fac");
    EXPECT_TRUE(std::filesystem::is_directory(dir.path()));
}

TEST_F(StorageFactoryTest, CreatesFileMemoryStorage) {
    auto storage = StorageFactory::create(fileConfig(StorageKind::FileMemory), logger);

    ASSERT_NE(std::dynamic_pointer_cast<FileMemoryStorage>(storage), nullptr);
    storage->set("fac::f::80", Bytes{1});
    EXPECT_TRUE(storage->contains("fac::f::80"));
}

TEST_F(StorageFactoryTest, UnreachableRedisIsConnectionError) {
    StorageConfig config;
    config.kind = StorageKind::Redis;
    config.connection_string = "redis://127.0.0.1:1";
    config.redis_connect_timeout = std::chrono::milliseconds(200);

    EXPECT_THROW(StorageFactory::create(config, logger), ConnectionError);
}

TEST_F(StorageFactoryTest, InvalidPrefixIsRejected) {
    StorageConfig config = fileConfig(StorageKind::File);
    config.key_prefix = "bad prefix";
    EXPECT_THROW(StorageFactory::create(config, logger), std::invalid_argument);
}

TEST_F(StorageFactoryTest, NullLoggerIsRejected) {
    EXPECT_THROW(StorageFactory::create(fileConfig(StorageKind::File), nullptr), std::invalid_argument);
}
