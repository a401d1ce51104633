/**
 * @file config_test.cc
 * @brief Unit tests for TOML configuration loading and saving
 */

#include "test_util.h"
#include <core/util/config.h>
#include <gtest/gtest.h>

using namespace filerelay::core;
using filerelay::test::TempDir;
using filerelay::test::WriteFileContents;

class ConfigTest : public ::testing::Test {
protected:
    TempDir dir_;

    void TearDown() override { settings = Settings{}; }
};

TEST_F(ConfigTest, MissingFileIsCreatedWithDefaults) {
    auto path = dir_.path() / "nested" / "config.toml";

    InitConfig(path);

    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(settings.receiver.address, "0.0.0.0");
    EXPECT_EQ(settings.receiver.port, 5001);
    EXPECT_EQ(settings.receiver.max_file_size, 2ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(settings.receiver.io_chunk_size, 64u * 1024);
    EXPECT_TRUE(settings.receiver.allowed_extensions.empty());
    EXPECT_EQ(settings.relay.address, "127.0.0.1");
    EXPECT_EQ(settings.relay.port, 8000);
    EXPECT_EQ(settings.relay.connect_timeout, std::chrono::seconds(10));
    EXPECT_EQ(settings.relay.max_chunk_size, 32u * 1024 * 1024);
    EXPECT_EQ(settings.log.level, "info");
}

TEST_F(ConfigTest, LoadsEveryTable) {
    auto path = dir_ / "config.toml";
    WriteFileContents(path, R"(
[receiver]
address = "127.0.0.1"
port = 6001
save-dir = "/tmp/incoming"
max-file-size = 1024
allowed-extensions = [".txt", ".png"]
io-chunk-size = 4096
shutdown-grace = 3

[relay]
port = 9000
connect-timeout = 2
max-chunk-size = 1048576

[log]
level = "debug"
)");

    InitConfig(path);

    EXPECT_EQ(settings.receiver.address, "127.0.0.1");
    EXPECT_EQ(settings.receiver.port, 6001);
    EXPECT_EQ(settings.receiver.save_dir, std::filesystem::path("/tmp/incoming"));
    EXPECT_EQ(settings.receiver.max_file_size, 1024u);
    EXPECT_EQ(settings.receiver.allowed_extensions, (std::vector<std::string>{".txt", ".png"}));
    EXPECT_EQ(settings.receiver.io_chunk_size, 4096u);
    EXPECT_EQ(settings.receiver.shutdown_grace, std::chrono::seconds(3));
    EXPECT_EQ(settings.relay.address, "127.0.0.1");
    EXPECT_EQ(settings.relay.port, 9000);
    EXPECT_EQ(settings.relay.connect_timeout, std::chrono::seconds(2));
    EXPECT_EQ(settings.relay.max_chunk_size, 1048576u);
    EXPECT_EQ(settings.log.level, "debug");
}

/**
 * @test Out-of-range values fall back to defaults
 */
TEST_F(ConfigTest, InvalidValuesKeepDefaults) {
    auto path = dir_ / "config.toml";
    WriteFileContents(path, R"(
[receiver]
port = 70000
max-file-size = -1

[relay]
connect-timeout = "soon"
)");

    InitConfig(path);

    EXPECT_EQ(settings.receiver.port, 5001);
    EXPECT_EQ(settings.receiver.max_file_size, 2ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(settings.relay.connect_timeout, std::chrono::seconds(10));
}

TEST_F(ConfigTest, UnparsableFileIsTreatedAsEmpty) {
    auto path = dir_ / "config.toml";
    WriteFileContents(path, "[receiver\nport = ");

    InitConfig(path);

    EXPECT_EQ(settings.receiver.port, 5001);
}

TEST_F(ConfigTest, SaveThenReload) {
    auto path = dir_ / "config.toml";
    InitConfig(path);
    settings.receiver.port = 7001;
    settings.receiver.allowed_extensions = {".bin"};
    settings.relay.port = 7002;
    settings.log.level = "warn";

    ASSERT_TRUE(SaveConfig());
    settings = Settings{};
    InitConfig(path);

    EXPECT_EQ(settings.receiver.port, 7001);
    EXPECT_EQ(settings.receiver.allowed_extensions, (std::vector<std::string>{".bin"}));
    EXPECT_EQ(settings.relay.port, 7002);
    EXPECT_EQ(settings.log.level, "warn");
}
