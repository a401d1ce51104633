/*
    config.h
    Application configuration kept in a TOML file.

    Example usage:

    General configuration:
    - Read a value from the raw table:
        T value = filerelay::core::config["key"].value_or(default_value);

    Application settings:
    - Read a setting:
        std::uint16_t port = filerelay::core::settings.receiver.port;
        std::filesystem::path save_dir = filerelay::core::settings.receiver.save_dir;
        std::string level = filerelay::core::settings.log.level;
    - Write a setting:
        filerelay::core::settings.relay.port = 9000;

    Initialization and saving:
    - Load the configuration (creates an empty file when missing):
        filerelay::core::InitConfig();
        filerelay::core::InitConfig("/path/to/config.toml");
    - Save the current settings back to the loaded file:
        filerelay::core::SaveConfig();

    File layout (kebab-case keys):

        [receiver]
        address = "0.0.0.0"
        port = 5001
        save-dir = "~/Downloads/filerelay"
        max-file-size = 2147483648
        allowed-extensions = []
        io-chunk-size = 65536
        shutdown-grace = 10

        [relay]
        address = "127.0.0.1"
        port = 8000
        connect-timeout = 10
        max-chunk-size = 33554432

        [log]
        level = "info"
*/

#pragma once

#include <chrono>
#include <core/constant/path.h>
#include <core/constant/transfer.h>
#include <cstdint>
#include <filesystem>
#include <string>
#include <toml++/toml.h>
#include <vector>

namespace filerelay::core {

inline toml::table config;

struct ReceiverSettings {
    std::string address = "0.0.0.0";
    std::uint16_t port = 5001;
    std::filesystem::path save_dir = path::kDefaultReceiveDir;
    std::uint64_t max_file_size = transfer::kDefaultMaxFileSize;
    std::vector<std::string> allowed_extensions; // empty allows any extension
    std::size_t io_chunk_size = transfer::kDefaultIoChunkSize;
    std::chrono::seconds shutdown_grace = transfer::kDefaultShutdownGrace;
};

struct RelaySettings {
    std::string address = "127.0.0.1";
    std::uint16_t port = 8000;
    std::chrono::seconds connect_timeout = transfer::kDefaultConnectTimeout;
    std::size_t max_chunk_size = transfer::kMaxRelayChunkSize; // HTTP body limit for /chunk
};

struct LogSettings {
    std::string level = "info";
};

struct Settings {
    ReceiverSettings receiver;
    RelaySettings relay;
    LogSettings log;
};

inline Settings settings;

// ~/.config/filerelay/config.toml
std::filesystem::path DefaultConfigPath();

// Resets settings to defaults, then applies whatever the file sets. A file that
// fails to parse is logged and treated as empty.
void InitConfig(const std::filesystem::path& config_path = DefaultConfigPath());

// Writes settings to the file InitConfig loaded
bool SaveConfig();

} // namespace filerelay::core
