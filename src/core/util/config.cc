#include <core/util/config.h>
#include <fstream>
#include <limits>
#include <optional>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace filerelay::core {

namespace {

fs::path loaded_path;

toml::table& Section(std::string_view name) {
    if (!config.contains(name)) {
        config.insert(name, toml::table{});
    }
    return *config[name].as_table();
}

// Integers outside [min, max] are reported and ignored
template <typename T>
std::optional<T> ReadInteger(toml::table& table,
                             std::string_view key,
                             std::int64_t min,
                             std::int64_t max = std::numeric_limits<std::int64_t>::max()) {
    if (!table.contains(key)) {
        return std::nullopt;
    }
    auto value = table[key].value<std::int64_t>();
    if (!value || *value < min || *value > max) {
        spdlog::warn("Ignoring invalid config value for \"{}\"", key);
        return std::nullopt;
    }
    return static_cast<T>(*value);
}

void LoadReceiver() {
    auto& receiver = Section("receiver");
    auto& target = settings.receiver;

    target.address = receiver["address"].value_or(target.address);
    if (auto port = ReadInteger<std::uint16_t>(receiver, "port", 0, 65535)) {
        target.port = *port;
    }
    if (receiver.contains("save-dir")) {
        target.save_dir = receiver["save-dir"].value_or(target.save_dir.string());
    }
    if (auto size = ReadInteger<std::uint64_t>(receiver, "max-file-size", 0)) {
        target.max_file_size = *size;
    }
    if (auto extensions = receiver["allowed-extensions"].as_array()) {
        target.allowed_extensions.clear();
        for (auto& node : *extensions) {
            if (auto extension = node.value<std::string>()) {
                target.allowed_extensions.push_back(*extension);
            }
        }
    }
    if (auto chunk = ReadInteger<std::size_t>(receiver, "io-chunk-size", 1)) {
        target.io_chunk_size = *chunk;
    }
    if (auto grace = ReadInteger<std::int64_t>(receiver, "shutdown-grace", 0)) {
        target.shutdown_grace = std::chrono::seconds(*grace);
    }
}

void LoadRelay() {
    auto& relay = Section("relay");
    auto& target = settings.relay;

    target.address = relay["address"].value_or(target.address);
    if (auto port = ReadInteger<std::uint16_t>(relay, "port", 0, 65535)) {
        target.port = *port;
    }
    if (auto timeout = ReadInteger<std::int64_t>(relay, "connect-timeout", 1)) {
        target.connect_timeout = std::chrono::seconds(*timeout);
    }
    if (auto chunk = ReadInteger<std::size_t>(relay, "max-chunk-size", 1)) {
        target.max_chunk_size = *chunk;
    }
}

void LoadLog() {
    auto& log = Section("log");
    settings.log.level = log["level"].value_or(settings.log.level);
}

} // namespace

fs::path DefaultConfigPath() {
    return path::kConfigDir / "config.toml";
}

void InitConfig(const fs::path& config_path) {
    settings = Settings{};
    loaded_path = config_path;

    std::error_code ec;
    if (config_path.has_parent_path() && !fs::exists(config_path.parent_path(), ec)) {
        spdlog::info("Config directory does not exist, creating...");
        fs::create_directories(config_path.parent_path(), ec);
    }
    if (!fs::exists(config_path, ec)) {
        std::ofstream ofs(config_path);
        spdlog::info("Config file does not exist, creating...");
    }

    try {
        config = toml::parse_file(config_path.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be parsed: {}", config_path.string(), err.description());
        config = toml::table{};
    }

    LoadReceiver();
    LoadRelay();
    LoadLog();
}

bool SaveConfig() {
    auto config_path = loaded_path.empty() ? DefaultConfigPath() : loaded_path;
    std::ofstream ofs(config_path);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open \"{}\" for saving config.", config_path.string());
        return false;
    }

    toml::array extensions;
    for (const auto& extension : settings.receiver.allowed_extensions) {
        extensions.push_back(extension);
    }
    config.insert_or_assign(
        "receiver",
        toml::table{
            {"address", settings.receiver.address},
            {"port", static_cast<std::int64_t>(settings.receiver.port)},
            {"save-dir", settings.receiver.save_dir.string()},
            {"max-file-size", static_cast<std::int64_t>(settings.receiver.max_file_size)},
            {"allowed-extensions", std::move(extensions)},
            {"io-chunk-size", static_cast<std::int64_t>(settings.receiver.io_chunk_size)},
            {"shutdown-grace", static_cast<std::int64_t>(settings.receiver.shutdown_grace.count())},
        });
    config.insert_or_assign(
        "relay",
        toml::table{
            {"address", settings.relay.address},
            {"port", static_cast<std::int64_t>(settings.relay.port)},
            {"connect-timeout", static_cast<std::int64_t>(settings.relay.connect_timeout.count())},
            {"max-chunk-size", static_cast<std::int64_t>(settings.relay.max_chunk_size)},
        });
    config.insert_or_assign("log", toml::table{{"level", settings.log.level}});
    ofs << config;
    return true;
}

} // namespace filerelay::core
