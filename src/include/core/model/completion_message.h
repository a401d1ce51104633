#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace filerelay::core {

enum class CompletionStatus {
    kError,
    kDone,
};

NLOHMANN_JSON_SERIALIZE_ENUM(CompletionStatus,
                             {
                                 {CompletionStatus::kError, "ERROR"},
                                 {CompletionStatus::kDone, "DONE"},
                             });

// Terminal frame of a transfer, receiver to sender.
struct CompletionMessage {
    CompletionStatus status{CompletionStatus::kError};
    std::string saved_as;
    std::uint64_t bytes_received{0};
    bool renamed{false};
    std::string message;
    std::string sha256; // hex digest of the bytes written, empty on failure

    bool done() const { return status == CompletionStatus::kDone; }
};

inline void to_json(nlohmann::json& j, const CompletionMessage& message) {
    j = nlohmann::json{
        {"status", message.status},
        {"saved_as", message.saved_as},
        {"bytes_received", message.bytes_received},
        {"renamed", message.renamed},
        {"message", message.message},
        {"sha256", message.sha256},
    };
}

inline void from_json(const nlohmann::json& j, CompletionMessage& message) {
    j.at("status").get_to(message.status);
    message.saved_as = j.value("saved_as", std::string{});
    message.bytes_received = j.value("bytes_received", std::uint64_t{0});
    message.renamed = j.value("renamed", false);
    message.message = j.value("message", std::string{});
    message.sha256 = j.value("sha256", std::string{});
}

} // namespace filerelay::core
