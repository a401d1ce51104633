#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace filerelay::core {

enum class AcceptanceStatus {
    kError,
    kOk,
};

// kError is listed first so that an unrecognised status decodes as an error
NLOHMANN_JSON_SERIALIZE_ENUM(AcceptanceStatus,
                             {
                                 {AcceptanceStatus::kError, "ERROR"},
                                 {AcceptanceStatus::kOk, "OK"},
                             });

// Receiver's answer to a HeaderMessage.
struct AcceptanceMessage {
    AcceptanceStatus status{AcceptanceStatus::kError};
    std::string save_as; // receiver-chosen name, empty on rejection
    std::string message;
};

inline void to_json(nlohmann::json& j, const AcceptanceMessage& message) {
    j = nlohmann::json{
        {"status", message.status},
        {"save_as", message.save_as},
        {"message", message.message},
    };
}

inline void from_json(const nlohmann::json& j, AcceptanceMessage& message) {
    j.at("status").get_to(message.status);
    message.save_as = j.value("save_as", std::string{});
    message.message = j.value("message", std::string{});
}

} // namespace filerelay::core
