#pragma once

#include <nlohmann/json.hpp>

namespace filerelay::core {

// Relay-side lifecycle, strictly forward: kCreated -> kStreaming -> terminal
enum class SessionStatus {
    kCreated,   // handshake done, no chunk yet
    kStreaming, // at least one chunk forwarded
    kCompleted, // end returned a completion
    kFailed,    // forwarding or completion read failed
    kCanceled,  // cancel was called
};

NLOHMANN_JSON_SERIALIZE_ENUM(SessionStatus,
                             {
                                 {SessionStatus::kCreated, "CREATED"},
                                 {SessionStatus::kStreaming, "STREAMING"},
                                 {SessionStatus::kCompleted, "COMPLETED"},
                                 {SessionStatus::kFailed, "FAILED"},
                                 {SessionStatus::kCanceled, "CANCELED"},
                             });

} // namespace filerelay::core
