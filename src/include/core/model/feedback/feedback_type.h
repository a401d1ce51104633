#pragma once

#include <nlohmann/json.hpp>

namespace filerelay::core {

enum class FeedbackType {
    kReceiveStarted,  // receiver accepted a header (TransferStarted)
    kReceiveProgress, // payload bytes written so far (TransferProgress)
    kReceiveEnded,    // receiver reached DONE or FAILED (TransferEnded)

    kRelaySessionStarted, // begin created a session (TransferStarted)
    kRelayProgress,       // chunk forwarded (TransferProgress)
    kRelaySessionEnded,   // session completed, failed or canceled (TransferEnded)

    kSendProgress, // sender streaming progress (TransferProgress)
    kSendEnded,    // sender finished (TransferEnded)
};

NLOHMANN_JSON_SERIALIZE_ENUM(FeedbackType,
                             {
                                 {FeedbackType::kReceiveStarted, "ReceiveStarted"},
                                 {FeedbackType::kReceiveProgress, "ReceiveProgress"},
                                 {FeedbackType::kReceiveEnded, "ReceiveEnded"},
                                 {FeedbackType::kRelaySessionStarted, "RelaySessionStarted"},
                                 {FeedbackType::kRelayProgress, "RelayProgress"},
                                 {FeedbackType::kRelaySessionEnded, "RelaySessionEnded"},
                                 {FeedbackType::kSendProgress, "SendProgress"},
                                 {FeedbackType::kSendEnded, "SendEnded"},
                             });

} // namespace filerelay::core
