#pragma once

#include <string_view>

namespace filerelay::core {

enum class ReceiveState {
    kAwaitHeader,
    kValidating,
    kRejected, // terminal
    kAccepted,
    kReceiving,
    kDone,   // terminal
    kFailed, // terminal
};

constexpr std::string_view ReceiveStateToString(ReceiveState state) {
    switch (state) {
    case ReceiveState::kAwaitHeader:
        return "AWAIT_HEADER";
    case ReceiveState::kValidating:
        return "VALIDATING";
    case ReceiveState::kRejected:
        return "REJECTED";
    case ReceiveState::kAccepted:
        return "ACCEPTED";
    case ReceiveState::kReceiving:
        return "RECEIVING";
    case ReceiveState::kDone:
        return "DONE";
    case ReceiveState::kFailed:
        return "FAILED";
    }
    return "UNKNOWN";
}

} // namespace filerelay::core
