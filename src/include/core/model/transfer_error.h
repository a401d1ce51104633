#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace filerelay::core {

enum class ErrorKind {
    kFraming,        // malformed or truncated control message
    kValidation,     // bad filename/size, or a request the receiver refused
    kConservation,   // chunk would overrun the declared size, or end came too early
    kConnection,     // peer closed or socket fault mid-transfer
    kUnknownSession, // relay operation on a missing or expired session id
    kSessionBusy,    // another chunk/end for the same session is still in flight
    kIo,             // local file could not be opened, read or written
    kIntegrity,      // payload digest mismatch
};

struct TransferError {
    ErrorKind kind;
    std::string message;
};

template <typename T>
using Result = std::expected<T, TransferError>;

inline std::unexpected<TransferError> MakeError(ErrorKind kind, std::string message) {
    return std::unexpected(TransferError{kind, std::move(message)});
}

constexpr std::string_view ErrorKindToString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::kFraming:
        return "FramingError";
    case ErrorKind::kValidation:
        return "ValidationError";
    case ErrorKind::kConservation:
        return "ConservationError";
    case ErrorKind::kConnection:
        return "ConnectionError";
    case ErrorKind::kUnknownSession:
        return "UnknownSessionError";
    case ErrorKind::kSessionBusy:
        return "SessionBusyError";
    case ErrorKind::kIo:
        return "IoError";
    case ErrorKind::kIntegrity:
        return "IntegrityError";
    }
    return "UnknownError";
}

} // namespace filerelay::core
