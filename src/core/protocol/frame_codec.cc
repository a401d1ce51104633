#include <boost/asio/error.hpp>
#include <boost/endian/conversion.hpp>
#include <core/protocol/frame_codec.h>
#include <cstring>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace filerelay::core {

Frame EncodeFrame(const json& message) {
    // Invalid UTF-8 in a string value is replaced rather than thrown
    std::string body = message.dump(-1, ' ', false, json::error_handler_t::replace);

    Frame frame(transfer::kLengthPrefixSize + body.size());
    LengthPrefix prefix = EncodeLengthPrefix(body.size());
    std::memcpy(frame.data(), prefix.data(), prefix.size());
    if (!body.empty()) {
        std::memcpy(frame.data() + prefix.size(), body.data(), body.size());
    }
    return frame;
}

LengthPrefix EncodeLengthPrefix(std::uint64_t length) {
    LengthPrefix prefix{};
    std::uint64_t big = boost::endian::native_to_big(length);
    std::memcpy(prefix.data(), &big, sizeof(big));
    return prefix;
}

std::uint64_t DecodeLengthPrefix(std::span<const std::uint8_t, transfer::kLengthPrefixSize> prefix) {
    std::uint64_t big = 0;
    std::memcpy(&big, prefix.data(), sizeof(big));
    return boost::endian::big_to_native(big);
}

Result<json> DecodeFrameBody(std::span<const std::uint8_t> body) {
    json message = json::parse(body.begin(), body.end(), nullptr, false);
    if (message.is_discarded()) {
        spdlog::debug("Discarding frame body of {} bytes: not valid JSON", body.size());
        return MakeError(ErrorKind::kFraming, "Frame body is not valid JSON");
    }
    if (!message.is_object()) {
        return MakeError(ErrorKind::kFraming,
                         fmt::format("Frame body must be a JSON object, got {}",
                                     message.type_name()));
    }
    return message;
}

Result<json> DecodeFrame(std::span<const std::uint8_t> bytes, std::size_t max_body_size) {
    if (bytes.size() < transfer::kLengthPrefixSize) {
        return MakeError(ErrorKind::kFraming,
                         fmt::format("Truncated frame: {} of {} length bytes",
                                     bytes.size(),
                                     transfer::kLengthPrefixSize));
    }

    std::uint64_t length = DecodeLengthPrefix(bytes.first<transfer::kLengthPrefixSize>());
    if (length > max_body_size) {
        return std::unexpected(details::OversizedFrame(length, max_body_size));
    }

    auto body = bytes.subspan(transfer::kLengthPrefixSize);
    if (body.size() < length) {
        return MakeError(ErrorKind::kFraming,
                         fmt::format("Truncated frame: {} of {} body bytes", body.size(), length));
    }
    if (body.size() > length) {
        return MakeError(ErrorKind::kFraming,
                         fmt::format("{} unexpected bytes after frame", body.size() - length));
    }
    return DecodeFrameBody(body);
}

namespace details {

TransferError ReadFailure(const boost::system::error_code& ec, std::string_view what) {
    if (ec == boost::asio::error::eof) {
        return TransferError{ErrorKind::kFraming,
                             fmt::format("Connection closed while reading {}", what)};
    }
    return TransferError{ErrorKind::kConnection,
                         fmt::format("Failed to read {}: {}", what, ec.message())};
}

TransferError OversizedFrame(std::uint64_t length, std::size_t max_body_size) {
    return TransferError{ErrorKind::kFraming,
                         fmt::format("Frame of {} bytes exceeds the {} byte limit",
                                     length,
                                     max_body_size)};
}

} // namespace details

} // namespace filerelay::core
