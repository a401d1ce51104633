#pragma once

#include <array>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <core/constant/transfer.h>
#include <core/model/transfer_error.h>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <span>
#include <string_view>
#include <vector>

/*
    Control messages travel as frames:

        [8-byte big-endian body length][UTF-8 JSON object]

    Payload bytes are never framed. ReadFrame keeps reading until the declared
    number of bytes has arrived or the stream fails, so a frame split across
    any number of TCP segments decodes the same as one delivered whole.
*/

namespace filerelay::core {

using Frame = std::vector<std::uint8_t>;
using LengthPrefix = std::array<std::uint8_t, transfer::kLengthPrefixSize>;

Frame EncodeFrame(const nlohmann::json& message);

LengthPrefix EncodeLengthPrefix(std::uint64_t length);
std::uint64_t DecodeLengthPrefix(std::span<const std::uint8_t, transfer::kLengthPrefixSize> prefix);

// Anything but a JSON object is a framing error
Result<nlohmann::json> DecodeFrameBody(std::span<const std::uint8_t> body);

// Decodes exactly one frame held in memory. Missing bytes and trailing bytes both fail.
Result<nlohmann::json> DecodeFrame(std::span<const std::uint8_t> bytes,
                                   std::size_t max_body_size = transfer::kMaxFrameBodySize);

namespace details {

// eof means the peer went away mid-frame (framing), anything else is a socket fault
TransferError ReadFailure(const boost::system::error_code& ec, std::string_view what);

TransferError OversizedFrame(std::uint64_t length, std::size_t max_body_size);

} // namespace details

template <typename AsyncReadStream>
boost::asio::awaitable<Result<nlohmann::json>> ReadFrame(
    AsyncReadStream& stream, std::size_t max_body_size = transfer::kMaxFrameBodySize) {
    namespace net = boost::asio;

    LengthPrefix prefix{};
    boost::system::error_code ec;
    co_await net::async_read(stream, net::buffer(prefix), net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(details::ReadFailure(ec, "frame length"));
    }

    std::uint64_t length = DecodeLengthPrefix(prefix);
    if (length > max_body_size) {
        co_return std::unexpected(details::OversizedFrame(length, max_body_size));
    }

    std::vector<std::uint8_t> body(static_cast<std::size_t>(length));
    if (!body.empty()) {
        co_await net::async_read(stream,
                                 net::buffer(body),
                                 net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            co_return std::unexpected(details::ReadFailure(ec, "frame body"));
        }
    }
    co_return DecodeFrameBody(body);
}

template <typename AsyncWriteStream>
boost::asio::awaitable<Result<void>> WriteFrame(AsyncWriteStream& stream,
                                                const nlohmann::json& message) {
    namespace net = boost::asio;

    Frame frame = EncodeFrame(message);
    boost::system::error_code ec;
    co_await net::async_write(stream, net::buffer(frame), net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        co_return MakeError(ErrorKind::kConnection, "Failed to write frame: " + ec.message());
    }
    co_return Result<void>{};
}

} // namespace filerelay::core
