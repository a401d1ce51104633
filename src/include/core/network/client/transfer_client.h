#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <chrono>
#include <core/constant/transfer.h>
#include <core/model.h>
#include <cstdint>
#include <span>
#include <string>

namespace filerelay::core {

// Sender end of one transfer connection. All operations must run on the
// executor the client was created with (give it a strand when other threads
// may call Close).
class TransferClient {
public:
    explicit TransferClient(boost::asio::any_io_executor executor);
    ~TransferClient();
    TransferClient(const TransferClient&) = delete;
    TransferClient& operator=(const TransferClient&) = delete;

    boost::asio::awaitable<Result<void>> Connect(
        std::string host,
        std::uint16_t port,
        std::chrono::steady_clock::duration timeout = transfer::kDefaultConnectTimeout);

    // Header out, Acceptance in. A refusal comes back as a validation error
    // carrying the receiver's reason.
    boost::asio::awaitable<Result<AcceptanceMessage>> SendHeader(HeaderMessage header);

    // Raw payload bytes, unframed. data must stay alive until the call completes.
    boost::asio::awaitable<Result<void>> WritePayload(std::span<const std::uint8_t> data);

    boost::asio::awaitable<Result<CompletionMessage>> ReadCompletion();

    void Close();

    boost::asio::any_io_executor get_executor() { return stream_.get_executor(); }

    // host:port of the receiver once connected
    const std::string& endpoint() const { return endpoint_; }

private:
    boost::beast::tcp_stream stream_;
    std::string endpoint_;
};

} // namespace filerelay::core
