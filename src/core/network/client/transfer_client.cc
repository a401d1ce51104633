#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/error.hpp>
#include <core/network/client/transfer_client.h>
#include <core/protocol/frame_codec.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = net::ip::tcp;

namespace filerelay::core {

TransferClient::TransferClient(net::any_io_executor executor)
    : stream_(std::move(executor)) {}

TransferClient::~TransferClient() {
    Close();
}

net::awaitable<Result<void>> TransferClient::Connect(std::string host,
                                                     std::uint16_t port,
                                                     std::chrono::steady_clock::duration timeout) {
    boost::system::error_code ec;
    tcp::resolver resolver(stream_.get_executor());
    auto results = co_await resolver.async_resolve(host,
                                                   std::to_string(port),
                                                   net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        co_return MakeError(ErrorKind::kConnection,
                            fmt::format("Cannot resolve {}: {}", host, ec.message()));
    }

    stream_.expires_after(timeout);
    co_await stream_.async_connect(results, net::redirect_error(net::use_awaitable, ec));
    stream_.expires_never();
    if (ec) {
        if (ec == beast::error::timeout) {
            co_return MakeError(ErrorKind::kConnection,
                                fmt::format("Timed out connecting to {}:{}", host, port));
        }
        co_return MakeError(ErrorKind::kConnection,
                            fmt::format("Cannot connect to {}:{}: {}", host, port, ec.message()));
    }

    endpoint_ = fmt::format("{}:{}", host, port);
    spdlog::debug("Connected to receiver {}", endpoint_);
    co_return Result<void>{};
}

net::awaitable<Result<AcceptanceMessage>> TransferClient::SendHeader(HeaderMessage header) {
    if (auto written = co_await WriteFrame(stream_, nlohmann::json(header)); !written) {
        co_return std::unexpected(written.error());
    }

    auto frame = co_await ReadFrame(stream_);
    if (!frame) {
        co_return std::unexpected(frame.error());
    }

    AcceptanceMessage acceptance;
    try {
        acceptance = frame->get<AcceptanceMessage>();
    } catch (const nlohmann::json::exception& e) {
        co_return MakeError(ErrorKind::kFraming, fmt::format("Bad acceptance frame: {}", e.what()));
    }

    if (acceptance.status != AcceptanceStatus::kOk) {
        co_return MakeError(ErrorKind::kValidation,
                            acceptance.message.empty() ? std::string("Rejected by receiver")
                                                       : acceptance.message);
    }
    co_return acceptance;
}

net::awaitable<Result<void>> TransferClient::WritePayload(std::span<const std::uint8_t> data) {
    boost::system::error_code ec;
    co_await net::async_write(stream_,
                              net::buffer(data.data(), data.size()),
                              net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        co_return MakeError(ErrorKind::kConnection,
                            fmt::format("Failed to forward payload to {}: {}",
                                        endpoint_,
                                        ec.message()));
    }
    co_return Result<void>{};
}

net::awaitable<Result<CompletionMessage>> TransferClient::ReadCompletion() {
    auto frame = co_await ReadFrame(stream_);
    if (!frame) {
        co_return std::unexpected(frame.error());
    }

    try {
        co_return frame->get<CompletionMessage>();
    } catch (const nlohmann::json::exception& e) {
        co_return MakeError(ErrorKind::kFraming, fmt::format("Bad completion frame: {}", e.what()));
    }
}

void TransferClient::Close() {
    auto& socket = stream_.socket();
    if (!socket.is_open()) {
        return;
    }
    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    stream_.close();
}

} // namespace filerelay::core
