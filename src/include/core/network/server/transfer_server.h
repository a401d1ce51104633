#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <core/model/feedback.h>
#include <core/network/server/receive_session.h>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace filerelay::core {

// Accepts transfer connections and runs one ReceiveSession coroutine per connection.
// The io_context may run on any number of threads. Shut the server down and let
// the io_context finish before destroying it.
class TransferServer {
public:
    TransferServer(boost::asio::io_context& io_context,
                   ReceiverOptions options,
                   FeedbackCallback callback = nullptr);
    ~TransferServer();
    TransferServer(const TransferServer&) = delete;
    TransferServer& operator=(const TransferServer&) = delete;

    // Port 0 binds an ephemeral port, see port()
    bool Start(const std::string& address, std::uint16_t port);

    // Stop accepting. In-flight transfers keep running.
    void Stop();

    // Stop accepting and close every in-flight connection
    void Shutdown();

    // Stop, wait up to grace for in-flight transfers to finish, then Shutdown
    boost::asio::awaitable<void> Drain(std::chrono::steady_clock::duration grace);

    // Only call before Start
    void SetFeedbackCallback(FeedbackCallback callback);

    std::uint16_t port() const { return port_; }
    bool running() const { return running_; }
    std::size_t active_connections() const;
    const ReceiverOptions& options() const { return options_; }

private:
    boost::asio::awaitable<void> acceptConnections();

    boost::asio::awaitable<void> handleConnection(
        std::shared_ptr<boost::asio::ip::tcp::socket> socket, std::uint64_t connection_id);

    boost::asio::io_context& io_context_;
    ReceiverOptions options_;
    FeedbackCallback callback_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::atomic<bool> running_;
    std::atomic<std::uint16_t> port_;

    mutable std::mutex connections_mutex_;
    std::uint64_t next_connection_id_ = 0;
    std::unordered_map<std::uint64_t, std::shared_ptr<boost::asio::ip::tcp::socket>> connections_;
};

} // namespace filerelay::core
