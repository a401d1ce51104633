#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/network/server/transfer_server.h>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <vector>

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace filerelay::core {

namespace {

void CloseSocket(tcp::socket& socket) {
    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
}

} // namespace

TransferServer::TransferServer(net::io_context& io_context,
                               ReceiverOptions options,
                               FeedbackCallback callback)
    : io_context_(io_context)
    , options_(std::move(options))
    , callback_(std::move(callback))
    , acceptor_(net::make_strand(io_context))
    , running_(false)
    , port_(0) {}

TransferServer::~TransferServer() {
    if (running_) {
        Shutdown();
    }
}

void TransferServer::SetFeedbackCallback(FeedbackCallback callback) {
    callback_ = std::move(callback);
}

bool TransferServer::Start(const std::string& address, std::uint16_t port) {
    if (running_) {
        spdlog::warn("Receiver is already running.");
        return false;
    }

    try {
        std::filesystem::create_directories(options_.save_dir);

        tcp::endpoint endpoint(net::ip::make_address(address), port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
        port_ = acceptor_.local_endpoint().port();
        running_ = true;
        spdlog::info("Receiver listening on {}:{}, saving to {}",
                     address,
                     port_.load(),
                     options_.save_dir.string());

        net::co_spawn(acceptor_.get_executor(), acceptConnections(), net::detached);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to start receiver on {}:{}: {}", address, port, e.what());
        running_ = false;
        boost::system::error_code ec;
        acceptor_.close(ec);
        return false;
    }
}

void TransferServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    net::post(acceptor_.get_executor(), [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });
    spdlog::info("Receiver stopped accepting connections.");
}

void TransferServer::Shutdown() {
    Stop();

    std::vector<std::shared_ptr<tcp::socket>> sockets;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto& [id, socket] : connections_) {
            sockets.push_back(socket);
        }
    }
    for (auto& socket : sockets) {
        net::post(socket->get_executor(), [socket]() { CloseSocket(*socket); });
    }
    if (!sockets.empty()) {
        spdlog::warn("Closing {} in-flight transfer(s).", sockets.size());
    }
}

net::awaitable<void> TransferServer::Drain(std::chrono::steady_clock::duration grace) {
    Stop();

    auto deadline = std::chrono::steady_clock::now() + grace;
    net::steady_timer timer(co_await net::this_coro::executor);
    while (active_connections() > 0 && std::chrono::steady_clock::now() < deadline) {
        spdlog::debug("Waiting for {} transfer(s) to finish", active_connections());
        timer.expires_after(std::chrono::milliseconds(100));
        co_await timer.async_wait(net::use_awaitable);
    }
    Shutdown();
}

std::size_t TransferServer::active_connections() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

net::awaitable<void> TransferServer::acceptConnections() {
    while (running_) {
        // Every connection gets its own strand
        tcp::socket socket(net::make_strand(io_context_));
        boost::system::error_code ec;
        co_await acceptor_.async_accept(socket, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
                spdlog::debug("Accept operation cancelled.");
                break;
            }
            spdlog::error("Error accepting connection: {}", ec.message());
            continue;
        }

        auto shared = std::make_shared<tcp::socket>(std::move(socket));
        std::uint64_t connection_id;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connection_id = next_connection_id_++;
            connections_.emplace(connection_id, shared);
        }
        net::co_spawn(shared->get_executor(),
                      handleConnection(shared, connection_id),
                      net::detached);
    }
    spdlog::info("Receiver stopped accepting connections.");
}

net::awaitable<void> TransferServer::handleConnection(std::shared_ptr<tcp::socket> socket,
                                                      std::uint64_t connection_id) {
    try {
        ReceiveSession session(*socket, options_, callback_);
        ReceiveState state = co_await session.Run();
        spdlog::debug("[{}] Connection finished in state {}",
                      session.transfer_id(),
                      ReceiveStateToString(state));
    } catch (const std::exception& e) {
        spdlog::error("Receive connection error: {}", e.what());
    }

    CloseSocket(*socket);
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(connection_id);
}

} // namespace filerelay::core
