#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <core/network/server/http_server.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace filerelay::core {

HttpServer::HttpServer(net::io_context& io_context, std::size_t body_limit)
    : io_context_(io_context)
    , body_limit_(body_limit)
    , acceptor_(net::make_strand(io_context))
    , running_(false)
    , port_(0) {}

HttpServer::~HttpServer() {
    if (running_) {
        Stop();
    }
}

void HttpServer::AddRoute(const std::string& path,
                          http::verb method,
                          BinaryRequestHandler&& handler) {
    routes_[path] = {method, RequestType::kBinary, std::move(handler)};
    spdlog::debug("Added route: {} {}", std::string(http::to_string(method)), path);
}

void HttpServer::AddRoute(const std::string& path,
                          http::verb method,
                          StringRequestHandler&& handler) {
    routes_[path] = {method, RequestType::kString, std::move(handler)};
    spdlog::debug("Added route: {} {}", std::string(http::to_string(method)), path);
}

bool HttpServer::Start(const std::string& address, std::uint16_t port) {
    if (running_) {
        spdlog::warn("Server is already running.");
        return false;
    }

    try {
        tcp::endpoint endpoint(net::ip::make_address(address), port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
        port_ = acceptor_.local_endpoint().port();
        running_ = true;
        spdlog::info("HTTP server started on {}:{}", address, port_.load());

        net::co_spawn(acceptor_.get_executor(), acceptConnections(), net::detached);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to start server on {}:{}: {}", address, port, e.what());
        running_ = false;
        boost::system::error_code ec;
        acceptor_.close(ec);
        return false;
    }
}

void HttpServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    net::post(acceptor_.get_executor(), [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });

    std::vector<std::shared_ptr<beast::tcp_stream>> streams;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto& [id, stream] : connections_) {
            streams.push_back(stream);
        }
    }
    for (auto& stream : streams) {
        net::post(stream->get_executor(), [stream]() { stream->close(); });
    }
    spdlog::info("HTTP server stopped.");
}

HttpResponse HttpServer::Json(http::status status,
                              unsigned int version,
                              bool keep_alive,
                              const nlohmann::json& body) {
    HttpResponse res{status, version};
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.keep_alive(keep_alive);
    res.set(http::field::content_type, "application/json");
    res.body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

HttpResponse HttpServer::Error(http::status status,
                               unsigned int version,
                               bool keep_alive,
                               std::string_view error_message) {
    return Json(status,
                version,
                keep_alive,
                nlohmann::json{{"status", "ERROR"}, {"message", error_message}});
}

HttpResponse HttpServer::Ok(unsigned int version, bool keep_alive, const nlohmann::json& body) {
    return Json(http::status::ok, version, keep_alive, body);
}

HttpResponse HttpServer::NotFound(unsigned int version,
                                  bool keep_alive,
                                  std::string_view error_message) {
    return Error(http::status::not_found, version, keep_alive, error_message);
}

HttpResponse HttpServer::BadRequest(unsigned int version,
                                    bool keep_alive,
                                    std::string_view error_message) {
    return Error(http::status::bad_request, version, keep_alive, error_message);
}

HttpResponse HttpServer::InternalServerError(unsigned int version,
                                             bool keep_alive,
                                             std::string_view error_message) {
    return Error(http::status::internal_server_error, version, keep_alive, error_message);
}

HttpResponse HttpServer::MethodNotAllowed(unsigned int version,
                                          bool keep_alive,
                                          std::string_view error_message) {
    return Error(http::status::method_not_allowed, version, keep_alive, error_message);
}

net::awaitable<void> HttpServer::acceptConnections() {
    while (running_) {
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

        auto stream = std::make_shared<beast::tcp_stream>(std::move(socket));
        std::uint64_t connection_id;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connection_id = next_connection_id_++;
            connections_.emplace(connection_id, stream);
        }
        net::co_spawn(stream->get_executor(),
                      handleConnection(stream, connection_id),
                      net::detached);
    }
    spdlog::info("Stopped accepting connections.");
}

net::awaitable<void> HttpServer::handleConnection(std::shared_ptr<beast::tcp_stream> stream,
                                                  std::uint64_t connection_id) {
    try {
        auto endpoint = stream->socket().remote_endpoint();
        spdlog::debug("New connection from: {}:{}", endpoint.address().to_string(), endpoint.port());

        beast::flat_buffer buffer;
        bool keep_alive = true;

        while (keep_alive) {
            stream->expires_after(transfer::kHttpIdleTimeout);

            http::request_parser<http::vector_body<std::uint8_t>> parser;
            parser.body_limit(body_limit_);

            beast::error_code ec;
            co_await http::async_read(*stream,
                                      buffer,
                                      parser,
                                      net::redirect_error(net::use_awaitable, ec));
            if (ec == http::error::body_limit) {
                spdlog::warn("Request body over {} bytes from {}:{}",
                             body_limit_,
                             endpoint.address().to_string(),
                             endpoint.port());
                auto res = Error(http::status::payload_too_large,
                                 parser.get().version(),
                                 false,
                                 "Request body too large");
                co_await http::async_write(*stream, res, net::redirect_error(net::use_awaitable, ec));
                break;
            }
            if (ec) {
                if (ec == http::error::end_of_stream || ec == beast::error::timeout
                    || ec == net::error::eof || ec == net::error::operation_aborted) {
                    spdlog::debug("Connection closed: {}", ec.message());
                } else {
                    spdlog::warn("Failed to read request: {}", ec.message());
                }
                break;
            }

            auto req = parser.release();
            spdlog::debug("Received {} request for {}",
                          std::string(req.method_string()),
                          std::string(req.target()));
            keep_alive = req.keep_alive();

            // Handlers may wait on a receiver for a long time
            stream->expires_never();
            HttpResponse res = co_await handleRequest(std::move(req));

            stream->expires_after(transfer::kHttpIdleTimeout);
            co_await http::async_write(*stream, res, net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                spdlog::debug("Failed to write response: {}", ec.message());
                break;
            }
        }

        beast::error_code ec;
        stream->socket().shutdown(tcp::socket::shutdown_send, ec);
    } catch (const std::exception& e) {
        spdlog::error("Session error: {}", e.what());
    }

    stream->close();
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(connection_id);
}

net::awaitable<HttpResponse> HttpServer::handleRequest(HttpRequest&& req) {
    auto target = req.target();
    std::string path(target.data(), std::min(target.size(), target.find('?')));
    auto it = routes_.find(path);

    if (it == routes_.end()) {
        spdlog::warn("Route not found: {}", path);
        co_return NotFound(req.version(), req.keep_alive());
    }

    const auto& route_info = it->second;
    if (route_info.method != req.method()) {
        spdlog::warn("Method not allowed for route {}: requested {}, expected {}",
                     path,
                     std::string(http::to_string(req.method())),
                     std::string(http::to_string(route_info.method)));
        co_return MethodNotAllowed(req.version(), req.keep_alive());
    }

    auto request_version = req.version();
    bool request_keep_alive = req.keep_alive();

    try {
        HttpResponse res;
        if (route_info.type == RequestType::kString) {
            auto handler = std::get<StringRequestHandler>(route_info.handler);
            res = co_await handler(binaryToStringRequest(req));
        } else {
            auto handler = std::get<BinaryRequestHandler>(route_info.handler);
            res = co_await handler(std::move(req));
        }
        co_return res;
    } catch (const std::exception& e) {
        spdlog::error("Error executing handler for {}: {}", path, e.what());
        co_return InternalServerError(request_version, request_keep_alive, e.what());
    }
}

StringRequest HttpServer::binaryToStringRequest(const BinaryRequest& req) {
    StringRequest string_req;
    string_req.method(req.method());
    string_req.target(req.target());
    string_req.version(req.version());

    for (auto const& field : req) {
        string_req.set(field.name_string(), field.value());
    }

    string_req.body().assign(reinterpret_cast<const char*>(req.body().data()), req.body().size());
    string_req.prepare_payload();

    return string_req;
}

} // namespace filerelay::core
