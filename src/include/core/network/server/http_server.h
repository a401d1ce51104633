#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <core/constant/transfer.h>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace filerelay::core {

using StringRequest = boost::beast::http::request<boost::beast::http::string_body>;
using BinaryRequest = boost::beast::http::request<boost::beast::http::vector_body<std::uint8_t>>;

using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

using StringRequestHandler = std::function<boost::asio::awaitable<HttpResponse>(StringRequest&&)>;
using BinaryRequestHandler = std::function<boost::asio::awaitable<HttpResponse>(BinaryRequest&&)>;

using HttpRequest = BinaryRequest;

enum class RequestType {
    kString,
    kBinary,
};

struct RouteInfo {
    boost::beast::http::verb method;
    RequestType type;
    std::variant<StringRequestHandler, BinaryRequestHandler> handler;
};

// Keep-alive HTTP/1.1 server, one coroutine per connection. Routes match on the
// target's path, the query string is left to the handler.
class HttpServer {
public:
    explicit HttpServer(boost::asio::io_context& io_context,
                        std::size_t body_limit = transfer::kMaxRelayChunkSize);
    ~HttpServer();
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Register every route before Start
    void AddRoute(const std::string& path,
                  boost::beast::http::verb method,
                  BinaryRequestHandler&& handler);
    void AddRoute(const std::string& path,
                  boost::beast::http::verb method,
                  StringRequestHandler&& handler);

    // Port 0 binds an ephemeral port, see port()
    bool Start(const std::string& address, std::uint16_t port);

    // Stop accepting and close open connections
    void Stop();

    std::uint16_t port() const { return port_; }
    bool running() const { return running_; }

    // JSON responses. Errors are {"status":"ERROR","message":...}
    static HttpResponse Json(boost::beast::http::status status,
                             unsigned int version,
                             bool keep_alive,
                             const nlohmann::json& body);
    static HttpResponse Error(boost::beast::http::status status,
                              unsigned int version,
                              bool keep_alive,
                              std::string_view error_message);

    static HttpResponse Ok(unsigned int version, bool keep_alive, const nlohmann::json& body);
    static HttpResponse NotFound(unsigned int version,
                                 bool keep_alive,
                                 std::string_view error_message = "Not Found");
    static HttpResponse BadRequest(unsigned int version,
                                   bool keep_alive,
                                   std::string_view error_message = "Bad Request");
    static HttpResponse InternalServerError(
        unsigned int version,
        bool keep_alive,
        std::string_view error_message = "Internal Server Error");
    static HttpResponse MethodNotAllowed(unsigned int version,
                                         bool keep_alive,
                                         std::string_view error_message = "Method Not Allowed");

private:
    boost::asio::awaitable<void> acceptConnections();

    boost::asio::awaitable<void> handleConnection(
        std::shared_ptr<boost::beast::tcp_stream> stream, std::uint64_t connection_id);

    boost::asio::awaitable<HttpResponse> handleRequest(HttpRequest&& request);

    static StringRequest binaryToStringRequest(const BinaryRequest& req);

    boost::asio::io_context& io_context_;
    std::size_t body_limit_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::atomic<bool> running_;
    std::atomic<std::uint16_t> port_;
    std::map<std::string, RouteInfo> routes_;

    std::mutex connections_mutex_;
    std::uint64_t next_connection_id_ = 0;
    std::unordered_map<std::uint64_t, std::shared_ptr<boost::beast::tcp_stream>> connections_;
};

} // namespace filerelay::core
