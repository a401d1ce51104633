#include <charconv>
#include <core/constant/route.h>
#include <core/network/server/controller/relay_controller.h>
#include <core/util/request_target.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using json = nlohmann::json;

namespace filerelay::core {

namespace {

template <typename Integer>
std::optional<Integer> ParseInteger(std::string_view text) {
    Integer value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

template <typename Body>
std::optional<std::string> HeaderValue(const http::request<Body>& req, std::string_view name) {
    auto it = req.find(beast::string_view(name.data(), name.size()));
    if (it == req.end()) {
        return std::nullopt;
    }
    return std::string(it->value().data(), it->value().size());
}

template <typename Body>
std::optional<RequestTarget> Target(const http::request<Body>& req) {
    auto target = req.target();
    return ParseRequestTarget(std::string_view(target.data(), target.size()));
}

std::optional<std::string> SessionId(const RequestTarget& target) {
    auto it = target.params.find("id");
    if (it == target.params.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

template <typename Body>
HttpResponse ErrorResponse(const http::request<Body>& req, const TransferError& error) {
    return HttpServer::Error(HttpStatusFor(error.kind), req.version(), req.keep_alive(), error.message);
}

} // namespace

http::status HttpStatusFor(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::kValidation:
    case ErrorKind::kConservation:
        return http::status::bad_request;
    case ErrorKind::kUnknownSession:
        return http::status::not_found;
    case ErrorKind::kSessionBusy:
        return http::status::conflict;
    case ErrorKind::kConnection:
    case ErrorKind::kFraming:
        return http::status::bad_gateway;
    default:
        return http::status::internal_server_error;
    }
}

RelayController::RelayController(HttpServer& server, SessionRelay& relay)
    : relay_(relay) {
    installRoutes(server);
}

net::awaitable<HttpResponse> RelayController::onBegin(const StringRequest& req) {
    auto target = Target(req);
    if (!target) {
        co_return HttpServer::BadRequest(req.version(), req.keep_alive(), "Malformed query string");
    }

    std::string host;
    if (auto it = target->params.find("host"); it != target->params.end()) {
        host = it->second;
    }
    std::uint16_t port = 0;
    if (auto it = target->params.find("port"); it != target->params.end()) {
        auto parsed = ParseInteger<std::uint16_t>(it->second);
        if (!parsed) {
            co_return HttpServer::BadRequest(req.version(), req.keep_alive(), "Invalid port");
        }
        port = *parsed;
    }

    auto raw_filename = HeaderValue(req, ApiHeader::kFilename);
    auto filename = raw_filename ? PercentDecode(*raw_filename) : std::nullopt;
    if (!filename) {
        co_return HttpServer::BadRequest(req.version(),
                                         req.keep_alive(),
                                         "Missing or malformed X-Filename header");
    }
    auto raw_filesize = HeaderValue(req, ApiHeader::kFilesize);
    auto filesize = raw_filesize ? ParseInteger<std::int64_t>(*raw_filesize) : std::nullopt;
    if (!filesize) {
        co_return HttpServer::BadRequest(req.version(),
                                         req.keep_alive(),
                                         "Missing or invalid X-Filesize header");
    }

    auto result = co_await relay_.Begin(host, port, *filename, *filesize);
    if (!result) {
        co_return ErrorResponse(req, result.error());
    }
    co_return HttpServer::Ok(req.version(),
                             req.keep_alive(),
                             json{
                                 {"status", "OK"},
                                 {"session_id", result->session_id},
                                 {"save_as", result->save_as},
                             });
}

net::awaitable<HttpResponse> RelayController::onChunk(BinaryRequest req) {
    auto target = Target(req);
    auto session_id = target ? SessionId(*target) : std::nullopt;
    if (!session_id) {
        co_return HttpServer::BadRequest(req.version(), req.keep_alive(), "Missing session id");
    }

    auto result = co_await relay_.Chunk(*session_id, std::move(req.body()));
    if (!result) {
        co_return ErrorResponse(req, result.error());
    }
    json body = *result;
    body["status"] = "OK";
    co_return HttpServer::Ok(req.version(), req.keep_alive(), body);
}

net::awaitable<HttpResponse> RelayController::onEnd(const StringRequest& req) {
    auto target = Target(req);
    auto session_id = target ? SessionId(*target) : std::nullopt;
    if (!session_id) {
        co_return HttpServer::BadRequest(req.version(), req.keep_alive(), "Missing session id");
    }

    auto completion = co_await relay_.End(*session_id);
    if (!completion) {
        co_return ErrorResponse(req, completion.error());
    }
    co_return HttpServer::Json(completion->done() ? http::status::ok
                                                  : http::status::internal_server_error,
                               req.version(),
                               req.keep_alive(),
                               *completion);
}

net::awaitable<HttpResponse> RelayController::onCancel(const StringRequest& req) {
    auto target = Target(req);
    auto session_id = target ? SessionId(*target) : std::nullopt;
    if (!session_id) {
        co_return HttpServer::BadRequest(req.version(), req.keep_alive(), "Missing session id");
    }

    bool existed = relay_.Cancel(*session_id);
    co_return HttpServer::Ok(req.version(),
                             req.keep_alive(),
                             json{
                                 {"status", "OK"},
                                 {"message", existed ? "Canceled" : "No session"},
                             });
}

void RelayController::installRoutes(HttpServer& server) {
    server.AddRoute(std::string(ApiRoute::kBegin),
                    http::verb::post,
                    StringRequestHandler(
                        std::bind(&RelayController::onBegin, this, std::placeholders::_1)));
    server.AddRoute(std::string(ApiRoute::kChunk),
                    http::verb::post,
                    BinaryRequestHandler(
                        std::bind(&RelayController::onChunk, this, std::placeholders::_1)));
    server.AddRoute(std::string(ApiRoute::kEnd),
                    http::verb::post,
                    StringRequestHandler(
                        std::bind(&RelayController::onEnd, this, std::placeholders::_1)));
    server.AddRoute(std::string(ApiRoute::kCancel),
                    http::verb::post,
                    StringRequestHandler(
                        std::bind(&RelayController::onCancel, this, std::placeholders::_1)));
}

} // namespace filerelay::core
