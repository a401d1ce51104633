#include <core/constant/route.h>
#include <core/network/server/controller/common_controller.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace net = boost::asio;
namespace http = boost::beast::http;
using json = nlohmann::json;

namespace filerelay::core {

CommonController::CommonController(HttpServer& server, const SessionRelay& relay)
    : relay_(relay) {
    installRoutes(server);
}

net::awaitable<HttpResponse> CommonController::onPing(const StringRequest& req) {
    spdlog::debug("CommonController::onPing");
    co_return HttpServer::Ok(req.version(), req.keep_alive(), json{{"status", "OK"}});
}

net::awaitable<HttpResponse> CommonController::onStatus(const StringRequest& req) {
    spdlog::debug("CommonController::onStatus");
    co_return HttpServer::Ok(req.version(),
                             req.keep_alive(),
                             json{{"status", "OK"}, {"sessions", relay_.ListSessions()}});
}

void CommonController::installRoutes(HttpServer& server) {
    server.AddRoute(std::string(ApiRoute::kPing),
                    http::verb::get,
                    StringRequestHandler(
                        std::bind(&CommonController::onPing, this, std::placeholders::_1)));
    server.AddRoute(std::string(ApiRoute::kStatus),
                    http::verb::get,
                    StringRequestHandler(
                        std::bind(&CommonController::onStatus, this, std::placeholders::_1)));
}

} // namespace filerelay::core
