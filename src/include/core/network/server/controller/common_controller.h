#pragma once

#include <boost/asio/awaitable.hpp>
#include <core/network/client/session_relay.h>
#include <core/network/server/http_server.h>

namespace filerelay::core {

// Liveness and session overview
class CommonController {
public:
    CommonController(HttpServer& server, const SessionRelay& relay);
    ~CommonController() = default;

private:
    boost::asio::awaitable<HttpResponse> onPing(const StringRequest& req);

    boost::asio::awaitable<HttpResponse> onStatus(const StringRequest& req);

    void installRoutes(HttpServer& server);

    const SessionRelay& relay_;
};

} // namespace filerelay::core
