#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/status.hpp>
#include <core/model/transfer_error.h>
#include <core/network/client/session_relay.h>
#include <core/network/server/http_server.h>

namespace filerelay::core {

// validation/conservation -> 400, unknown session -> 404, busy -> 409,
// upstream connection or framing -> 502, anything else -> 500
boost::beast::http::status HttpStatusFor(ErrorKind kind);

// Exposes SessionRelay as POST /begin, /chunk, /end and /cancel
class RelayController {
public:
    RelayController(HttpServer& server, SessionRelay& relay);
    ~RelayController() = default;

private:
    boost::asio::awaitable<HttpResponse> onBegin(const StringRequest& req);

    // By value, the body is handed to the relay without a copy
    boost::asio::awaitable<HttpResponse> onChunk(BinaryRequest req);

    boost::asio::awaitable<HttpResponse> onEnd(const StringRequest& req);

    boost::asio::awaitable<HttpResponse> onCancel(const StringRequest& req);

    void installRoutes(HttpServer& server);

    SessionRelay& relay_;
};

} // namespace filerelay::core
