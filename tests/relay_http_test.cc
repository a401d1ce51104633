/**
 * @file relay_http_test.cc
 * @brief End-to-end tests of the HTTP relay surface
 *
 * A synchronous Beast client talks to HttpServer with the common and relay
 * controllers installed, backed by a real receiver.
 */

#include "test_util.h"
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <core/network/client/session_relay.h>
#include <core/network/server/controller/common_controller.h>
#include <core/network/server/controller/relay_controller.h>
#include <core/network/server/http_server.h>
#include <core/network/server/transfer_server.h>
#include <gtest/gtest.h>
#include <map>

using namespace filerelay::core;
using namespace filerelay::test;
using json = nlohmann::json;
namespace beast = boost::beast;
namespace http = beast::http;

namespace {

struct Reply {
    http::status status;
    json body;
};

} // namespace

//=============================================================================
// Test Fixture
//=============================================================================

class RelayHttpTest : public ::testing::Test {
protected:
    IoContextRunner runner_{4};
    TempDir dir_;
    std::unique_ptr<TransferServer> receiver_;
    std::unique_ptr<SessionRelay> relay_;
    std::unique_ptr<HttpServer> http_;
    std::unique_ptr<CommonController> common_controller_;
    std::unique_ptr<RelayController> relay_controller_;

    void SetUp() override {
        ReceiverOptions options;
        options.save_dir = dir_.path();
        receiver_ = std::make_unique<TransferServer>(runner_.io_context(), std::move(options));
        ASSERT_TRUE(receiver_->Start("127.0.0.1", 0));

        relay_ = std::make_unique<SessionRelay>(runner_.io_context());
        http_ = std::make_unique<HttpServer>(runner_.io_context());
        common_controller_ = std::make_unique<CommonController>(*http_, *relay_);
        relay_controller_ = std::make_unique<RelayController>(*http_, *relay_);
        ASSERT_TRUE(http_->Start("127.0.0.1", 0));
    }

    void TearDown() override {
        if (http_) {
            http_->Stop();
        }
        if (relay_) {
            relay_->CancelAll();
        }
        if (receiver_) {
            receiver_->Shutdown();
        }
        runner_.Stop();
        relay_controller_.reset();
        common_controller_.reset();
        http_.reset();
        relay_.reset();
        receiver_.reset();
    }

    Reply Request(http::verb method,
                  const std::string& target,
                  const std::string& body = {},
                  const std::map<std::string, std::string>& headers = {}) {
        net::io_context io_context;
        beast::tcp_stream stream(io_context);
        stream.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), http_->port()));

        http::request<http::string_body> req{method, target, 11};
        req.set(http::field::host, "127.0.0.1");
        req.keep_alive(false);
        for (const auto& [name, value] : headers) {
            req.set(name, value);
        }
        req.body() = body;
        req.prepare_payload();
        http::write(stream, req);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(stream, buffer, res);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);

        return Reply{res.result(), json::parse(res.body(), nullptr, false)};
    }

    std::string BeginTarget() const {
        return "/begin?host=127.0.0.1&port=" + std::to_string(receiver_->port());
    }

    Reply Begin(const std::string& filename, const std::string& filesize) {
        return Request(http::verb::post,
                       BeginTarget(),
                       {},
                       {{"X-Filename", filename}, {"X-Filesize", filesize}});
    }
};

//=============================================================================
// Common routes
//=============================================================================

TEST_F(RelayHttpTest, PingAnswersOk) {
    auto reply = Request(http::verb::get, "/ping");

    EXPECT_EQ(reply.status, http::status::ok);
    EXPECT_EQ(reply.body["status"], "OK");
}

TEST_F(RelayHttpTest, UnknownRouteIsNotFound) {
    auto reply = Request(http::verb::get, "/nowhere");

    EXPECT_EQ(reply.status, http::status::not_found);
    EXPECT_EQ(reply.body["status"], "ERROR");
}

TEST_F(RelayHttpTest, WrongMethodIsRejected) {
    auto reply = Request(http::verb::get, "/begin");

    EXPECT_EQ(reply.status, http::status::method_not_allowed);
}

TEST_F(RelayHttpTest, StatusListsOpenSessions) {
    auto begun = Begin("listed.txt", "3");
    ASSERT_EQ(begun.status, http::status::ok);

    auto reply = Request(http::verb::get, "/status");

    ASSERT_EQ(reply.status, http::status::ok);
    ASSERT_EQ(reply.body["sessions"].size(), 1u);
    EXPECT_EQ(reply.body["sessions"][0]["filename"], "listed.txt");
    EXPECT_EQ(reply.body["sessions"][0]["declared_size"], 3);
}

/**
 * @test /status shows only a short prefix of each session id, and the prefix
 * does not open the session
 */
TEST_F(RelayHttpTest, StatusNeverExposesSessionIds) {
    auto begun = Begin("secret.txt", "3");
    ASSERT_EQ(begun.status, http::status::ok);
    std::string id = begun.body["session_id"];

    auto reply = Request(http::verb::get, "/status");

    ASSERT_EQ(reply.status, http::status::ok);
    ASSERT_EQ(reply.body["sessions"].size(), 1u);
    EXPECT_FALSE(reply.body["sessions"][0].contains("session_id"));
    EXPECT_EQ(reply.body["sessions"][0]["id_prefix"], id.substr(0, 8));
    EXPECT_EQ(reply.body.dump().find(id), std::string::npos);

    std::string prefix = reply.body["sessions"][0]["id_prefix"];
    EXPECT_EQ(Request(http::verb::post, "/chunk?id=" + prefix, "abc").status,
              http::status::not_found);
    EXPECT_EQ(Request(http::verb::post, "/cancel?id=" + prefix).body["message"], "No session");
    EXPECT_EQ(relay_->session_count(), 1u);
}

//=============================================================================
// Relay flow
//=============================================================================

/**
 * @test begin, two chunks and end produce the file on the receiver
 */
TEST_F(RelayHttpTest, FullRelayFlow) {
    auto begun = Begin("my%20file.txt", "10");
    ASSERT_EQ(begun.status, http::status::ok);
    EXPECT_EQ(begun.body["status"], "OK");
    EXPECT_EQ(begun.body["save_as"], "my file.txt");
    std::string id = begun.body["session_id"];

    auto first = Request(http::verb::post, "/chunk?id=" + id, "Hello,");
    ASSERT_EQ(first.status, http::status::ok);
    EXPECT_EQ(first.body["received"], 6);
    EXPECT_EQ(first.body["remaining"], 4);

    auto second = Request(http::verb::post, "/chunk?id=" + id, "Worl");
    ASSERT_EQ(second.status, http::status::ok);
    EXPECT_EQ(second.body["remaining"], 0);

    auto ended = Request(http::verb::post, "/end?id=" + id);
    ASSERT_EQ(ended.status, http::status::ok);
    EXPECT_EQ(ended.body["status"], "DONE");
    EXPECT_EQ(ended.body["bytes_received"], 10);
    EXPECT_EQ(ReadFileContents(dir_ / "my file.txt"), "Hello,Worl");
}

TEST_F(RelayHttpTest, BinaryChunkIsForwardedVerbatim) {
    std::string payload;
    for (int i = 0; i < 256; ++i) {
        payload += static_cast<char>(i);
    }
    auto begun = Begin("bytes.bin", std::to_string(payload.size()));
    ASSERT_EQ(begun.status, http::status::ok);
    std::string id = begun.body["session_id"];

    ASSERT_EQ(Request(http::verb::post, "/chunk?id=" + id, payload).status, http::status::ok);
    ASSERT_EQ(Request(http::verb::post, "/end?id=" + id).status, http::status::ok);

    EXPECT_EQ(ReadFileContents(dir_ / "bytes.bin"), payload);
}

TEST_F(RelayHttpTest, FilenameHeaderIsPercentDecoded) {
    auto begun = Begin("r%C3%A9sum%C3%A9+v2%20final.txt", "0");
    ASSERT_EQ(begun.status, http::status::ok);
    EXPECT_EQ(begun.body["save_as"], "résumé+v2 final.txt");

    std::string id = begun.body["session_id"];
    ASSERT_EQ(Request(http::verb::post, "/end?id=" + id).status, http::status::ok);
    EXPECT_TRUE(std::filesystem::exists(dir_ / "résumé+v2 final.txt"));

    auto malformed = Begin("bad%zz.txt", "0");
    EXPECT_EQ(malformed.status, http::status::bad_request);
}

TEST_F(RelayHttpTest, OversizedChunkIsBadRequest) {
    auto begun = Begin("a.txt", "2");
    std::string id = begun.body["session_id"];

    auto reply = Request(http::verb::post, "/chunk?id=" + id, "abc");

    EXPECT_EQ(reply.status, http::status::bad_request);
    EXPECT_EQ(reply.body["status"], "ERROR");
    EXPECT_EQ(reply.body["message"], "Chunk of 3 bytes exceeds the remaining 2 of 2 declared bytes.");
}

TEST_F(RelayHttpTest, EarlyEndIsBadRequestAndKeepsSession) {
    auto begun = Begin("a.txt", "2");
    std::string id = begun.body["session_id"];

    auto early = Request(http::verb::post, "/end?id=" + id);
    EXPECT_EQ(early.status, http::status::bad_request);

    ASSERT_EQ(Request(http::verb::post, "/chunk?id=" + id, "ab").status, http::status::ok);
    EXPECT_EQ(Request(http::verb::post, "/end?id=" + id).status, http::status::ok);
}

TEST_F(RelayHttpTest, CancelReportsWhetherSessionExisted) {
    auto begun = Begin("a.txt", "5");
    std::string id = begun.body["session_id"];

    auto first = Request(http::verb::post, "/cancel?id=" + id);
    auto second = Request(http::verb::post, "/cancel?id=" + id);

    EXPECT_EQ(first.status, http::status::ok);
    EXPECT_EQ(first.body["message"], "Canceled");
    EXPECT_EQ(second.status, http::status::ok);
    EXPECT_EQ(second.body["message"], "No session");

    auto chunk = Request(http::verb::post, "/chunk?id=" + id, "x");
    EXPECT_EQ(chunk.status, http::status::not_found);
}

//=============================================================================
// Request errors
//=============================================================================

TEST_F(RelayHttpTest, BeginRequiresFilenameAndSize) {
    auto no_name = Request(http::verb::post, BeginTarget(), {}, {{"X-Filesize", "1"}});
    EXPECT_EQ(no_name.status, http::status::bad_request);
    EXPECT_EQ(no_name.body["message"], "Missing or malformed X-Filename header");

    auto bad_size = Begin("a.txt", "ten");
    EXPECT_EQ(bad_size.status, http::status::bad_request);
    EXPECT_EQ(bad_size.body["message"], "Missing or invalid X-Filesize header");

    auto negative = Begin("a.txt", "-4");
    EXPECT_EQ(negative.status, http::status::bad_request);
    EXPECT_EQ(negative.body["message"], "Filesize must be non-negative.");
}

TEST_F(RelayHttpTest, BeginRejectsBadPort) {
    auto reply = Request(http::verb::post,
                         "/begin?host=127.0.0.1&port=99999",
                         {},
                         {{"X-Filename", "a.txt"}, {"X-Filesize", "1"}});

    EXPECT_EQ(reply.status, http::status::bad_request);
    EXPECT_EQ(reply.body["message"], "Invalid port");
}

TEST_F(RelayHttpTest, ReceiverRefusalIsBadRequest) {
    auto reply = Begin("..%2Fescape.txt", "1");

    EXPECT_EQ(reply.status, http::status::bad_request);
    EXPECT_EQ(reply.body["message"], "Invalid filename.");
    EXPECT_EQ(relay_->session_count(), 0u);
}

TEST_F(RelayHttpTest, UnreachableReceiverIsBadGateway) {
    net::io_context io_context;
    tcp::acceptor unused(io_context, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    std::uint16_t port = unused.local_endpoint().port();
    unused.close();

    auto reply = Request(http::verb::post,
                         "/begin?host=127.0.0.1&port=" + std::to_string(port),
                         {},
                         {{"X-Filename", "a.txt"}, {"X-Filesize", "1"}});

    EXPECT_EQ(reply.status, http::status::bad_gateway);
}

TEST_F(RelayHttpTest, MissingSessionIdIsBadRequest) {
    for (const char* target : {"/chunk", "/end", "/cancel", "/end?id="}) {
        auto reply = Request(http::verb::post, target);
        EXPECT_EQ(reply.status, http::status::bad_request) << target;
        EXPECT_EQ(reply.body["message"], "Missing session id") << target;
    }
}

TEST_F(RelayHttpTest, UnknownSessionIsNotFound) {
    EXPECT_EQ(Request(http::verb::post, "/chunk?id=deadbeef", "x").status, http::status::not_found);
    EXPECT_EQ(Request(http::verb::post, "/end?id=deadbeef").status, http::status::not_found);
}

//=============================================================================
// Error mapping
//=============================================================================

TEST(HttpStatusForTest, MapsEveryErrorKind) {
    EXPECT_EQ(HttpStatusFor(ErrorKind::kValidation), http::status::bad_request);
    EXPECT_EQ(HttpStatusFor(ErrorKind::kConservation), http::status::bad_request);
    EXPECT_EQ(HttpStatusFor(ErrorKind::kUnknownSession), http::status::not_found);
    EXPECT_EQ(HttpStatusFor(ErrorKind::kSessionBusy), http::status::conflict);
    EXPECT_EQ(HttpStatusFor(ErrorKind::kConnection), http::status::bad_gateway);
    EXPECT_EQ(HttpStatusFor(ErrorKind::kFraming), http::status::bad_gateway);
    EXPECT_EQ(HttpStatusFor(ErrorKind::kIo), http::status::internal_server_error);
    EXPECT_EQ(HttpStatusFor(ErrorKind::kIntegrity), http::status::internal_server_error);
}
