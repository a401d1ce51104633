#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <core/constant/transfer.h>
#include <core/model.h>
#include <core/network/client/transfer_client.h>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace filerelay::core {

struct RelayOptions {
    std::chrono::steady_clock::duration connect_timeout = transfer::kDefaultConnectTimeout;
};

// Keeps receiver connections open across independent begin/chunk/end calls so
// a client that cannot hold a socket can stream a file piecewise.
//
// The table is one map under one mutex; payload bytes are forwarded outside the
// lock on the session's own strand. Each session id is an unguessable token and
// is the only credential for its session.
class SessionRelay {
public:
    explicit SessionRelay(boost::asio::io_context& io_context,
                          RelayOptions options = {},
                          FeedbackCallback callback = nullptr);
    ~SessionRelay();
    SessionRelay(const SessionRelay&) = delete;
    SessionRelay& operator=(const SessionRelay&) = delete;

    // Connects and runs the header handshake. A refusal creates no session and
    // comes back as a validation error with the receiver's reason.
    boost::asio::awaitable<Result<BeginResultDto>> Begin(std::string host,
                                                         std::uint16_t port,
                                                         std::string filename,
                                                         std::int64_t filesize);

    // Forwards data verbatim. Completes once the bytes are written to the socket.
    boost::asio::awaitable<Result<ChunkResultDto>> Chunk(std::string session_id,
                                                         std::vector<std::uint8_t> data);

    // Only valid once every declared byte went through; otherwise the session is
    // left open. On success the session is gone whatever the completion says.
    boost::asio::awaitable<Result<CompletionMessage>> End(std::string session_id);

    // Closes and discards. Returns whether the session existed; never fails.
    bool Cancel(const std::string& session_id);

    // Returns the number of sessions closed
    std::size_t CancelAll();

    std::vector<SessionSummaryDto> ListSessions() const;

    std::size_t session_count() const;

    void SetFeedbackCallback(FeedbackCallback callback);

private:
    struct RelaySession {
        std::string id;
        std::string destination; // host:port
        std::string filename;
        std::string save_as;
        std::uint64_t declared_size = 0;
        std::uint64_t bytes_forwarded = 0;
        SessionStatus status = SessionStatus::kCreated;
        bool busy = false; // a chunk or end is running
        std::chrono::steady_clock::time_point created_at;
        std::unique_ptr<TransferClient> client;
    };
    using SessionPtr = std::shared_ptr<RelaySession>;

    // Copied under mutex_ so an end is reported without touching the live session
    struct EndReport {
        std::string id;
        std::string destination;
        std::string save_as;
        std::uint64_t declared_size = 0;
        std::uint64_t bytes_forwarded = 0;
        SessionStatus status = SessionStatus::kFailed;
    };

    static boost::asio::awaitable<Result<AcceptanceMessage>> handshake(
        SessionPtr session,
        std::string host,
        std::uint16_t port,
        std::chrono::steady_clock::duration timeout);
    static boost::asio::awaitable<Result<void>> forward(SessionPtr session,
                                                        std::vector<std::uint8_t> data);
    static boost::asio::awaitable<Result<CompletionMessage>> finish(SessionPtr session);

    // Both expect mutex_ held. discard returns false when the session was already removed.
    Result<SessionPtr> acquire(const std::string& session_id);
    bool discard(const SessionPtr& session);

    void close(const SessionPtr& session);

    static EndReport snapshot(const RelaySession& session);
    void reportStarted(const RelaySession& session);
    void reportProgress(const RelaySession& session, std::uint64_t received);
    void reportEnd(const EndReport& report, bool success, std::string message);

    boost::asio::io_context& io_context_;
    RelayOptions options_;
    FeedbackCallback callback_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, SessionPtr> sessions_;

    void feedback(Feedback&& feedback) {
        if (callback_) {
            callback_(std::move(feedback));
        }
    }
};

} // namespace filerelay::core
