#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/network/client/session_relay.h>
#include <core/security/token_generator.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;

namespace filerelay::core {

namespace {

// Session ids are credentials, keep them out of the logs
std::string ShortId(const std::string& session_id) {
    return session_id.substr(0, 8);
}

} // namespace

SessionRelay::SessionRelay(net::io_context& io_context,
                           RelayOptions options,
                           FeedbackCallback callback)
    : io_context_(io_context)
    , options_(options)
    , callback_(std::move(callback)) {}

SessionRelay::~SessionRelay() {
    CancelAll();
}

void SessionRelay::SetFeedbackCallback(FeedbackCallback callback) {
    callback_ = std::move(callback);
}

net::awaitable<Result<BeginResultDto>> SessionRelay::Begin(std::string host,
                                                           std::uint16_t port,
                                                           std::string filename,
                                                           std::int64_t filesize) {
    if (host.empty()) {
        co_return MakeError(ErrorKind::kValidation, "Missing destination host.");
    }
    if (port == 0) {
        co_return MakeError(ErrorKind::kValidation, "Missing destination port.");
    }
    if (filesize < 0) {
        co_return MakeError(ErrorKind::kValidation, "Filesize must be non-negative.");
    }

    auto session = std::make_shared<RelaySession>();
    session->destination = fmt::format("{}:{}", host, port);
    session->filename = filename;
    session->declared_size = static_cast<std::uint64_t>(filesize);
    session->client = std::make_unique<TransferClient>(net::make_strand(io_context_));

    auto acceptance = co_await net::co_spawn(session->client->get_executor(),
                                             handshake(session,
                                                       host,
                                                       port,
                                                       options_.connect_timeout),
                                             net::use_awaitable);
    if (!acceptance) {
        spdlog::warn("Relay begin to {} for '{}' failed: {}",
                     session->destination,
                     filename,
                     acceptance.error().message);
        co_return std::unexpected(acceptance.error());
    }

    session->id = GenerateSessionToken();
    session->save_as = acceptance->save_as;
    session->created_at = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.emplace(session->id, session);
    }

    spdlog::info("Relay session {} opened to {}: '{}' ({} bytes) saved as '{}'",
                 ShortId(session->id),
                 session->destination,
                 filename,
                 filesize,
                 session->save_as);
    reportStarted(*session);
    BeginResultDto result{.session_id = session->id, .save_as = session->save_as};
    co_return result;
}

net::awaitable<Result<ChunkResultDto>> SessionRelay::Chunk(std::string session_id,
                                                           std::vector<std::uint8_t> data) {
    const std::uint64_t size = data.size();
    SessionPtr session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto acquired = acquire(session_id);
        if (!acquired) {
            co_return std::unexpected(acquired.error());
        }
        session = *acquired;

        std::uint64_t remaining = session->declared_size - session->bytes_forwarded;
        if (size > remaining) {
            session->busy = false;
            co_return MakeError(ErrorKind::kConservation,
                                fmt::format("Chunk of {} bytes exceeds the remaining {} of {} "
                                            "declared bytes.",
                                            size,
                                            remaining,
                                            session->declared_size));
        }
    }

    Result<void> written{};
    if (size > 0) {
        written = co_await net::co_spawn(session->client->get_executor(),
                                         forward(session, std::move(data)),
                                         net::use_awaitable);
    }

    std::unique_lock<std::mutex> lock(mutex_);
    session->busy = false;
    if (!written) {
        // A concurrent cancel already removed and reported the session
        bool owned = discard(session);
        EndReport report;
        if (owned) {
            session->status = SessionStatus::kFailed;
            report = snapshot(*session);
        }
        lock.unlock();

        if (owned) {
            close(session);
            spdlog::error("Relay session {} to {} dropped after {} bytes: {}",
                          ShortId(session_id),
                          report.destination,
                          report.bytes_forwarded,
                          written.error().message);
            reportEnd(report, false, written.error().message);
        }
        co_return std::unexpected(written.error());
    }

    session->bytes_forwarded += size;
    if (session->status == SessionStatus::kCreated) {
        session->status = SessionStatus::kStreaming;
    }
    ChunkResultDto result{
        .received = session->bytes_forwarded,
        .remaining = session->declared_size - session->bytes_forwarded,
    };
    lock.unlock();

    spdlog::debug("Relay session {}: forwarded {} bytes, {} remaining",
                  ShortId(session_id),
                  size,
                  result.remaining);
    reportProgress(*session, result.received);
    co_return result;
}

net::awaitable<Result<CompletionMessage>> SessionRelay::End(std::string session_id) {
    SessionPtr session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto acquired = acquire(session_id);
        if (!acquired) {
            co_return std::unexpected(acquired.error());
        }
        session = *acquired;

        if (session->bytes_forwarded != session->declared_size) {
            session->busy = false;
            co_return MakeError(ErrorKind::kConservation,
                                fmt::format("Cannot end: forwarded {} of {} declared bytes.",
                                            session->bytes_forwarded,
                                            session->declared_size));
        }
    }

    auto completion = co_await net::co_spawn(session->client->get_executor(),
                                             finish(session),
                                             net::use_awaitable);

    bool done = completion && completion->done();
    bool owned;
    EndReport report;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session->busy = false;
        owned = discard(session);
        if (owned) {
            session->status = done ? SessionStatus::kCompleted : SessionStatus::kFailed;
            report = snapshot(*session);
        }
    }

    if (!completion) {
        if (owned) {
            spdlog::error("Relay session {} to {}: no completion: {}",
                          ShortId(session_id),
                          report.destination,
                          completion.error().message);
            reportEnd(report, false, completion.error().message);
        }
        co_return std::unexpected(completion.error());
    }
    if (!owned) {
        co_return *completion;
    }

    if (done) {
        spdlog::info("Relay session {} completed: '{}' ({} bytes)",
                     ShortId(session_id),
                     completion->saved_as,
                     completion->bytes_received);
    } else {
        spdlog::error("Relay session {}: receiver reported an error: {}",
                      ShortId(session_id),
                      completion->message);
    }
    reportEnd(report, done, completion->message);
    co_return *completion;
}

bool SessionRelay::Cancel(const std::string& session_id) {
    SessionPtr session;
    EndReport report;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }
        session = it->second;
        session->status = SessionStatus::kCanceled;
        report = snapshot(*session);
        sessions_.erase(it);
    }

    // Unblocks a chunk or end still writing/reading on this socket
    close(session);
    spdlog::info("Relay session {} to {} canceled after {} of {} bytes",
                 ShortId(session_id),
                 report.destination,
                 report.bytes_forwarded,
                 report.declared_size);
    reportEnd(report, false, "Canceled");
    return true;
}

std::size_t SessionRelay::CancelAll() {
    std::unordered_map<std::string, SessionPtr> sessions;
    std::vector<EndReport> reports;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
        reports.reserve(sessions.size());
        for (auto& [id, session] : sessions) {
            session->status = SessionStatus::kCanceled;
            reports.push_back(snapshot(*session));
        }
    }
    for (auto& [id, session] : sessions) {
        close(session);
    }
    for (const auto& report : reports) {
        reportEnd(report, false, "Canceled");
    }
    if (!sessions.empty()) {
        spdlog::info("Canceled {} relay session(s)", sessions.size());
    }
    return sessions.size();
}

std::vector<SessionSummaryDto> SessionRelay::ListSessions() const {
    auto now = std::chrono::steady_clock::now();
    std::vector<SessionSummaryDto> summaries;

    std::lock_guard<std::mutex> lock(mutex_);
    summaries.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        summaries.push_back(SessionSummaryDto{
            .id_prefix = ShortId(id),
            .destination = session->destination,
            .filename = session->filename,
            .save_as = session->save_as,
            .declared_size = session->declared_size,
            .bytes_forwarded = session->bytes_forwarded,
            .status = session->status,
            .busy = session->busy,
            .age_seconds = std::chrono::duration_cast<std::chrono::seconds>(now
                                                                            - session->created_at)
                               .count(),
        });
    }
    return summaries;
}

std::size_t SessionRelay::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

net::awaitable<Result<AcceptanceMessage>> SessionRelay::handshake(
    SessionPtr session,
    std::string host,
    std::uint16_t port,
    std::chrono::steady_clock::duration timeout) {
    if (auto connected = co_await session->client->Connect(host, port, timeout); !connected) {
        co_return std::unexpected(connected.error());
    }
    HeaderMessage header{
        .filename = session->filename,
        .filesize = static_cast<std::int64_t>(session->declared_size),
    };
    co_return co_await session->client->SendHeader(std::move(header));
}

net::awaitable<Result<void>> SessionRelay::forward(SessionPtr session,
                                                   std::vector<std::uint8_t> data) {
    co_return co_await session->client->WritePayload(data);
}

net::awaitable<Result<CompletionMessage>> SessionRelay::finish(SessionPtr session) {
    auto completion = co_await session->client->ReadCompletion();
    session->client->Close();
    co_return completion;
}

Result<SessionRelay::SessionPtr> SessionRelay::acquire(const std::string& session_id) {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return MakeError(ErrorKind::kUnknownSession, "Unknown session.");
    }
    if (it->second->busy) {
        return MakeError(ErrorKind::kSessionBusy,
                         "Another request for this session is still running.");
    }
    it->second->busy = true;
    return it->second;
}

bool SessionRelay::discard(const SessionPtr& session) {
    auto it = sessions_.find(session->id);
    if (it == sessions_.end() || it->second != session) {
        return false;
    }
    sessions_.erase(it);
    return true;
}

void SessionRelay::close(const SessionPtr& session) {
    net::post(session->client->get_executor(), [session]() { session->client->Close(); });
}

SessionRelay::EndReport SessionRelay::snapshot(const RelaySession& session) {
    return EndReport{
        .id = session.id,
        .destination = session.destination,
        .save_as = session.save_as,
        .declared_size = session.declared_size,
        .bytes_forwarded = session.bytes_forwarded,
        .status = session.status,
    };
}

void SessionRelay::reportStarted(const RelaySession& session) {
    feedback(Feedback{
        .type = FeedbackType::kRelaySessionStarted,
        .data = feedback::TransferStarted{
            .id = session.id,
            .peer = session.destination,
            .filename = session.filename,
            .save_as = session.save_as,
            .filesize = session.declared_size,
        },
    });
}

void SessionRelay::reportProgress(const RelaySession& session, std::uint64_t received) {
    feedback(Feedback{
        .type = FeedbackType::kRelayProgress,
        .data = feedback::TransferProgress{
            .id = session.id,
            .filename = session.save_as,
            .bytes_transferred = received,
            .total_bytes = session.declared_size,
            .progress = feedback::Percentage(received, session.declared_size),
        },
    });
}

void SessionRelay::reportEnd(const EndReport& report, bool success, std::string message) {
    const char* status = "FAILED";
    if (report.status == SessionStatus::kCompleted) {
        status = "COMPLETED";
    } else if (report.status == SessionStatus::kCanceled) {
        status = "CANCELED";
    }
    feedback(Feedback{
        .type = FeedbackType::kRelaySessionEnded,
        .data = feedback::TransferEnded{
            .id = report.id,
            .filename = report.save_as,
            .success = success,
            .bytes_transferred = report.bytes_forwarded,
            .status = status,
            .message = std::move(message),
        },
    });
}

} // namespace filerelay::core
