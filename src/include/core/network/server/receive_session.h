#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <core/constant/path.h>
#include <core/constant/transfer.h>
#include <core/model.h>
#include <core/protocol/header_validator.h>
#include <core/security/file_hasher.h>
#include <core/util/filename_resolver.h>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace filerelay::core {

struct ReceiverOptions {
    std::filesystem::path save_dir = path::kDefaultReceiveDir;
    ReceivePolicy policy;
    std::size_t io_chunk_size = transfer::kDefaultIoChunkSize;
};

// Receive side of one transfer over one accepted connection:
//
//   AWAIT_HEADER -> VALIDATING -> REJECTED
//                              -> ACCEPTED -> RECEIVING -> DONE | FAILED
//
// A header that cannot be read ends in FAILED without any reply. A payload cut
// short by the peer ends in FAILED without a completion frame and leaves the
// truncated file on disk.
class ReceiveSession {
public:
    ReceiveSession(boost::asio::ip::tcp::socket& socket,
                   const ReceiverOptions& options,
                   FeedbackCallback callback = nullptr);
    ~ReceiveSession() = default;
    ReceiveSession(const ReceiveSession&) = delete;
    ReceiveSession& operator=(const ReceiveSession&) = delete;

    // Drives the state machine to a terminal state. The caller closes the socket.
    boost::asio::awaitable<ReceiveState> Run();

    ReceiveState state() const { return state_; }
    const std::string& transfer_id() const { return transfer_id_; }

private:
    boost::asio::awaitable<bool> accept();
    boost::asio::awaitable<bool> receive();
    boost::asio::awaitable<void> complete();
    boost::asio::awaitable<void> reject(std::string reason);
    boost::asio::awaitable<void> fail(TransferError error, bool notify_peer);

    // Feedback is assembled outside the coroutine frames
    void reportStarted();
    void reportProgress();
    void reportEnded(bool success, std::string status, std::string message);

    boost::asio::ip::tcp::socket& socket_;
    const ReceiverOptions& options_;
    FeedbackCallback callback_;

    std::string transfer_id_;
    std::string peer_;
    ReceiveState state_{ReceiveState::kAwaitHeader};

    HeaderMessage header_{};
    std::optional<ReservedFile> output_;
    std::string save_name_;
    std::uint64_t bytes_received_{0};
    FileHasher hasher_;

    void feedback(Feedback&& feedback) {
        if (callback_) {
            callback_(std::move(feedback));
        }
    }
};

} // namespace filerelay::core
