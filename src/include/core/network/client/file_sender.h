#pragma once

#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <core/constant/transfer.h>
#include <core/model.h>
#include <cstdint>
#include <filesystem>
#include <string>

namespace filerelay::core {

struct SendOptions {
    std::chrono::steady_clock::duration connect_timeout = transfer::kDefaultConnectTimeout;
    std::size_t chunk_size = transfer::kDefaultIoChunkSize;
    std::string remote_name; // empty sends the file's basename
};

// Streams one local file to a receiver. Runs on the awaiting coroutine's executor.
class FileSender {
public:
    explicit FileSender(FeedbackCallback callback = nullptr);
    ~FileSender() = default;

    // Any completion the receiver sends is returned, check done(). A DONE whose
    // digest differs from what was streamed becomes an integrity error.
    boost::asio::awaitable<Result<CompletionMessage>> SendFile(std::string host,
                                                               std::uint16_t port,
                                                               std::filesystem::path file_path,
                                                               SendOptions options = {});

    void SetFeedbackCallback(FeedbackCallback callback);

private:
    void reportProgress(const std::string& id,
                        const std::string& filename,
                        std::uint64_t bytes_sent,
                        std::uint64_t total_bytes);
    void reportEnd(const std::string& id,
                   const std::string& filename,
                   bool success,
                   std::uint64_t bytes_sent,
                   std::string status,
                   std::string message);

    FeedbackCallback callback_;

    void feedback(Feedback&& feedback) {
        if (callback_) {
            callback_(std::move(feedback));
        }
    }
};

} // namespace filerelay::core
