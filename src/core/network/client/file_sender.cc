#include <algorithm>
#include <boost/asio/this_coro.hpp>
#include <core/network/client/file_sender.h>
#include <core/network/client/transfer_client.h>
#include <core/security/file_hasher.h>
#include <core/security/token_generator.h>
#include <fstream>
#include <limits>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace net = boost::asio;
namespace fs = std::filesystem;

namespace filerelay::core {

FileSender::FileSender(FeedbackCallback callback)
    : callback_(std::move(callback)) {}

void FileSender::SetFeedbackCallback(FeedbackCallback callback) {
    callback_ = std::move(callback);
}

net::awaitable<Result<CompletionMessage>> FileSender::SendFile(std::string host,
                                                               std::uint16_t port,
                                                               fs::path file_path,
                                                               SendOptions options) {
    std::error_code fs_ec;
    if (!fs::is_regular_file(file_path, fs_ec)) {
        co_return MakeError(ErrorKind::kIo, fmt::format("File not found: {}", file_path.string()));
    }
    std::uint64_t filesize = fs::file_size(file_path, fs_ec);
    if (fs_ec) {
        co_return MakeError(ErrorKind::kIo,
                            fmt::format("Cannot stat {}: {}", file_path.string(), fs_ec.message()));
    }
    if (filesize > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        co_return MakeError(ErrorKind::kValidation,
                            fmt::format("File too large: {}", file_path.string()));
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        co_return MakeError(ErrorKind::kIo, fmt::format("Cannot open {}", file_path.string()));
    }

    std::string remote_name = options.remote_name.empty() ? file_path.filename().string()
                                                          : options.remote_name;
    std::string id = GenerateTransferId();

    TransferClient client(co_await net::this_coro::executor);
    if (auto connected = co_await client.Connect(host, port, options.connect_timeout); !connected) {
        reportEnd(id, remote_name, false, 0, "ERROR", connected.error().message);
        co_return std::unexpected(connected.error());
    }

    HeaderMessage header{
        .filename = remote_name,
        .filesize = static_cast<std::int64_t>(filesize),
    };
    auto acceptance = co_await client.SendHeader(std::move(header));
    if (!acceptance) {
        spdlog::warn("[{}] {} refused '{}': {}",
                     id,
                     client.endpoint(),
                     remote_name,
                     acceptance.error().message);
        reportEnd(id, remote_name, false, 0, "REJECTED", acceptance.error().message);
        co_return std::unexpected(acceptance.error());
    }
    spdlog::info("[{}] Sending '{}' ({} bytes) to {} as '{}'",
                 id,
                 file_path.string(),
                 filesize,
                 client.endpoint(),
                 acceptance->save_as);

    FileHasher hasher;
    std::vector<std::uint8_t> buffer(std::max<std::size_t>(options.chunk_size, 1));
    std::uint64_t sent = 0;
    std::uint64_t next_progress = transfer::kProgressInterval;
    while (sent < filesize) {
        std::size_t want = static_cast<std::size_t>(
            std::min<std::uint64_t>(buffer.size(), filesize - sent));
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
        auto n = static_cast<std::size_t>(file.gcount());
        if (n == 0) {
            std::string reason = fmt::format("{} ended after {} of {} bytes",
                                             file_path.string(),
                                             sent,
                                             filesize);
            reportEnd(id, remote_name, false, sent, "ERROR", reason);
            co_return MakeError(ErrorKind::kIo, std::move(reason));
        }

        if (auto written = co_await client.WritePayload({buffer.data(), n}); !written) {
            reportEnd(id, remote_name, false, sent, "ERROR", written.error().message);
            co_return std::unexpected(written.error());
        }
        hasher.Update({buffer.data(), n});
        sent += n;

        if (sent >= next_progress || sent == filesize) {
            next_progress = sent + transfer::kProgressInterval;
            reportProgress(id, remote_name, sent, filesize);
        }
    }

    auto completion = co_await client.ReadCompletion();
    client.Close();
    if (!completion) {
        reportEnd(id, remote_name, false, sent, "ERROR", completion.error().message);
        co_return std::unexpected(completion.error());
    }

    if (completion->done()) {
        std::string local_digest = hasher.HexDigest();
        if (!completion->sha256.empty() && completion->sha256 != local_digest) {
            std::string reason = fmt::format("Digest mismatch for '{}': sent {}, receiver has {}",
                                             completion->saved_as,
                                             local_digest,
                                             completion->sha256);
            reportEnd(id, remote_name, false, sent, "ERROR", reason);
            co_return MakeError(ErrorKind::kIntegrity, std::move(reason));
        }
        spdlog::info("[{}] Receiver saved '{}' ({} bytes{})",
                     id,
                     completion->saved_as,
                     completion->bytes_received,
                     completion->renamed ? ", renamed" : "");
        reportEnd(id, completion->saved_as, true, sent, "DONE", completion->message);
    } else {
        spdlog::error("[{}] Receiver reported an error: {}", id, completion->message);
        reportEnd(id, remote_name, false, sent, "ERROR", completion->message);
    }
    co_return *completion;
}

void FileSender::reportProgress(const std::string& id,
                                const std::string& filename,
                                std::uint64_t bytes_sent,
                                std::uint64_t total_bytes) {
    feedback(Feedback{
        .type = FeedbackType::kSendProgress,
        .data = feedback::TransferProgress{
            .id = id,
            .filename = filename,
            .bytes_transferred = bytes_sent,
            .total_bytes = total_bytes,
            .progress = feedback::Percentage(bytes_sent, total_bytes),
        },
    });
}

void FileSender::reportEnd(const std::string& id,
                           const std::string& filename,
                           bool success,
                           std::uint64_t bytes_sent,
                           std::string status,
                           std::string message) {
    feedback(Feedback{
        .type = FeedbackType::kSendEnded,
        .data = feedback::TransferEnded{
            .id = id,
            .filename = filename,
            .success = success,
            .bytes_transferred = bytes_sent,
            .status = std::move(status),
            .message = std::move(message),
        },
    });
}

} // namespace filerelay::core
