#include <algorithm>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cerrno>
#include <core/network/server/receive_session.h>
#include <core/protocol/frame_codec.h>
#include <core/security/token_generator.h>
#include <cstring>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace filerelay::core {

ReceiveSession::ReceiveSession(tcp::socket& socket,
                               const ReceiverOptions& options,
                               FeedbackCallback callback)
    : socket_(socket)
    , options_(options)
    , callback_(std::move(callback))
    , transfer_id_(GenerateTransferId()) {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    peer_ = ec ? std::string("unknown peer")
               : fmt::format("{}:{}", endpoint.address().to_string(), endpoint.port());
}

net::awaitable<ReceiveState> ReceiveSession::Run() {
    spdlog::info("[{}] Connected from {}", transfer_id_, peer_);

    auto frame = co_await ReadFrame(socket_);
    if (!frame) {
        co_await fail(frame.error(), false);
        co_return state_;
    }

    state_ = ReceiveState::kValidating;
    auto header = ParseHeader(*frame);
    if (!header) {
        co_await reject(header.error().message);
        co_return state_;
    }
    if (auto valid = ValidateHeader(*header, options_.policy); !valid) {
        co_await reject(valid.error().message);
        co_return state_;
    }
    header_ = std::move(*header);

    if (!co_await accept()) {
        co_return state_;
    }
    if (!co_await receive()) {
        co_return state_;
    }
    co_await complete();
    co_return state_;
}

net::awaitable<bool> ReceiveSession::accept() {
    auto reserved = ReserveSavePath(options_.save_dir, header_.filename);
    if (!reserved) {
        co_await reject(reserved.error().message);
        co_return false;
    }
    output_ = std::move(*reserved);
    save_name_ = output_->path.filename().string();
    state_ = ReceiveState::kAccepted;

    AcceptanceMessage acceptance{
        .status = AcceptanceStatus::kOk,
        .save_as = save_name_,
        .message = "Ready to receive",
    };
    if (auto written = co_await WriteFrame(socket_, acceptance); !written) {
        co_await fail(written.error(), false);
        co_return false;
    }

    spdlog::info("[{}] Receiving '{}' ({} bytes) from {} -> {}",
                 transfer_id_,
                 header_.filename,
                 header_.filesize,
                 peer_,
                 output_->path.string());
    reportStarted();
    co_return true;
}

net::awaitable<bool> ReceiveSession::receive() {
    state_ = ReceiveState::kReceiving;

    const auto filesize = static_cast<std::uint64_t>(header_.filesize);
    std::vector<std::uint8_t> buffer(std::max<std::size_t>(options_.io_chunk_size, 1));
    std::uint64_t remaining = filesize;
    std::uint64_t next_progress = transfer::kProgressInterval;

    while (remaining > 0) {
        std::size_t want = static_cast<std::size_t>(
            std::min<std::uint64_t>(buffer.size(), remaining));
        boost::system::error_code ec;
        std::size_t n = co_await socket_.async_read_some(net::buffer(buffer.data(), want),
                                                         net::redirect_error(net::use_awaitable,
                                                                             ec));
        if (ec) {
            std::string reason = ec == net::error::eof
                                     ? fmt::format("Connection closed after {} of {} bytes",
                                                   bytes_received_,
                                                   filesize)
                                     : fmt::format("Failed to read payload after {} bytes: {}",
                                                   bytes_received_,
                                                   ec.message());
            TransferError error{ErrorKind::kConnection, std::move(reason)};
            co_await fail(std::move(error), false);
            co_return false;
        }

        if (std::fwrite(buffer.data(), 1, n, output_->file.get()) != n) {
            TransferError error{ErrorKind::kIo,
                                fmt::format("Failed to write {}: {}",
                                            output_->path.string(),
                                            std::strerror(errno))};
            co_await fail(std::move(error), true);
            co_return false;
        }
        hasher_.Update({buffer.data(), n});
        bytes_received_ += n;
        remaining -= n;

        if (bytes_received_ >= next_progress) {
            reportProgress();
            next_progress = bytes_received_ + transfer::kProgressInterval;
        }
    }
    co_return true;
}

net::awaitable<void> ReceiveSession::complete() {
    if (std::fclose(output_->file.release()) != 0) {
        TransferError error{ErrorKind::kIo,
                            fmt::format("Failed to close {}: {}",
                                        output_->path.string(),
                                        std::strerror(errno))};
        co_await fail(std::move(error), true);
        co_return;
    }
    reportProgress();
    state_ = ReceiveState::kDone;

    CompletionMessage done{
        .status = CompletionStatus::kDone,
        .saved_as = save_name_,
        .bytes_received = bytes_received_,
        .renamed = output_->renamed,
        .message = "Received successfully",
        .sha256 = hasher_.HexDigest(),
    };
    if (auto written = co_await WriteFrame(socket_, done); !written) {
        // The file is complete on disk, only the notification got lost
        spdlog::warn("[{}] Saved '{}' but could not report completion: {}",
                     transfer_id_,
                     save_name_,
                     written.error().message);
    }

    spdlog::info("[{}] Done '{}' from {} -> saved as '{}' (sha256 {})",
                 transfer_id_,
                 header_.filename,
                 peer_,
                 save_name_,
                 done.sha256);
    reportEnded(true, "DONE", done.message);
}

net::awaitable<void> ReceiveSession::reject(std::string reason) {
    state_ = ReceiveState::kRejected;
    spdlog::warn("[{}] Validation error from {}: {}", transfer_id_, peer_, reason);

    AcceptanceMessage rejection{
        .status = AcceptanceStatus::kError,
        .save_as = {},
        .message = reason,
    };
    if (auto written = co_await WriteFrame(socket_, rejection); !written) {
        spdlog::debug("[{}] Rejection not delivered: {}", transfer_id_, written.error().message);
    }

    reportEnded(false, "REJECTED", std::move(reason));
}

net::awaitable<void> ReceiveSession::fail(TransferError error, bool notify_peer) {
    ReceiveState failed_in = state_;
    state_ = ReceiveState::kFailed;
    // Whatever was written stays on disk
    if (output_) {
        output_->file.reset();
    }
    spdlog::error("[{}] {} in {} from {}: {}",
                  transfer_id_,
                  ErrorKindToString(error.kind),
                  ReceiveStateToString(failed_in),
                  peer_,
                  error.message);

    if (notify_peer) {
        CompletionMessage failure{
            .status = CompletionStatus::kError,
            .saved_as = save_name_,
            .bytes_received = bytes_received_,
            .renamed = output_ && output_->renamed,
            .message = error.message,
            .sha256 = {},
        };
        if (auto written = co_await WriteFrame(socket_, failure); !written) {
            spdlog::debug("[{}] Failure not delivered: {}", transfer_id_, written.error().message);
        }
    }

    reportEnded(false, "ERROR", std::move(error.message));
}

void ReceiveSession::reportStarted() {
    feedback(Feedback{
        .type = FeedbackType::kReceiveStarted,
        .data = feedback::TransferStarted{
            .id = transfer_id_,
            .peer = peer_,
            .filename = header_.filename,
            .save_as = save_name_,
            .filesize = static_cast<std::uint64_t>(header_.filesize),
        },
    });
}

void ReceiveSession::reportProgress() {
    const auto filesize = static_cast<std::uint64_t>(header_.filesize);
    double progress = feedback::Percentage(bytes_received_, filesize);
    spdlog::info("[{}] Progress: {}/{} bytes ({:.2f}%)",
                 transfer_id_,
                 bytes_received_,
                 filesize,
                 progress);
    feedback(Feedback{
        .type = FeedbackType::kReceiveProgress,
        .data = feedback::TransferProgress{
            .id = transfer_id_,
            .filename = save_name_,
            .bytes_transferred = bytes_received_,
            .total_bytes = filesize,
            .progress = progress,
        },
    });
}

void ReceiveSession::reportEnded(bool success, std::string status, std::string message) {
    feedback(Feedback{
        .type = FeedbackType::kReceiveEnded,
        .data = feedback::TransferEnded{
            .id = transfer_id_,
            .filename = save_name_.empty() ? header_.filename : save_name_,
            .success = success,
            .bytes_transferred = bytes_received_,
            .status = std::move(status),
            .message = std::move(message),
        },
    });
}

} // namespace filerelay::core
