#include <cli/progress_display.h>
#include <iomanip>
#include <iostream>
#include <string>

namespace filerelay::cli {

namespace {

std::string ShortId(const std::string& id) {
    return id.substr(0, 8);
}

} // namespace

void ProgressDisplay::Handle(const core::Feedback& feedback) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        switch (feedback.type) {
        case core::FeedbackType::kReceiveStarted:
        case core::FeedbackType::kRelaySessionStarted:
            printStarted(feedback.data.get<core::feedback::TransferStarted>(),
                         feedback.type == core::FeedbackType::kRelaySessionStarted);
            break;
        case core::FeedbackType::kReceiveProgress:
        case core::FeedbackType::kRelayProgress:
        case core::FeedbackType::kSendProgress:
            printProgress(feedback.data.get<core::feedback::TransferProgress>());
            break;
        case core::FeedbackType::kReceiveEnded:
        case core::FeedbackType::kRelaySessionEnded:
        case core::FeedbackType::kSendEnded:
            printEnded(feedback.data.get<core::feedback::TransferEnded>());
            break;
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Unreadable feedback event: " << e.what() << std::endl;
    }
}

void ProgressDisplay::printStarted(const core::feedback::TransferStarted& started, bool relay) {
    clearLine();
    std::cout << "[" << ShortId(started.id) << "] " << (relay ? "Relaying '" : "Receiving '")
              << started.filename << "' (" << started.filesize << " bytes) "
              << (relay ? "to " : "from ") << started.peer << " as '" << started.save_as << "'"
              << std::endl;
}

void ProgressDisplay::printProgress(const core::feedback::TransferProgress& progress) {
    std::cout << "\r[" << ShortId(progress.id) << "] " << progress.filename << ": " << std::fixed
              << std::setprecision(1) << progress.progress << "% (" << progress.bytes_transferred
              << " / " << progress.total_bytes << " bytes)" << std::flush;
    progress_line_ = true;
}

void ProgressDisplay::printEnded(const core::feedback::TransferEnded& ended) {
    clearLine();
    std::cout << "[" << ShortId(ended.id) << "] " << ended.status << " '" << ended.filename
              << "' after " << ended.bytes_transferred << " bytes";
    if (!ended.message.empty()) {
        std::cout << ": " << ended.message;
    }
    std::cout << std::endl;
}

void ProgressDisplay::clearLine() {
    if (progress_line_) {
        std::cout << "\r" << std::string(100, ' ') << "\r" << std::flush;
        progress_line_ = false;
    }
}

} // namespace filerelay::cli
