#pragma once

#include <core/model/feedback.h>
#include <mutex>

namespace filerelay::cli {

// Renders feedback events on the terminal. Safe to call from I/O threads.
class ProgressDisplay {
public:
    ProgressDisplay() = default;
    ~ProgressDisplay() = default;

    void Handle(const core::Feedback& feedback);

    core::FeedbackCallback callback() {
        return [this](core::Feedback&& feedback) { Handle(feedback); };
    }

private:
    void printStarted(const core::feedback::TransferStarted& started, bool relay);
    void printProgress(const core::feedback::TransferProgress& progress);
    void printEnded(const core::feedback::TransferEnded& ended);
    void clearLine();

    std::mutex mutex_;
    bool progress_line_ = false;
};

} // namespace filerelay::cli
