#pragma once

#include "feedback/feedback_type.h"
#include "feedback/transfer_ended.h"
#include "feedback/transfer_progress.h"
#include "feedback/transfer_started.h"
#include <functional>
#include <nlohmann/json.hpp>

namespace filerelay::core {

struct Feedback {
    FeedbackType type;
    nlohmann::json data;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Feedback, type, data);
};

// Invoked from I/O threads, implementations must be thread-safe
using FeedbackCallback = std::function<void(Feedback&&)>;

} // namespace filerelay::core
