#pragma once

#include <core/constant/transfer.h>
#include <core/model/header_message.h>
#include <core/model/transfer_error.h>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace filerelay::core {

struct ReceivePolicy {
    std::uint64_t max_file_size = transfer::kDefaultMaxFileSize;
    std::vector<std::string> allowed_extensions; // empty allows everything, e.g. {".txt", ".png"}
};

// Field presence and type check on a decoded header frame
Result<HeaderMessage> ParseHeader(const nlohmann::json& frame);

// Non-empty, no path separator, not "." or "..", no NUL
bool IsBareFilename(std::string_view filename);

Result<void> ValidateHeader(const HeaderMessage& header, const ReceivePolicy& policy);

} // namespace filerelay::core
