#include <algorithm>
#include <cctype>
#include <core/protocol/header_validator.h>
#include <filesystem>
#include <limits>
#include <spdlog/fmt/fmt.h>

using json = nlohmann::json;

namespace filerelay::core {

namespace {

std::string ToLower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

} // namespace

Result<HeaderMessage> ParseHeader(const json& frame) {
    auto filename = frame.find("filename");
    if (filename == frame.end() || !filename->is_string()) {
        return MakeError(ErrorKind::kValidation, "Header is missing a string \"filename\".");
    }
    auto filesize = frame.find("filesize");
    if (filesize == frame.end() || !filesize->is_number_integer()) {
        return MakeError(ErrorKind::kValidation, "Header is missing an integer \"filesize\".");
    }

    HeaderMessage header;
    header.filename = filename->get<std::string>();
    if (filesize->is_number_unsigned()
        && filesize->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return MakeError(ErrorKind::kValidation, "Filesize is out of range.");
    }
    header.filesize = filesize->get<std::int64_t>();
    return header;
}

bool IsBareFilename(std::string_view filename) {
    if (filename.empty() || filename == "." || filename == "..") {
        return false;
    }
    return filename.find_first_of(std::string_view("/\\\0", 3)) == std::string_view::npos;
}

Result<void> ValidateHeader(const HeaderMessage& header, const ReceivePolicy& policy) {
    if (header.filesize < 0) {
        return MakeError(ErrorKind::kValidation, "Filesize must be non-negative.");
    }
    if (static_cast<std::uint64_t>(header.filesize) > policy.max_file_size) {
        return MakeError(ErrorKind::kValidation,
                         fmt::format("File too large. Limit is {} bytes.", policy.max_file_size));
    }
    if (!IsBareFilename(header.filename)) {
        return MakeError(ErrorKind::kValidation, "Invalid filename.");
    }
    if (!policy.allowed_extensions.empty()) {
        std::string ext = ToLower(
            std::filesystem::path(header.filename).extension().string());
        bool allowed = std::any_of(policy.allowed_extensions.begin(),
                                   policy.allowed_extensions.end(),
                                   [&ext](const std::string& candidate) {
                                       return ToLower(candidate) == ext;
                                   });
        if (!allowed) {
            return MakeError(ErrorKind::kValidation,
                             fmt::format("Extension {} not allowed.", ext.empty() ? "(none)" : ext));
        }
    }
    return Result<void>{};
}

} // namespace filerelay::core
