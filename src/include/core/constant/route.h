#pragma once

#include <string_view>

namespace filerelay::core {

class ApiRoute {
public:
    static constexpr std::string_view kPing = "/ping";
    static constexpr std::string_view kStatus = "/status";
    static constexpr std::string_view kBegin = "/begin";
    static constexpr std::string_view kChunk = "/chunk";
    static constexpr std::string_view kEnd = "/end";
    static constexpr std::string_view kCancel = "/cancel";
};

class ApiHeader {
public:
    static constexpr std::string_view kFilename = "X-Filename";
    static constexpr std::string_view kFilesize = "X-Filesize";
};

} // namespace filerelay::core
