#pragma once

#include "../session_status.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace filerelay::core {

struct SessionSummaryDto {
    std::string id_prefix; // first characters of the session id, not usable as one
    std::string destination; // host:port
    std::string filename;
    std::string save_as;
    std::uint64_t declared_size;
    std::uint64_t bytes_forwarded;
    SessionStatus status;
    bool busy;
    std::int64_t age_seconds;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(SessionSummaryDto,
                                   id_prefix,
                                   destination,
                                   filename,
                                   save_as,
                                   declared_size,
                                   bytes_forwarded,
                                   status,
                                   busy,
                                   age_seconds);
};

} // namespace filerelay::core
