#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace filerelay::core {

// First frame of every transfer, sender to receiver.
struct HeaderMessage {
    std::string filename; // basename only
    std::int64_t filesize;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(HeaderMessage, filename, filesize);
};

} // namespace filerelay::core
