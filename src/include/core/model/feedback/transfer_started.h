#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace filerelay::core::feedback {

struct TransferStarted {
    std::string id; // receiver transfer id or relay session id
    std::string peer;
    std::string filename;
    std::string save_as;
    std::uint64_t filesize;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TransferStarted, id, peer, filename, save_as, filesize);
};

} // namespace filerelay::core::feedback
