#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace filerelay::core::feedback {

struct TransferEnded {
    std::string id;
    std::string filename;
    bool success;
    std::uint64_t bytes_transferred;
    std::string status; // DONE, ERROR, CANCELED ...
    std::string message;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(
        TransferEnded, id, filename, success, bytes_transferred, status, message);
};

} // namespace filerelay::core::feedback
