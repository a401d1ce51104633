#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace filerelay::core::feedback {

struct TransferProgress {
    std::string id;
    std::string filename;
    std::uint64_t bytes_transferred;
    std::uint64_t total_bytes;
    double progress; // percentage

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(
        TransferProgress, id, filename, bytes_transferred, total_bytes, progress);
};

inline double Percentage(std::uint64_t done, std::uint64_t total) {
    return total == 0 ? 100.0 : static_cast<double>(done) / static_cast<double>(total) * 100.0;
}

} // namespace filerelay::core::feedback
