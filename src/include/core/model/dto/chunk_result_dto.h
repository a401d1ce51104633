#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>

namespace filerelay::core {

struct ChunkResultDto {
    std::uint64_t received;  // bytes forwarded so far
    std::uint64_t remaining; // declared size minus received

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ChunkResultDto, received, remaining);
};

} // namespace filerelay::core
