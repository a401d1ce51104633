#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace filerelay::core {

struct BeginResultDto {
    std::string session_id; // opaque token authorising chunk/end/cancel
    std::string save_as;    // name chosen by the receiver

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(BeginResultDto, session_id, save_as);
};

} // namespace filerelay::core
