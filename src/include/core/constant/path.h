#pragma once

#include <cstdlib>
#include <filesystem>

namespace filerelay::core {
namespace path {

inline const std::filesystem::path kHomeDir = []() -> std::filesystem::path {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        return std::filesystem::temp_directory_path();
    }
    return std::filesystem::path(home);
}();

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "filerelay"
                                             / "logs";

inline const std::filesystem::path kConfigDir = kHomeDir / ".config" / "filerelay";

inline const std::filesystem::path kDefaultReceiveDir = kHomeDir / "Downloads" / "filerelay";

} // namespace path
} // namespace filerelay::core
