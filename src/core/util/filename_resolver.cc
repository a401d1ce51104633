#include <cerrno>
#include <core/util/filename_resolver.h>
#include <cstring>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <system_error>

namespace fs = std::filesystem;

namespace filerelay::core {

namespace {

constexpr std::size_t kMaxCandidates = 100000;

} // namespace

std::string CandidateName(std::string_view requested_name, std::size_t counter) {
    if (counter == 0) {
        return std::string(requested_name);
    }
    fs::path name{std::string(requested_name)};
    return fmt::format("{} ({}){}", name.stem().string(), counter, name.extension().string());
}

ResolvedPath ResolveSavePath(const fs::path& dir, std::string_view requested_name) {
    std::size_t counter = 0;
    fs::path candidate = dir / CandidateName(requested_name, counter);
    std::error_code ec;
    while (fs::exists(candidate, ec)) {
        candidate = dir / CandidateName(requested_name, ++counter);
    }
    return ResolvedPath{candidate, counter != 0};
}

Result<ReservedFile> ReserveSavePath(const fs::path& dir, std::string_view requested_name) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return MakeError(ErrorKind::kIo,
                         fmt::format("Cannot create directory {}: {}", dir.string(), ec.message()));
    }

    for (std::size_t counter = 0; counter < kMaxCandidates; ++counter) {
        fs::path candidate = dir / CandidateName(requested_name, counter);
        // "x": fail with EEXIST instead of truncating somebody else's file
        std::FILE* file = std::fopen(candidate.c_str(), "wbx");
        if (file != nullptr) {
            if (counter != 0) {
                spdlog::debug("\"{}\" exists, saving as \"{}\"",
                              requested_name,
                              candidate.filename().string());
            }
            return ReservedFile{candidate, counter != 0, FilePtr(file)};
        }
        if (errno != EEXIST) {
            return MakeError(ErrorKind::kIo,
                             fmt::format("Cannot create {}: {}",
                                         candidate.string(),
                                         std::strerror(errno)));
        }
    }
    return MakeError(ErrorKind::kIo,
                     fmt::format("No free name for \"{}\" in {}", requested_name, dir.string()));
}

} // namespace filerelay::core
