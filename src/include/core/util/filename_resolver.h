#pragma once

#include <core/model/transfer_error.h>
#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace filerelay::core {

struct FileCloser {
    void operator()(std::FILE* file) const {
        if (file) {
            std::fclose(file);
        }
    }
};

using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

struct ResolvedPath {
    std::filesystem::path path;
    bool renamed;
};

struct ReservedFile {
    std::filesystem::path path;
    bool renamed;
    FilePtr file; // opened for binary writing
};

// "report.txt", 0 -> "report.txt"; "report.txt", 2 -> "report (2).txt"
std::string CandidateName(std::string_view requested_name, std::size_t counter);

// Picks the first candidate that does not exist yet. Nothing is created, so two
// callers racing on the same directory can get the same answer; create the file
// right after resolving, or use ReserveSavePath.
ResolvedPath ResolveSavePath(const std::filesystem::path& dir, std::string_view requested_name);

// Same candidate order as ResolveSavePath, but each candidate is created with an
// exclusive open so a concurrent caller can never end up with the same file.
// Creates dir when it is missing.
Result<ReservedFile> ReserveSavePath(const std::filesystem::path& dir,
                                     std::string_view requested_name);

} // namespace filerelay::core
