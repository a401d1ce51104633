#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <openssl/evp.h>
#include <span>
#include <string>

namespace filerelay::core {

// Incremental SHA-256, fed as payload bytes pass through
class FileHasher {
public:
    FileHasher();
    ~FileHasher() = default;
    FileHasher(const FileHasher&) = delete;
    FileHasher& operator=(const FileHasher&) = delete;
    FileHasher(FileHasher&&) = default;
    FileHasher& operator=(FileHasher&&) = default;

    void Update(std::span<const std::uint8_t> data);

    // Lower-case hex. Finalizes the digest; further updates start a new one.
    std::string HexDigest();

    static std::string CalculateFileChecksum(const std::filesystem::path& file_path);
    static std::string CalculateDataChecksum(std::span<const std::uint8_t> data);

private:
    struct ContextDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };

    void reset();

    std::unique_ptr<EVP_MD_CTX, ContextDeleter> ctx_;
};

} // namespace filerelay::core
