#include <core/security/file_hasher.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace filerelay::core {

FileHasher::FileHasher()
    : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    reset();
}

void FileHasher::reset() {
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

void FileHasher::Update(std::span<const std::uint8_t> data) {
    if (!data.empty()) {
        EVP_DigestUpdate(ctx_.get(), data.data(), data.size());
    }
}

std::string FileHasher::HexDigest() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    EVP_DigestFinal_ex(ctx_.get(), hash, &hash_len);
    reset();

    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string FileHasher::CalculateFileChecksum(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file for checksum calculation");
    }

    FileHasher hasher;
    constexpr std::size_t buffer_size = 8192;
    std::vector<char> buffer(buffer_size);
    while (file) {
        file.read(buffer.data(), buffer_size);
        auto bytes_read = static_cast<std::size_t>(file.gcount());
        if (bytes_read > 0) {
            hasher.Update({reinterpret_cast<const std::uint8_t*>(buffer.data()), bytes_read});
        }
    }
    return hasher.HexDigest();
}

std::string FileHasher::CalculateDataChecksum(std::span<const std::uint8_t> data) {
    FileHasher hasher;
    hasher.Update(data);
    return hasher.HexDigest();
}

} // namespace filerelay::core
