#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace filerelay::core {

namespace transfer {

constexpr std::size_t kLengthPrefixSize = 8;           // big-endian uint64 before every frame
constexpr std::size_t kMaxFrameBodySize = 64 * 1024;   // control messages are tiny
constexpr std::size_t kDefaultIoChunkSize = 64 * 1024; // 64 KB
constexpr std::size_t kMaxRelayChunkSize = 32 * 1024 * 1024; // 32 MB
constexpr std::uint64_t kDefaultMaxFileSize = 2ULL * 1024 * 1024 * 1024; // 2 GB
constexpr std::uint64_t kProgressInterval = 1024 * 1024; // log roughly every MB

constexpr std::chrono::seconds kDefaultConnectTimeout{10};
constexpr std::chrono::seconds kDefaultShutdownGrace{10};
constexpr std::chrono::seconds kHttpIdleTimeout{30};

} // namespace transfer

} // namespace filerelay::core
