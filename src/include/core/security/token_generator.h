#pragma once

#include <cstddef>
#include <string>

namespace filerelay::core {

// Hex-encoded bytes from OpenSSL's CSPRNG. A relay session id is the only thing
// standing between a caller and a live socket, so it must not be guessable.
std::string GenerateSessionToken(std::size_t num_bytes = 16);

// Random UUID used to tag a receiver connection in logs and feedback
std::string GenerateTransferId();

} // namespace filerelay::core
