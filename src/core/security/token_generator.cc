#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <core/security/token_generator.h>
#include <iomanip>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace filerelay::core {

std::string GenerateSessionToken(std::size_t num_bytes) {
    std::vector<unsigned char> bytes(num_bytes);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error(std::string("RAND_bytes failed: ")
                                 + ERR_error_string(ERR_get_error(), nullptr));
    }

    std::stringstream ss;
    for (unsigned char byte : bytes) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return ss.str();
}

std::string GenerateTransferId() {
    boost::uuids::random_generator uuid_gen;
    return boost::uuids::to_string(uuid_gen());
}

} // namespace filerelay::core
