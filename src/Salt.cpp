#include "Salt.hpp"
#include "sealbox/SealboxException.hpp"
#include <openssl/rand.h>

namespace sealbox {

Salt::Salt(const std::vector<uint8_t>& bytes) : bytes_(bytes) {
}

Salt Salt::generateRandom(const size_t saltLength) {
    std::vector<uint8_t> salt(saltLength);
    if (RAND_bytes(salt.data(), static_cast<int>(saltLength)) != 1) {
        throw SealboxException("Failed to generate random salt");
    }
    return Salt(salt);
}

const std::vector<uint8_t>& Salt::getBytes() const {
    return bytes_;
}

}
