#include "CipherIv.hpp"
#include "sealbox/SealboxException.hpp"
#include <openssl/rand.h>

namespace sealbox {

CipherIv::CipherIv(const std::vector<uint8_t>& bytes) : bytes_(bytes) {
}

CipherIv CipherIv::generateRandom(const size_t ivLength) {
    std::vector<uint8_t> iv(ivLength);
    if (RAND_bytes(iv.data(), static_cast<int>(ivLength)) != 1) {
        throw SealboxException("Failed to generate random IV");
    }
    return CipherIv(iv);
}

const std::vector<uint8_t>& CipherIv::getBytes() const {
    return bytes_;
}

}
