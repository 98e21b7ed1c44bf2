#include "DerivedKey.hpp"
#include <openssl/crypto.h>
#include <utility>

namespace sealbox {

DerivedKey::DerivedKey(std::vector<uint8_t> keyData)
    : keyData_(std::move(keyData)) {
}

DerivedKey::~DerivedKey() {
    if (!keyData_.empty()) {
        OPENSSL_cleanse(keyData_.data(), keyData_.size());
    }
}

const std::vector<uint8_t>& DerivedKey::getKeyData() const {
    return keyData_;
}

}
