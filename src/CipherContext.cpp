#include "CipherContext.hpp"
#include "DerivedKey.hpp"
#include "sealbox/SealboxException.hpp"
#include <climits>

namespace sealbox {

CipherContext::CipherContext(const std::string& algorithmName,
                             const Direction direction,
                             const DerivedKey& key,
                             const std::span<const uint8_t> iv)
    : ctx_(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free),
      direction_(direction) {

    if (!ctx_) {
        throw SealboxException("Failed to create cipher context");
    }

    EVP_CIPHER* cipher = EVP_CIPHER_fetch(nullptr, algorithmName.c_str(), nullptr);
    if (!cipher) {
        throw SealboxException("Failed to fetch cipher: " + algorithmName);
    }
    std::unique_ptr<EVP_CIPHER, decltype(&EVP_CIPHER_free)> cipherGuard(cipher, EVP_CIPHER_free);

    if (key.size() != static_cast<size_t>(EVP_CIPHER_get_key_length(cipher))) {
        throw InvalidParameterException("invalid key length for " + algorithmName);
    }

    const int enc = direction == Direction::Encrypt ? 1 : 0;
    if (EVP_CipherInit_ex(ctx_.get(), cipher, nullptr, nullptr, nullptr, enc) != 1) {
        throw SealboxException("Failed to initialize cipher");
    }
    if (EVP_CIPHER_get_mode(cipher) == EVP_CIPH_GCM_MODE &&
        EVP_CIPHER_CTX_ctrl(ctx_.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1) {
        throw SealboxException("Failed to set nonce length");
    }
    if (EVP_CipherInit_ex(ctx_.get(), nullptr, nullptr, key.getKeyData().data(), iv.data(), enc) != 1) {
        throw SealboxException("Failed to set cipher key");
    }
}

void CipherContext::disablePadding() {
    if (EVP_CIPHER_CTX_set_padding(ctx_.get(), 0) != 1) {
        throw SealboxException("Failed to disable padding");
    }
}

void CipherContext::updateAad(const std::span<const uint8_t> aad) {
    if (aad.empty()) {
        return;
    }
    int len;
    if (EVP_CipherUpdate(ctx_.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
        throw SealboxException("Failed to set AAD");
    }
}

std::vector<uint8_t> CipherContext::update(const std::span<const uint8_t> input) {
    if (input.empty()) {
        return {};
    }
    if (input.size() > static_cast<size_t>(INT_MAX - EVP_MAX_BLOCK_LENGTH)) {
        throw InvalidParameterException("cipher input too large");
    }

    std::vector<uint8_t> output(input.size() + EVP_MAX_BLOCK_LENGTH);
    int len;
    if (EVP_CipherUpdate(ctx_.get(), output.data(), &len, input.data(), static_cast<int>(input.size())) != 1) {
        throw SealboxException(direction_ == Direction::Encrypt ? "Failed to encrypt data" : "Failed to decrypt data");
    }
    output.resize(static_cast<size_t>(len));
    return output;
}

std::vector<uint8_t> CipherContext::finish() {
    std::vector<uint8_t> output(EVP_MAX_BLOCK_LENGTH);
    int len;
    if (EVP_CipherFinal_ex(ctx_.get(), output.data(), &len) != 1) {
        if (direction_ == Direction::Decrypt) {
            throw IntegrityException();
        }
        throw SealboxException("Failed to finalize encryption");
    }
    output.resize(static_cast<size_t>(len));
    return output;
}

std::vector<uint8_t> CipherContext::getTag(const size_t tagLength) {
    std::vector<uint8_t> tag(tagLength);
    if (EVP_CIPHER_CTX_ctrl(ctx_.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(tagLength), tag.data()) != 1) {
        throw SealboxException("Failed to get authentication tag");
    }
    return tag;
}

void CipherContext::setTag(const std::span<const uint8_t> tag) {
    if (EVP_CIPHER_CTX_ctrl(ctx_.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(tag.size()),
                            const_cast<uint8_t*>(tag.data())) != 1) {
        throw SealboxException("Failed to set authentication tag");
    }
}

}
