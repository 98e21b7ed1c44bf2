#pragma once

#include <openssl/evp.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace sealbox {

class DerivedKey;

// One EVP cipher operation, encrypting or decrypting, for CBC or GCM.
class CipherContext {
public:
    enum class Direction { Encrypt, Decrypt };

    CipherContext(const std::string& algorithmName, Direction direction,
                  const DerivedKey& key, std::span<const uint8_t> iv);

    CipherContext(const CipherContext&) = delete;
    CipherContext& operator=(const CipherContext&) = delete;

    // Padding is done by BlockPadder, never by OpenSSL.
    void disablePadding();

    void updateAad(std::span<const uint8_t> aad);

    [[nodiscard]] std::vector<uint8_t> update(std::span<const uint8_t> input);

    // Decryption that fails here (tag mismatch) throws IntegrityException.
    [[nodiscard]] std::vector<uint8_t> finish();

    [[nodiscard]] std::vector<uint8_t> getTag(size_t tagLength);
    void setTag(std::span<const uint8_t> tag);

private:
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> ctx_;
    Direction direction_;
};

}
