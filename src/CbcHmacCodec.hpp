#pragma once

#include "EnvelopeCodec.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace sealbox {

class CipherIv;
class DerivedKey;
class MacAccumulator;
class Salt;

// AES-CBC encrypt-then-MAC with HMAC. The MAC covers `iv | ciphertext`, followed by
// `aad | uint64_be(bit length of aad)` only when associated data is supplied, and is
// checked before any byte is decrypted.
class CbcHmacCodec : public EnvelopeCodec {
public:
    CbcHmacCodec(const CipherSuite& cipherSuite, const EnvelopeParameterSpec& parameterSpec);
    ~CbcHmacCodec() override;

    void seal(
        const Credentials& credentials,
        ByteSource& plaintext,
        ByteSink& envelope,
        std::span<const uint8_t> aad) override;

    void open(
        const Credentials& credentials,
        ByteSource& envelope,
        ByteSink& plaintext,
        std::span<const uint8_t> aad) override;

    static void authenticateAssociatedData(MacAccumulator& mac, std::span<const uint8_t> aad);

#ifdef SEALBOX_TESTING
public:  // Expose only in test builds
#else
private:
#endif
    void sealWith(
        const Credentials& credentials,
        const Salt& salt,
        const CipherIv& iv,
        ByteSource& plaintext,
        ByteSink& envelope,
        std::span<const uint8_t> aad);

private:
    [[nodiscard]] std::vector<uint8_t> computeTag(
        const DerivedKey& macKey,
        const CipherIv& iv,
        ByteSource& envelope,
        uint64_t ciphertextLength,
        std::span<const uint8_t> aad) const;

    [[nodiscard]] size_t finalBlockPaddingLength(
        const DerivedKey& encryptionKey,
        const CipherIv& iv,
        ByteSource& envelope,
        uint64_t ciphertextLength) const;

    void decrypt(
        const KeyPair& keys,
        const CipherIv& iv,
        ByteSource& envelope,
        uint64_t ciphertextLength,
        size_t paddingLength,
        std::span<const uint8_t> storedTag,
        std::span<const uint8_t> aad,
        ByteSink& plaintext) const;
};

}
