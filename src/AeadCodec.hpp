#pragma once

#include "EnvelopeCodec.hpp"
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace sealbox {

class CipherIv;
class DerivedKey;
class EnvelopeHeader;
class Salt;

// AES-GCM. The tag covers the header bytes, the caller's associated data and the
// ciphertext; there is no padding.
class AeadCodec : public EnvelopeCodec {
public:
    AeadCodec(const CipherSuite& cipherSuite, const EnvelopeParameterSpec& parameterSpec);
    ~AeadCodec() override;

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

#ifdef SEALBOX_TESTING
public:  // Expose only in test builds
#else
private:
#endif
    void sealWith(
        const Credentials& credentials,
        const Salt& salt,
        const CipherIv& nonce,
        ByteSource& plaintext,
        ByteSink& envelope,
        std::span<const uint8_t> aad);

private:
    using ChunkConsumer = std::function<void(std::span<const uint8_t>)>;

    [[nodiscard]] DerivedKey deriveKey(const Credentials& credentials, const Salt& salt) const;

    // Decrypts the whole ciphertext, handing each plaintext chunk to `consumer`, and
    // throws IntegrityException if the tag does not verify at the end. The final
    // chunk reaches `consumer` only after the tag verified.
    void decryptPass(
        const DerivedKey& key,
        const EnvelopeHeader& header,
        ByteSource& envelope,
        uint64_t ciphertextLength,
        std::span<const uint8_t> tag,
        std::span<const uint8_t> aad,
        const ChunkConsumer& consumer) const;
};

}
