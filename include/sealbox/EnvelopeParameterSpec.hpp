#pragma once

#include "sealbox/CipherSuite.hpp"
#include "sealbox/Hash.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>

namespace sealbox {

// Non-secret settings shared by sealer and opener. None of them is stored in the
// envelope except the cipher suite (as the version byte), so both sides must agree
// on the KDF iteration count. Immutable and threadsafe.
class EnvelopeParameterSpec {
public:
    static constexpr uint32_t MIN_KDF_ITERATIONS = 310000;
    static constexpr size_t SALT_LENGTH = 16;
    static constexpr size_t DEFAULT_CHUNK_SIZE = 1024 * 1024;
    static constexpr size_t MAX_CHUNK_SIZE = 1024 * 1024 * 1024;

    // AES-256-CBC with HMAC-SHA-512, PBKDF2-HMAC-SHA-256 at 310,000 iterations, 1 MiB chunks
    static const EnvelopeParameterSpec AES256_CBC_HMAC_SHA512_1M;
    // AES-256-GCM, PBKDF2-HMAC-SHA-256 at 310,000 iterations, 1 MiB chunks
    static const EnvelopeParameterSpec AES256_GCM_1M;

    EnvelopeParameterSpec(const CipherSuite& cipherSuite, uint32_t kdfIterations, size_t chunkSize);

    // Copy of this spec with a different iteration count, for raising the cost over time.
    [[nodiscard]] EnvelopeParameterSpec withKdfIterations(uint32_t kdfIterations) const;

    [[nodiscard]] const CipherSuite& getCipherSuite() const { return cipherSuite_; }
    [[nodiscard]] const Hash& getKdfHash() const { return kdfHash_; }
    [[nodiscard]] uint32_t getKdfIterations() const { return kdfIterations_; }
    [[nodiscard]] size_t getChunkSize() const { return chunkSize_; }

    // version, salt and IV/nonce
    [[nodiscard]] size_t getHeaderLength() const;

    // Exact number of bytes seal() produces for a plaintext of the given length.
    [[nodiscard]] uint64_t getEnvelopeLength(uint64_t plaintextLength) const;

#ifdef SEALBOX_TESTING
public:  // Expose only in test builds
#else
private:
#endif
    EnvelopeParameterSpec(
        CipherSuite cipherSuite,
        Hash kdfHash,
        uint32_t kdfIterations,
        size_t chunkSize,
        std::optional<uint32_t> kdfIterationFloorOverride);

private:
    CipherSuite cipherSuite_;
    Hash kdfHash_;
    uint32_t kdfIterations_;
    size_t chunkSize_;
    std::optional<uint32_t> kdfIterationFloorOverride_;
};

}
