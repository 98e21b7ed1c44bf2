#include <utility>

#include "sealbox/EnvelopeParameterSpec.hpp"
#include "sealbox/SealboxException.hpp"

namespace sealbox {

static constexpr size_t VERSION_LENGTH = 1;
// One spec opens envelopes of every suite, so chunks stay AES-block aligned.
static constexpr size_t CHUNK_ALIGNMENT = 16;

const EnvelopeParameterSpec EnvelopeParameterSpec::AES256_CBC_HMAC_SHA512_1M = EnvelopeParameterSpec(
    CipherSuite::fromType(CipherSuiteType::AES_256_CBC_HMAC_SHA512),
    MIN_KDF_ITERATIONS,
    DEFAULT_CHUNK_SIZE
);

const EnvelopeParameterSpec EnvelopeParameterSpec::AES256_GCM_1M = EnvelopeParameterSpec(
    CipherSuite::fromType(CipherSuiteType::AES_256_GCM),
    MIN_KDF_ITERATIONS,
    DEFAULT_CHUNK_SIZE
);

EnvelopeParameterSpec::EnvelopeParameterSpec(
    const CipherSuite& cipherSuite,
    const uint32_t kdfIterations,
    const size_t chunkSize)
    : EnvelopeParameterSpec(cipherSuite, Hash::fromType(HashType::SHA256), kdfIterations, chunkSize,
                            std::nullopt) {
}

EnvelopeParameterSpec::EnvelopeParameterSpec(
    CipherSuite cipherSuite,
    Hash kdfHash,
    const uint32_t kdfIterations,
    const size_t chunkSize,
    const std::optional<uint32_t> kdfIterationFloorOverride)
    : cipherSuite_(std::move(cipherSuite)),
      kdfHash_(std::move(kdfHash)),
      kdfIterations_(kdfIterations),
      chunkSize_(chunkSize),
      kdfIterationFloorOverride_(kdfIterationFloorOverride) {

    const uint32_t floor = kdfIterationFloorOverride_.value_or(MIN_KDF_ITERATIONS);
    if (kdfIterations_ == 0 || kdfIterations_ < floor) {
        throw InvalidParameterException("kdfIterations must be at least " + std::to_string(floor) +
                                        ", got " + std::to_string(kdfIterations_));
    }
    if (chunkSize_ == 0 || chunkSize_ > MAX_CHUNK_SIZE) {
        throw InvalidParameterException("chunkSize must be in (0, " + std::to_string(MAX_CHUNK_SIZE) +
                                        "], got " + std::to_string(chunkSize_));
    }
    if (chunkSize_ % CHUNK_ALIGNMENT != 0) {
        throw InvalidParameterException("chunkSize must be a multiple of " + std::to_string(CHUNK_ALIGNMENT) +
                                        ", got " + std::to_string(chunkSize_));
    }
}

EnvelopeParameterSpec EnvelopeParameterSpec::withKdfIterations(const uint32_t kdfIterations) const {
    return {cipherSuite_, kdfHash_, kdfIterations, chunkSize_, kdfIterationFloorOverride_};
}

size_t EnvelopeParameterSpec::getHeaderLength() const {
    return VERSION_LENGTH + SALT_LENGTH + cipherSuite_.getIvLength();
}

uint64_t EnvelopeParameterSpec::getEnvelopeLength(const uint64_t plaintextLength) const {
    return getHeaderLength() +
           cipherSuite_.getCiphertextLength(plaintextLength) +
           cipherSuite_.getTagLength();
}

}
