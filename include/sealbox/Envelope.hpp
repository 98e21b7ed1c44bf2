#pragma once

#include "sealbox/EnvelopeParameterSpec.hpp"
#include <cstdint>
#include <iosfwd>
#include <span>
#include <vector>

namespace sealbox {

class Credentials;
class ByteSource;
class ByteSink;

// Seals data into, and opens data from, the versioned envelope
// `version | salt | iv or nonce | ciphertext | tag`.
//
// seal() always writes the version of the configured cipher suite. open() reads the
// version byte first and dispatches to the matching codec, so an Envelope configured
// for one suite still opens envelopes of the other; the KDF iteration count and
// chunk size always come from this object's parameter spec.
//
// Failures are reported with the exceptions in SealboxException.hpp. Opening never
// returns or writes plaintext unless the whole envelope authenticated.
// Immutable; one instance may serve concurrent calls.
class Envelope {
public:
    explicit Envelope(const EnvelopeParameterSpec& parameterSpec);
    ~Envelope();

    [[nodiscard]] std::vector<uint8_t> seal(
        const Credentials& credentials,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> aad = {}) const;

    // Reads the plaintext in chunks, so memory stays bounded for any input size.
    // The input stream does not need to be seekable.
    void seal(
        const Credentials& credentials,
        std::istream& plaintext,
        std::ostream& envelope,
        std::span<const uint8_t> aad = {}) const;

    [[nodiscard]] std::vector<uint8_t> open(
        const Credentials& credentials,
        std::span<const uint8_t> envelope,
        std::span<const uint8_t> aad = {}) const;

    // Makes two passes over the envelope (authenticate, then decrypt), so the input
    // stream must be seekable. Offsets are relative to the stream's position on entry.
    // The input must not change between the passes. The second pass authenticates
    // again and withholds the final chunk on a mismatch, but chunks before it have
    // already been written by then. Callers reading files that another process may
    // write should open a buffered copy instead.
    void open(
        const Credentials& credentials,
        std::istream& envelope,
        std::ostream& plaintext,
        std::span<const uint8_t> aad = {}) const;

    [[nodiscard]] uint64_t getEnvelopeLength(uint64_t plaintextLength) const;

    [[nodiscard]] const EnvelopeParameterSpec& getParameterSpec() const { return parameterSpec_; }

private:
    void sealFrom(const Credentials& credentials, ByteSource& plaintext, ByteSink& envelope,
                  std::span<const uint8_t> aad) const;
    void openFrom(const Credentials& credentials, ByteSource& envelope, ByteSink& plaintext,
                  std::span<const uint8_t> aad) const;

    EnvelopeParameterSpec parameterSpec_;
};

}
