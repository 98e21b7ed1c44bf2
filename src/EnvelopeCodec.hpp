#pragma once

#include "KeyDerivator.hpp"
#include "sealbox/CipherSuite.hpp"
#include "sealbox/EnvelopeParameterSpec.hpp"
#include <cstdint>
#include <span>

namespace sealbox {

class ByteSink;
class ByteSource;
class Credentials;

// One cipher suite's seal/open. A codec instance serves a single call at a time; it
// holds no key material between calls.
class EnvelopeCodec {
public:
    virtual ~EnvelopeCodec();
    
    virtual void seal(
        const Credentials& credentials,
        ByteSource& plaintext,
        ByteSink& envelope,
        std::span<const uint8_t> aad) = 0;
    
    // `envelope` has already been positioned past the version byte.
    virtual void open(
        const Credentials& credentials,
        ByteSource& envelope,
        ByteSink& plaintext,
        std::span<const uint8_t> aad) = 0;

protected:
    EnvelopeCodec(const CipherSuite& cipherSuite, const EnvelopeParameterSpec& parameterSpec);

    // Length of the ciphertext field, or IntegrityException when the envelope is
    // shorter than its fixed fields plus `minimumCiphertextLength`.
    [[nodiscard]] uint64_t ciphertextLengthOf(uint64_t envelopeLength, uint64_t minimumCiphertextLength) const;

    const CipherSuite& cipherSuite_;
    EnvelopeParameterSpec parameterSpec_;
    KeyDerivator keyDerivator_;
};

}
