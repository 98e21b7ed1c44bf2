#include "EnvelopeCodec.hpp"
#include "EnvelopeHeader.hpp"
#include "sealbox/SealboxException.hpp"

namespace sealbox {

EnvelopeCodec::~EnvelopeCodec() = default;

EnvelopeCodec::EnvelopeCodec(const CipherSuite& cipherSuite, const EnvelopeParameterSpec& parameterSpec)
    : cipherSuite_(cipherSuite),
      parameterSpec_(parameterSpec),
      keyDerivator_(parameterSpec_.getKdfHash()) {
}

uint64_t EnvelopeCodec::ciphertextLengthOf(const uint64_t envelopeLength,
                                           const uint64_t minimumCiphertextLength) const {
    const uint64_t fixedLength = EnvelopeHeader::lengthFor(cipherSuite_) + cipherSuite_.getTagLength();
    if (envelopeLength < fixedLength + minimumCiphertextLength) {
        throw IntegrityException();
    }
    return envelopeLength - fixedLength;
}

}
