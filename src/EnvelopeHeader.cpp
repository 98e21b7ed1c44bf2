#include "EnvelopeHeader.hpp"
#include "ByteStream.hpp"
#include "sealbox/CipherSuite.hpp"
#include "sealbox/EnvelopeParameterSpec.hpp"
#include "sealbox/SealboxException.hpp"
#include <utility>

namespace sealbox {

static constexpr size_t VERSION_LENGTH = 1;

EnvelopeHeader::EnvelopeHeader(const CipherSuite& cipherSuite, Salt salt, CipherIv iv)
    : cipherSuite_(cipherSuite),
      salt_(std::move(salt)),
      iv_(std::move(iv)) {

    if (salt_.getBytes().size() != EnvelopeParameterSpec::SALT_LENGTH) {
        throw InvalidParameterException("invalid salt length, expected " +
                                        std::to_string(EnvelopeParameterSpec::SALT_LENGTH) +
                                        ", got " + std::to_string(salt_.getBytes().size()));
    }
    if (iv_.getBytes().size() != cipherSuite_.getIvLength()) {
        throw InvalidParameterException("invalid IV length, expected " +
                                        std::to_string(cipherSuite_.getIvLength()) +
                                        ", got " + std::to_string(iv_.getBytes().size()));
    }
}

uint8_t EnvelopeHeader::readVersion(ByteSource& source) {
    std::vector<uint8_t> version(VERSION_LENGTH);
    if (!source.readFully(version)) {
        throw IntegrityException();
    }
    return version[0];
}

EnvelopeHeader EnvelopeHeader::readFields(ByteSource& source, const CipherSuite& cipherSuite) {
    std::vector<uint8_t> salt(EnvelopeParameterSpec::SALT_LENGTH);
    std::vector<uint8_t> iv(cipherSuite.getIvLength());
    if (!source.readFully(salt) || !source.readFully(iv)) {
        throw IntegrityException();
    }
    return {cipherSuite, Salt(salt), CipherIv(iv)};
}

size_t EnvelopeHeader::lengthFor(const CipherSuite& cipherSuite) {
    return VERSION_LENGTH + EnvelopeParameterSpec::SALT_LENGTH + cipherSuite.getIvLength();
}

std::vector<uint8_t> EnvelopeHeader::toBytes() const {
    std::vector<uint8_t> header;
    header.reserve(lengthFor(cipherSuite_));
    header.push_back(cipherSuite_.getVersion());
    header.insert(header.end(), salt_.getBytes().begin(), salt_.getBytes().end());
    header.insert(header.end(), iv_.getBytes().begin(), iv_.getBytes().end());
    return header;
}

}
