#include <utility>

#include "sealbox/CipherSuite.hpp"
#include "sealbox/Hash.hpp"
#include "sealbox/SealboxException.hpp"
#include "AeadCodec.hpp"
#include "CbcHmacCodec.hpp"

namespace sealbox {

CipherSuite::CipherSuite(const CipherSuiteType type,
                         std::string algorithmName,
                         const size_t keyLength,
                         const size_t ivLength,
                         const size_t tagLength,
                         const size_t blockSize,
                         const Hash* macHash)
    : type_(type),
      algorithmName_(std::move(algorithmName)),
      keyLength_(keyLength),
      ivLength_(ivLength),
      tagLength_(tagLength),
      blockSize_(blockSize),
      macHash_(macHash) { }

const CipherSuite& CipherSuite::fromType(const CipherSuiteType type) {
    switch (type) {
        case CipherSuiteType::AES_256_CBC_HMAC_SHA512: {
            static const CipherSuite instance(type, "AES-256-CBC", 32, 16, 64, 16,
                                              &Hash::fromType(HashType::SHA512));
            return instance;
        }
        case CipherSuiteType::AES_256_GCM: {
            static const CipherSuite instance(type, "AES-256-GCM", 32, 12, 16, 1, nullptr);
            return instance;
        }
        default:
            throw InvalidParameterException("Unknown cipher suite");
    }
}

const CipherSuite& CipherSuite::fromVersion(const uint8_t version) {
    switch (version) {
        case static_cast<uint8_t>(CipherSuiteType::AES_256_CBC_HMAC_SHA512):
            return fromType(CipherSuiteType::AES_256_CBC_HMAC_SHA512);
        case static_cast<uint8_t>(CipherSuiteType::AES_256_GCM):
            return fromType(CipherSuiteType::AES_256_GCM);
        default:
            throw UnsupportedVersionException(version);
    }
}

size_t CipherSuite::getCiphertextLength(const size_t plaintextLength) const {
    if (macHash_ == nullptr) {
        return plaintextLength;
    }
    // Padding is always present, so an aligned plaintext gains a whole block.
    return (plaintextLength / blockSize_ + 1) * blockSize_;
}

std::unique_ptr<EnvelopeCodec> CipherSuite::createCodec(const EnvelopeParameterSpec& parameterSpec) const {
    if (macHash_ == nullptr) {
        return std::make_unique<AeadCodec>(fromType(type_), parameterSpec);
    }
    return std::make_unique<CbcHmacCodec>(fromType(type_), parameterSpec);
}

}
