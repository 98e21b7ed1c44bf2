#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace sealbox {

class EnvelopeCodec;
class EnvelopeParameterSpec;
class Hash;

// The enumerator value is the version byte written at the start of an envelope.
enum class CipherSuiteType : uint8_t {
    AES_256_CBC_HMAC_SHA512 = 0x01,
    AES_256_GCM = 0x02
};

class CipherSuite {
public:
    [[nodiscard]] static const CipherSuite& fromType(CipherSuiteType type);

    // Throws UnsupportedVersionException for any byte that names no suite.
    [[nodiscard]] static const CipherSuite& fromVersion(uint8_t version);
    
    [[nodiscard]] CipherSuiteType getType() const { return type_; }
    [[nodiscard]] uint8_t getVersion() const { return static_cast<uint8_t>(type_); }
    [[nodiscard]] const std::string& getAlgorithmName() const { return algorithmName_; }
    [[nodiscard]] size_t getKeyLength() const { return keyLength_; }
    [[nodiscard]] size_t getIvLength() const { return ivLength_; }
    [[nodiscard]] size_t getTagLength() const { return tagLength_; }
    [[nodiscard]] size_t getBlockSize() const { return blockSize_; }

    // Null for suites whose cipher authenticates on its own.
    [[nodiscard]] const Hash* getMacHash() const { return macHash_; }

    [[nodiscard]] size_t getCiphertextLength(size_t plaintextLength) const;
    
    [[nodiscard]] std::unique_ptr<EnvelopeCodec> createCodec(const EnvelopeParameterSpec& parameterSpec) const;

private:
    CipherSuite(CipherSuiteType type, std::string algorithmName,
                size_t keyLength, size_t ivLength, size_t tagLength, size_t blockSize,
                const Hash* macHash);
    
    CipherSuiteType type_;
    std::string algorithmName_;
    size_t keyLength_;
    size_t ivLength_;
    size_t tagLength_;
    size_t blockSize_;
    const Hash* macHash_;
};

}
