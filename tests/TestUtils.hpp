#pragma once

#include <sealbox/CipherSuite.hpp>
#include <sealbox/Credentials.hpp>
#include <sealbox/Envelope.hpp>
#include <sealbox/EnvelopeParameterSpec.hpp>
#include <sealbox/Hash.hpp>
#include <sealbox/SealboxException.hpp>
#include <cstdlib>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace sealbox::test {

// Far below the production floor so that tests run quickly. Only reachable through
// the test-only EnvelopeParameterSpec constructor.
constexpr uint32_t TEST_KDF_ITERATIONS = 1000;

inline EnvelopeParameterSpec createFastParameterSpec(
    const CipherSuiteType type,
    const size_t chunkSize = EnvelopeParameterSpec::DEFAULT_CHUNK_SIZE) {
    return {
        CipherSuite::fromType(type),
        Hash::fromType(HashType::SHA256),
        TEST_KDF_ITERATIONS,
        chunkSize,
        TEST_KDF_ITERATIONS
    };
}

inline Credentials createTestCredentials() {
    return Credentials::fromString("correct horse battery staple");
}

inline std::vector<uint8_t> toBytes(const std::string_view text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

inline std::vector<uint8_t> hexToBytes(const std::string& hex) {
    std::vector<uint8_t> bytes;
    for (size_t i = 0; i < hex.length(); i += 2) {
        std::string byteString = hex.substr(i, 2);
        bytes.push_back(static_cast<uint8_t>(strtol(byteString.c_str(), nullptr, 16)));
    }
    return bytes;
}

inline std::vector<uint8_t> randomBytes(const size_t length, const uint32_t seed = 42) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution dis(0, 255);
    std::vector<uint8_t> bytes(length);
    for (auto& byte : bytes) {
        byte = static_cast<uint8_t>(dis(gen));
    }
    return bytes;
}

}
