#pragma once

#include "DerivedKey.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace sealbox {

class Credentials;
class Hash;

struct KeyPair {
    DerivedKey encryptionKey;
    DerivedKey authenticationKey;
};

// PBKDF2 over HMAC with the configured hash. Deterministic; keeps no state between
// calls and never logs what it derives.
class KeyDerivator {
public:
    static constexpr size_t MIN_SALT_LENGTH = 16;

    explicit KeyDerivator(const Hash& hash);
    
    [[nodiscard]] DerivedKey derive(
        std::span<const uint8_t> password,
        std::span<const uint8_t> salt,
        size_t outputLength,
        uint32_t iterations) const;

    // Encryption and authentication keys for encrypt-then-MAC. A separate
    // authentication password gets its own PBKDF2 run; otherwise one run of twice the
    // key length is split in half.
    [[nodiscard]] KeyPair deriveKeyPair(
        const Credentials& credentials,
        std::span<const uint8_t> salt,
        size_t keyLength,
        uint32_t iterations) const;

private:
    [[nodiscard]] std::vector<uint8_t> pbkdf2(
        std::span<const uint8_t> password,
        std::span<const uint8_t> salt,
        size_t outputLength,
        uint32_t iterations) const;
    
    const Hash& hash_;
};

}
