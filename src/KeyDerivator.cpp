#include "KeyDerivator.hpp"
#include "sealbox/Credentials.hpp"
#include "sealbox/Hash.hpp"
#include "sealbox/SealboxException.hpp"
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <memory>
#include <string>

namespace sealbox {

KeyDerivator::KeyDerivator(const Hash& hash)
    : hash_(hash) {
}

DerivedKey KeyDerivator::derive(
    const std::span<const uint8_t> password,
    const std::span<const uint8_t> salt,
    const size_t outputLength,
    const uint32_t iterations) const {

    if (salt.size() < MIN_SALT_LENGTH) {
        throw InvalidParameterException("salt length too short, expected at least " +
                                        std::to_string(MIN_SALT_LENGTH) +
                                        ", got " + std::to_string(salt.size()));
    }
    if (outputLength == 0) {
        throw InvalidParameterException("output length must be > 0");
    }
    if (iterations == 0) {
        throw InvalidParameterException("iterations must be > 0");
    }
    
    return DerivedKey(pbkdf2(password, salt, outputLength, iterations));
}

KeyPair KeyDerivator::deriveKeyPair(
    const Credentials& credentials,
    const std::span<const uint8_t> salt,
    const size_t keyLength,
    const uint32_t iterations) const {

    if (credentials.hasAuthenticationPassword()) {
        return {
            derive(credentials.getEncryptionPassword(), salt, keyLength, iterations),
            derive(credentials.getAuthenticationPassword(), salt, keyLength, iterations)
        };
    }

    const DerivedKey combined = derive(credentials.getEncryptionPassword(), salt, keyLength * 2, iterations);
    const auto& bytes = combined.getKeyData();
    const auto middle = bytes.begin() + static_cast<std::ptrdiff_t>(keyLength);
    return {
        DerivedKey(std::vector<uint8_t>(bytes.begin(), middle)),
        DerivedKey(std::vector<uint8_t>(middle, bytes.end()))
    };
}

std::vector<uint8_t> KeyDerivator::pbkdf2(
    const std::span<const uint8_t> password,
    const std::span<const uint8_t> salt,
    const size_t outputLength,
    const uint32_t iterations) const {
    
    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, "PBKDF2", nullptr);
    if (!kdf) {
        throw SealboxException("Failed to fetch PBKDF2 algorithm");
    }
    
    EVP_KDF_CTX* ctx = EVP_KDF_CTX_new(kdf);
    EVP_KDF_free(kdf);
    if (!ctx) {
        throw SealboxException("Failed to create KDF context");
    }
    std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)> ctxGuard(ctx, EVP_KDF_CTX_free);
    
    unsigned int iterationCount = iterations;
    // Lengths are validated above; turn off the provider's SP 800-132 lower bounds.
    int pkcs5Checks = 1;
    const std::string& digestName = hash_.getOsslName();
    const OSSL_PARAM params[] = {
        OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD,
                                          const_cast<uint8_t*>(password.data()), password.size()),
        OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT,
                                          const_cast<uint8_t*>(salt.data()), salt.size()),
        OSSL_PARAM_construct_uint(OSSL_KDF_PARAM_ITER, &iterationCount),
        OSSL_PARAM_construct_int(OSSL_KDF_PARAM_PKCS5, &pkcs5Checks),
        OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, const_cast<char*>(digestName.c_str()), 0),
        OSSL_PARAM_construct_end()
    };
    
    std::vector<uint8_t> result(outputLength);
    if (EVP_KDF_derive(ctx, result.data(), result.size(), params) != 1) {
        OPENSSL_cleanse(result.data(), result.size());
        throw SealboxException("PBKDF2 derivation failed");
    }
    
    return result;
}

}
