#include "MacAccumulator.hpp"
#include "DerivedKey.hpp"
#include "sealbox/Hash.hpp"
#include "sealbox/SealboxException.hpp"
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/params.h>
#include <string>

namespace sealbox {

namespace {

EVP_MAC_CTX* newHmacContext() {
    EVP_MAC* mac = EVP_MAC_fetch(nullptr, "HMAC", nullptr);
    if (!mac) {
        throw SealboxException("Failed to fetch HMAC algorithm");
    }
    
    EVP_MAC_CTX* ctx = EVP_MAC_CTX_new(mac);
    EVP_MAC_free(mac);
    if (!ctx) {
        throw SealboxException("Failed to create MAC context");
    }
    return ctx;
}

}

MacAccumulator::MacAccumulator(const Hash& hash, const DerivedKey& key)
    : ctx_(newHmacContext(), EVP_MAC_CTX_free),
      tagLength_(hash.getLength()),
      finalized_(false) {
    
    const std::string& digestName = hash.getOsslName();
    const OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, const_cast<char*>(digestName.c_str()), digestName.size()),
        OSSL_PARAM_construct_end()
    };
    
    if (EVP_MAC_init(ctx_.get(), key.getKeyData().data(), key.getKeyData().size(), params) != 1) {
        throw SealboxException("Failed to initialize MAC");
    }
}

void MacAccumulator::update(const std::span<const uint8_t> data) {
    assertNotFinalized();
    if (data.empty()) {
        return;
    }
    if (EVP_MAC_update(ctx_.get(), data.data(), data.size()) != 1) {
        throw SealboxException("Failed to update MAC");
    }
}

std::vector<uint8_t> MacAccumulator::finalize() {
    assertNotFinalized();
    finalized_ = true;

    std::vector<uint8_t> tag(tagLength_);
    size_t outLen = 0;
    if (EVP_MAC_final(ctx_.get(), tag.data(), &outLen, tag.size()) != 1) {
        throw SealboxException("MAC computation failed");
    }
    tag.resize(outLen);
    return tag;
}

bool MacAccumulator::constantTimeEquals(const std::span<const uint8_t> expected,
                                        const std::span<const uint8_t> actual) {
    if (expected.size() != actual.size()) {
        return false;
    }
    return CRYPTO_memcmp(expected.data(), actual.data(), expected.size()) == 0;
}

void MacAccumulator::assertNotFinalized() const {
    if (finalized_) {
        throw SealboxException("MAC has already been finalized");
    }
}

}
