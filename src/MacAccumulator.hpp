#pragma once

#include <openssl/evp.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace sealbox {

class DerivedKey;
class Hash;

// Incremental HMAC. Input order is part of what gets authenticated, so callers feed
// fields in exactly the order the format defines.
class MacAccumulator {
public:
    MacAccumulator(const Hash& hash, const DerivedKey& key);
    
    MacAccumulator(const MacAccumulator&) = delete;
    MacAccumulator& operator=(const MacAccumulator&) = delete;

    void update(std::span<const uint8_t> data);

    // May be called once.
    [[nodiscard]] std::vector<uint8_t> finalize();

    [[nodiscard]] size_t getTagLength() const { return tagLength_; }

    // Runs in time independent of where the first differing byte is.
    [[nodiscard]] static bool constantTimeEquals(std::span<const uint8_t> expected,
                                                 std::span<const uint8_t> actual);

private:
    void assertNotFinalized() const;

    std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)> ctx_;
    size_t tagLength_;
    bool finalized_;
};

}
