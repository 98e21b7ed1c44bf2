#pragma once

#include "CipherIv.hpp"
#include "Salt.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace sealbox {

class ByteSource;
class CipherSuite;

// The fixed-size fields at the front of an envelope: version, salt, IV or nonce.
class EnvelopeHeader {
public:
    EnvelopeHeader(const CipherSuite& cipherSuite, Salt salt, CipherIv iv);

    // Reads only the first byte. An empty source fails as IntegrityException.
    [[nodiscard]] static uint8_t readVersion(ByteSource& source);

    // Reads salt and IV from a source positioned just past the version byte.
    [[nodiscard]] static EnvelopeHeader readFields(ByteSource& source, const CipherSuite& cipherSuite);

    [[nodiscard]] static size_t lengthFor(const CipherSuite& cipherSuite);

    [[nodiscard]] std::vector<uint8_t> toBytes() const;

    [[nodiscard]] const CipherSuite& getCipherSuite() const { return cipherSuite_; }
    [[nodiscard]] const Salt& getSalt() const { return salt_; }
    [[nodiscard]] const CipherIv& getIv() const { return iv_; }

private:
    const CipherSuite& cipherSuite_;
    Salt salt_;
    CipherIv iv_;
};

}
