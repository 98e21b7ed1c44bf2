#pragma once

#include "sealbox/SealboxException.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace sealbox {

// Never leaves a codec: CbcHmacCodec reports it as IntegrityException.
class PaddingException : public SealboxException {
public:
    explicit PaddingException(std::string message)
        : SealboxException(std::move(message)) {}
};

// PKCS#7 padding. Padding is always added, a full block when the input is aligned,
// so unpad() never has to guess.
class BlockPadder {
public:
    [[nodiscard]] static std::vector<uint8_t> pad(std::span<const uint8_t> buffer, size_t blockSize);
    static void padInPlace(std::vector<uint8_t>& buffer, size_t blockSize);

    [[nodiscard]] static std::vector<uint8_t> unpad(std::span<const uint8_t> buffer, size_t blockSize);

    // Validates the padding of `buffer` and returns its length. The bytes of the last
    // block are all inspected whatever their values.
    [[nodiscard]] static size_t paddingLength(std::span<const uint8_t> buffer, size_t blockSize);

private:
    static void verifyBlockSize(size_t blockSize);
};

}
