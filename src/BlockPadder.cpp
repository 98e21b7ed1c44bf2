#include "BlockPadder.hpp"

namespace sealbox {

static constexpr size_t MAX_BLOCK_SIZE = 255;

void BlockPadder::verifyBlockSize(const size_t blockSize) {
    if (blockSize == 0 || blockSize > MAX_BLOCK_SIZE) {
        throw InvalidParameterException("block size must be in [1, " + std::to_string(MAX_BLOCK_SIZE) +
                                        "], got " + std::to_string(blockSize));
    }
}

std::vector<uint8_t> BlockPadder::pad(const std::span<const uint8_t> buffer, const size_t blockSize) {
    std::vector<uint8_t> padded(buffer.begin(), buffer.end());
    padInPlace(padded, blockSize);
    return padded;
}

void BlockPadder::padInPlace(std::vector<uint8_t>& buffer, const size_t blockSize) {
    verifyBlockSize(blockSize);
    const size_t n = blockSize - buffer.size() % blockSize;
    buffer.insert(buffer.end(), n, static_cast<uint8_t>(n));
}

std::vector<uint8_t> BlockPadder::unpad(const std::span<const uint8_t> buffer, const size_t blockSize) {
    const size_t n = paddingLength(buffer, blockSize);
    return {buffer.begin(), buffer.end() - static_cast<std::ptrdiff_t>(n)};
}

size_t BlockPadder::paddingLength(const std::span<const uint8_t> buffer, const size_t blockSize) {
    verifyBlockSize(blockSize);
    if (buffer.empty() || buffer.size() % blockSize != 0) {
        throw PaddingException("padded length must be a non-zero multiple of " + std::to_string(blockSize) +
                               ", got " + std::to_string(buffer.size()));
    }

    const uint32_t n = buffer.back();
    const uint32_t size = static_cast<uint32_t>(blockSize);
    const uint8_t* block = buffer.data() + buffer.size() - blockSize;

    // Each term is 1 when its check fails; the high bit of a wrapped subtraction
    // stands in for a comparison.
    uint32_t bad = (n - 1) >> 31;
    bad |= (size - n) >> 31;
    for (uint32_t i = 0; i < size; ++i) {
        const uint32_t inPadding = (i - n) >> 31;
        const uint32_t mismatch = (0U - (block[size - 1 - i] ^ n)) >> 31;
        bad |= inPadding & mismatch;
    }

    if (bad != 0) {
        throw PaddingException("invalid padding");
    }
    return n;
}

}
