#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace sealbox {

class ByteSource;

// Hands out fixed-size chunks in input order, keeping one chunk of read-ahead so the
// caller knows when the chunk it holds is the last one. An empty input yields a
// single empty chunk.
class ChunkReader {
public:
    ChunkReader(ByteSource& source, size_t chunkSize, std::optional<uint64_t> limit = std::nullopt);

    [[nodiscard]] std::vector<uint8_t> next();

    // True once the chunk most recently returned by next() was the final one.
    [[nodiscard]] bool isExhausted() const { return exhausted_; }

private:
    [[nodiscard]] std::vector<uint8_t> readChunk();

    ByteSource& source_;
    size_t chunkSize_;
    std::optional<uint64_t> remaining_;
    std::vector<uint8_t> pending_;
    bool exhausted_;
};

}
