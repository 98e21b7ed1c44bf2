#include "ChunkReader.hpp"
#include "ByteStream.hpp"
#include "sealbox/SealboxException.hpp"
#include <algorithm>
#include <utility>

namespace sealbox {

ChunkReader::ChunkReader(ByteSource& source, const size_t chunkSize, const std::optional<uint64_t> limit)
    : source_(source),
      chunkSize_(chunkSize),
      remaining_(limit),
      exhausted_(false) {
    pending_ = readChunk();
}

std::vector<uint8_t> ChunkReader::next() {
    if (exhausted_) {
        throw SealboxException("no chunks left to read");
    }
    std::vector<uint8_t> current = std::move(pending_);
    // A short chunk means the input ended; don't block on another read.
    pending_ = current.size() < chunkSize_ ? std::vector<uint8_t>() : readChunk();
    exhausted_ = pending_.empty();
    return current;
}

std::vector<uint8_t> ChunkReader::readChunk() {
    size_t wanted = chunkSize_;
    if (remaining_) {
        wanted = static_cast<size_t>(std::min<uint64_t>(wanted, *remaining_));
    }
    std::vector<uint8_t> chunk(wanted);
    const size_t count = wanted == 0 ? 0 : source_.read(chunk);
    chunk.resize(count);
    if (remaining_) {
        *remaining_ -= count;
    }
    return chunk;
}

}
