#include "ByteStream.hpp"
#include "sealbox/SealboxException.hpp"
#include <algorithm>
#include <istream>
#include <ostream>

namespace sealbox {

bool ByteSource::readFully(const std::span<uint8_t> buffer) {
    return read(buffer) == buffer.size();
}

BufferSource::BufferSource(const std::span<const uint8_t> data)
    : data_(data), position_(0) {
}

size_t BufferSource::read(const std::span<uint8_t> buffer) {
    const size_t count = std::min(buffer.size(), data_.size() - position_);
    std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(position_), count, buffer.begin());
    position_ += count;
    return count;
}

uint64_t BufferSource::length() {
    return data_.size();
}

void BufferSource::seek(const uint64_t offset) {
    if (offset > data_.size()) {
        throw SealboxException("seek past end of input");
    }
    position_ = static_cast<size_t>(offset);
}

StreamSource::StreamSource(std::istream& stream)
    : stream_(stream), origin_(static_cast<int64_t>(stream.tellg())) {
}

size_t StreamSource::read(const std::span<uint8_t> buffer) {
    if (buffer.empty() || stream_.eof()) {
        return 0;
    }
    stream_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (stream_.bad()) {
        throw SealboxException("failed to read input stream");
    }
    return static_cast<size_t>(stream_.gcount());
}

uint64_t StreamSource::length() {
    assertSeekable();
    stream_.clear();
    const std::streampos current = stream_.tellg();
    stream_.seekg(0, std::ios::end);
    const std::streampos end = stream_.tellg();
    stream_.seekg(current);
    if (!stream_ || static_cast<int64_t>(end) < origin_) {
        throw SealboxException("failed to determine input stream length");
    }
    return static_cast<uint64_t>(static_cast<int64_t>(end) - origin_);
}

void StreamSource::seek(const uint64_t offset) {
    assertSeekable();
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(origin_ + static_cast<int64_t>(offset)));
    if (!stream_) {
        throw SealboxException("failed to seek input stream");
    }
}

void StreamSource::assertSeekable() const {
    if (origin_ < 0) {
        throw InvalidParameterException("input stream is not seekable");
    }
}

BufferSink::BufferSink(std::vector<uint8_t>& buffer)
    : buffer_(buffer) {
}

void BufferSink::write(const std::span<const uint8_t> data) {
    buffer_.insert(buffer_.end(), data.begin(), data.end());
}

StreamSink::StreamSink(std::ostream& stream)
    : stream_(stream) {
}

void StreamSink::write(const std::span<const uint8_t> data) {
    if (data.empty()) {
        return;
    }
    stream_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!stream_) {
        throw SealboxException("failed to write output stream");
    }
}

}
