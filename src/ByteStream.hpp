#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <span>
#include <vector>

namespace sealbox {

class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Returns fewer bytes than requested only at end of input.
    [[nodiscard]] virtual size_t read(std::span<uint8_t> buffer) = 0;

    // Total length of the input. Throws InvalidParameterException when the source
    // cannot report it.
    [[nodiscard]] virtual uint64_t length() = 0;

    virtual void seek(uint64_t offset) = 0;

    [[nodiscard]] bool readFully(std::span<uint8_t> buffer);
};

class ByteSink {
public:
    virtual ~ByteSink() = default;
    
    virtual void write(std::span<const uint8_t> data) = 0;
};

class BufferSource : public ByteSource {
public:
    explicit BufferSource(std::span<const uint8_t> data);

    [[nodiscard]] size_t read(std::span<uint8_t> buffer) override;
    [[nodiscard]] uint64_t length() override;
    void seek(uint64_t offset) override;

private:
    std::span<const uint8_t> data_;
    size_t position_;
};

// Offsets are relative to the stream position at construction.
class StreamSource : public ByteSource {
public:
    explicit StreamSource(std::istream& stream);

    [[nodiscard]] size_t read(std::span<uint8_t> buffer) override;
    [[nodiscard]] uint64_t length() override;
    void seek(uint64_t offset) override;

private:
    void assertSeekable() const;

    std::istream& stream_;
    int64_t origin_;
};

class BufferSink : public ByteSink {
public:
    explicit BufferSink(std::vector<uint8_t>& buffer);

    void write(std::span<const uint8_t> data) override;

private:
    std::vector<uint8_t>& buffer_;
};

class StreamSink : public ByteSink {
public:
    explicit StreamSink(std::ostream& stream);

    void write(std::span<const uint8_t> data) override;

private:
    std::ostream& stream_;
};

}
