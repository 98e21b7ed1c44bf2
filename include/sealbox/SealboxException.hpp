#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <utility>

namespace sealbox {

class SealboxException : public std::exception {
public:
    explicit SealboxException(std::string message)
        : message_(std::move(message)) {}
    
    explicit SealboxException(const std::string& message, const std::exception& cause)
        : message_(message + ": " + cause.what()) {}
    
    [[nodiscard]] const char* what() const noexcept override {
        return message_.c_str();
    }

private:
    std::string message_;
};

// Caller error: bad lengths, iteration counts, credentials or stream shape.
class InvalidParameterException : public SealboxException {
public:
    explicit InvalidParameterException(std::string message)
        : SealboxException(std::move(message)) {}
};

// Raised from the version byte alone, before anything else is read.
class UnsupportedVersionException : public SealboxException {
public:
    explicit UnsupportedVersionException(const uint8_t version)
        : SealboxException("unsupported envelope version " + std::to_string(version)),
          version_(version) {}

    [[nodiscard]] uint8_t getVersion() const { return version_; }

private:
    uint8_t version_;
};

// Tag mismatch, wrong password, truncation and malformed padding all share this
// class and message so that callers cannot tell them apart.
class IntegrityException : public SealboxException {
public:
    static constexpr const char* MESSAGE = "envelope authentication failed";

    IntegrityException()
        : SealboxException(MESSAGE) {}
};

}
