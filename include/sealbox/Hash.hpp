#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace sealbox {

enum class HashType : uint8_t {
    SHA256 = 0,
    SHA512 = 1
};

class Hash {
public:
    [[nodiscard]] static const Hash& fromType(HashType type);

    [[nodiscard]] HashType getType() const { return type_; }
    [[nodiscard]] const std::string& getOsslName() const { return osslName_; }
    [[nodiscard]] size_t getLength() const { return length_; }

private:
    Hash(HashType type, std::string osslName, size_t length);
    
    HashType type_;
    std::string osslName_;
    size_t length_;
};

}
