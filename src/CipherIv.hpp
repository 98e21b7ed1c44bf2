#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sealbox {

// CBC initialization vector or GCM nonce; random per seal.
class CipherIv {
public:
    explicit CipherIv(const std::vector<uint8_t>& bytes);
    
    static CipherIv generateRandom(size_t ivLength);
    
    [[nodiscard]] const std::vector<uint8_t>& getBytes() const;

private:
    std::vector<uint8_t> bytes_;
};

}
