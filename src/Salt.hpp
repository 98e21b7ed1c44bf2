#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sealbox {

class Salt {
public:
    explicit Salt(const std::vector<uint8_t>& bytes);
    
    static Salt generateRandom(size_t saltLength);
    
    [[nodiscard]] const std::vector<uint8_t>& getBytes() const;

private:
    std::vector<uint8_t> bytes_;
};

}
