#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace sealbox {

class DerivedKey {
public:
    explicit DerivedKey(std::vector<uint8_t> keyData);
    ~DerivedKey();
    
    DerivedKey(const DerivedKey&) = delete;
    DerivedKey& operator=(const DerivedKey&) = delete;
    DerivedKey(DerivedKey&&) noexcept = default;
    DerivedKey& operator=(DerivedKey&&) = delete;
    
    [[nodiscard]] const std::vector<uint8_t>& getKeyData() const;
    [[nodiscard]] size_t size() const { return keyData_.size(); }

private:
    std::vector<uint8_t> keyData_;
};

}
