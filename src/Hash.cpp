#include <utility>

#include "sealbox/Hash.hpp"
#include "sealbox/SealboxException.hpp"

namespace sealbox {

Hash::Hash(const HashType type, std::string osslName, const size_t length)
    : type_(type),
      osslName_(std::move(osslName)),
      length_(length) { }

const Hash& Hash::fromType(const HashType type) {
    switch (type) {
        case HashType::SHA256: {
            static const Hash instance(type, "SHA256", 32);
            return instance;
        }
        case HashType::SHA512: {
            static const Hash instance(type, "SHA512", 64);
            return instance;
        }
        default:
            throw InvalidParameterException("Unknown hash type");
    }
}

}
