#include "sealbox/Credentials.hpp"
#include "sealbox/SealboxException.hpp"
#include <openssl/crypto.h>

namespace sealbox {

namespace {

std::span<const uint8_t> asBytes(const std::string_view text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

void wipe(std::vector<uint8_t>& bytes) {
    if (!bytes.empty()) {
        OPENSSL_cleanse(bytes.data(), bytes.size());
    }
}

}

Credentials::Credentials(const std::span<const uint8_t> password)
    : encryptionPassword_(password.begin(), password.end()) {
}

Credentials::Credentials(const std::span<const uint8_t> encryptionPassword,
                         const std::span<const uint8_t> authenticationPassword)
    : encryptionPassword_(encryptionPassword.begin(), encryptionPassword.end()),
      authenticationPassword_(std::vector<uint8_t>(authenticationPassword.begin(), authenticationPassword.end())) {
}

Credentials Credentials::fromString(const std::string_view password) {
    return Credentials(asBytes(password));
}

Credentials Credentials::fromStrings(const std::string_view encryptionPassword,
                                     const std::string_view authenticationPassword) {
    return {asBytes(encryptionPassword), asBytes(authenticationPassword)};
}

Credentials::~Credentials() {
    wipe(encryptionPassword_);
    if (authenticationPassword_) {
        wipe(*authenticationPassword_);
    }
}

std::span<const uint8_t> Credentials::getEncryptionPassword() const {
    return encryptionPassword_;
}

std::span<const uint8_t> Credentials::getAuthenticationPassword() const {
    if (!authenticationPassword_) {
        throw InvalidParameterException("no separate authentication password was supplied");
    }
    return *authenticationPassword_;
}

}
