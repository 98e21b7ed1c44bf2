#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace sealbox {

// Passwords handed to seal/open. The object keeps its own copy and wipes it when
// destroyed; nothing is persisted.
//
// With a single password the CBC+HMAC suite splits one PBKDF2 output into an
// encryption key and an authentication key. Supplying a separate authentication
// password derives the two keys from independent secrets instead. AES-GCM accepts
// only a single password.
class Credentials {
public:
    explicit Credentials(std::span<const uint8_t> password);
    Credentials(std::span<const uint8_t> encryptionPassword, std::span<const uint8_t> authenticationPassword);

    static Credentials fromString(std::string_view password);
    static Credentials fromStrings(std::string_view encryptionPassword, std::string_view authenticationPassword);

    ~Credentials();

    Credentials(const Credentials&) = delete;
    Credentials& operator=(const Credentials&) = delete;
    Credentials(Credentials&&) noexcept = default;
    Credentials& operator=(Credentials&&) = delete;

    [[nodiscard]] std::span<const uint8_t> getEncryptionPassword() const;
    [[nodiscard]] bool hasAuthenticationPassword() const { return authenticationPassword_.has_value(); }

    // Throws InvalidParameterException when no separate password was supplied.
    [[nodiscard]] std::span<const uint8_t> getAuthenticationPassword() const;

private:
    std::vector<uint8_t> encryptionPassword_;
    std::optional<std::vector<uint8_t>> authenticationPassword_;
};

}
