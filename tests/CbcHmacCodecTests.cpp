#include <catch2/catch_test_macros.hpp>
#include "TestUtils.hpp"
#include "ByteStream.hpp"
#include "CbcHmacCodec.hpp"
#include "CipherIv.hpp"
#include "KeyDerivator.hpp"
#include "MacAccumulator.hpp"
#include "Salt.hpp"
#include <algorithm>

using sealbox::test::createFastParameterSpec;
using sealbox::test::createTestCredentials;
using sealbox::test::randomBytes;
using sealbox::test::toBytes;
using sealbox::test::TEST_KDF_ITERATIONS;

namespace {

constexpr auto CBC = sealbox::CipherSuiteType::AES_256_CBC_HMAC_SHA512;
constexpr size_t HEADER_LENGTH = 1 + 16 + 16;
constexpr size_t TAG_LENGTH = 64;

const sealbox::Salt FIXED_SALT(std::vector<uint8_t>(16, 0x11));
const sealbox::CipherIv FIXED_IV(std::vector<uint8_t>(16, 0x22));

std::vector<uint8_t> sealWithFixedRandomness(
    const sealbox::EnvelopeParameterSpec& spec,
    const sealbox::Credentials& credentials,
    const std::vector<uint8_t>& plaintext,
    const std::span<const uint8_t> aad = {}) {

    sealbox::CbcHmacCodec codec(spec.getCipherSuite(), spec);
    sealbox::BufferSource source(plaintext);
    std::vector<uint8_t> envelope;
    sealbox::BufferSink sink(envelope);
    codec.sealWith(credentials, FIXED_SALT, FIXED_IV, source, sink, aad);
    return envelope;
}

// Recomputes a valid tag over a modified ciphertext, as someone holding the MAC key could.
void reauthenticate(std::vector<uint8_t>& envelope, const sealbox::Credentials& credentials) {
    const sealbox::KeyDerivator derivator(sealbox::Hash::fromType(sealbox::HashType::SHA256));
    const sealbox::KeyPair keys = derivator.deriveKeyPair(
        credentials, FIXED_SALT.getBytes(), 32, TEST_KDF_ITERATIONS);

    const size_t ciphertextLength = envelope.size() - HEADER_LENGTH - TAG_LENGTH;
    sealbox::MacAccumulator mac(sealbox::Hash::fromType(sealbox::HashType::SHA512), keys.authenticationKey);
    mac.update(FIXED_IV.getBytes());
    mac.update(std::span(envelope).subspan(HEADER_LENGTH, ciphertextLength));

    const auto tag = mac.finalize();
    std::ranges::copy(tag, envelope.begin() + static_cast<std::ptrdiff_t>(HEADER_LENGTH + ciphertextLength));
}

}

TEST_CASE("CBC envelope layout for a short message", "[cbc]") {
    const sealbox::Envelope envelope(createFastParameterSpec(CBC));
    const auto credentials = createTestCredentials();

    const auto sealed = envelope.seal(credentials, toBytes("Hello, World!"));

    REQUIRE(sealed.size() == 113);
    REQUIRE(sealed[0] == 0x01);
    REQUIRE(envelope.getEnvelopeLength(13) == 113);
    REQUIRE(envelope.open(credentials, sealed) == toBytes("Hello, World!"));
}

TEST_CASE("CBC envelope matches a known answer", "[cbc][kat]") {
    const auto spec = createFastParameterSpec(CBC);
    const auto credentials = createTestCredentials();

    const auto sealed = sealWithFixedRandomness(spec, credentials, toBytes("Hello World"));
    REQUIRE(sealed == sealbox::test::hexToBytes(
        "01" "11111111111111111111111111111111" "22222222222222222222222222222222"
        "7fce169df485efdde9a13ac3d340541d"
        "358eff69c6162da93ca0ce4ab830a34b6a7eefd6128ac13ae6ee57edda4a6e4e"
        "6f1595d1adee31b2d05e2241833245a47ddf8cd5d1ade84499693ae8a7644044"));

    const auto withAad = sealWithFixedRandomness(spec, credentials, toBytes("Hello World"), toBytes("record-42"));
    REQUIRE(std::vector<uint8_t>(withAad.begin(), withAad.end() - TAG_LENGTH) ==
            std::vector<uint8_t>(sealed.begin(), sealed.end() - TAG_LENGTH));
    REQUIRE(std::vector<uint8_t>(withAad.end() - TAG_LENGTH, withAad.end()) == sealbox::test::hexToBytes(
        "726cacdb3b3437f38d429bf07e72e4ad27e345fcc0abd7070a0c7f43d5ea6a89"
        "4a63736a6e68fb289d302e520bb6c587b7515e9448ac50f22ec6228d4c884d15"));
}

TEST_CASE("Without associated data the CBC tag is HMAC over iv and ciphertext", "[cbc][kat]") {
    const auto spec = createFastParameterSpec(CBC);
    const sealbox::Envelope envelope(spec);
    const auto credentials = createTestCredentials();

    const auto sealed = envelope.seal(credentials, toBytes("Hello, World!"));
    REQUIRE(sealed.size() == 113);
    const std::span<const uint8_t> view(sealed);

    const sealbox::KeyDerivator derivator(spec.getKdfHash());
    const sealbox::KeyPair keys = derivator.deriveKeyPair(credentials, view.subspan(1, 16), 32, TEST_KDF_ITERATIONS);

    sealbox::MacAccumulator mac(sealbox::Hash::fromType(sealbox::HashType::SHA512), keys.authenticationKey);
    mac.update(view.subspan(17, 16));
    mac.update(view.subspan(HEADER_LENGTH, 16));
    const auto expected = mac.finalize();

    REQUIRE(std::vector<uint8_t>(sealed.end() - TAG_LENGTH, sealed.end()) == expected);

    const auto withAad = envelope.seal(credentials, toBytes("Hello, World!"), toBytes("record-42"));
    const std::span<const uint8_t> aadView(withAad);
    const sealbox::KeyPair aadKeys = derivator.deriveKeyPair(credentials, aadView.subspan(1, 16), 32, TEST_KDF_ITERATIONS);
    sealbox::MacAccumulator bare(sealbox::Hash::fromType(sealbox::HashType::SHA512), aadKeys.authenticationKey);
    bare.update(aadView.subspan(17, 16));
    bare.update(aadView.subspan(HEADER_LENGTH, 16));
    REQUIRE(std::vector<uint8_t>(withAad.end() - TAG_LENGTH, withAad.end()) != bare.finalize());
}

TEST_CASE("CBC round trips across chunk boundaries", "[cbc]") {
    const auto spec = createFastParameterSpec(CBC, 64);
    const sealbox::Envelope envelope(spec);
    const auto credentials = createTestCredentials();

    for (const size_t length : {0, 1, 15, 16, 17, 63, 64, 65, 128, 129, 1000}) {
        const auto plaintext = randomBytes(length, static_cast<uint32_t>(length));
        const auto sealed = envelope.seal(credentials, plaintext);

        REQUIRE(sealed.size() == spec.getEnvelopeLength(length));
        REQUIRE((sealed.size() - HEADER_LENGTH - TAG_LENGTH) % 16 == 0);
        REQUIRE(envelope.open(credentials, sealed) == plaintext);
    }
}

TEST_CASE("CBC round trips a multi-megabyte message", "[cbc]") {
    const sealbox::Envelope envelope(createFastParameterSpec(CBC));
    const auto credentials = createTestCredentials();
    const auto plaintext = randomBytes(3 * 1024 * 1024 + 5);

    const auto sealed = envelope.seal(credentials, plaintext);
    REQUIRE(sealed.size() == HEADER_LENGTH + 3 * 1024 * 1024 + 16 + TAG_LENGTH);
    REQUIRE(envelope.open(credentials, sealed) == plaintext);
}

TEST_CASE("Every single-bit flip in a CBC envelope is detected", "[cbc][tamper]") {
    const sealbox::Envelope envelope(createFastParameterSpec(CBC));
    const auto credentials = createTestCredentials();
    auto sealed = envelope.seal(credentials, toBytes("Hello World"));

    for (size_t bit = 0; bit < 8; ++bit) {
        sealed[0] ^= static_cast<uint8_t>(1u << bit);
        REQUIRE_THROWS_AS(envelope.open(credentials, sealed), sealbox::UnsupportedVersionException);
        sealed[0] ^= static_cast<uint8_t>(1u << bit);
    }

    for (size_t index = 1; index < sealed.size(); ++index) {
        for (size_t bit = 0; bit < 8; ++bit) {
            sealed[index] ^= static_cast<uint8_t>(1u << bit);
            REQUIRE_THROWS_AS(envelope.open(credentials, sealed), sealbox::IntegrityException);
            sealed[index] ^= static_cast<uint8_t>(1u << bit);
        }
    }

    REQUIRE(envelope.open(credentials, sealed) == toBytes("Hello World"));
}

TEST_CASE("Truncated or extended CBC envelopes are rejected", "[cbc][tamper]") {
    const sealbox::Envelope envelope(createFastParameterSpec(CBC));
    const auto credentials = createTestCredentials();
    const auto sealed = envelope.seal(credentials, toBytes("Hello World"));

    for (size_t length = 1; length < sealed.size(); ++length) {
        const std::vector<uint8_t> truncated(sealed.begin(), sealed.begin() + static_cast<std::ptrdiff_t>(length));
        REQUIRE_THROWS_AS(envelope.open(credentials, truncated), sealbox::IntegrityException);
    }

    auto extended = sealed;
    extended.push_back(0x00);
    REQUIRE_THROWS_AS(envelope.open(credentials, extended), sealbox::IntegrityException);
}

TEST_CASE("CBC open fails with the wrong credentials", "[cbc]") {
    const sealbox::Envelope envelope(createFastParameterSpec(CBC));
    const auto sealed = envelope.seal(createTestCredentials(), toBytes("secret"));

    REQUIRE_THROWS_AS(envelope.open(sealbox::Credentials::fromString("Correct horse battery staple"), sealed),
                      sealbox::IntegrityException);
    REQUIRE_THROWS_AS(envelope.open(sealbox::Credentials::fromStrings("correct horse battery staple", "x"), sealed),
                      sealbox::IntegrityException);
}

TEST_CASE("CBC associated data must match", "[cbc]") {
    const sealbox::Envelope envelope(createFastParameterSpec(CBC));
    const auto credentials = createTestCredentials();
    const auto aad = toBytes("record-42");

    const auto sealed = envelope.seal(credentials, toBytes("payload"), aad);

    REQUIRE(envelope.open(credentials, sealed, aad) == toBytes("payload"));
    REQUIRE_THROWS_AS(envelope.open(credentials, sealed), sealbox::IntegrityException);
    REQUIRE_THROWS_AS(envelope.open(credentials, sealed, toBytes("record-43")), sealbox::IntegrityException);

    const auto sealedWithoutAad = envelope.seal(credentials, toBytes("payload"));
    REQUIRE_THROWS_AS(envelope.open(credentials, sealedWithoutAad, aad), sealbox::IntegrityException);
}

TEST_CASE("Repeated CBC seals use a fresh salt and IV", "[cbc]") {
    const sealbox::Envelope envelope(createFastParameterSpec(CBC));
    const auto credentials = createTestCredentials();
    const auto plaintext = toBytes("same message");

    const auto first = envelope.seal(credentials, plaintext);
    const auto second = envelope.seal(credentials, plaintext);

    const std::vector<uint8_t> firstSalt(first.begin() + 1, first.begin() + 17);
    const std::vector<uint8_t> secondSalt(second.begin() + 1, second.begin() + 17);
    const std::vector<uint8_t> firstIv(first.begin() + 17, first.begin() + 33);
    const std::vector<uint8_t> secondIv(second.begin() + 17, second.begin() + 33);

    REQUIRE(firstSalt != secondSalt);
    REQUIRE(firstIv != secondIv);
    REQUIRE(first != second);
}

TEST_CASE("Separate passwords keep encryption and authentication keys independent", "[cbc]") {
    const auto spec = createFastParameterSpec(CBC);
    const auto plaintext = randomBytes(40);

    const auto original = sealbox::Credentials::fromStrings("encryption", "authentication");
    const auto otherMacPassword = sealbox::Credentials::fromStrings("encryption", "authentication!");
    const auto otherEncPassword = sealbox::Credentials::fromStrings("encryption!", "authentication");

    const auto base = sealWithFixedRandomness(spec, original, plaintext);
    const auto macChanged = sealWithFixedRandomness(spec, otherMacPassword, plaintext);
    const auto encChanged = sealWithFixedRandomness(spec, otherEncPassword, plaintext);

    const auto ciphertextOf = [](const std::vector<uint8_t>& sealed) {
        return std::vector<uint8_t>(sealed.begin() + HEADER_LENGTH, sealed.end() - TAG_LENGTH);
    };
    const auto tagOf = [](const std::vector<uint8_t>& sealed) {
        return std::vector<uint8_t>(sealed.end() - TAG_LENGTH, sealed.end());
    };

    REQUIRE(ciphertextOf(base) == ciphertextOf(macChanged));
    REQUIRE(tagOf(base) != tagOf(macChanged));
    REQUIRE(ciphertextOf(base) != ciphertextOf(encChanged));

    const sealbox::Envelope envelope(spec);
    REQUIRE(envelope.open(original, base) == plaintext);
    REQUIRE_THROWS_AS(envelope.open(otherMacPassword, base), sealbox::IntegrityException);
}

TEST_CASE("A single password still yields distinct encryption and MAC keys", "[cbc]") {
    const auto spec = createFastParameterSpec(CBC);
    const auto credentials = createTestCredentials();

    const auto sealed = sealWithFixedRandomness(spec, credentials, randomBytes(32));
    const auto again = sealWithFixedRandomness(spec, credentials, randomBytes(32));
    REQUIRE(sealed == again);

    const sealbox::KeyDerivator derivator(spec.getKdfHash());
    const sealbox::KeyPair keys = derivator.deriveKeyPair(credentials, FIXED_SALT.getBytes(), 32, TEST_KDF_ITERATIONS);
    REQUIRE(keys.encryptionKey.getKeyData() != keys.authenticationKey.getKeyData());
}

TEST_CASE("Re-authenticated ciphertext with intact padding opens", "[cbc][padding]") {
    const auto spec = createFastParameterSpec(CBC);
    const auto credentials = createTestCredentials();
    const std::vector<uint8_t> plaintext(20, 'A');

    auto sealed = sealWithFixedRandomness(spec, credentials, plaintext);
    REQUIRE(sealed.size() == HEADER_LENGTH + 32 + TAG_LENGTH);

    // Flipping a bit of the first ciphertext block flips the same bit of the second
    // plaintext block, here a data byte.
    sealed[HEADER_LENGTH] ^= 0x01;
    reauthenticate(sealed, credentials);

    const auto opened = sealbox::Envelope(spec).open(credentials, sealed);
    REQUIRE(opened.size() == 20);
    REQUIRE(opened[16] == ('A' ^ 0x01));
    REQUIRE(opened[17] == 'A');
}

TEST_CASE("Bad padding behind a valid tag looks like a bad tag", "[cbc][padding]") {
    const auto spec = createFastParameterSpec(CBC);
    const sealbox::Envelope envelope(spec);
    const auto credentials = createTestCredentials();
    const std::vector<uint8_t> plaintext(20, 'A');

    auto badPadding = sealWithFixedRandomness(spec, credentials, plaintext);
    // Turns the final pad byte 0x0c into 0x0d.
    badPadding[HEADER_LENGTH + 15] ^= 0x01;
    reauthenticate(badPadding, credentials);

    auto badTag = sealWithFixedRandomness(spec, credentials, plaintext);
    badTag.back() ^= 0x01;

    std::string paddingMessage;
    std::string tagMessage;
    try {
        (void) envelope.open(credentials, badPadding);
    } catch (const sealbox::IntegrityException& e) {
        paddingMessage = e.what();
    }
    try {
        (void) envelope.open(credentials, badTag);
    } catch (const sealbox::IntegrityException& e) {
        tagMessage = e.what();
    }

    REQUIRE(paddingMessage == sealbox::IntegrityException::MESSAGE);
    REQUIRE(paddingMessage == tagMessage);
}

TEST_CASE("Failed CBC open writes no plaintext", "[cbc][tamper]") {
    const auto spec = createFastParameterSpec(CBC, 64);
    const auto credentials = createTestCredentials();
    const auto plaintext = randomBytes(500);

    auto sealed = sealbox::Envelope(spec).seal(credentials, plaintext);
    sealed.back() ^= 0x01;

    sealbox::CbcHmacCodec codec(spec.getCipherSuite(), spec);
    sealbox::BufferSource source(sealed);
    std::vector<uint8_t> output;
    sealbox::BufferSink sink(output);
    source.seek(1);

    REQUIRE_THROWS_AS(codec.open(credentials, source, sink, {}), sealbox::IntegrityException);
    REQUIRE(output.empty());
}
