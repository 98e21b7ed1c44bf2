#include "sealbox/Envelope.hpp"
#include "sealbox/Credentials.hpp"
#include "sealbox/SealboxException.hpp"
#include "ByteStream.hpp"
#include "EnvelopeCodec.hpp"
#include "EnvelopeHeader.hpp"
#include "Log.hpp"
#include <istream>
#include <ostream>
#include <string>

namespace sealbox {

Envelope::~Envelope() = default;

Envelope::Envelope(const EnvelopeParameterSpec& parameterSpec)
    : parameterSpec_(parameterSpec) {
    Log::info("envelope configured for " + parameterSpec_.getCipherSuite().getAlgorithmName() +
              ", " + std::to_string(parameterSpec_.getKdfIterations()) + " KDF iterations, " +
              std::to_string(parameterSpec_.getChunkSize()) + " byte chunks");
}

std::vector<uint8_t> Envelope::seal(
    const Credentials& credentials,
    const std::span<const uint8_t> plaintext,
    const std::span<const uint8_t> aad) const {

    BufferSource source(plaintext);
    std::vector<uint8_t> envelope;
    envelope.reserve(static_cast<size_t>(getEnvelopeLength(plaintext.size())));
    BufferSink sink(envelope);
    sealFrom(credentials, source, sink, aad);
    return envelope;
}

void Envelope::seal(
    const Credentials& credentials,
    std::istream& plaintext,
    std::ostream& envelope,
    const std::span<const uint8_t> aad) const {

    StreamSource source(plaintext);
    StreamSink sink(envelope);
    sealFrom(credentials, source, sink, aad);
}

std::vector<uint8_t> Envelope::open(
    const Credentials& credentials,
    const std::span<const uint8_t> envelope,
    const std::span<const uint8_t> aad) const {

    BufferSource source(envelope);
    std::vector<uint8_t> plaintext;
    BufferSink sink(plaintext);
    openFrom(credentials, source, sink, aad);
    return plaintext;
}

void Envelope::open(
    const Credentials& credentials,
    std::istream& envelope,
    std::ostream& plaintext,
    const std::span<const uint8_t> aad) const {

    StreamSource source(envelope);
    StreamSink sink(plaintext);
    openFrom(credentials, source, sink, aad);
}

uint64_t Envelope::getEnvelopeLength(const uint64_t plaintextLength) const {
    return parameterSpec_.getEnvelopeLength(plaintextLength);
}

void Envelope::sealFrom(
    const Credentials& credentials,
    ByteSource& plaintext,
    ByteSink& envelope,
    const std::span<const uint8_t> aad) const {

    const CipherSuite& cipherSuite = parameterSpec_.getCipherSuite();
    Log::debug("sealing " + cipherSuite.getAlgorithmName() + " envelope, version " +
               std::to_string(cipherSuite.getVersion()));

    const auto codec = cipherSuite.createCodec(parameterSpec_);
    try {
        codec->seal(credentials, plaintext, envelope, aad);
    } catch (const SealboxException&) {
        throw;
    } catch (const std::exception& e) {
        throw SealboxException("seal failed", e);
    }
}

void Envelope::openFrom(
    const Credentials& credentials,
    ByteSource& envelope,
    ByteSink& plaintext,
    const std::span<const uint8_t> aad) const {

    try {
        // Nothing past the version byte is read, and no key derived, until the
        // version is known.
        const CipherSuite& cipherSuite = CipherSuite::fromVersion(EnvelopeHeader::readVersion(envelope));
        Log::debug("opening " + cipherSuite.getAlgorithmName() + " envelope, version " +
                   std::to_string(cipherSuite.getVersion()));

        const auto codec = cipherSuite.createCodec(parameterSpec_);
        codec->open(credentials, envelope, plaintext, aad);
    } catch (const IntegrityException& e) {
        Log::warn(e.what());
        throw;
    } catch (const UnsupportedVersionException& e) {
        Log::warn(e.what());
        throw;
    } catch (const SealboxException&) {
        throw;
    } catch (const std::exception& e) {
        throw SealboxException("open failed", e);
    }
}

}
