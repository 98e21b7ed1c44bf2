#include "AeadCodec.hpp"
#include "ByteStream.hpp"
#include "ChunkReader.hpp"
#include "CipherContext.hpp"
#include "CipherIv.hpp"
#include "DerivedKey.hpp"
#include "EnvelopeHeader.hpp"
#include "Salt.hpp"
#include "sealbox/Credentials.hpp"
#include "sealbox/SealboxException.hpp"

namespace sealbox {

AeadCodec::~AeadCodec() = default;

AeadCodec::AeadCodec(const CipherSuite& cipherSuite, const EnvelopeParameterSpec& parameterSpec)
    : EnvelopeCodec(cipherSuite, parameterSpec) {

    if (cipherSuite_.getMacHash() != nullptr) {
        throw InvalidParameterException(cipherSuite_.getAlgorithmName() + " is not an AEAD cipher");
    }
}

void AeadCodec::seal(
    const Credentials& credentials,
    ByteSource& plaintext,
    ByteSink& envelope,
    const std::span<const uint8_t> aad) {

    // The salt, and with it the key, is fresh for every seal, so a random nonce can
    // never repeat under the same key.
    sealWith(credentials,
             Salt::generateRandom(EnvelopeParameterSpec::SALT_LENGTH),
             CipherIv::generateRandom(cipherSuite_.getIvLength()),
             plaintext, envelope, aad);
}

void AeadCodec::sealWith(
    const Credentials& credentials,
    const Salt& salt,
    const CipherIv& nonce,
    ByteSource& plaintext,
    ByteSink& envelope,
    const std::span<const uint8_t> aad) {

    const DerivedKey key = deriveKey(credentials, salt);

    const EnvelopeHeader header(cipherSuite_, salt, nonce);
    const std::vector<uint8_t> headerBytes = header.toBytes();
    envelope.write(headerBytes);

    CipherContext cipher(cipherSuite_.getAlgorithmName(), CipherContext::Direction::Encrypt,
                         key, nonce.getBytes());
    cipher.updateAad(headerBytes);
    cipher.updateAad(aad);

    ChunkReader reader(plaintext, parameterSpec_.getChunkSize());
    do {
        envelope.write(cipher.update(reader.next()));
    } while (!reader.isExhausted());

    envelope.write(cipher.finish());
    envelope.write(cipher.getTag(cipherSuite_.getTagLength()));
}

void AeadCodec::open(
    const Credentials& credentials,
    ByteSource& envelope,
    ByteSink& plaintext,
    const std::span<const uint8_t> aad) {

    const uint64_t ciphertextLength = ciphertextLengthOf(envelope.length(), 0);
    const EnvelopeHeader header = EnvelopeHeader::readFields(envelope, cipherSuite_);

    std::vector<uint8_t> tag(cipherSuite_.getTagLength());
    envelope.seek(EnvelopeHeader::lengthFor(cipherSuite_) + ciphertextLength);
    if (!envelope.readFully(tag)) {
        throw IntegrityException();
    }

    const DerivedKey key = deriveKey(credentials, header.getSalt());

    if (ciphertextLength <= parameterSpec_.getChunkSize()) {
        std::vector<uint8_t> decrypted;
        decrypted.reserve(static_cast<size_t>(ciphertextLength));
        decryptPass(key, header, envelope, ciphertextLength, tag, aad,
                    [&decrypted](const std::span<const uint8_t> chunk) {
                        decrypted.insert(decrypted.end(), chunk.begin(), chunk.end());
                    });
        plaintext.write(decrypted);
        return;
    }

    // Too large to hold in memory: authenticate first with the output discarded, then
    // decrypt again for real.
    decryptPass(key, header, envelope, ciphertextLength, tag, aad,
                [](std::span<const uint8_t>) {});
    decryptPass(key, header, envelope, ciphertextLength, tag, aad,
                [&plaintext](const std::span<const uint8_t> chunk) { plaintext.write(chunk); });
}

DerivedKey AeadCodec::deriveKey(const Credentials& credentials, const Salt& salt) const {
    if (credentials.hasAuthenticationPassword()) {
        throw InvalidParameterException(cipherSuite_.getAlgorithmName() + " takes a single password");
    }
    return keyDerivator_.derive(credentials.getEncryptionPassword(), salt.getBytes(),
                                cipherSuite_.getKeyLength(), parameterSpec_.getKdfIterations());
}

void AeadCodec::decryptPass(
    const DerivedKey& key,
    const EnvelopeHeader& header,
    ByteSource& envelope,
    const uint64_t ciphertextLength,
    const std::span<const uint8_t> tag,
    const std::span<const uint8_t> aad,
    const ChunkConsumer& consumer) const {

    envelope.seek(EnvelopeHeader::lengthFor(cipherSuite_));

    CipherContext cipher(cipherSuite_.getAlgorithmName(), CipherContext::Direction::Decrypt,
                         key, header.getIv().getBytes());
    cipher.updateAad(header.toBytes());
    cipher.updateAad(aad);
    cipher.setTag(tag);

    ChunkReader reader(envelope, parameterSpec_.getChunkSize(), ciphertextLength);
    std::vector<uint8_t> chunk;
    do {
        chunk = cipher.update(reader.next());
        if (!reader.isExhausted()) {
            consumer(chunk);
        }
    } while (!reader.isExhausted());

    // The last chunk is held back until the tag has verified.
    const std::vector<uint8_t> tail = cipher.finish();
    chunk.insert(chunk.end(), tail.begin(), tail.end());
    consumer(chunk);
}

}
