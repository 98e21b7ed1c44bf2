#include "CbcHmacCodec.hpp"
#include "BlockPadder.hpp"
#include "ByteStream.hpp"
#include "ChunkReader.hpp"
#include "CipherContext.hpp"
#include "CipherIv.hpp"
#include "EnvelopeHeader.hpp"
#include "MacAccumulator.hpp"
#include "Salt.hpp"
#include "sealbox/Credentials.hpp"
#include "sealbox/Hash.hpp"
#include "sealbox/SealboxException.hpp"
#include <algorithm>

namespace sealbox {

CbcHmacCodec::~CbcHmacCodec() = default;

CbcHmacCodec::CbcHmacCodec(const CipherSuite& cipherSuite, const EnvelopeParameterSpec& parameterSpec)
    : EnvelopeCodec(cipherSuite, parameterSpec) {

    if (cipherSuite_.getMacHash() == nullptr) {
        throw InvalidParameterException(cipherSuite_.getAlgorithmName() + " has no MAC hash");
    }
}

void CbcHmacCodec::seal(
    const Credentials& credentials,
    ByteSource& plaintext,
    ByteSink& envelope,
    const std::span<const uint8_t> aad) {

    sealWith(credentials,
             Salt::generateRandom(EnvelopeParameterSpec::SALT_LENGTH),
             CipherIv::generateRandom(cipherSuite_.getIvLength()),
             plaintext, envelope, aad);
}

void CbcHmacCodec::sealWith(
    const Credentials& credentials,
    const Salt& salt,
    const CipherIv& iv,
    ByteSource& plaintext,
    ByteSink& envelope,
    const std::span<const uint8_t> aad) {

    const KeyPair keys = keyDerivator_.deriveKeyPair(
        credentials, salt.getBytes(), cipherSuite_.getKeyLength(), parameterSpec_.getKdfIterations());

    const EnvelopeHeader header(cipherSuite_, salt, iv);
    envelope.write(header.toBytes());

    MacAccumulator mac(*cipherSuite_.getMacHash(), keys.authenticationKey);
    mac.update(iv.getBytes());

    CipherContext cipher(cipherSuite_.getAlgorithmName(), CipherContext::Direction::Encrypt,
                         keys.encryptionKey, iv.getBytes());
    cipher.disablePadding();

    ChunkReader reader(plaintext, parameterSpec_.getChunkSize());
    do {
        std::vector<uint8_t> chunk = reader.next();
        if (reader.isExhausted()) {
            BlockPadder::padInPlace(chunk, cipherSuite_.getBlockSize());
        }
        const std::vector<uint8_t> ciphertext = cipher.update(chunk);
        mac.update(ciphertext);
        envelope.write(ciphertext);
    } while (!reader.isExhausted());

    const std::vector<uint8_t> tail = cipher.finish();
    mac.update(tail);
    envelope.write(tail);

    authenticateAssociatedData(mac, aad);
    envelope.write(mac.finalize());
}

void CbcHmacCodec::open(
    const Credentials& credentials,
    ByteSource& envelope,
    ByteSink& plaintext,
    const std::span<const uint8_t> aad) {

    const size_t blockSize = cipherSuite_.getBlockSize();
    const uint64_t ciphertextLength = ciphertextLengthOf(envelope.length(), blockSize);
    if (ciphertextLength % blockSize != 0) {
        throw IntegrityException();
    }

    const EnvelopeHeader header = EnvelopeHeader::readFields(envelope, cipherSuite_);
    const KeyPair keys = keyDerivator_.deriveKeyPair(
        credentials, header.getSalt().getBytes(), cipherSuite_.getKeyLength(), parameterSpec_.getKdfIterations());

    const std::vector<uint8_t> computedTag = computeTag(
        keys.authenticationKey, header.getIv(), envelope, ciphertextLength, aad);

    std::vector<uint8_t> storedTag(cipherSuite_.getTagLength());
    envelope.seek(EnvelopeHeader::lengthFor(cipherSuite_) + ciphertextLength);
    if (!envelope.readFully(storedTag) || !MacAccumulator::constantTimeEquals(storedTag, computedTag)) {
        throw IntegrityException();
    }

    // Past this point the ciphertext is authentic, but a bad final padding must still
    // look exactly like a bad tag to the caller.
    size_t paddingLength;
    try {
        paddingLength = finalBlockPaddingLength(keys.encryptionKey, header.getIv(), envelope, ciphertextLength);
    } catch (const PaddingException&) {
        throw IntegrityException();
    }

    decrypt(keys, header.getIv(), envelope, ciphertextLength, paddingLength, storedTag, aad, plaintext);
}

void CbcHmacCodec::authenticateAssociatedData(MacAccumulator& mac, const std::span<const uint8_t> aad) {
    // Without associated data the tag is exactly HMAC(iv | ciphertext).
    if (aad.empty()) {
        return;
    }
    mac.update(aad);

    const uint64_t aadBitsBE = __builtin_bswap64(static_cast<uint64_t>(aad.size()) * 8);
    const auto* aadBitsBytes = reinterpret_cast<const uint8_t*>(&aadBitsBE);
    mac.update(std::span(aadBitsBytes, sizeof(aadBitsBE)));
}

std::vector<uint8_t> CbcHmacCodec::computeTag(
    const DerivedKey& macKey,
    const CipherIv& iv,
    ByteSource& envelope,
    const uint64_t ciphertextLength,
    const std::span<const uint8_t> aad) const {

    MacAccumulator mac(*cipherSuite_.getMacHash(), macKey);
    mac.update(iv.getBytes());

    envelope.seek(EnvelopeHeader::lengthFor(cipherSuite_));
    ChunkReader reader(envelope, parameterSpec_.getChunkSize(), ciphertextLength);
    do {
        mac.update(reader.next());
    } while (!reader.isExhausted());

    authenticateAssociatedData(mac, aad);
    return mac.finalize();
}

size_t CbcHmacCodec::finalBlockPaddingLength(
    const DerivedKey& encryptionKey,
    const CipherIv& iv,
    ByteSource& envelope,
    const uint64_t ciphertextLength) const {

    // A CBC block decrypts on its own given the block before it, so the padding can
    // be checked without decrypting the rest.
    const size_t blockSize = cipherSuite_.getBlockSize();
    const uint64_t ciphertextStart = EnvelopeHeader::lengthFor(cipherSuite_);

    std::vector<uint8_t> previous = iv.getBytes();
    std::vector<uint8_t> last(blockSize);
    if (ciphertextLength > blockSize) {
        envelope.seek(ciphertextStart + ciphertextLength - 2 * blockSize);
        if (!envelope.readFully(previous)) {
            throw IntegrityException();
        }
    } else {
        envelope.seek(ciphertextStart + ciphertextLength - blockSize);
    }
    if (!envelope.readFully(last)) {
        throw IntegrityException();
    }

    CipherContext cipher(cipherSuite_.getAlgorithmName(), CipherContext::Direction::Decrypt,
                         encryptionKey, previous);
    cipher.disablePadding();
    std::vector<uint8_t> block = cipher.update(last);
    const std::vector<uint8_t> tail = cipher.finish();
    block.insert(block.end(), tail.begin(), tail.end());

    return BlockPadder::paddingLength(block, blockSize);
}

void CbcHmacCodec::decrypt(
    const KeyPair& keys,
    const CipherIv& iv,
    ByteSource& envelope,
    const uint64_t ciphertextLength,
    const size_t paddingLength,
    const std::span<const uint8_t> storedTag,
    const std::span<const uint8_t> aad,
    ByteSink& plaintext) const {

    envelope.seek(EnvelopeHeader::lengthFor(cipherSuite_));

    CipherContext cipher(cipherSuite_.getAlgorithmName(), CipherContext::Direction::Decrypt,
                         keys.encryptionKey, iv.getBytes());
    cipher.disablePadding();

    // The source is read a second time here, so the tag is checked again before the
    // last chunk goes out.
    MacAccumulator mac(*cipherSuite_.getMacHash(), keys.authenticationKey);
    mac.update(iv.getBytes());

    ChunkReader reader(envelope, parameterSpec_.getChunkSize(), ciphertextLength);
    do {
        const std::vector<uint8_t> ciphertext = reader.next();
        mac.update(ciphertext);
        std::vector<uint8_t> chunk = cipher.update(ciphertext);
        if (reader.isExhausted()) {
            authenticateAssociatedData(mac, aad);
            if (!MacAccumulator::constantTimeEquals(storedTag, mac.finalize())) {
                throw IntegrityException();
            }
            const std::vector<uint8_t> tail = cipher.finish();
            chunk.insert(chunk.end(), tail.begin(), tail.end());
            chunk.resize(chunk.size() - std::min(paddingLength, chunk.size()));
        }
        plaintext.write(chunk);
    } while (!reader.isExhausted());
}

}
