// BlobEncoder.cpp
#include "BlobEncoder.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <utility>

#include "CrtParams.hpp"
#include "IntegerCodec.hpp"
#include "Verbose.hpp"

namespace KeyBlob {

namespace {

void writeHeader(std::vector<uint8_t>& out, uint8_t blobType, uint32_t algId,
                 uint32_t magic, uint32_t bitLen, uint32_t pubExp) {
    // PUBLICKEYSTRUC
    out.push_back(blobType);
    out.push_back(CUR_BLOB_VERSION);
    out.push_back(0x00);  // reserved
    out.push_back(0x00);
    IntegerCodec::appendUInt32LE(out, algId);

    // RSAPUBKEY
    IntegerCodec::appendUInt32LE(out, magic);
    IntegerCodec::appendUInt32LE(out, bitLen);
    IntegerCodec::appendUInt32LE(out, pubExp);
}

bool checkModulus(const BigNum& n, KeyBlobError& error) {
    if (n.isZero() || n.isNegative()) {
        return error.fail(ErrorCode::InvalidKeyMaterial, "modulus must be positive");
    }
    return true;
}

} // anonymous namespace

bool algIdForUsage(KeyUsage usage, uint32_t& algId) {
    switch (usage) {
    case KeyUsage::Sign:
        algId = AlgId::RSASign;
        return true;
    case KeyUsage::KeyExchange:
        algId = AlgId::RSAKeyX;
        return true;
    }
    return false;
}

bool encodePublicKeyBlob(const RSAPublicKey& key, KeyUsage usage, std::vector<uint8_t>& blob, KeyBlobError& error) {
    blob.clear();

    uint32_t algId = 0;
    if (!algIdForUsage(usage, algId)) {
        return error.fail(ErrorCode::InvalidUsage, "invalid rsa key usage " + std::to_string(static_cast<int>(usage)));
    }
    if (!checkModulus(key.n, error)) {
        return false;
    }

    const size_t keyLen = static_cast<size_t>(key.byteLength());

    std::vector<uint8_t> out;
    out.reserve(publicBlobSize(keyLen));
    writeHeader(out, BlobType::PublicKey, algId, Magic::RSA1,
                static_cast<uint32_t>(key.bitLength()), key.e);

    if (!IntegerCodec::encode(key.n, keyLen, out, error)) {
        return false;
    }

    if (verboseLogging()) {
        std::cerr << "[BlobEncoder] PUBLICKEYBLOB " << key.bitLength() << " bits, usage "
                  << keyUsageName(usage) << ", " << out.size() << " bytes" << std::endl;
    }

    blob = std::move(out);
    return true;
}

bool encodePrivateKeyBlob(const RSAPrivateKey& key, KeyUsage usage, std::vector<uint8_t>& blob, KeyBlobError& error) {
    blob.clear();

    uint32_t algId = 0;
    if (!algIdForUsage(usage, algId)) {
        return error.fail(ErrorCode::InvalidUsage, "invalid rsa key usage " + std::to_string(static_cast<int>(usage)));
    }
    if (!checkModulus(key.n, error)) {
        return false;
    }

    const size_t keyLen = static_cast<size_t>(key.byteLength());
    if (keyLen % 2 != 0) {
        std::ostringstream msg;
        msg << "modulus length " << keyLen << " bytes cannot be split between prime1 and prime2";
        return error.fail(ErrorCode::EncodingOverflow, msg.str());
    }
    const size_t halfLen = keyLen / 2;

    CrtParams crt;
    if (!deriveCrtParams(key.d, key.p, key.q, crt, error)) {
        return false;
    }

    std::vector<uint8_t> out;
    out.reserve(privateBlobSize(keyLen));
    writeHeader(out, BlobType::PrivateKey, algId, Magic::RSA2,
                static_cast<uint32_t>(key.bitLength()), key.e);

    // Field order and widths are fixed by the blob format
    struct Field { const BigNum& value; size_t width; const char* name; };
    const Field fields[] = {
        {key.n, keyLen, "modulus"},
        {key.p, halfLen, "prime1"},
        {key.q, halfLen, "prime2"},
        {crt.dP, halfLen, "exponent1"},
        {crt.dQ, halfLen, "exponent2"},
        {crt.qInv, halfLen, "coefficient"},
        {key.d, keyLen, "privateExponent"},
    };
    for (const Field& field : fields) {
        if (!IntegerCodec::encode(field.value, field.width, out, error)) {
            error.message = std::string(field.name) + ": " + error.message;
            return false;
        }
    }

    if (verboseLogging()) {
        std::cerr << "[BlobEncoder] PRIVATEKEYBLOB " << key.bitLength() << " bits, usage "
                  << keyUsageName(usage) << ", " << out.size() << " bytes" << std::endl;
    }

    blob = std::move(out);
    return true;
}

} // namespace KeyBlob
