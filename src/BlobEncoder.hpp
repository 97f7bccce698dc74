// BlobEncoder.hpp
// Export of RSA keys as CryptoAPI PUBLICKEYBLOB / PRIVATEKEYBLOB
//
// Layout (little-endian throughout):
//   PUBLICKEYSTRUC  bType, bVersion, reserved(2), aiKeyAlg(4)
//   RSAPUBKEY       magic(4), bitlen(4), pubexp(4)
//   BYTE modulus[L]
// private blobs continue with
//   BYTE prime1[H], prime2[H], exponent1[H], exponent2[H], coefficient[H]
//   BYTE privateExponent[L]
// where L is the modulus byte length and H = L / 2.

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "BlobConstants.hpp"
#include "KeyBlobError.hpp"
#include "RSAKey.hpp"

namespace KeyBlob {

// Map usage to its ALG_ID; false for any value outside {Sign, KeyExchange}
bool algIdForUsage(KeyUsage usage, uint32_t& algId);

bool encodePublicKeyBlob(const RSAPublicKey& key, KeyUsage usage, std::vector<uint8_t>& blob, KeyBlobError& error);

// Derives exponent1, exponent2 and coefficient from d, p, q. Requires an even
// modulus byte length.
bool encodePrivateKeyBlob(const RSAPrivateKey& key, KeyUsage usage, std::vector<uint8_t>& blob, KeyBlobError& error);

constexpr size_t publicBlobSize(size_t modulusBytes) {
    return BLOB_HEADER_SIZE + modulusBytes;
}

constexpr size_t privateBlobSize(size_t modulusBytes) {
    return BLOB_HEADER_SIZE + 2 * modulusBytes + 5 * (modulusBytes / 2);
}

} // namespace KeyBlob
