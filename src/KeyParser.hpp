// KeyParser.hpp - Load RSA keys from PEM or ASN.1 DER
//
// Public keys are accepted as PKCS#1 RSAPublicKey or as SubjectPublicKeyInfo,
// private keys as PKCS#1 RSAPrivateKey or as PKCS#8 PrivateKeyInfo. The raw
// PKCS#1 layout is tried first; the wrapped layout only if that fails.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "BlobConstants.hpp"
#include "KeyBlobError.hpp"
#include "RSAKey.hpp"

namespace KeyBlob {

bool parsePublicKey(const std::vector<uint8_t>& der, RSAPublicKey& key, KeyBlobError& error);
bool parsePrivateKey(const std::vector<uint8_t>& der, RSAPrivateKey& key, KeyBlobError& error);

// Decode the first PEM block in `pem` and hand its bytes to the DER parser.
// PEMDecodeError if no block is present.
bool parsePublicKeyPEM(const std::vector<uint8_t>& pem, RSAPublicKey& key, KeyBlobError& error);
bool parsePrivateKeyPEM(const std::vector<uint8_t>& pem, RSAPrivateKey& key, KeyBlobError& error);

// PEM block contents plus the label from its BEGIN line (e.g. "RSA PRIVATE KEY")
bool decodePEM(const std::vector<uint8_t>& pem, std::vector<uint8_t>& der, std::string& label, KeyBlobError& error);

// Parse + encode in one step
bool exportPublicKeyBlobFromPEM(const std::vector<uint8_t>& pem, KeyUsage usage, std::vector<uint8_t>& blob, KeyBlobError& error);
bool exportPrivateKeyBlobFromPEM(const std::vector<uint8_t>& pem, KeyUsage usage, std::vector<uint8_t>& blob, KeyBlobError& error);

} // namespace KeyBlob
