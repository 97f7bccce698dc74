// BlobConstants.hpp
// CryptoAPI key blob constants (PUBLICKEYSTRUC / RSAPUBKEY)
// Reference: https://learn.microsoft.com/en-us/windows/win32/seccrypto/rsa-schannel-key-blobs

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace KeyBlob {

// Caller-selected key usage; not derivable from the key itself
enum class KeyUsage : int {
    Sign = 1,
    KeyExchange = 2
};

namespace BlobType {
    constexpr uint8_t PublicKey = 0x06;   // PUBLICKEYBLOB
    constexpr uint8_t PrivateKey = 0x07;  // PRIVATEKEYBLOB
}

namespace AlgId {
    constexpr uint32_t RSASign = 0x00002400;  // CALG_RSA_SIGN
    constexpr uint32_t RSAKeyX = 0x0000A400;  // CALG_RSA_KEYX
}

namespace Magic {
    constexpr uint32_t RSA1 = 0x31415352;  // "RSA1", public
    constexpr uint32_t RSA2 = 0x32415352;  // "RSA2", private
}

constexpr uint8_t CUR_BLOB_VERSION = 0x02;

// PUBLICKEYSTRUC (8) + RSAPUBKEY (12)
constexpr size_t BLOB_HEADER_SIZE = 20;

const char* keyUsageName(KeyUsage usage);

// Accepts "sign" / "keyx" (case-insensitive); false for anything else
bool keyUsageFromString(const std::string& text, KeyUsage& usage);

} // namespace KeyBlob
