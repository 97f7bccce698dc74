// RSAKey.hpp - Canonical RSA key values fed to the blob encoder
#pragma once

#include <cstdint>

#include "BigNum.hpp"

namespace KeyBlob {

struct RSAPublicKey {
    BigNum n;        // modulus
    uint32_t e{0};   // public exponent

    // Size of the modulus in whole bytes; every blob field width derives from it
    int byteLength() const { return n.byteLength(); }
    int bitLength() const { return byteLength() * 8; }
};

struct RSAPrivateKey {
    BigNum n;
    uint32_t e{0};
    BigNum d;   // private exponent
    BigNum p;   // prime1
    BigNum q;   // prime2

    int byteLength() const { return n.byteLength(); }
    int bitLength() const { return byteLength() * 8; }

    RSAPublicKey publicKey() const { return RSAPublicKey{n, e}; }
};

} // namespace KeyBlob
