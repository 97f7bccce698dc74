// CrtParams.hpp - Chinese Remainder Theorem private key parameters
#pragma once

#include "BigNum.hpp"
#include "KeyBlobError.hpp"

namespace KeyBlob {

struct CrtParams {
    BigNum dP;    // exponent1   = d mod (p - 1)
    BigNum dQ;    // exponent2   = d mod (q - 1)
    BigNum qInv;  // coefficient = q^-1 mod p
};

// Fails with InvalidKeyMaterial when p or q is not above 1 or when q has no
// inverse modulo p.
bool deriveCrtParams(const BigNum& d, const BigNum& p, const BigNum& q, CrtParams& out, KeyBlobError& error);

} // namespace KeyBlob
