// CrtParams.cpp
#include "CrtParams.hpp"

#include <memory>
#include <utility>

#include <openssl/bn.h>

namespace KeyBlob {

namespace {

struct BnCtxDeleter {
    void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};

using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;

// x mod (m - 1)
bool modMinusOne(const BigNum& x, const BigNum& m, BigNum& out, BN_CTX* ctx) {
    BigNum mMinus1;
    if (BN_sub(mMinus1.get(), m.get(), BN_value_one()) != 1) return false;
    return BN_mod(out.get(), x.get(), mMinus1.get(), ctx) == 1;
}

} // anonymous namespace

bool deriveCrtParams(const BigNum& d, const BigNum& p, const BigNum& q, CrtParams& out, KeyBlobError& error) {
    if (!d.get() || !p.get() || !q.get()) {
        return error.fail(ErrorCode::InvalidKeyMaterial, "d, p and q must all hold a value");
    }

    const BigNum one(1);
    if (p.isNegative() || q.isNegative() || BN_cmp(p.get(), one.get()) <= 0 || BN_cmp(q.get(), one.get()) <= 0) {
        return error.fail(ErrorCode::InvalidKeyMaterial, "primes must be greater than 1");
    }
    if (d.isNegative()) {
        return error.fail(ErrorCode::InvalidKeyMaterial, "private exponent is negative");
    }

    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) {
        return error.fail(ErrorCode::InvalidKeyMaterial, "BN_CTX_new failed: " + lastOpenSSLError());
    }

    CrtParams params;
    if (!modMinusOne(d, p, params.dP, ctx.get())) {
        return error.fail(ErrorCode::InvalidKeyMaterial, "d mod (p-1) failed: " + lastOpenSSLError());
    }
    if (!modMinusOne(d, q, params.dQ, ctx.get())) {
        return error.fail(ErrorCode::InvalidKeyMaterial, "d mod (q-1) failed: " + lastOpenSSLError());
    }

    // BN_mod_inverse returns NULL when gcd(q, p) != 1
    if (!BN_mod_inverse(params.qInv.get(), q.get(), p.get(), ctx.get())) {
        return error.fail(ErrorCode::InvalidKeyMaterial, "q has no inverse modulo p: " + lastOpenSSLError());
    }

    out = std::move(params);
    return true;
}

} // namespace KeyBlob
