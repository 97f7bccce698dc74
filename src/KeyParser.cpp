// KeyParser.cpp - PKCS#1 / PKIX / PKCS#8 RSA key loading via OpenSSL
#include "KeyParser.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/objects.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include "BlobEncoder.hpp"
#include "Verbose.hpp"

namespace KeyBlob {

namespace {

struct RsaDeleter { void operator()(RSA* r) const { RSA_free(r); } };
struct PkeyDeleter { void operator()(EVP_PKEY* k) const { EVP_PKEY_free(k); } };
struct Pkcs8Deleter { void operator()(PKCS8_PRIV_KEY_INFO* p) const { PKCS8_PRIV_KEY_INFO_free(p); } };
struct BioDeleter { void operator()(BIO* b) const { BIO_free(b); } };

using RsaPtr = std::unique_ptr<RSA, RsaDeleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using Pkcs8Ptr = std::unique_ptr<PKCS8_PRIV_KEY_INFO, Pkcs8Deleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

void logAttempt(const char* what, const std::string& reason) {
    if (verboseLogging()) {
        std::cerr << "[KeyParser] " << what << " failed: " << reason << std::endl;
    }
}

// Decoders must consume the whole input; trailing bytes mean a different layout
bool consumedAll(const unsigned char* start, const unsigned char* end, size_t size) {
    return static_cast<size_t>(end - start) == size;
}

// Raw PKCS#1 RSAPublicKey
RsaPtr decodePKCS1Public(const std::vector<uint8_t>& der) {
    const unsigned char* p = der.data();
    RsaPtr rsa(d2i_RSAPublicKey(nullptr, &p, static_cast<long>(der.size())));
    if (rsa && !consumedAll(der.data(), p, der.size())) {
        return nullptr;
    }
    return rsa;
}

// Raw PKCS#1 RSAPrivateKey
RsaPtr decodePKCS1Private(const std::vector<uint8_t>& der) {
    const unsigned char* p = der.data();
    RsaPtr rsa(d2i_RSAPrivateKey(nullptr, &p, static_cast<long>(der.size())));
    if (rsa && !consumedAll(der.data(), p, der.size())) {
        return nullptr;
    }
    return rsa;
}

// SubjectPublicKeyInfo, any algorithm
PkeyPtr decodePKIXPublic(const std::vector<uint8_t>& der) {
    const unsigned char* p = der.data();
    PkeyPtr pkey(d2i_PUBKEY(nullptr, &p, static_cast<long>(der.size())));
    if (pkey && !consumedAll(der.data(), p, der.size())) {
        return nullptr;
    }
    return pkey;
}

// PKCS#8 PrivateKeyInfo, any algorithm
PkeyPtr decodePKCS8Private(const std::vector<uint8_t>& der) {
    const unsigned char* p = der.data();
    Pkcs8Ptr info(d2i_PKCS8_PRIV_KEY_INFO(nullptr, &p, static_cast<long>(der.size())));
    if (!info || !consumedAll(der.data(), p, der.size())) {
        return nullptr;
    }
    return PkeyPtr(EVP_PKCS82PKEY(info.get()));
}

bool extractPublicExponent(const BIGNUM* e, uint32_t& out, KeyBlobError& error) {
    if (!e || BN_is_zero(e) || BN_is_negative(e)) {
        return error.fail(ErrorCode::DecodeError, "RSA public exponent is not a positive number");
    }
    if (BN_num_bits(e) > 32) {
        return error.fail(ErrorCode::DecodeError, "RSA public exponent does not fit in 32 bits");
    }
    out = static_cast<uint32_t>(BN_get_word(e));
    return true;
}

bool extractPublic(const RSA* rsa, RSAPublicKey& key, KeyBlobError& error) {
    const BIGNUM* n = nullptr;
    const BIGNUM* e = nullptr;
    RSA_get0_key(rsa, &n, &e, nullptr);
    if (!n || BN_is_zero(n) || BN_is_negative(n)) {
        return error.fail(ErrorCode::DecodeError, "RSA modulus is not a positive number");
    }

    RSAPublicKey out;
    if (!extractPublicExponent(e, out.e, error)) {
        return false;
    }
    out.n = BigNum::copyOf(n);
    key = std::move(out);
    return true;
}

bool extractPrivate(const RSA* rsa, RSAPrivateKey& key, KeyBlobError& error) {
    if (RSA_get_multi_prime_extra_count(rsa) > 0) {
        return error.fail(ErrorCode::InvalidKeyMaterial, "multi-prime RSA keys are not supported");
    }

    const BIGNUM* n = nullptr;
    const BIGNUM* e = nullptr;
    const BIGNUM* d = nullptr;
    const BIGNUM* p = nullptr;
    const BIGNUM* q = nullptr;
    RSA_get0_key(rsa, &n, &e, &d);
    RSA_get0_factors(rsa, &p, &q);

    if (!n || BN_is_zero(n) || BN_is_negative(n)) {
        return error.fail(ErrorCode::DecodeError, "RSA modulus is not a positive number");
    }
    if (!d || !p || !q) {
        return error.fail(ErrorCode::InvalidKeyMaterial, "RSA private key lacks d, p or q");
    }

    RSAPrivateKey out;
    if (!extractPublicExponent(e, out.e, error)) {
        return false;
    }
    out.n = BigNum::copyOf(n);
    out.d = BigNum::copyOf(d);
    out.p = BigNum::copyOf(p);
    out.q = BigNum::copyOf(q);
    key = std::move(out);
    return true;
}

bool isRSA(const EVP_PKEY* pkey) {
    return EVP_PKEY_base_id(pkey) == EVP_PKEY_RSA;
}

std::string keyTypeName(const EVP_PKEY* pkey) {
    const char* sn = OBJ_nid2sn(EVP_PKEY_base_id(pkey));
    return sn ? sn : "unknown";
}

} // anonymous namespace

bool parsePublicKey(const std::vector<uint8_t>& der, RSAPublicKey& key, KeyBlobError& error) {
    if (der.empty()) {
        return error.fail(ErrorCode::DecodeError, "empty DER input");
    }

    if (RsaPtr rsa = decodePKCS1Public(der)) {
        return extractPublic(rsa.get(), key, error);
    }
    const std::string pkcs1Reason = lastOpenSSLError();
    logAttempt("PKCS#1 RSAPublicKey", pkcs1Reason);

    PkeyPtr pkey = decodePKIXPublic(der);
    if (!pkey) {
        const std::string pkixReason = lastOpenSSLError();
        logAttempt("SubjectPublicKeyInfo", pkixReason);
        return error.fail(ErrorCode::DecodeError,
                          "not a PKCS#1 or PKIX public key (" + pkixReason + ")");
    }
    if (!isRSA(pkey.get())) {
        return error.fail(ErrorCode::KeyTypeMismatch,
                          "invalid public key type: " + keyTypeName(pkey.get()));
    }

    const RSA* rsa = EVP_PKEY_get0_RSA(pkey.get());
    if (!rsa) {
        return error.fail(ErrorCode::DecodeError, "EVP_PKEY_get0_RSA failed: " + lastOpenSSLError());
    }
    return extractPublic(rsa, key, error);
}

bool parsePrivateKey(const std::vector<uint8_t>& der, RSAPrivateKey& key, KeyBlobError& error) {
    if (der.empty()) {
        return error.fail(ErrorCode::DecodeError, "empty DER input");
    }

    if (RsaPtr rsa = decodePKCS1Private(der)) {
        return extractPrivate(rsa.get(), key, error);
    }
    const std::string pkcs1Reason = lastOpenSSLError();
    logAttempt("PKCS#1 RSAPrivateKey", pkcs1Reason);

    PkeyPtr pkey = decodePKCS8Private(der);
    if (!pkey) {
        const std::string pkcs8Reason = lastOpenSSLError();
        logAttempt("PKCS#8 PrivateKeyInfo", pkcs8Reason);
        return error.fail(ErrorCode::DecodeError,
                          "not a PKCS#1 or PKCS#8 private key (" + pkcs8Reason + ")");
    }
    if (!isRSA(pkey.get())) {
        return error.fail(ErrorCode::KeyTypeMismatch,
                          "invalid private key type: " + keyTypeName(pkey.get()));
    }

    const RSA* rsa = EVP_PKEY_get0_RSA(pkey.get());
    if (!rsa) {
        return error.fail(ErrorCode::DecodeError, "EVP_PKEY_get0_RSA failed: " + lastOpenSSLError());
    }
    return extractPrivate(rsa, key, error);
}

bool decodePEM(const std::vector<uint8_t>& pem, std::vector<uint8_t>& der, std::string& label, KeyBlobError& error) {
    if (pem.empty()) {
        return error.fail(ErrorCode::PEMDecodeError, "failed to decode PEM data: empty input");
    }

    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return error.fail(ErrorCode::PEMDecodeError, "BIO_new_mem_buf failed: " + lastOpenSSLError());
    }

    char* name = nullptr;
    char* header = nullptr;
    unsigned char* data = nullptr;
    long len = 0;
    if (PEM_read_bio(bio.get(), &name, &header, &data, &len) != 1) {
        std::string reason = lastOpenSSLError();
        return error.fail(ErrorCode::PEMDecodeError, "failed to decode PEM data" + (reason.empty() ? "" : ": " + reason));
    }

    label = name ? name : "";
    der.assign(data, data + len);
    OPENSSL_free(name);
    OPENSSL_free(header);
    OPENSSL_free(data);

    if (verboseLogging()) {
        std::cerr << "[KeyParser] PEM block \"" << label << "\": " << der.size() << " bytes" << std::endl;
    }
    return true;
}

bool parsePublicKeyPEM(const std::vector<uint8_t>& pem, RSAPublicKey& key, KeyBlobError& error) {
    std::vector<uint8_t> der;
    std::string label;
    if (!decodePEM(pem, der, label, error)) {
        return false;
    }
    return parsePublicKey(der, key, error);
}

bool parsePrivateKeyPEM(const std::vector<uint8_t>& pem, RSAPrivateKey& key, KeyBlobError& error) {
    std::vector<uint8_t> der;
    std::string label;
    if (!decodePEM(pem, der, label, error)) {
        return false;
    }
    return parsePrivateKey(der, key, error);
}

bool exportPublicKeyBlobFromPEM(const std::vector<uint8_t>& pem, KeyUsage usage, std::vector<uint8_t>& blob, KeyBlobError& error) {
    blob.clear();
    RSAPublicKey key;
    if (!parsePublicKeyPEM(pem, key, error)) {
        return false;
    }
    return encodePublicKeyBlob(key, usage, blob, error);
}

bool exportPrivateKeyBlobFromPEM(const std::vector<uint8_t>& pem, KeyUsage usage, std::vector<uint8_t>& blob, KeyBlobError& error) {
    blob.clear();
    RSAPrivateKey key;
    if (!parsePrivateKeyPEM(pem, key, error)) {
        return false;
    }
    return encodePrivateKeyBlob(key, usage, blob, error);
}

} // namespace KeyBlob
