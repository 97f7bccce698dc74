// TestKeys.cpp
#include "TestKeys.hpp"

#include <iostream>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

namespace {

std::vector<uint8_t> takeDER(unsigned char* der, int length) {
    if (length <= 0 || !der) {
        std::cerr << "[TestKeys] DER encoding failed: " << ERR_get_error() << std::endl;
        return {};
    }
    std::vector<uint8_t> out(der, der + length);
    OPENSSL_free(der);
    return out;
}

std::vector<uint8_t> pkcs8Of(EVP_PKEY* pkey) {
    PKCS8_PRIV_KEY_INFO* info = EVP_PKEY2PKCS8(pkey);
    if (!info) {
        std::cerr << "[TestKeys] EVP_PKEY2PKCS8 failed: " << ERR_get_error() << std::endl;
        return {};
    }
    unsigned char* der = nullptr;
    int length = i2d_PKCS8_PRIV_KEY_INFO(info, &der);
    PKCS8_PRIV_KEY_INFO_free(info);
    return takeDER(der, length);
}

} // anonymous namespace

TestRSAKey::TestRSAKey() {}

TestRSAKey::~TestRSAKey() {
    RSA_free(m_rsa);
}

bool TestRSAKey::generate(int bits) {
    RSA* keyPair = RSA_new();
    if (!keyPair) {
        std::cerr << "[TestKeys] Failed to create RSA structure" << std::endl;
        return false;
    }

    BIGNUM* exponent = BN_new();
    if (!exponent) {
        RSA_free(keyPair);
        std::cerr << "[TestKeys] Failed to create BIGNUM for exponent" << std::endl;
        return false;
    }
    BN_set_word(exponent, RSA_F4);

    int result = RSA_generate_key_ex(keyPair, bits, exponent, nullptr);
    BN_free(exponent);

    if (result != 1) {
        std::cerr << "[TestKeys] Failed to generate " << bits << "-bit keypair: " << ERR_get_error() << std::endl;
        RSA_free(keyPair);
        return false;
    }

    RSA_free(m_rsa);
    m_rsa = keyPair;
    return true;
}

std::vector<uint8_t> TestRSAKey::getPKCS1PublicDER() const {
    unsigned char* der = nullptr;
    int length = i2d_RSAPublicKey(m_rsa, &der);
    return takeDER(der, length);
}

std::vector<uint8_t> TestRSAKey::getPKIXPublicDER() const {
    unsigned char* der = nullptr;
    int length = i2d_RSA_PUBKEY(m_rsa, &der);
    return takeDER(der, length);
}

std::vector<uint8_t> TestRSAKey::getPKCS1PrivateDER() const {
    unsigned char* der = nullptr;
    int length = i2d_RSAPrivateKey(m_rsa, &der);
    return takeDER(der, length);
}

std::vector<uint8_t> TestRSAKey::getPKCS8PrivateDER() const {
    EVP_PKEY* pkey = EVP_PKEY_new();
    if (!pkey) return {};
    if (EVP_PKEY_set1_RSA(pkey, m_rsa) != 1) {
        EVP_PKEY_free(pkey);
        return {};
    }
    std::vector<uint8_t> out = pkcs8Of(pkey);
    EVP_PKEY_free(pkey);
    return out;
}

bool generateEd25519(std::vector<uint8_t>& pkixPublicDER, std::vector<uint8_t>& pkcs8PrivateDER) {
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
    if (!ctx) return false;

    EVP_PKEY* pkey = nullptr;
    bool ok = EVP_PKEY_keygen_init(ctx) == 1 && EVP_PKEY_keygen(ctx, &pkey) == 1;
    EVP_PKEY_CTX_free(ctx);
    if (!ok) {
        std::cerr << "[TestKeys] Ed25519 keygen failed: " << ERR_get_error() << std::endl;
        return false;
    }

    unsigned char* der = nullptr;
    int length = i2d_PUBKEY(pkey, &der);
    pkixPublicDER = takeDER(der, length);
    pkcs8PrivateDER = pkcs8Of(pkey);
    EVP_PKEY_free(pkey);

    return !pkixPublicDER.empty() && !pkcs8PrivateDER.empty();
}

std::vector<uint8_t> toPEM(const std::string& label, const std::vector<uint8_t>& der) {
    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) return {};
    if (PEM_write_bio(bio, label.c_str(), "", der.data(), static_cast<long>(der.size())) <= 0) {
        BIO_free(bio);
        return {};
    }
    char* data = nullptr;
    long length = BIO_get_mem_data(bio, &data);
    std::vector<uint8_t> out(data, data + length);
    BIO_free(bio);
    return out;
}
