// TestKeys.hpp - RSA/Ed25519 key generation and serialization for the test harness
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <openssl/rsa.h>

class TestRSAKey {
public:
    TestRSAKey();
    ~TestRSAKey();
    TestRSAKey(const TestRSAKey&) = delete;
    TestRSAKey& operator=(const TestRSAKey&) = delete;

    // Generate a fresh keypair with e = 65537
    bool generate(int bits);

    // DER encodings of every layout the parser accepts
    std::vector<uint8_t> getPKCS1PublicDER() const;
    std::vector<uint8_t> getPKIXPublicDER() const;
    std::vector<uint8_t> getPKCS1PrivateDER() const;
    std::vector<uint8_t> getPKCS8PrivateDER() const;

    const RSA* rsa() const { return m_rsa; }

private:
    RSA* m_rsa{nullptr};
};

// Ed25519 key for type-mismatch cases (SubjectPublicKeyInfo / PKCS#8)
bool generateEd25519(std::vector<uint8_t>& pkixPublicDER, std::vector<uint8_t>& pkcs8PrivateDER);

// Wrap DER bytes in a PEM block with the given label
std::vector<uint8_t> toPEM(const std::string& label, const std::vector<uint8_t>& der);
