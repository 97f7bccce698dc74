// BigNum.hpp - Value wrapper around an OpenSSL BIGNUM
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <openssl/bn.h>

namespace KeyBlob {

// Owns one BIGNUM. Copies are deep (BN_dup), so key structs holding
// BigNum members behave like plain values.
//
// The source of a move construction holds no BIGNUM: get() returns nullptr
// and the queries report zero. Assign it a new value before handing it to
// OpenSSL. Move assignment swaps.
class BigNum {
public:
    BigNum();
    explicit BigNum(uint64_t value);
    ~BigNum();

    BigNum(const BigNum& other);
    BigNum& operator=(const BigNum& other);
    BigNum(BigNum&& other) noexcept;
    BigNum& operator=(BigNum&& other) noexcept;

    // Build from an unsigned big-endian magnitude
    static BigNum fromBytes(const std::vector<uint8_t>& bigEndian);

    // Take ownership of a BIGNUM allocated by OpenSSL
    static BigNum adopt(BIGNUM* bn);

    // Copy a BIGNUM still owned by someone else (e.g. RSA_get0_key results)
    static BigNum copyOf(const BIGNUM* bn);

    int bitLength() const;
    int byteLength() const;
    bool isZero() const;
    bool isNegative() const;

    // Minimal big-endian magnitude (empty for zero)
    std::vector<uint8_t> toBytes() const;
    std::string toHex() const;

    // nullptr only after this BigNum was moved from
    const BIGNUM* get() const { return m_bn; }
    BIGNUM* get() { return m_bn; }

    bool operator==(const BigNum& other) const;
    bool operator!=(const BigNum& other) const { return !(*this == other); }

private:
    BIGNUM* m_bn{nullptr};
};

} // namespace KeyBlob
