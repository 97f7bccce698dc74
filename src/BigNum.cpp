// BigNum.cpp
#include "BigNum.hpp"

#include <new>
#include <utility>

#include <openssl/crypto.h>

namespace KeyBlob {

namespace {

BIGNUM* allocOrThrow(BIGNUM* bn) {
    if (!bn) {
        throw std::bad_alloc();
    }
    return bn;
}

} // anonymous namespace

BigNum::BigNum()
    : m_bn(allocOrThrow(BN_new()))
{
}

BigNum::BigNum(uint64_t value)
    : m_bn(allocOrThrow(BN_new()))
{
    if (BN_set_word(m_bn, static_cast<BN_ULONG>(value)) != 1) {
        BN_free(m_bn);
        throw std::bad_alloc();
    }
}

BigNum::~BigNum() {
    BN_free(m_bn);
}

BigNum::BigNum(const BigNum& other)
    : m_bn(other.m_bn ? allocOrThrow(BN_dup(other.m_bn)) : nullptr)
{
}

BigNum& BigNum::operator=(const BigNum& other) {
    if (this != &other) {
        BIGNUM* copy = other.m_bn ? allocOrThrow(BN_dup(other.m_bn)) : nullptr;
        BN_free(m_bn);
        m_bn = copy;
    }
    return *this;
}

BigNum::BigNum(BigNum&& other) noexcept
    : m_bn(other.m_bn)
{
    other.m_bn = nullptr;
}

BigNum& BigNum::operator=(BigNum&& other) noexcept {
    if (this != &other) {
        std::swap(m_bn, other.m_bn);
    }
    return *this;
}

BigNum BigNum::fromBytes(const std::vector<uint8_t>& bigEndian) {
    BigNum out;
    if (!BN_bin2bn(bigEndian.data(), static_cast<int>(bigEndian.size()), out.m_bn)) {
        throw std::bad_alloc();
    }
    return out;
}

BigNum BigNum::adopt(BIGNUM* bn) {
    BigNum out;
    BN_free(out.m_bn);
    out.m_bn = allocOrThrow(bn);
    return out;
}

BigNum BigNum::copyOf(const BIGNUM* bn) {
    return adopt(BN_dup(bn));
}

int BigNum::bitLength() const {
    return m_bn ? BN_num_bits(m_bn) : 0;
}

int BigNum::byteLength() const {
    return m_bn ? BN_num_bytes(m_bn) : 0;
}

bool BigNum::isZero() const {
    return !m_bn || BN_is_zero(m_bn);
}

bool BigNum::isNegative() const {
    return m_bn && BN_is_negative(m_bn);
}

std::vector<uint8_t> BigNum::toBytes() const {
    std::vector<uint8_t> out(static_cast<size_t>(byteLength()));
    if (!out.empty()) {
        BN_bn2bin(m_bn, out.data());
    }
    return out;
}

std::string BigNum::toHex() const {
    if (!m_bn) return "0";
    char* hex = BN_bn2hex(m_bn);
    if (!hex) {
        throw std::bad_alloc();
    }
    std::string result = hex;
    OPENSSL_free(hex);
    return result;
}

bool BigNum::operator==(const BigNum& other) const {
    if (!m_bn || !other.m_bn) return isZero() && other.isZero();
    return BN_cmp(m_bn, other.m_bn) == 0;
}

} // namespace KeyBlob
