// IntegerCodec.cpp
#include "IntegerCodec.hpp"

#include <algorithm>
#include <new>
#include <sstream>

#include <openssl/bn.h>

namespace KeyBlob {
namespace IntegerCodec {

bool encode(const BigNum& value, size_t width, std::vector<uint8_t>& out, KeyBlobError& error) {
    if (value.isNegative()) {
        return error.fail(ErrorCode::EncodingOverflow, "negative integers have no blob encoding");
    }

    size_t needed = static_cast<size_t>(value.byteLength());
    if (needed > width) {
        std::ostringstream msg;
        msg << "integer needs " << needed << " bytes but the field holds " << width;
        return error.fail(ErrorCode::EncodingOverflow, msg.str());
    }

    // Big-endian, zero padded on the most significant side, then reversed
    std::vector<uint8_t> field(width);
    // A moved-from value has no BIGNUM and encodes as zero
    if (width > 0 && value.get() && BN_bn2binpad(value.get(), field.data(), static_cast<int>(width)) < 0) {
        return error.fail(ErrorCode::EncodingOverflow, "BN_bn2binpad failed: " + lastOpenSSLError());
    }
    std::reverse(field.begin(), field.end());

    out.insert(out.end(), field.begin(), field.end());
    return true;
}

BigNum decode(const uint8_t* field, size_t width) {
    if (width == 0) return BigNum();
    BIGNUM* bn = BN_lebin2bn(field, static_cast<int>(width), nullptr);
    if (!bn) {
        throw std::bad_alloc();
    }
    return BigNum::adopt(bn);
}

void appendUInt32LE(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

} // namespace IntegerCodec
} // namespace KeyBlob
