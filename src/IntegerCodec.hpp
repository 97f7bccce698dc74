// IntegerCodec.hpp - Fixed-width little-endian integer fields
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "BigNum.hpp"
#include "KeyBlobError.hpp"

namespace KeyBlob {
namespace IntegerCodec {

// Render `value` zero-padded to exactly `width` bytes, least significant byte
// first, and append it to `out`. Fails with EncodingOverflow instead of
// truncating when the magnitude needs more than `width` bytes; `out` is left
// untouched on failure.
bool encode(const BigNum& value, size_t width, std::vector<uint8_t>& out, KeyBlobError& error);

// Little-endian field back to an integer
BigNum decode(const uint8_t* field, size_t width);

void appendUInt32LE(std::vector<uint8_t>& out, uint32_t value);

} // namespace IntegerCodec
} // namespace KeyBlob
