// KeyBlobError.cpp
#include "KeyBlobError.hpp"

#include <openssl/err.h>

namespace KeyBlob {

void KeyBlobError::clear() {
    code = ErrorCode::None;
    message.clear();
}

bool KeyBlobError::fail(ErrorCode errorCode, const std::string& what) {
    code = errorCode;
    message = what;
    return false;
}

const char* errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::None: return "None";
    case ErrorCode::PEMDecodeError: return "PEMDecodeError";
    case ErrorCode::DecodeError: return "DecodeError";
    case ErrorCode::KeyTypeMismatch: return "KeyTypeMismatch";
    case ErrorCode::InvalidUsage: return "InvalidUsage";
    case ErrorCode::EncodingOverflow: return "EncodingOverflow";
    case ErrorCode::InvalidKeyMaterial: return "InvalidKeyMaterial";
    }
    return "Unknown";
}

std::string lastOpenSSLError() {
    unsigned long err = ERR_get_error();
    if (err == 0) return {};
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

} // namespace KeyBlob
