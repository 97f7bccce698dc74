// KeyBlobError.hpp - Error reporting for key parsing and blob export
#pragma once

#include <string>

namespace KeyBlob {

enum class ErrorCode {
    None,
    PEMDecodeError,     // no PEM block found
    DecodeError,        // no recognized DER layout matched
    KeyTypeMismatch,    // wrapped key decoded but is not RSA
    InvalidUsage,       // usage outside {SIGN, KEYX}
    EncodingOverflow,   // value does not fit its fixed field width
    InvalidKeyMaterial  // CRT derivation preconditions violated
};

struct KeyBlobError {
    ErrorCode code{ErrorCode::None};
    std::string message;

    bool ok() const { return code == ErrorCode::None; }
    void clear();

    // Record a failure and return false, so call sites can `return error.fail(...)`
    bool fail(ErrorCode errorCode, const std::string& what);
};

const char* errorCodeName(ErrorCode code);

// Pop the earliest queued OpenSSL error and clear the rest (empty if the queue is empty)
std::string lastOpenSSLError();

} // namespace KeyBlob
