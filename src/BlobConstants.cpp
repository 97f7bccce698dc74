// BlobConstants.cpp
#include "BlobConstants.hpp"

#include <algorithm>
#include <cctype>

namespace KeyBlob {

const char* keyUsageName(KeyUsage usage) {
    switch (usage) {
    case KeyUsage::Sign: return "sign";
    case KeyUsage::KeyExchange: return "keyx";
    }
    return "invalid";
}

bool keyUsageFromString(const std::string& text, KeyUsage& usage) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "sign") {
        usage = KeyUsage::Sign;
        return true;
    }
    if (lower == "keyx") {
        usage = KeyUsage::KeyExchange;
        return true;
    }
    return false;
}

} // namespace KeyBlob
