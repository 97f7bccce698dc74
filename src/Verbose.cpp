// Verbose.cpp
#include "Verbose.hpp"

#include <atomic>
#include <cstdlib>
#include <string>

namespace KeyBlob {

namespace {

bool envVerbose() {
    const char* env = std::getenv("KEYBLOB_VERBOSE");
    if (!env) return false;
    std::string value = env;
    return value == "1" || value == "true";
}

std::atomic<bool> g_forced{false};

} // anonymous namespace

bool verboseLogging() {
    static const bool fromEnv = envVerbose();
    return fromEnv || g_forced.load();
}

void setVerboseLogging(bool enabled) {
    g_forced.store(enabled);
}

} // namespace KeyBlob
