// Verbose.hpp - Diagnostic logging switch
#pragma once

namespace KeyBlob {

// True when KEYBLOB_VERBOSE is "1"/"true" or setVerboseLogging(true) was called.
// Diagnostics are written to std::cerr with a bracketed component tag.
bool verboseLogging();
void setVerboseLogging(bool enabled);

} // namespace KeyBlob
