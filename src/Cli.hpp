// Cli.hpp - Option parsing and conversion behind the keyblob executable
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "BlobConstants.hpp"
#include "KeyBlobError.hpp"

namespace KeyBlob {

enum class BlobKind { Auto, Public, Private };

struct CliOptions {
    std::string inPath = "-";   // "-" reads stdin
    std::string outPath;        // empty writes stdout
    BlobKind kind = BlobKind::Auto;
    KeyUsage usage = KeyUsage::Sign;
    bool forceDer = false;
    bool hex = false;
    bool verbose = false;
    bool help = false;
};

// Process exit codes
namespace ExitCode {
    constexpr int Success = 0;
    constexpr int ConversionError = 1;
    constexpr int UsageError = 2;
}

// Parse `--name=value` style arguments (program name excluded). KEYBLOB_USAGE
// supplies the usage when --usage is absent. Returns an ExitCode value;
// anything but Success comes with a description in `problem`.
int parseCommandLine(const std::vector<std::string>& args, CliOptions& opts, std::string& problem);

// Turn the key file contents into a blob. Unless forceDer is set, a PEM block
// is tried first and raw DER is assumed when none is found. In Auto mode a
// private key gives PRIVATEKEYBLOB, a public key PUBLICKEYBLOB, and a PEM
// label naming a public key skips the private attempt. Public mode on a
// private key exports its public half.
bool convertKey(const std::vector<uint8_t>& input, const CliOptions& opts,
                std::vector<uint8_t>& blob, KeyBlobError& error);

// Whole program: parse, read, convert, write. Returns the exit code.
int runCli(const std::vector<std::string>& args);

void printUsage();

// Lowercase hex, two digits per byte
std::string hexString(const std::vector<uint8_t>& bytes);

} // namespace KeyBlob
