// Cli.cpp
#include "Cli.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>

#include "BlobEncoder.hpp"
#include "KeyParser.hpp"
#include "Verbose.hpp"

namespace KeyBlob {

namespace {

bool readAll(const std::string& path, std::vector<uint8_t>& data) {
    if (path == "-") {
        data.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return false;
    data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

bool writeAll(const std::string& path, const std::vector<uint8_t>& blob, bool hex) {
    std::string text = hex ? hexString(blob) + "\n" : std::string(blob.begin(), blob.end());
    if (path.empty()) {
        std::cout.write(text.data(), static_cast<std::streamsize>(text.size()));
        std::cout.flush();
        return static_cast<bool>(std::cout);
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) return false;
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    return static_cast<bool>(out);
}

bool convertDer(const std::vector<uint8_t>& der, const std::string& label, const CliOptions& opts,
                std::vector<uint8_t>& blob, KeyBlobError& error) {
    const bool labelSaysPublic = label.find("PUBLIC") != std::string::npos;

    if (opts.kind == BlobKind::Private || (opts.kind == BlobKind::Auto && !labelSaysPublic)) {
        RSAPrivateKey key;
        if (parsePrivateKey(der, key, error)) {
            return encodePrivateKeyBlob(key, opts.usage, blob, error);
        }
        if (opts.kind == BlobKind::Private || error.code != ErrorCode::DecodeError) {
            return false;
        }
        error.clear();
    }

    RSAPublicKey key;
    if (!parsePublicKey(der, key, error)) {
        if (opts.kind != BlobKind::Public || error.code != ErrorCode::DecodeError || labelSaysPublic) {
            return false;
        }
        // --public on a private key file
        RSAPrivateKey priv;
        KeyBlobError privError;
        if (!parsePrivateKey(der, priv, privError)) {
            return false;
        }
        error.clear();
        key = priv.publicKey();
    }
    return encodePublicKeyBlob(key, opts.usage, blob, error);
}

} // anonymous namespace

std::string hexString(const std::vector<uint8_t>& bytes) {
    static const char* hexd = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[2 * i] = hexd[(bytes[i] >> 4) & 0xF];
        out[2 * i + 1] = hexd[bytes[i] & 0xF];
    }
    return out;
}

void printUsage() {
    std::cout << "Usage: keyblob [options]\n"
              << "  --in=PATH        RSA key in PEM or DER (default: stdin)\n"
              << "  --out=PATH       write the blob here (default: stdout)\n"
              << "  --public         emit PUBLICKEYBLOB (a private key exports its public half)\n"
              << "  --private        emit PRIVATEKEYBLOB\n"
              << "  --usage=sign|keyx  ALG_ID for the blob header (env KEYBLOB_USAGE, default sign)\n"
              << "  --der            input is DER, skip PEM decoding\n"
              << "  --hex            write lowercase hex text instead of raw bytes\n"
              << "  --verbose        diagnostics on stderr (env KEYBLOB_VERBOSE=1)\n";
}

int parseCommandLine(const std::vector<std::string>& args, CliOptions& opts, std::string& problem) {
    bool usageSet = false;

    for (const std::string& arg : args) {
        const std::string inFlag = "--in=";
        const std::string outFlag = "--out=";
        const std::string usageFlag = "--usage=";

        if (arg.rfind(inFlag, 0) == 0) opts.inPath = arg.substr(inFlag.size());
        else if (arg.rfind(outFlag, 0) == 0) opts.outPath = arg.substr(outFlag.size());
        else if (arg.rfind(usageFlag, 0) == 0) {
            const std::string value = arg.substr(usageFlag.size());
            if (!keyUsageFromString(value, opts.usage)) {
                problem = std::string(errorCodeName(ErrorCode::InvalidUsage)) + ": unknown usage '" + value + "'";
                return ExitCode::ConversionError;
            }
            usageSet = true;
        }
        else if (arg == "--public") opts.kind = BlobKind::Public;
        else if (arg == "--private") opts.kind = BlobKind::Private;
        else if (arg == "--der") opts.forceDer = true;
        else if (arg == "--hex") opts.hex = true;
        else if (arg == "--verbose") opts.verbose = true;
        else if (arg == "--help" || arg == "-h") opts.help = true;
        else {
            problem = "Unknown argument: " + arg;
            return ExitCode::UsageError;
        }
    }

    if (!usageSet) {
        if (const char* envUsage = std::getenv("KEYBLOB_USAGE")) {
            if (!keyUsageFromString(envUsage, opts.usage)) {
                problem = std::string(errorCodeName(ErrorCode::InvalidUsage)) + ": KEYBLOB_USAGE='" + envUsage + "'";
                return ExitCode::ConversionError;
            }
        }
    }
    return ExitCode::Success;
}

bool convertKey(const std::vector<uint8_t>& input, const CliOptions& opts,
                std::vector<uint8_t>& blob, KeyBlobError& error) {
    blob.clear();
    std::vector<uint8_t> der;
    std::string label;
    if (opts.forceDer) {
        der = input;
    } else if (!decodePEM(input, der, label, error)) {
        if (verboseLogging()) {
            std::cerr << "[keyblob] No PEM block, treating input as DER" << std::endl;
        }
        error.clear();
        der = input;
    }
    return convertDer(der, label, opts, blob, error);
}

int runCli(const std::vector<std::string>& args) {
    CliOptions opts;
    std::string problem;
    int rc = parseCommandLine(args, opts, problem);
    if (rc != ExitCode::Success) {
        std::cerr << "[keyblob] " << problem << std::endl;
        if (rc == ExitCode::UsageError) printUsage();
        return rc;
    }
    if (opts.help) {
        printUsage();
        return ExitCode::Success;
    }
    if (opts.verbose) setVerboseLogging(true);

    std::vector<uint8_t> input;
    if (!readAll(opts.inPath, input)) {
        std::cerr << "[keyblob] Cannot read " << opts.inPath << std::endl;
        return ExitCode::UsageError;
    }

    std::vector<uint8_t> blob;
    KeyBlobError error;
    if (!convertKey(input, opts, blob, error)) {
        std::cerr << "[keyblob] " << errorCodeName(error.code) << ": " << error.message << std::endl;
        return ExitCode::ConversionError;
    }

    if (!writeAll(opts.outPath, blob, opts.hex)) {
        std::cerr << "[keyblob] Cannot write " << (opts.outPath.empty() ? "stdout" : opts.outPath) << std::endl;
        return ExitCode::UsageError;
    }

    if (verboseLogging()) {
        std::cerr << "[keyblob] Wrote " << blob.size() << " byte blob, usage " << keyUsageName(opts.usage) << std::endl;
    }
    return ExitCode::Success;
}

} // namespace KeyBlob
