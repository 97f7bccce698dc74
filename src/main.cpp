// main.cpp - keyblob: convert PEM/DER RSA keys to CryptoAPI key blobs
#include "Cli.hpp"

#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return KeyBlob::runCli(args);
}
