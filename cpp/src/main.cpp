#include "idtoken/codec.hpp"
#include "idtoken/constants.hpp"
#include "idtoken/env.hpp"
#include "idtoken/errors.hpp"
#include "idtoken/log.hpp"
#include "idtoken/tokenizer.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  idtoken encode <id> -p <password> -s <salt> [--bits <n>] [--digest <name>] [--alphabet legacy|crockford]\n";
    std::cout << "  idtoken decode <token> -p <password> -s <salt> [--bits <n>] [--digest <name>] [--alphabet legacy|crockford]\n";
    std::cout << "  idtoken verify <token> -p <password> -s <salt> [--bits <n>] [--digest <name>] [--alphabet legacy|crockford]\n";
    std::cout << "  idtoken convert <digits> <from-base> <to-base>\n";
    std::cout << "  idtoken version\n";
    std::cout << "Common flags: --no-color, --debug\n";
    std::cout << "Environment: IDTOKEN_PASSWORD, IDTOKEN_SALT, IDTOKEN_DIGEST, IDTOKEN_TAG_BITS, IDTOKEN_ALPHABET, IDTOKEN_DEBUG\n";
}

struct TokenArgs {
    std::string input;
    std::string password;
    std::string salt;
    bool has_salt = false;
    idtoken::TokenizerOptions options;
};

int ParseBase(const std::string& value) {
    std::size_t used = 0;
    int base = std::stoi(value, &used);
    if (used != value.size()) {
        throw std::runtime_error("Invalid base: " + value);
    }
    return base;
}

TokenArgs ParseTokenArgs(int argc, char** argv, int start_index) {
    TokenArgs opts;
    opts.options = idtoken::TokenizerOptions::FromEnvironment();
    if (start_index >= argc) {
        throw std::runtime_error("Missing payload");
    }
    opts.input = argv[start_index];
    int idx = start_index + 1;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "-p" || flag == "--password") {
            if (idx + 1 >= argc) {
                throw std::runtime_error("Missing password value");
            }
            opts.password = argv[idx + 1];
            idx += 2;
        } else if (flag == "-s" || flag == "--salt") {
            if (idx + 1 >= argc) {
                throw std::runtime_error("Missing salt value");
            }
            opts.salt = argv[idx + 1];
            opts.has_salt = true;
            idx += 2;
        } else if (flag == "--bits") {
            if (idx + 1 >= argc) {
                throw std::runtime_error("Missing tag length");
            }
            opts.options.tag_bits = static_cast<std::size_t>(std::stoul(argv[idx + 1]));
            idx += 2;
        } else if (flag == "--digest") {
            if (idx + 1 >= argc) {
                throw std::runtime_error("Missing digest name");
            }
            opts.options.digest = argv[idx + 1];
            idx += 2;
        } else if (flag == "--alphabet") {
            if (idx + 1 >= argc) {
                throw std::runtime_error("Missing alphabet name");
            }
            opts.options.alphabet = idtoken::codec::ParseBase32Alphabet(argv[idx + 1]);
            idx += 2;
        } else {
            throw std::runtime_error("Unknown flag: " + flag);
        }
    }
    if (opts.password.empty()) {
        opts.password = idtoken::env::Get(idtoken::constants::kEnvPassword);
    }
    if (!opts.has_salt) {
        opts.salt = idtoken::env::Get(idtoken::constants::kEnvSalt);
        opts.has_salt = !opts.salt.empty();
    }
    if (opts.password.empty()) {
        throw std::runtime_error("Password is required (-p or IDTOKEN_PASSWORD)");
    }
    if (!opts.has_salt) {
        throw std::runtime_error("Salt is required (-s or IDTOKEN_SALT)");
    }
    return opts;
}

// Strips --no-color and --debug wherever they appear.
int ApplyGlobalFlags(int argc, char** argv) {
    int out = 1;
    for (int i = 1; i < argc; ++i) {
        std::string flag(argv[i]);
        if (flag == "--no-color") {
            idtoken::log::SetColorsEnabled(false);
        } else if (flag == "--debug") {
            idtoken::log::SetDebugEnabled(true);
        } else {
            argv[out++] = argv[i];
        }
    }
    return out;
}

}  // namespace

int main(int argc, char** argv) {
    argc = ApplyGlobalFlags(argc, argv);
    if (argc < 2) {
        PrintUsage();
        return 2;
    }
    std::string command(argv[1]);
    try {
        if (command == "version") {
            std::cout << "idtoken " << idtoken::constants::kVersion << "\n";
            return 0;
        }
        if (command == "convert") {
            if (argc != 5) {
                PrintUsage();
                return 2;
            }
            std::cout << idtoken::codec::Convert(argv[2], ParseBase(argv[3]), ParseBase(argv[4])) << "\n";
            return 0;
        }
        if (command == "encode" || command == "decode" || command == "verify") {
            TokenArgs opts = ParseTokenArgs(argc, argv, 2);
            idtoken::Tokenizer tokenizer(opts.password, opts.salt, opts.options);
            if (command == "encode") {
                std::cout << tokenizer.Encode(opts.input) << "\n";
                return 0;
            }
            std::optional<std::string> id = tokenizer.TryDecode(opts.input);
            if (!id) {
                idtoken::log::Error("invalid token");
                return 1;
            }
            if (command == "decode") {
                std::cout << *id << "\n";
            } else {
                std::cout << "valid\n";
            }
            return 0;
        }
        PrintUsage();
        return 2;
    } catch (const std::exception& exc) {
        idtoken::log::Error(exc.what());
        return 1;
    }
}
