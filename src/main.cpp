#include "cryptid/cryptid.hpp"

#include <cctype>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  cryptid encode <name> <number> [-k <key>] [--hmac-length <n>] [--zero-pad-length <n>]\n";
    std::cout << "  cryptid decode <name> <token> [-k <key>] [--hmac-length <n>] [--zero-pad-length <n>]\n";
    std::cout << "  cryptid uuid <name> <number> [-k <key>]\n";
    std::cout << "  cryptid uuid-decode <name> <uuid> [-k <key>]\n";
    std::cout << "The key defaults to $" << cryptid::constants::kEnvKey << ".\n";
}

struct ParsedOptions {
    std::string name;
    std::string input;
    std::string key;
    std::optional<unsigned int> hmac_length;
    std::optional<unsigned int> zero_pad_length;
};

std::uint64_t ParseNumber(const std::string& text) {
    if (text.empty() || text.size() > 20) {
        throw std::runtime_error("Not a 64-bit unsigned number: " + text);
    }
    for (char ch : text) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            throw std::runtime_error("Not a 64-bit unsigned number: " + text);
        }
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        throw std::runtime_error("Not a 64-bit unsigned number: " + text);
    }
}

unsigned int ParseLength(const std::string& flag, const std::string& text) {
    if (text.empty() || text.size() > 2 || !std::isdigit(static_cast<unsigned char>(text[0]))
        || (text.size() == 2 && !std::isdigit(static_cast<unsigned char>(text[1])))) {
        throw std::runtime_error("Invalid value for " + flag + ": " + text);
    }
    return static_cast<unsigned int>(std::stoul(text));
}

ParsedOptions ParseArgs(int argc, char** argv, int start_index) {
    ParsedOptions opts;
    if (start_index + 1 >= argc) {
        throw std::runtime_error("Missing name or payload");
    }
    opts.name = argv[start_index];
    opts.input = argv[start_index + 1];
    int idx = start_index + 2;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (idx + 1 >= argc) {
            throw std::runtime_error("Missing value for " + flag);
        }
        std::string value(argv[idx + 1]);
        if (flag == "-k" || flag == "--key") {
            opts.key = value;
        } else if (flag == "--hmac-length") {
            opts.hmac_length = ParseLength(flag, value);
        } else if (flag == "--zero-pad-length") {
            opts.zero_pad_length = ParseLength(flag, value);
        } else {
            throw std::runtime_error("Unknown flag: " + flag);
        }
        idx += 2;
    }
    return opts;
}

cryptid::Config BuildConfig(const ParsedOptions& opts) {
    cryptid::Config config = opts.key.empty() ? cryptid::Config::FromEnv() : cryptid::Config(opts.key);
    if (opts.hmac_length) {
        config.SetHmacLength(*opts.hmac_length);
    }
    if (opts.zero_pad_length) {
        config.SetZeroPadLength(*opts.zero_pad_length);
    }
    return config;
}

int PrintDecoded(const cryptid::DecodeResult& result) {
    if (!result.ok()) {
        std::cerr << "Error: " << result.error->Message() << " ("
                  << cryptid::ErrorKindName(result.error->kind) << ")\n";
        return 1;
    }
    std::cout << result.value << "\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 2;
    }
    std::string command(argv[1]);
    if (command == "-h" || command == "--help" || command == "help") {
        PrintUsage();
        return 0;
    }
    try {
        if (command != "encode" && command != "decode" && command != "uuid" && command != "uuid-decode") {
            PrintUsage();
            return 2;
        }
        ParsedOptions opts = ParseArgs(argc, argv, 2);
        cryptid::Codec codec(opts.name, BuildConfig(opts));
        if (command == "encode") {
            std::cout << codec.Encode(ParseNumber(opts.input)) << "\n";
            return 0;
        }
        if (command == "uuid") {
            std::cout << codec.EncodeUuid(ParseNumber(opts.input)) << "\n";
            return 0;
        }
        if (command == "decode") {
            return PrintDecoded(codec.Decode(opts.input));
        }
        return PrintDecoded(codec.DecodeUuid(opts.input));
    } catch (const std::exception& exc) {
        std::cerr << "Error: " << exc.what() << "\n";
        return 1;
    }
}
