#include "cryptid/config.hpp"

#include "cryptid/env.hpp"
#include "cryptid/error.hpp"
#include "cryptid/packing.hpp"

#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <utility>

namespace cryptid {

namespace {

// Each distinct message is printed once per process.
void WarnConfig(const std::string& message) {
    if (env::IsEnabled(constants::kEnvQuiet)) {
        return;
    }
    static std::mutex mutex;
    static std::set<std::string> emitted;
    std::lock_guard<std::mutex> lock(mutex);
    if (emitted.insert(message).second) {
        std::cerr << "WARN: " << message << "\n";
    }
}

std::mutex& GlobalMutex() {
    static std::mutex mutex;
    return mutex;
}

std::optional<Config>& GlobalSlot() {
    static std::optional<Config> slot;
    return slot;
}

}  // namespace

Config::Config(crypto::Bytes key) : key_(std::move(key)) {}

Config::Config(std::string_view key) : key_(key.begin(), key.end()) {}

Config Config::FromEnv() {
    std::string key = env::Get(constants::kEnvKey);
    if (key.empty()) {
        throw ConfigError(ConfigErrorKind::MissingKey, std::string(constants::kEnvKey) + " is not set");
    }
    Config config(key);
    if (auto hmac_length = env::GetU8(constants::kEnvHmacLength)) {
        config.SetHmacLength(*hmac_length);
    }
    if (auto zero_pad_length = env::GetU8(constants::kEnvZeroPadLength)) {
        config.SetZeroPadLength(*zero_pad_length);
    }
    return config;
}

Config& Config::SetHmacLength(unsigned int hmac_length) {
    if (hmac_length > constants::kMaxHmacLength) {
        throw ConfigError(ConfigErrorKind::InvalidMacLength,
                          "hmac_length must be between 0 and 8, got " + std::to_string(hmac_length));
    }
    hmac_length_ = static_cast<std::uint8_t>(hmac_length);
    return *this;
}

Config& Config::SetZeroPadLength(unsigned int zero_pad_length) {
    if (zero_pad_length > constants::kMaxZeroPadLength) {
        throw ConfigError(ConfigErrorKind::InvalidZeroPadLength,
                          "zero_pad_length must be between 0 and 8, got " + std::to_string(zero_pad_length));
    }
    zero_pad_length_ = static_cast<std::uint8_t>(zero_pad_length);
    return *this;
}

void Config::Validate() const {
    if (!packing::IsLayoutSafe(hmac_length_, zero_pad_length_)) {
        throw ConfigError(ConfigErrorKind::UnsafeLayout,
                          "hmac_length " + std::to_string(hmac_length_) + " with zero_pad_length "
                              + std::to_string(zero_pad_length_)
                              + " leaves no room for the sentinel byte in a 16-byte token");
    }
    for (const std::string& warning : Warnings()) {
        WarnConfig(warning);
    }
}

std::vector<std::string> Config::Warnings() const {
    std::vector<std::string> warnings;
    if (hmac_length_ == 0) {
        warnings.push_back("hmac_length is 0; tokens are obfuscated but not integrity protected");
    }
    if (key_.size() < constants::kMinRecommendedKeyLen) {
        warnings.push_back("master key is " + std::to_string(key_.size()) + " bytes, shorter than "
                           + std::to_string(constants::kMinRecommendedKeyLen));
    }
    return warnings;
}

void Config::SetGlobal(Config config) {
    std::lock_guard<std::mutex> lock(GlobalMutex());
    GlobalSlot() = std::move(config);
}

std::optional<Config> Config::Global() {
    std::lock_guard<std::mutex> lock(GlobalMutex());
    return GlobalSlot();
}

void Config::ClearGlobal() {
    std::lock_guard<std::mutex> lock(GlobalMutex());
    GlobalSlot().reset();
}

}  // namespace cryptid
