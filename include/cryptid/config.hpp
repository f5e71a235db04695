#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cryptid/constants.hpp"
#include "cryptid/crypto.hpp"

namespace cryptid {

// Secret key and layout options for building codecs.
//
// hmac_length defaults to 4, enough to make guessing impractical while keeping
// tokens short. zero_pad_length defaults to 4, so most applications never see
// tokens grow. The key is copied; it should be random with enough entropy.
class Config {
public:
    explicit Config(crypto::Bytes key);
    explicit Config(std::string_view key);

    // Reads CRYPTID_KEY, CRYPTID_HMAC_LENGTH and CRYPTID_ZERO_PAD_LENGTH.
    static Config FromEnv();

    // Both accept 0..8 and throw ConfigError otherwise.
    Config& SetHmacLength(unsigned int hmac_length);
    Config& SetZeroPadLength(unsigned int zero_pad_length);

    const crypto::Bytes& key() const noexcept { return key_; }
    std::uint8_t hmac_length() const noexcept { return hmac_length_; }
    std::uint8_t zero_pad_length() const noexcept { return zero_pad_length_; }

    // Throws ConfigError{UnsafeLayout} for a combination that cannot round-trip
    // every 64-bit number through the 16-byte buffer.
    // Also logs Warnings(), each distinct message once per process.
    void Validate() const;
    // Accepted but weak settings: no MAC, or a short key.
    std::vector<std::string> Warnings() const;

    // Process-wide holder for collaborators that build codecs by name.
    static void SetGlobal(Config config);
    static std::optional<Config> Global();
    static void ClearGlobal();

private:
    crypto::Bytes key_;
    std::uint8_t hmac_length_ = constants::kDefaultHmacLength;
    std::uint8_t zero_pad_length_ = constants::kDefaultZeroPadLength;
};

}  // namespace cryptid
