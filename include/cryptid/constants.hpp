#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace cryptid::constants {

// Packed tokens are base62 renderings of a 128-bit value.
inline constexpr std::size_t kMaxBuffer = 16;
inline constexpr std::uint8_t kSentinel = 1;

inline constexpr std::size_t kNumberBytes = 8;
inline constexpr std::uint8_t kMaxHmacLength = 8;
inline constexpr std::uint8_t kMaxZeroPadLength = 8;
inline constexpr std::uint8_t kDefaultHmacLength = 4;
inline constexpr std::uint8_t kDefaultZeroPadLength = 4;

inline constexpr std::uint8_t kUuidHmacLength = 8;
inline constexpr std::uint8_t kUuidZeroPadLength = 8;

inline constexpr std::size_t kSubkeyLen = 32;
inline constexpr std::size_t kMinRecommendedKeyLen = 16;

// FF1 needs radix^n >= 1,000,000, which is 20 bits for radix 2.
inline constexpr std::size_t kFf1MinBits = 20;
inline constexpr std::size_t kFf1MinBytes = (kFf1MinBits + 7) / 8;
inline constexpr std::size_t kFf1MaxBytes = 16;
inline constexpr std::size_t kFf1Rounds = 10;
inline constexpr std::uint32_t kFf1Radix = 2;

inline constexpr std::string_view kCipherLabelSuffix = "/ff1";
inline constexpr std::string_view kMacLabelSuffix = "/hmac";
inline constexpr char kPrefixSeparator = '_';

inline constexpr std::string_view kEnvKey = "CRYPTID_KEY";
inline constexpr std::string_view kEnvHmacLength = "CRYPTID_HMAC_LENGTH";
inline constexpr std::string_view kEnvZeroPadLength = "CRYPTID_ZERO_PAD_LENGTH";
inline constexpr std::string_view kEnvQuiet = "CRYPTID_QUIET";

}  // namespace cryptid::constants
