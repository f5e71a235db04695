#pragma once

#include <string>
#include <string_view>

#include "cryptid/packing.hpp"

namespace cryptid::base62 {

// Digits, then uppercase, then lowercase.
inline constexpr char kAlphabet[] =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
inline constexpr unsigned kRadix = 62;

std::string Encode(const packing::Block& value);
// Empty input, characters outside the alphabet and values above 2^128 - 1 fail.
packing::Block Decode(std::string_view input, bool* ok = nullptr);

}  // namespace cryptid::base62
