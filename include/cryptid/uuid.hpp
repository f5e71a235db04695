#pragma once

#include <string>
#include <string_view>

#include "cryptid/packing.hpp"

namespace cryptid::uuid {

// Lowercase 8-4-4-4-12 rendering, byte 0 first.
std::string Format(const packing::Block& bytes);
// Accepts the hyphenated form or 32 bare hex digits, either case.
packing::Block Parse(std::string_view text, bool* ok = nullptr);

}  // namespace cryptid::uuid
