#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cryptid::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);

// Unset or empty yields nullopt; anything that is not a decimal in range throws.
std::optional<std::uint8_t> GetU8(std::string_view name);

}  // namespace cryptid::env
