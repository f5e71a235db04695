#include "cryptid/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace cryptid::env {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

}  // namespace

std::string Get(std::string_view name) {
    std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (!value) {
        return {};
    }
    return std::string(value);
}

bool IsEnabled(std::string_view name, bool default_value) {
    std::string value = Get(name);
    if (value.empty()) {
        return default_value;
    }
    value = ToLower(value);
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::optional<std::uint8_t> GetU8(std::string_view name) {
    std::string raw = Get(name);
    if (raw.empty()) {
        return std::nullopt;
    }
    if (!std::all_of(raw.begin(), raw.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })
        || raw.size() > 3) {
        throw std::invalid_argument(std::string(name) + " is not a small decimal number: " + raw);
    }
    unsigned long parsed = std::stoul(raw);
    if (parsed > std::numeric_limits<std::uint8_t>::max()) {
        throw std::invalid_argument(std::string(name) + " is out of range: " + raw);
    }
    return static_cast<std::uint8_t>(parsed);
}

}  // namespace cryptid::env
