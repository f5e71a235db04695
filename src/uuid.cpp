#include "cryptid/uuid.hpp"

#include <cctype>

namespace cryptid::uuid {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

bool IsHyphenSlot(std::size_t index) {
    return index == 8 || index == 13 || index == 18 || index == 23;
}

int HexValue(unsigned char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    ch = static_cast<unsigned char>(std::tolower(ch));
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    return -1;
}

}  // namespace

std::string Format(const packing::Block& bytes) {
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(kHexDigits[bytes[i] >> 4]);
        out.push_back(kHexDigits[bytes[i] & 0x0F]);
    }
    return out;
}

packing::Block Parse(std::string_view text, bool* ok) {
    packing::Block out{};
    bool hyphenated = text.size() == 36;
    bool success = hyphenated || text.size() == 32;
    std::size_t nibble = 0;
    for (std::size_t i = 0; success && i < text.size(); ++i) {
        if (hyphenated && IsHyphenSlot(i)) {
            success = text[i] == '-';
            continue;
        }
        int value = HexValue(static_cast<unsigned char>(text[i]));
        if (value < 0) {
            success = false;
            break;
        }
        std::uint8_t& byte = out[nibble / 2];
        byte = static_cast<std::uint8_t>(nibble % 2 == 0 ? value << 4 : byte | value);
        ++nibble;
    }
    if (ok) {
        *ok = success;
    }
    if (!success) {
        out.fill(0);
    }
    return out;
}

}  // namespace cryptid::uuid
