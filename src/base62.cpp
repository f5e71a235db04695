#include "cryptid/base62.hpp"

#include <algorithm>
#include <array>

namespace cryptid::base62 {

namespace {

std::array<int, 256> BuildDecodeTable() {
    std::array<int, 256> table{};
    table.fill(-1);
    for (unsigned i = 0; i < kRadix; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int>(i);
    }
    return table;
}

const std::array<int, 256> kDecodeTable = BuildDecodeTable();

bool IsZero(const packing::Block& value) {
    return std::all_of(value.begin(), value.end(), [](std::uint8_t b) { return b == 0; });
}

}  // namespace

std::string Encode(const packing::Block& value) {
    // Long division on a big-endian copy, one base62 digit per pass.
    packing::Block work;
    std::reverse_copy(value.begin(), value.end(), work.begin());
    std::string out;
    out.reserve(22);
    while (!IsZero(work)) {
        unsigned rem = 0;
        for (std::uint8_t& byte : work) {
            unsigned cur = (rem << 8) | byte;
            byte = static_cast<std::uint8_t>(cur / kRadix);
            rem = cur % kRadix;
        }
        out.push_back(kAlphabet[rem]);
    }
    if (out.empty()) {
        out.push_back(kAlphabet[0]);
    }
    std::reverse(out.begin(), out.end());
    return out;
}

packing::Block Decode(std::string_view input, bool* ok) {
    bool success = !input.empty();
    packing::Block out{};
    for (unsigned char c : input) {
        int digit = kDecodeTable[c];
        if (digit < 0) {
            success = false;
            break;
        }
        unsigned carry = static_cast<unsigned>(digit);
        for (std::uint8_t& byte : out) {
            unsigned cur = static_cast<unsigned>(byte) * kRadix + carry;
            byte = static_cast<std::uint8_t>(cur & 0xFF);
            carry = cur >> 8;
        }
        if (carry != 0) {
            success = false;
            break;
        }
    }
    if (ok) {
        *ok = success;
    }
    if (!success) {
        out.fill(0);
    }
    return out;
}

}  // namespace cryptid::base62
