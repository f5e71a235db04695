#include "cryptid/packing.hpp"

#include <algorithm>
#include <stdexcept>

namespace cryptid::packing {

namespace {

// Index of the highest non-zero byte, or 0 when every byte is zero.
template <typename Container>
std::size_t LastNonZero(const Container& bytes) {
    for (std::size_t i = bytes.size(); i-- > 0;) {
        if (bytes[i] != 0) {
            return i;
        }
    }
    return 0;
}

}  // namespace

crypto::Bytes TrimNumber(std::uint64_t num, std::size_t min_length) {
    std::array<std::uint8_t, constants::kNumberBytes> bytes{};
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<std::uint8_t>((num >> (8 * i)) & 0xFF);
    }
    std::size_t length = std::max(LastNonZero(bytes) + 1, min_length);
    length = std::min(length, bytes.size());
    return crypto::Bytes(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(length));
}

std::uint64_t ExpandNumber(const crypto::Bytes& bytes) {
    if (bytes.size() > constants::kNumberBytes) {
        throw std::length_error("Number does not fit in 64 bits");
    }
    std::uint64_t num = 0;
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        num |= static_cast<std::uint64_t>(bytes[i]) << (8 * i);
    }
    return num;
}

std::size_t MaxPayloadLength(std::size_t hmac_length, std::size_t zero_pad_length) {
    return std::max(constants::kNumberBytes, zero_pad_length) + hmac_length;
}

bool UsesSentinel(std::size_t hmac_length, std::size_t zero_pad_length) {
    return hmac_length + zero_pad_length < constants::kMaxBuffer;
}

bool IsLayoutSafe(std::size_t hmac_length, std::size_t zero_pad_length) {
    if (hmac_length > constants::kMaxHmacLength || zero_pad_length > constants::kMaxZeroPadLength) {
        return false;
    }
    std::size_t longest = MaxPayloadLength(hmac_length, zero_pad_length);
    if (UsesSentinel(hmac_length, zero_pad_length)) {
        return longest < constants::kMaxBuffer;
    }
    return longest == constants::kMaxBuffer;
}

Block Pack(const crypto::Bytes& payload) {
    if (payload.size() > constants::kMaxBuffer) {
        throw std::length_error("Payload exceeds 16 bytes");
    }
    Block block{};
    std::copy(payload.begin(), payload.end(), block.begin());
    if (payload.size() < block.size()) {
        block[payload.size()] = constants::kSentinel;
    }
    return block;
}

std::optional<crypto::Bytes> Unpack(const Block& block, bool sentinel_terminated, Error* error) {
    std::size_t length = block.size();
    if (sentinel_terminated) {
        length = LastNonZero(block);
        if (block[length] != constants::kSentinel) {
            if (error) {
                *error = Error::SentinelMismatch(block[length], constants::kSentinel);
            }
            return std::nullopt;
        }
    }
    return crypto::Bytes(block.begin(), block.begin() + static_cast<std::ptrdiff_t>(length));
}

}  // namespace cryptid::packing
