#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "cryptid/constants.hpp"
#include "cryptid/crypto.hpp"
#include "cryptid/error.hpp"

namespace cryptid::packing {

// 128-bit value, little-endian.
using Block = std::array<std::uint8_t, constants::kMaxBuffer>;

// Little-endian bytes of `num`, trailing zero bytes dropped but never shorter
// than `min_length` (capped at 8).
crypto::Bytes TrimNumber(std::uint64_t num, std::size_t min_length);
// Zero-extends up to 8 little-endian bytes. Longer input throws std::length_error.
std::uint64_t ExpandNumber(const crypto::Bytes& bytes);

std::size_t MaxPayloadLength(std::size_t hmac_length, std::size_t zero_pad_length);
bool UsesSentinel(std::size_t hmac_length, std::size_t zero_pad_length);
// False for layouts whose longest payload would leave no sentinel slot while
// decoding still expects one, or would not fit at all.
bool IsLayoutSafe(std::size_t hmac_length, std::size_t zero_pad_length);

// Places the payload at offset 0 and the sentinel right after it when there is
// room. Payloads over 16 bytes throw std::length_error.
Block Pack(const crypto::Bytes& payload);

// Recovers the payload. With `sentinel_terminated` the highest non-zero byte
// must be the sentinel; otherwise all 16 bytes are payload.
std::optional<crypto::Bytes> Unpack(const Block& block, bool sentinel_terminated, Error* error);

}  // namespace cryptid::packing
