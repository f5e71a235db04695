#pragma once

#include <cstddef>
#include <cstdint>

#include "cryptid/crypto.hpp"

namespace cryptid {

// Truncated HMAC-SHA256 over the ciphertext.
class IntegrityTag {
public:
    IntegrityTag(crypto::Bytes key, std::size_t length);

    std::size_t length() const noexcept { return length_; }
    IntegrityTag WithLength(std::size_t length) const;

    crypto::Bytes Compute(const crypto::Bytes& data) const;
    void Append(crypto::Bytes& data) const;

    // Constant time in the tag contents.
    bool Verify(const crypto::Bytes& data, const std::uint8_t* tag, std::size_t tag_len) const;

private:
    crypto::Bytes key_;
    std::size_t length_ = 0;
};

}  // namespace cryptid
