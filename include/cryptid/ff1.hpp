#pragma once

#include <cstddef>
#include <optional>

#include "cryptid/crypto.hpp"

namespace cryptid {

// NIST SP 800-38G FF1 over radix 2 with an AES-256 PRF and no tweak.
//
// A byte string is read as a binary numeral string little-endian bit first:
// numeral 8*i + j is bit j of byte i. Output has the same length as input.
class Ff1 {
public:
    explicit Ff1(crypto::Bytes key);

    static bool SupportsLength(std::size_t len) noexcept;

    // nullopt when the length is outside what FF1 accepts here.
    std::optional<crypto::Bytes> Encrypt(const crypto::Bytes& plaintext) const;
    std::optional<crypto::Bytes> Decrypt(const crypto::Bytes& ciphertext) const;

private:
    crypto::Bytes key_;
};

}  // namespace cryptid
