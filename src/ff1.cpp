#include "cryptid/ff1.hpp"

#include "cryptid/constants.hpp"

#include <array>
#include <stdexcept>
#include <utility>

namespace cryptid {

namespace {

using crypto::Bytes;
using Block = std::array<std::uint8_t, crypto::kAesBlockSize>;

// Numerals [offset, offset + count) read most significant first.
std::uint64_t NumFromBits(const Bytes& bytes, std::size_t offset, std::size_t count) {
    std::uint64_t value = 0;
    for (std::size_t k = offset; k < offset + count; ++k) {
        value = (value << 1) | ((bytes[k / 8] >> (k % 8)) & 1u);
    }
    return value;
}

void WriteBits(Bytes& bytes, std::size_t offset, std::size_t count, std::uint64_t value) {
    for (std::size_t i = 0; i < count; ++i) {
        std::size_t k = offset + count - 1 - i;
        if ((value >> i) & 1u) {
            bytes[k / 8] = static_cast<std::uint8_t>(bytes[k / 8] | (1u << (k % 8)));
        }
    }
}

std::uint64_t Mask(std::size_t bits) {
    return bits >= 64 ? ~std::uint64_t{0} : ((std::uint64_t{1} << bits) - 1);
}

// PRF(P || Q) for one FF1 call. P is the same for every round, so its CBC-MAC
// block is computed once; with no tweak and b < 16, Q is a single block.
class RoundFunction {
public:
    RoundFunction(const Bytes& key, std::size_t n, std::size_t u) : aes_(key) {
        std::size_t v = n - u;
        b_ = (v + 7) / 8;
        d_ = 4 * ((b_ + 3) / 4) + 4;

        Block p{};
        p[0] = 1;
        p[1] = 2;
        p[2] = 1;
        p[3] = static_cast<std::uint8_t>((constants::kFf1Radix >> 16) & 0xFF);
        p[4] = static_cast<std::uint8_t>((constants::kFf1Radix >> 8) & 0xFF);
        p[5] = static_cast<std::uint8_t>(constants::kFf1Radix & 0xFF);
        p[6] = static_cast<std::uint8_t>(constants::kFf1Rounds);
        p[7] = static_cast<std::uint8_t>(u % 256);
        p[8] = static_cast<std::uint8_t>((n >> 24) & 0xFF);
        p[9] = static_cast<std::uint8_t>((n >> 16) & 0xFF);
        p[10] = static_cast<std::uint8_t>((n >> 8) & 0xFF);
        p[11] = static_cast<std::uint8_t>(n & 0xFF);
        aes_.Encrypt(p.data(), p_mac_.data());
    }

    // Low 64 bits of NUM_2(S); m never exceeds 64 so nothing else matters.
    std::uint64_t operator()(std::size_t round, std::uint64_t num) {
        Block q{};
        q[crypto::kAesBlockSize - 1 - b_] = static_cast<std::uint8_t>(round);
        for (std::size_t j = 0; j < b_; ++j) {
            q[crypto::kAesBlockSize - 1 - j] = static_cast<std::uint8_t>((num >> (8 * j)) & 0xFF);
        }
        for (std::size_t j = 0; j < q.size(); ++j) {
            q[j] ^= p_mac_[j];
        }
        Block r{};
        aes_.Encrypt(q.data(), r.data());

        std::uint64_t y = 0;
        for (std::size_t j = d_ > 8 ? d_ - 8 : 0; j < d_; ++j) {
            y = (y << 8) | r[j];
        }
        return y;
    }

private:
    crypto::Aes256Block aes_;
    Block p_mac_{};
    std::size_t b_ = 0;
    std::size_t d_ = 0;
};

}  // namespace

Ff1::Ff1(crypto::Bytes key) : key_(std::move(key)) {
    if (key_.size() != constants::kSubkeyLen) {
        throw std::invalid_argument("FF1 expects a 32-byte AES-256 key");
    }
}

bool Ff1::SupportsLength(std::size_t len) noexcept {
    return len >= constants::kFf1MinBytes && len <= constants::kFf1MaxBytes;
}

std::optional<crypto::Bytes> Ff1::Encrypt(const crypto::Bytes& plaintext) const {
    if (!SupportsLength(plaintext.size())) {
        return std::nullopt;
    }
    const std::size_t n = plaintext.size() * 8;
    const std::size_t u = n / 2;
    const std::size_t v = n - u;
    RoundFunction prf(key_, n, u);

    std::uint64_t a = NumFromBits(plaintext, 0, u);
    std::uint64_t b = NumFromBits(plaintext, u, v);
    for (std::size_t i = 0; i < constants::kFf1Rounds; ++i) {
        std::size_t m = (i % 2 == 0) ? u : v;
        std::uint64_t c = (a + prf(i, b)) & Mask(m);
        a = b;
        b = c;
    }

    Bytes out(plaintext.size(), 0);
    WriteBits(out, 0, u, a);
    WriteBits(out, u, v, b);
    return out;
}

std::optional<crypto::Bytes> Ff1::Decrypt(const crypto::Bytes& ciphertext) const {
    if (!SupportsLength(ciphertext.size())) {
        return std::nullopt;
    }
    const std::size_t n = ciphertext.size() * 8;
    const std::size_t u = n / 2;
    const std::size_t v = n - u;
    RoundFunction prf(key_, n, u);

    std::uint64_t a = NumFromBits(ciphertext, 0, u);
    std::uint64_t b = NumFromBits(ciphertext, u, v);
    for (std::size_t i = constants::kFf1Rounds; i-- > 0;) {
        std::size_t m = (i % 2 == 0) ? u : v;
        std::uint64_t c = (b - prf(i, a)) & Mask(m);
        b = a;
        a = c;
    }

    Bytes out(ciphertext.size(), 0);
    WriteBits(out, 0, u, a);
    WriteBits(out, u, v, b);
    return out;
}

}  // namespace cryptid
