#pragma once

#include <openssl/evp.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace cryptid::crypto {

namespace detail {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};

struct PKeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const noexcept { EVP_PKEY_CTX_free(ctx); }
};

using UniqueCipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;
using UniquePKeyCtx = std::unique_ptr<EVP_PKEY_CTX, PKeyCtxDeleter>;

}  // namespace detail

using Bytes = std::vector<std::uint8_t>;

inline constexpr std::size_t kAesBlockSize = 16;

// HKDF-SHA256, extract (no salt) then expand with `info`.
Bytes HkdfSha256(const Bytes& key_material, std::string_view info, std::size_t length);
Bytes HmacSha256(const Bytes& key, const Bytes& data);
bool ConstantTimeEquals(const std::uint8_t* lhs, const std::uint8_t* rhs, std::size_t len);

// Raw AES-256 block function. Holds an OpenSSL context, so an instance must
// not be shared between threads.
class Aes256Block {
public:
    explicit Aes256Block(const Bytes& key);

    void Encrypt(const std::uint8_t* in, std::uint8_t* out);

private:
    detail::UniqueCipherCtx ctx_;
};

}  // namespace cryptid::crypto
