#include "cryptid/crypto.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/kdf.h>

#include <stdexcept>

namespace cryptid::crypto {

namespace {

constexpr std::size_t kHkdfHashLen = 32;

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

}  // namespace

Bytes HkdfSha256(const Bytes& key_material, std::string_view info, std::size_t length) {
    detail::UniquePKeyCtx pctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
    if (!pctx) {
        throw std::runtime_error("HKDF context allocation failed");
    }
    Bytes out(length);
    std::size_t out_len = out.size();

    Ensure(EVP_PKEY_derive_init(pctx.get()) == 1, "HKDF init failed");
    Ensure(EVP_PKEY_CTX_set_hkdf_md(pctx.get(), EVP_sha256()) == 1, "HKDF set md failed");
    if (key_material.empty()) {
        // OpenSSL refuses empty input keying material, so run the extract
        // step here and hand the PRK to expand-only mode.
        Bytes prk = HmacSha256(Bytes(kHkdfHashLen, 0), Bytes{});
        Ensure(EVP_PKEY_CTX_set_hkdf_mode(pctx.get(), EVP_PKEY_HKDEF_MODE_EXPAND_ONLY) == 1,
               "HKDF set mode failed");
        Ensure(EVP_PKEY_CTX_set1_hkdf_key(pctx.get(), prk.data(), static_cast<int>(prk.size())) == 1,
               "HKDF set key failed");
    } else {
        Ensure(EVP_PKEY_CTX_set1_hkdf_key(pctx.get(), key_material.data(), static_cast<int>(key_material.size())) == 1,
               "HKDF set key failed");
    }
    if (!info.empty()) {
        Ensure(EVP_PKEY_CTX_add1_hkdf_info(pctx.get(), reinterpret_cast<const unsigned char*>(info.data()),
                                           static_cast<int>(info.size())) == 1,
               "HKDF set info failed");
    }
    Ensure(EVP_PKEY_derive(pctx.get(), out.data(), &out_len) == 1, "HKDF derive failed");
    Ensure(out_len == length, "HKDF returned a short key");
    return out;
}

Bytes HmacSha256(const Bytes& key, const Bytes& data) {
    unsigned int out_len = EVP_MAX_MD_SIZE;
    Bytes out(out_len);
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), data.data(),
              data.size(), out.data(), &out_len)) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    out.resize(out_len);
    return out;
}

bool ConstantTimeEquals(const std::uint8_t* lhs, const std::uint8_t* rhs, std::size_t len) {
    if (len == 0) {
        return true;
    }
    return CRYPTO_memcmp(lhs, rhs, len) == 0;
}

Aes256Block::Aes256Block(const Bytes& key) : ctx_(EVP_CIPHER_CTX_new()) {
    if (key.size() != 32) {
        throw std::invalid_argument("AES-256 expects 32-byte key");
    }
    if (!ctx_) {
        throw std::runtime_error("AES context allocation failed");
    }
    Ensure(EVP_EncryptInit_ex(ctx_.get(), EVP_aes_256_ecb(), nullptr, key.data(), nullptr) == 1,
           "AES init failed");
    Ensure(EVP_CIPHER_CTX_set_padding(ctx_.get(), 0) == 1, "AES set padding failed");
}

void Aes256Block::Encrypt(const std::uint8_t* in, std::uint8_t* out) {
    int out_len = 0;
    Ensure(EVP_EncryptUpdate(ctx_.get(), out, &out_len, in, static_cast<int>(kAesBlockSize)) == 1,
           "AES encrypt failed");
    Ensure(out_len == static_cast<int>(kAesBlockSize), "AES returned a partial block");
}

}  // namespace cryptid::crypto
