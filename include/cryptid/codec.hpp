#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "cryptid/config.hpp"
#include "cryptid/crypto.hpp"
#include "cryptid/error.hpp"
#include "cryptid/ff1.hpp"
#include "cryptid/kdf.hpp"
#include "cryptid/tag.hpp"

namespace cryptid {

struct DecodeResult {
    std::uint64_t value = 0;
    std::optional<Error> error;

    bool ok() const noexcept { return !error.has_value(); }
    explicit operator bool() const noexcept { return ok(); }
};

// Encrypts integers into "<name>_<base62>" tokens and back.
//
// The name is the token prefix and, together with the master key, selects the
// subkeys, so codecs with different names are independent. A Codec is
// immutable after construction and may be shared between threads.
class Codec {
public:
    // Throws ConfigError when the config layout is unsafe.
    Codec(std::string name, const Config& config);

    const std::string& name() const noexcept { return name_; }
    const std::string& prefix() const noexcept { return prefix_; }
    std::size_t hmac_length() const noexcept { return hmac_length_; }
    std::size_t zero_pad_length() const noexcept { return zero_pad_length_; }

    std::string Encode(std::uint64_t num) const;
    DecodeResult Decode(std::string_view encoded) const;
    // Throws CodecError on failure.
    std::uint64_t DecodeOrThrow(std::string_view encoded) const;

    // Fixed 8-byte tag and 8-byte plaintext, which fills all 16 bytes.
    std::string EncodeUuid(std::uint64_t num) const;
    DecodeResult DecodeUuid(std::string_view text) const;

private:
    Codec(const std::string& name, const Config& config, kdf::Subkeys keys);

    crypto::Bytes EncryptNumber(const IntegrityTag& tag, std::size_t zero_pad_length, std::uint64_t num) const;
    DecodeResult DecryptPayload(const IntegrityTag& tag,
                                std::size_t zero_pad_length,
                                const crypto::Bytes& payload) const;

    std::string name_;
    std::string prefix_;
    Ff1 ff1_;
    IntegrityTag tag_;
    IntegrityTag uuid_tag_;
    std::size_t hmac_length_ = 0;
    std::size_t zero_pad_length_ = 0;
    bool sentinel_terminated_ = true;
};

}  // namespace cryptid
