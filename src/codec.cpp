#include "cryptid/codec.hpp"

#include "cryptid/base62.hpp"
#include "cryptid/constants.hpp"
#include "cryptid/packing.hpp"
#include "cryptid/uuid.hpp"

#include <algorithm>
#include <utility>

namespace cryptid {

namespace {

const Config& Validated(const Config& config) {
    config.Validate();
    return config;
}

DecodeResult Failure(Error error) {
    DecodeResult result;
    result.error = std::move(error);
    return result;
}

DecodeResult Failure(ErrorKind kind) {
    return Failure(Error::Of(kind));
}

}  // namespace

Codec::Codec(std::string name, const Config& config)
    : Codec(name, config, kdf::DeriveSubkeys(Validated(config).key(), name)) {}

Codec::Codec(const std::string& name, const Config& config, kdf::Subkeys keys)
    : name_(name),
      prefix_(name + constants::kPrefixSeparator),
      ff1_(std::move(keys.cipher_key)),
      tag_(std::move(keys.mac_key), config.hmac_length()),
      uuid_tag_(tag_.WithLength(constants::kUuidHmacLength)),
      hmac_length_(config.hmac_length()),
      zero_pad_length_(config.zero_pad_length()),
      sentinel_terminated_(packing::UsesSentinel(config.hmac_length(), config.zero_pad_length())) {}

std::string Codec::Encode(std::uint64_t num) const {
    crypto::Bytes payload = EncryptNumber(tag_, zero_pad_length_, num);
    return prefix_ + base62::Encode(packing::Pack(payload));
}

DecodeResult Codec::Decode(std::string_view encoded) const {
    // The prefix runs up to and including the last underscore.
    std::size_t split = encoded.rfind(constants::kPrefixSeparator);
    std::string_view received = split == std::string_view::npos ? std::string_view() : encoded.substr(0, split + 1);
    if (received != prefix_) {
        return Failure(Error::InvalidPrefix(std::string(received), prefix_));
    }

    bool ok = false;
    packing::Block block = base62::Decode(encoded.substr(prefix_.size()), &ok);
    if (!ok) {
        return Failure(ErrorKind::DecodingFailed);
    }

    Error error;
    std::optional<crypto::Bytes> payload = packing::Unpack(block, sentinel_terminated_, &error);
    if (!payload) {
        return Failure(std::move(error));
    }
    return DecryptPayload(tag_, zero_pad_length_, *payload);
}

std::uint64_t Codec::DecodeOrThrow(std::string_view encoded) const {
    DecodeResult result = Decode(encoded);
    if (!result.ok()) {
        throw CodecError(*result.error);
    }
    return result.value;
}

std::string Codec::EncodeUuid(std::uint64_t num) const {
    crypto::Bytes payload = EncryptNumber(uuid_tag_, constants::kUuidZeroPadLength, num);
    packing::Block block{};
    std::copy(payload.begin(), payload.end(), block.begin());
    return uuid::Format(block);
}

DecodeResult Codec::DecodeUuid(std::string_view text) const {
    bool ok = false;
    packing::Block block = uuid::Parse(text, &ok);
    if (!ok) {
        return Failure(ErrorKind::DecodingFailed);
    }
    return DecryptPayload(uuid_tag_, constants::kUuidZeroPadLength, crypto::Bytes(block.begin(), block.end()));
}

crypto::Bytes Codec::EncryptNumber(const IntegrityTag& tag, std::size_t zero_pad_length, std::uint64_t num) const {
    // Plaintexts shorter than FF1's minimum domain are padded up to it.
    std::size_t min_length = std::max(zero_pad_length, constants::kFf1MinBytes);
    std::optional<crypto::Bytes> ciphertext = ff1_.Encrypt(packing::TrimNumber(num, min_length));
    if (!ciphertext) {
        throw CodecError(Error::Of(ErrorKind::EncryptionFailed));
    }
    tag.Append(*ciphertext);
    return std::move(*ciphertext);
}

DecodeResult Codec::DecryptPayload(const IntegrityTag& tag,
                                   std::size_t zero_pad_length,
                                   const crypto::Bytes& payload) const {
    if (payload.size() < tag.length() + zero_pad_length
        || payload.size() - tag.length() > constants::kNumberBytes) {
        return Failure(ErrorKind::InvalidDataLength);
    }
    const std::size_t split = payload.size() - tag.length();
    crypto::Bytes ciphertext(payload.begin(), payload.begin() + static_cast<std::ptrdiff_t>(split));
    if (!tag.Verify(ciphertext, payload.data() + split, tag.length())) {
        return Failure(ErrorKind::IncorrectMac);
    }

    std::optional<crypto::Bytes> plaintext = ff1_.Decrypt(ciphertext);
    if (!plaintext) {
        return Failure(ErrorKind::DecryptionFailed);
    }
    DecodeResult result;
    result.value = packing::ExpandNumber(*plaintext);
    return result;
}

}  // namespace cryptid
