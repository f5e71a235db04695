#include "cryptid/tag.hpp"

#include <stdexcept>
#include <utility>

namespace cryptid {

IntegrityTag::IntegrityTag(crypto::Bytes key, std::size_t length) : key_(std::move(key)), length_(length) {
    if (length_ > 32) {
        throw std::invalid_argument("HMAC-SHA256 tag cannot exceed 32 bytes");
    }
}

IntegrityTag IntegrityTag::WithLength(std::size_t length) const {
    return IntegrityTag(key_, length);
}

crypto::Bytes IntegrityTag::Compute(const crypto::Bytes& data) const {
    crypto::Bytes mac = crypto::HmacSha256(key_, data);
    mac.resize(length_);
    return mac;
}

void IntegrityTag::Append(crypto::Bytes& data) const {
    if (length_ == 0) {
        return;
    }
    crypto::Bytes mac = Compute(data);
    data.insert(data.end(), mac.begin(), mac.end());
}

bool IntegrityTag::Verify(const crypto::Bytes& data, const std::uint8_t* tag, std::size_t tag_len) const {
    if (tag_len != length_) {
        return false;
    }
    crypto::Bytes expected = Compute(data);
    return crypto::ConstantTimeEquals(expected.data(), tag, length_);
}

}  // namespace cryptid
