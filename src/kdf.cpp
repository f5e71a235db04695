#include "cryptid/kdf.hpp"

#include "cryptid/constants.hpp"

namespace cryptid::kdf {

std::string CipherLabel(std::string_view name) {
    std::string label(name);
    label.append(constants::kCipherLabelSuffix);
    return label;
}

std::string MacLabel(std::string_view name) {
    std::string label(name);
    label.append(constants::kMacLabelSuffix);
    return label;
}

Subkeys DeriveSubkeys(const crypto::Bytes& master_key, std::string_view name) {
    Subkeys keys;
    keys.cipher_key = crypto::HkdfSha256(master_key, CipherLabel(name), constants::kSubkeyLen);
    keys.mac_key = crypto::HkdfSha256(master_key, MacLabel(name), constants::kSubkeyLen);
    return keys;
}

}  // namespace cryptid::kdf
