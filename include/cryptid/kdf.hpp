#pragma once

#include <string>
#include <string_view>

#include "cryptid/crypto.hpp"

namespace cryptid::kdf {

struct Subkeys {
    crypto::Bytes cipher_key;
    crypto::Bytes mac_key;
};

std::string CipherLabel(std::string_view name);
std::string MacLabel(std::string_view name);

// Expands the master key into the two per-name subkeys. Distinct names give
// independent subkeys under the same master key.
Subkeys DeriveSubkeys(const crypto::Bytes& master_key, std::string_view name);

}  // namespace cryptid::kdf
