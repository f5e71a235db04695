#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "cryptid/registry.hpp"

namespace cryptid {

// An object id bound to the codec name of its object type. The raw value is
// what persistence layers store; Encode() is what APIs expose.
class TypedId {
public:
    TypedId(std::string name, std::uint64_t id, CodecRegistry& registry = CodecRegistry::Default());

    // Throws CodecError when `encoded` does not decode under `name`.
    static TypedId Parse(std::string name,
                         std::string_view encoded,
                         CodecRegistry& registry = CodecRegistry::Default());

    const std::string& name() const noexcept { return name_; }
    std::uint64_t value() const noexcept { return id_; }

    std::string Encode() const;
    std::string EncodeUuid() const;
    std::string ToString() const;

private:
    std::string name_;
    std::uint64_t id_ = 0;
    CodecRegistry* registry_ = nullptr;
};

bool operator==(const TypedId& lhs, const TypedId& rhs);
bool operator!=(const TypedId& lhs, const TypedId& rhs);

}  // namespace cryptid
