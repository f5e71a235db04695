#include "cryptid/typed_id.hpp"

#include <utility>

namespace cryptid {

TypedId::TypedId(std::string name, std::uint64_t id, CodecRegistry& registry)
    : name_(std::move(name)), id_(id), registry_(&registry) {}

TypedId TypedId::Parse(std::string name, std::string_view encoded, CodecRegistry& registry) {
    std::uint64_t id = registry.Get(name)->DecodeOrThrow(encoded);
    return TypedId(std::move(name), id, registry);
}

std::string TypedId::Encode() const {
    return registry_->Get(name_)->Encode(id_);
}

std::string TypedId::EncodeUuid() const {
    return registry_->Get(name_)->EncodeUuid(id_);
}

std::string TypedId::ToString() const {
    return "TypedId { id: " + std::to_string(id_) + ", name: " + name_ + " }";
}

bool operator==(const TypedId& lhs, const TypedId& rhs) {
    return lhs.name() == rhs.name() && lhs.value() == rhs.value();
}

bool operator!=(const TypedId& lhs, const TypedId& rhs) {
    return !(lhs == rhs);
}

}  // namespace cryptid
