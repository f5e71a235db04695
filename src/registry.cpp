#include "cryptid/registry.hpp"

#include "cryptid/error.hpp"

#include <optional>
#include <utility>

namespace cryptid {

CodecRegistry& CodecRegistry::Default() {
    static CodecRegistry registry;
    return registry;
}

std::shared_ptr<const Codec> CodecRegistry::Get(std::string_view name) {
    std::optional<Config> config = Config::Global();
    if (!config) {
        throw ConfigError(ConfigErrorKind::MissingKey,
                          "no global config set; cannot build codec '" + std::string(name) + "'");
    }
    return Get(name, *config);
}

std::shared_ptr<const Codec> CodecRegistry::Get(std::string_view name, const Config& config) {
    CacheKey key = MakeKey(name, config);
    if (auto codec = Find(key)) {
        return codec;
    }
    return Insert(std::move(key), std::make_shared<const Codec>(std::string(name), config));
}

std::size_t CodecRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return codecs_.size();
}

void CodecRegistry::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    codecs_.clear();
}

CodecRegistry::CacheKey CodecRegistry::MakeKey(std::string_view name, const Config& config) {
    return CacheKey(std::string(name), config.key(), config.hmac_length(), config.zero_pad_length());
}

std::shared_ptr<const Codec> CodecRegistry::Find(const CacheKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = codecs_.find(key);
    if (it == codecs_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<const Codec> CodecRegistry::Insert(CacheKey key, std::shared_ptr<const Codec> codec) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto inserted = codecs_.emplace(std::move(key), std::move(codec));
    return inserted.first->second;
}

}  // namespace cryptid
