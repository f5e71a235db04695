#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <tuple>

#include "cryptid/codec.hpp"
#include "cryptid/config.hpp"

namespace cryptid {

// Codec cache keyed by name, key bytes and layout, so a cached codec always
// matches Codec(name, config). Two threads racing on the same entry may both
// build a codec; the first one stored wins and both results are equivalent.
class CodecRegistry {
public:
    CodecRegistry() = default;
    CodecRegistry(const CodecRegistry&) = delete;
    CodecRegistry& operator=(const CodecRegistry&) = delete;

    static CodecRegistry& Default();

    // Builds from Config::Global(); throws ConfigError{MissingKey} when unset.
    std::shared_ptr<const Codec> Get(std::string_view name);
    std::shared_ptr<const Codec> Get(std::string_view name, const Config& config);

    std::size_t Size() const;
    void Clear();

private:
    using CacheKey = std::tuple<std::string, crypto::Bytes, std::uint8_t, std::uint8_t>;

    static CacheKey MakeKey(std::string_view name, const Config& config);
    std::shared_ptr<const Codec> Find(const CacheKey& key) const;
    std::shared_ptr<const Codec> Insert(CacheKey key, std::shared_ptr<const Codec> codec);

    mutable std::mutex mutex_;
    std::map<CacheKey, std::shared_ptr<const Codec>> codecs_;
};

}  // namespace cryptid
