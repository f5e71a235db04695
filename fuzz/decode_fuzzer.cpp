#include "cryptid/codec.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

// Decode must reject arbitrary input with an error, never crash or throw.
extern "C" int LLVMFuzzerTestOneInput(const std::uint8_t* data, std::size_t size) {
    static const cryptid::Codec codec("test", cryptid::Config("fuzzing key material"));
    std::string_view input(reinterpret_cast<const char*>(data), size);
    cryptid::DecodeResult result = codec.Decode(input);
    if (result.ok()) {
        (void)codec.Encode(result.value);
    }
    (void)codec.DecodeUuid(input);
    return 0;
}
