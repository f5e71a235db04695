#include <gtest/gtest.h>

#include "cryptid/codec.hpp"

#include <cstdint>
#include <limits>
#include <random>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {

using cryptid::Codec;
using cryptid::Config;
using cryptid::Error;
using cryptid::ErrorKind;

constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();

Codec DefaultCodec() {
    return Codec("test", Config("Test key here"));
}

void ExpectError(const cryptid::DecodeResult& result, ErrorKind kind) {
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(kind, result.error->kind) << result.error->Message();
}

}  // namespace

TEST(CodecTest, DefaultVectors) {
    Codec codec = DefaultCodec();
    const std::vector<std::pair<std::uint64_t, std::string>> cases = {
        {0, "test_g1HdsEGpXp5"},
        {1, "test_bTPc8uxHEwv"},
        {2, "test_dZ0iJdcLBgB"},
        {123, "test_hHLBCl4rZ3u"},
        {kMax, "test_20cMzlnhTkILdJzWt"},
    };
    for (const auto& [input, expected] : cases) {
        EXPECT_EQ(expected, codec.Encode(input));
        cryptid::DecodeResult decoded = codec.Decode(expected);
        ASSERT_TRUE(decoded.ok()) << expected;
        EXPECT_EQ(input, decoded.value);
    }
}

TEST(CodecTest, ExampleVector) {
    Codec codec("example", Config("your-secure-key"));
    EXPECT_EQ("example_VgwPy6rwatl", codec.Encode(12345));
    EXPECT_EQ(12345u, codec.DecodeOrThrow("example_VgwPy6rwatl"));
}

TEST(CodecTest, LongLayoutVectors) {
    Config config("Test key here");
    config.SetHmacLength(8).SetZeroPadLength(8);
    Codec codec("test", config);
    const std::vector<std::pair<std::uint64_t, std::string>> cases = {
        {0, "test_6XNFaHOCeuIBNvRT4pIrVZ"},
        {1, "test_1m9BJW23Jk5hSIlfPxoboZ"},
        {2, "test_2MpvWPgnp5j1dIqFnJVOjU"},
        {123, "test_1BirgT1ZJhfSsKFLgxA5gt"},
        {kMax, "test_5vegfyOLrrmwtgznQByI4J"},
    };
    for (const auto& [input, expected] : cases) {
        EXPECT_EQ(expected, codec.Encode(input));
        EXPECT_EQ(input, codec.DecodeOrThrow(expected));
    }
}

TEST(CodecTest, ShortLayoutVectors) {
    Config config("Test key here");
    config.SetHmacLength(0).SetZeroPadLength(3);
    Codec codec("test", config);
    const std::vector<std::pair<std::uint64_t, std::string>> cases = {
        {0, "test_1zG8O"},
        {1, "test_1R8PN"},
        {2, "test_1nzgo"},
        {123, "test_1YqNT"},
        {kMax, "test_Mlu72Yai97j"},
    };
    for (const auto& [input, expected] : cases) {
        EXPECT_EQ(expected, codec.Encode(input));
        EXPECT_EQ(input, codec.DecodeOrThrow(expected));
    }

    // Without a MAC nearly any string decodes to some number.
    EXPECT_EQ(20580488769766u, codec.DecodeOrThrow("test_1helloall"));
}

TEST(CodecTest, DecodeErrors) {
    Codec codec = DefaultCodec();

    EXPECT_EQ(Error::InvalidPrefix("", "test_"), *codec.Decode("hHLBCl4rZ3u").error);
    EXPECT_EQ(Error::InvalidPrefix("_", "test_"), *codec.Decode("_hHLBCl4rZ3u").error);
    EXPECT_EQ(Error::InvalidPrefix("wrong_", "test_"), *codec.Decode("wrong_hHLBCl4rZ3u").error);
    EXPECT_EQ(Error::InvalidPrefix("test_test_", "test_"), *codec.Decode("test_test_hHLBCl4rZ3u").error);

    EXPECT_EQ(Error::SentinelMismatch(2, 1), *codec.Decode("test_iHLBCl4rZ3u").error);
    EXPECT_EQ(Error::SentinelMismatch(0, 1), *codec.Decode("test_0").error);

    ExpectError(codec.Decode("test_hHLBCl4rZ3v"), ErrorKind::IncorrectMac);
    ExpectError(codec.Decode("test_hHMBCl4rZ3u"), ErrorKind::IncorrectMac);

    ExpectError(codec.Decode("test_hHLBCl+rZ3u"), ErrorKind::DecodingFailed);
    ExpectError(codec.Decode("test_"), ErrorKind::DecodingFailed);
    ExpectError(codec.Decode("test_7n42DGM5Tflk9n8mt7Fhc8"), ErrorKind::DecodingFailed);

    // A lone sentinel carries an empty payload.
    ExpectError(codec.Decode("test_1"), ErrorKind::InvalidDataLength);
    ExpectError(codec.Decode("test_HW1"), ErrorKind::InvalidDataLength);

    cryptid::DecodeResult good = codec.Decode("test_hHLBCl4rZ3u");
    ASSERT_TRUE(good.ok());
    EXPECT_EQ(123u, good.value);
}

TEST(CodecTest, ErrorMessages) {
    Codec codec = DefaultCodec();
    EXPECT_EQ("Prefix was wrong_, expected test_", codec.Decode("wrong_abc").error->Message());
    EXPECT_EQ("Sentinel byte was 2, expected 1", codec.Decode("test_iHLBCl4rZ3u").error->Message());
    EXPECT_EQ("Incorrect MAC", codec.Decode("test_hHLBCl4rZ3v").error->Message());
}

TEST(CodecTest, DecodeOrThrowCarriesError) {
    Codec codec = DefaultCodec();
    try {
        codec.DecodeOrThrow("test_hHLBCl4rZ3v");
        FAIL() << "expected CodecError";
    } catch (const cryptid::CodecError& e) {
        EXPECT_EQ(ErrorKind::IncorrectMac, e.kind());
        EXPECT_STREQ("Incorrect MAC", e.what());
    }
}

TEST(CodecTest, PayloadLongerThanANumberIsRejected) {
    Config config("Test key here");
    config.SetHmacLength(0).SetZeroPadLength(3);
    Codec codec("test", config);
    ExpectError(codec.Decode("test_1Ynf1pZ6ktAkT"), ErrorKind::InvalidDataLength);
}

TEST(CodecTest, CiphertextBelowCipherMinimumFailsDecryption) {
    Config config("Test key here");
    config.SetHmacLength(0).SetZeroPadLength(0);
    Codec codec("test", config);
    ExpectError(codec.Decode("test_HW1"), ErrorKind::DecryptionFailed);
}

TEST(CodecTest, ZeroPadBelowCipherMinimumStillRoundTrips) {
    Config config("Test key here");
    config.SetHmacLength(2).SetZeroPadLength(0);
    Codec codec("test", config);
    for (std::uint64_t n : {std::uint64_t{0}, std::uint64_t{1}, std::uint64_t{255}, std::uint64_t{65536}, kMax}) {
        EXPECT_EQ(n, codec.DecodeOrThrow(codec.Encode(n)));
    }
}

TEST(CodecTest, EveryLayoutRoundTrips) {
    for (unsigned hmac = 0; hmac <= 8; ++hmac) {
        for (unsigned pad = 0; pad <= 8; ++pad) {
            if (hmac == 8 && pad < 8) {
                continue;
            }
            Config config("Test key here");
            config.SetHmacLength(hmac).SetZeroPadLength(pad);
            Codec codec("layout", config);
            for (std::uint64_t n : {std::uint64_t{0}, std::uint64_t{1}, std::uint64_t{123},
                                    std::uint64_t{1} << 40, kMax}) {
                cryptid::DecodeResult decoded = codec.Decode(codec.Encode(n));
                ASSERT_TRUE(decoded.ok()) << "hmac=" << hmac << " pad=" << pad << " n=" << n;
                EXPECT_EQ(n, decoded.value);
            }
        }
    }
}

TEST(CodecTest, RandomRoundTrips) {
    Codec codec = DefaultCodec();
    std::mt19937_64 rng(20240607);
    for (int i = 0; i < 10000; ++i) {
        std::uint64_t number = rng();
        std::string encoded = codec.Encode(number);
        cryptid::DecodeResult decoded = codec.Decode(encoded);
        ASSERT_TRUE(decoded.ok()) << "Failed at number: " << number;
        ASSERT_EQ(number, decoded.value) << "Failed at number: " << number;
    }
}

TEST(CodecTest, EncodeIsDeterministic) {
    Codec first = DefaultCodec();
    Codec second = DefaultCodec();
    for (std::uint64_t n : {std::uint64_t{7}, std::uint64_t{1} << 33, kMax - 1}) {
        EXPECT_EQ(first.Encode(n), first.Encode(n));
        EXPECT_EQ(first.Encode(n), second.Encode(n));
    }
}

TEST(CodecTest, TamperedTokensAreRejected) {
    Codec codec = DefaultCodec();
    const std::string token = "test_hHLBCl4rZ3u";
    const std::string alphabet = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
    for (std::size_t i = 0; i < token.size(); ++i) {
        for (char c : alphabet) {
            if (c == token[i]) {
                continue;
            }
            std::string tampered = token;
            tampered[i] = c;
            cryptid::DecodeResult result = codec.Decode(tampered);
            EXPECT_FALSE(result.ok()) << tampered;
        }
    }
}

TEST(CodecTest, PrefixIsolation) {
    Config config("Test key here");
    Codec user("user", config);
    Codec org("org", config);
    EXPECT_EQ("user_XDbN9ZApAyE", user.Encode(42));
    EXPECT_EQ("org_frAEihCIfN7", org.Encode(42));
    EXPECT_EQ(Error::InvalidPrefix("user_", "org_"), *org.Decode(user.Encode(42)).error);
    EXPECT_EQ(Error::InvalidPrefix("org_", "user_"), *user.Decode(org.Encode(42)).error);
}

TEST(CodecTest, NamesContainingUnderscores) {
    Codec codec("line_item", Config("Test key here"));
    std::string token = codec.Encode(99);
    EXPECT_EQ(0u, token.rfind("line_item_", 0));
    EXPECT_EQ(99u, codec.DecodeOrThrow(token));
}

TEST(CodecTest, KeyIsolation) {
    const std::vector<std::pair<unsigned, unsigned>> layouts = {{4, 4}, {8, 8}, {6, 2}};
    for (const auto& [hmac, pad] : layouts) {
        Config first("Test key here");
        first.SetHmacLength(hmac).SetZeroPadLength(pad);
        Config second("Another key here");
        second.SetHmacLength(hmac).SetZeroPadLength(pad);
        Codec encoder("test", first);
        Codec decoder("test", second);
        for (std::uint64_t n : {std::uint64_t{0}, std::uint64_t{1}, std::uint64_t{123}, std::uint64_t{65535},
                                std::uint64_t{1} << 40, kMax}) {
            cryptid::DecodeResult result = decoder.Decode(encoder.Encode(n));
            ASSERT_FALSE(result.ok()) << "hmac=" << hmac << " pad=" << pad << " n=" << n;
            EXPECT_EQ(ErrorKind::IncorrectMac, result.error->kind);
        }
        ExpectError(decoder.DecodeUuid(encoder.EncodeUuid(123)), ErrorKind::IncorrectMac);
    }
}

TEST(CodecTest, EmptyKeyRoundTrips) {
    Codec codec("test", Config(std::string_view("")));
    for (std::uint64_t n : {std::uint64_t{0}, std::uint64_t{123}, kMax}) {
        EXPECT_EQ(n, codec.DecodeOrThrow(codec.Encode(n)));
    }
    Codec keyed = DefaultCodec();
    ExpectError(keyed.Decode(codec.Encode(123)), ErrorKind::IncorrectMac);
}

TEST(CodecTest, UuidVectors) {
    Codec codec = DefaultCodec();
    const std::vector<std::pair<std::uint64_t, std::string>> cases = {
        {0, "59142369-adeb-8ef9-a1be-28f61c05d4d6"},
        {1, "93196956-2d32-d8d2-54f7-9a86fc765f3a"},
        {2, "3c10f25c-005e-6f6f-87a9-781efe02d14d"},
        {123, "571fd9d5-e133-f7b0-b0df-f444e4dd1127"},
        {kMax, "a3b06cf5-dd4d-3f09-4000-9d3519d4d6c2"},
    };
    for (const auto& [input, expected] : cases) {
        EXPECT_EQ(expected, codec.EncodeUuid(input));
        cryptid::DecodeResult decoded = codec.DecodeUuid(expected);
        ASSERT_TRUE(decoded.ok()) << expected;
        EXPECT_EQ(input, decoded.value);
    }
}

TEST(CodecTest, UuidIgnoresConfiguredLayout) {
    Config config("Test key here");
    config.SetHmacLength(0).SetZeroPadLength(3);
    Codec codec("test", config);
    EXPECT_EQ("59142369-adeb-8ef9-a1be-28f61c05d4d6", codec.EncodeUuid(0));
}

TEST(CodecTest, UuidDecodeErrors) {
    Codec codec = DefaultCodec();
    ExpectError(codec.DecodeUuid("not-a-uuid"), ErrorKind::DecodingFailed);
    ExpectError(codec.DecodeUuid("59142369-adeb-8ef9-a1be-28f61c05d4d7"), ErrorKind::IncorrectMac);
    EXPECT_EQ(0u, codec.DecodeUuid("59142369ADEB8EF9A1BE28F61C05D4D6").value);
}

TEST(CodecTest, SharedAcrossThreads) {
    const Codec codec = DefaultCodec();
    std::vector<std::thread> workers;
    std::vector<int> failures(4, 0);
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&codec, &failures, t] {
            for (std::uint64_t n = 0; n < 500; ++n) {
                std::uint64_t value = n * 7919 + static_cast<std::uint64_t>(t);
                cryptid::DecodeResult decoded = codec.Decode(codec.Encode(value));
                if (!decoded.ok() || decoded.value != value) {
                    ++failures[t];
                }
            }
        });
    }
    for (std::thread& worker : workers) {
        worker.join();
    }
    for (int count : failures) {
        EXPECT_EQ(0, count);
    }
    EXPECT_EQ("test_hHLBCl4rZ3u", codec.Encode(123));
}
