#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cryptid {

enum class ErrorKind {
    DecodingFailed,
    DecryptionFailed,
    EncryptionFailed,
    IncorrectMac,
    InvalidDataLength,
    InvalidPrefix,
    SentinelMismatch
};

// A decode failure. Prefix fields are set only for InvalidPrefix, sentinel
// fields only for SentinelMismatch.
struct Error {
    ErrorKind kind = ErrorKind::DecodingFailed;
    std::string received_prefix;
    std::string expected_prefix;
    std::uint8_t received_sentinel = 0;
    std::uint8_t expected_sentinel = 0;

    static Error Of(ErrorKind kind);
    static Error InvalidPrefix(std::string received, std::string expected);
    static Error SentinelMismatch(std::uint8_t received, std::uint8_t expected);

    std::string Message() const;
};

bool operator==(const Error& lhs, const Error& rhs);
bool operator!=(const Error& lhs, const Error& rhs);

const char* ErrorKindName(ErrorKind kind);

class CodecError : public std::runtime_error {
public:
    explicit CodecError(Error error);

    const Error& error() const noexcept { return error_; }
    ErrorKind kind() const noexcept { return error_.kind; }

private:
    Error error_;
};

enum class ConfigErrorKind {
    InvalidMacLength,
    InvalidZeroPadLength,
    UnsafeLayout,
    MissingKey
};

class ConfigError : public std::invalid_argument {
public:
    ConfigError(ConfigErrorKind kind, const std::string& message);

    ConfigErrorKind kind() const noexcept { return kind_; }

private:
    ConfigErrorKind kind_;
};

}  // namespace cryptid
