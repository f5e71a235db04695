#include "cryptid/error.hpp"

#include <utility>

namespace cryptid {

Error Error::Of(ErrorKind kind) {
    Error error;
    error.kind = kind;
    return error;
}

Error Error::InvalidPrefix(std::string received, std::string expected) {
    Error error = Of(ErrorKind::InvalidPrefix);
    error.received_prefix = std::move(received);
    error.expected_prefix = std::move(expected);
    return error;
}

Error Error::SentinelMismatch(std::uint8_t received, std::uint8_t expected) {
    Error error = Of(ErrorKind::SentinelMismatch);
    error.received_sentinel = received;
    error.expected_sentinel = expected;
    return error;
}

std::string Error::Message() const {
    switch (kind) {
        case ErrorKind::DecodingFailed:
            return "Decoding string failed";
        case ErrorKind::DecryptionFailed:
            return "FF1 decryption failed";
        case ErrorKind::EncryptionFailed:
            return "FF1 encryption failed";
        case ErrorKind::IncorrectMac:
            return "Incorrect MAC";
        case ErrorKind::InvalidDataLength:
            return "Invalid data length";
        case ErrorKind::InvalidPrefix:
            return "Prefix was " + received_prefix + ", expected " + expected_prefix;
        case ErrorKind::SentinelMismatch:
            return "Sentinel byte was " + std::to_string(received_sentinel) + ", expected "
                   + std::to_string(expected_sentinel);
    }
    return "Unknown error";
}

bool operator==(const Error& lhs, const Error& rhs) {
    return lhs.kind == rhs.kind && lhs.received_prefix == rhs.received_prefix
           && lhs.expected_prefix == rhs.expected_prefix && lhs.received_sentinel == rhs.received_sentinel
           && lhs.expected_sentinel == rhs.expected_sentinel;
}

bool operator!=(const Error& lhs, const Error& rhs) {
    return !(lhs == rhs);
}

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DecodingFailed:
            return "DecodingFailed";
        case ErrorKind::DecryptionFailed:
            return "DecryptionFailed";
        case ErrorKind::EncryptionFailed:
            return "EncryptionFailed";
        case ErrorKind::IncorrectMac:
            return "IncorrectMAC";
        case ErrorKind::InvalidDataLength:
            return "InvalidDataLength";
        case ErrorKind::InvalidPrefix:
            return "InvalidPrefix";
        case ErrorKind::SentinelMismatch:
            return "SentinelMismatch";
    }
    return "Unknown";
}

CodecError::CodecError(Error error)
    : std::runtime_error(error.Message()), error_(std::move(error)) {}

ConfigError::ConfigError(ConfigErrorKind kind, const std::string& message)
    : std::invalid_argument(message), kind_(kind) {}

}  // namespace cryptid
