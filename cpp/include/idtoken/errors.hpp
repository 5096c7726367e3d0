#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace idtoken {

enum class ErrorKind {
    InvalidIdentifier,
    MalformedToken,
    TagMismatch,
    InvalidToken,
    UnsupportedBase,
    InvalidDigit,
    InvalidConfig,
    CryptoFailure
};

inline std::string_view ToString(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidIdentifier:
            return "InvalidIdentifier";
        case ErrorKind::MalformedToken:
            return "MalformedToken";
        case ErrorKind::TagMismatch:
            return "TagMismatch";
        case ErrorKind::InvalidToken:
            return "InvalidToken";
        case ErrorKind::UnsupportedBase:
            return "UnsupportedBase";
        case ErrorKind::InvalidDigit:
            return "InvalidDigit";
        case ErrorKind::InvalidConfig:
            return "InvalidConfig";
        case ErrorKind::CryptoFailure:
            return "CryptoFailure";
    }
    return "UnknownError";
}

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace idtoken
