#pragma once

#include "idtoken/crypto.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

namespace idtoken::kdf {

// Key material owned by exactly one holder. Wiped on destruction, never copied.
class SecretKey {
public:
    SecretKey() = default;
    explicit SecretKey(crypto::Bytes bytes) : bytes_(std::move(bytes)) {}
    ~SecretKey() { crypto::SecureWipe(bytes_); }

    SecretKey(const SecretKey&) = delete;
    SecretKey& operator=(const SecretKey&) = delete;
    SecretKey(SecretKey&& other) noexcept : bytes_(std::move(other.bytes_)) { other.bytes_.clear(); }
    SecretKey& operator=(SecretKey&& other) noexcept {
        if (this != &other) {
            crypto::SecureWipe(bytes_);
            bytes_ = std::move(other.bytes_);
            other.bytes_.clear();
        }
        return *this;
    }

    const crypto::Bytes& bytes() const noexcept { return bytes_; }
    std::size_t size() const noexcept { return bytes_.size(); }
    bool empty() const noexcept { return bytes_.empty(); }

private:
    crypto::Bytes bytes_;
};

// Single-block PBKDF2-HMAC-SHA256 with a fixed 1000 iterations. Tokens issued
// under a password/salt pair stay valid only while these constants hold.
SecretKey DeriveKey(std::string_view password, std::string_view salt);

}  // namespace idtoken::kdf
