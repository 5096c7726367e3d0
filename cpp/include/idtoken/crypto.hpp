#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace idtoken::crypto {

using Bytes = std::vector<std::uint8_t>;

// Output size in bytes of the named message digest ("sha256", "sha512", ...).
// Throws Error(InvalidConfig) for unknown or extendable-output digests.
std::size_t DigestSize(std::string_view digest_name);

Bytes Hmac(std::string_view digest_name, const Bytes& key, const std::uint8_t* data, std::size_t length);
Bytes Hmac(std::string_view digest_name, const Bytes& key, std::string_view data);
Bytes HmacSha256(const Bytes& key, const Bytes& data);
Bytes Pbkdf2HmacSha256(std::string_view password, const Bytes& salt, std::size_t iterations, std::size_t length);

// Runs in time dependent only on `length`.
bool ConstantTimeEqual(const void* a, const void* b, std::size_t length);
// False for differing lengths; otherwise the same fixed-time comparison.
bool ConstantTimeEqual(std::string_view a, std::string_view b);

void SecureWipe(Bytes& data);
std::string HexLower(const Bytes& data);
Bytes ToBytes(std::string_view text);

}  // namespace idtoken::crypto
