#pragma once

#include "idtoken/crypto.hpp"
#include "idtoken/kdf.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace idtoken::tag {

inline constexpr std::size_t HexLength(std::size_t bits) { return (bits + 3) / 4; }
inline constexpr std::size_t Base32Length(std::size_t bits) { return (bits + 4) / 5; }

// The `bits` most-significant bits of `mac` as a number, in lowercase hex
// zero-padded to HexLength(bits). For bits divisible by 4 this is simply a
// prefix of the full hex digest.
std::string TruncateToBits(const crypto::Bytes& mac, std::size_t bits);

class Generator {
public:
    // Throws Error(InvalidConfig) unless 0 < bits <= digest output size in bits.
    Generator(std::string digest_name, std::size_t bits);

    std::string Compute(std::string_view message, const kdf::SecretKey& key) const;

    std::size_t bits() const noexcept { return bits_; }
    std::size_t hex_length() const noexcept { return HexLength(bits_); }
    std::size_t base32_length() const noexcept { return Base32Length(bits_); }
    const std::string& digest_name() const noexcept { return digest_name_; }

private:
    std::string digest_name_;
    std::size_t bits_;
};

}  // namespace idtoken::tag
