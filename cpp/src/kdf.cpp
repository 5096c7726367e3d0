#include "idtoken/kdf.hpp"

#include "idtoken/constants.hpp"

namespace idtoken::kdf {

SecretKey DeriveKey(std::string_view password, std::string_view salt) {
    crypto::Bytes password_key = crypto::ToBytes(password);

    crypto::Bytes block = crypto::ToBytes(salt);
    const std::uint32_t index = constants::kKdfBlockIndex;
    block.push_back(static_cast<std::uint8_t>((index >> 24) & 0xFF));
    block.push_back(static_cast<std::uint8_t>((index >> 16) & 0xFF));
    block.push_back(static_cast<std::uint8_t>((index >> 8) & 0xFF));
    block.push_back(static_cast<std::uint8_t>(index & 0xFF));

    crypto::Bytes last = crypto::HmacSha256(password_key, block);
    crypto::Bytes xorsum = last;
    for (std::size_t round = 1; round < constants::kKdfIterations; ++round) {
        crypto::Bytes next = crypto::HmacSha256(password_key, last);
        for (std::size_t i = 0; i < xorsum.size(); ++i) {
            xorsum[i] = static_cast<std::uint8_t>(xorsum[i] ^ next[i]);
        }
        crypto::SecureWipe(last);
        last = std::move(next);
    }
    crypto::SecureWipe(last);
    crypto::SecureWipe(password_key);
    return SecretKey(std::move(xorsum));
}

}  // namespace idtoken::kdf
