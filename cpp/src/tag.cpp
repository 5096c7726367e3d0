#include "idtoken/tag.hpp"

#include "idtoken/constants.hpp"
#include "idtoken/errors.hpp"
#include "idtoken/log.hpp"

#include <utility>

namespace idtoken::tag {

std::string TruncateToBits(const crypto::Bytes& mac, std::size_t bits) {
    if (bits == 0 || bits > mac.size() * 8) {
        throw Error(ErrorKind::InvalidConfig, "Tag length exceeds MAC size");
    }
    static constexpr char kHex[] = "0123456789abcdef";
    const std::size_t hex_len = HexLength(bits);
    const std::size_t pad = hex_len * 4 - bits;

    std::string out;
    out.reserve(hex_len);
    for (std::size_t nibble = 0; nibble < hex_len; ++nibble) {
        unsigned value = 0;
        for (std::size_t b = 0; b < 4; ++b) {
            std::size_t pos = nibble * 4 + b;
            unsigned bit = 0;
            if (pos >= pad) {
                std::size_t j = pos - pad;
                bit = (mac[j / 8] >> (7 - j % 8)) & 1u;
            }
            value = (value << 1) | bit;
        }
        out.push_back(kHex[value]);
    }
    return out;
}

Generator::Generator(std::string digest_name, std::size_t bits)
    : digest_name_(std::move(digest_name)), bits_(bits) {
    const std::size_t max_bits = crypto::DigestSize(digest_name_) * 8;
    if (bits_ == 0 || bits_ > max_bits) {
        throw Error(ErrorKind::InvalidConfig,
                    "Tag length must be between 1 and " + std::to_string(max_bits) + " bits for " + digest_name_
                        + ", got " + std::to_string(bits_));
    }
    if (bits_ < constants::kMinRecommendedTagBits) {
        log::Warn("tag length of " + std::to_string(bits_) + " bits makes forged tokens likely to verify");
    }
}

std::string Generator::Compute(std::string_view message, const kdf::SecretKey& key) const {
    crypto::Bytes mac = crypto::Hmac(digest_name_, key.bytes(), message);
    return TruncateToBits(mac, bits_);
}

}  // namespace idtoken::tag
