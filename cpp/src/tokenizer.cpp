#include "idtoken/tokenizer.hpp"

#include "idtoken/crypto.hpp"
#include "idtoken/env.hpp"
#include "idtoken/log.hpp"

#include <stdexcept>
#include <utility>

namespace idtoken {

namespace {

constexpr int kDecimal = 10;
constexpr int kHex = 16;
constexpr int kToken = constants::kTokenBase;

// Largest std::uint64_t has 20 decimal digits.
constexpr std::size_t kMaxU64Digits = 20;

}  // namespace

TokenizerOptions TokenizerOptions::FromEnvironment() {
    TokenizerOptions options;
    std::string digest = env::Get(constants::kEnvDigest);
    if (!digest.empty()) {
        options.digest = digest;
    }
    options.tag_bits = env::GetSize(constants::kEnvTagBits, constants::kDefaultTagBits);
    options.alphabet = codec::ParseBase32Alphabet(env::Get(constants::kEnvAlphabet));
    return options;
}

Tokenizer::Tokenizer(std::string_view password, std::string_view salt, TokenizerOptions options)
    : options_(std::move(options)), tag_(options_.digest, options_.tag_bits) {
    if (password.empty()) {
        throw Error(ErrorKind::InvalidConfig, "Password is required");
    }
    key_ = kdf::DeriveKey(password, salt);
}

std::string Tokenizer::Encode(std::string_view id) const {
    if (id.empty() || !codec::IsValidDigits(id, kDecimal)) {
        throw Error(ErrorKind::InvalidIdentifier, "Identifier must be a non-negative decimal integer");
    }
    const std::string canonical = codec::StripLeadingZeros(id);
    std::string id_encoded = codec::Convert(canonical, kDecimal, kToken);
    std::string tag_hex = tag_.Compute(canonical, key_);
    std::string tag_encoded = codec::PadLeft(codec::Convert(tag_hex, kHex, kToken), tag_.base32_length());
    return codec::ToDisplay(tag_encoded + id_encoded, options_.alphabet);
}

std::string Tokenizer::Encode(std::uint64_t id) const {
    return Encode(std::to_string(id));
}

std::optional<std::string> Tokenizer::TryDecode(std::string_view token, ErrorKind* reason) const {
    const std::size_t tag_len = tag_.base32_length();
    bool well_formed = token.size() > tag_len;

    std::string digits;
    if (well_formed) {
        bool ok = false;
        digits = codec::FromDisplay(token, options_.alphabet, &ok);
        well_formed = ok;
    }

    // A malformed token still pays for one tag computation and comparison.
    std::string id = "0";
    std::string tag_from_token(tag_.hex_length(), '0');
    if (well_formed) {
        std::string_view view(digits);
        std::string_view tag_part = view.substr(0, tag_len);
        std::string_view id_part = view.substr(tag_len);
        if (id_part.size() > 1 && id_part.front() == '0') {
            well_formed = false;
        } else {
            id = codec::Convert(id_part, kToken, kDecimal);
            tag_from_token = codec::PadLeft(codec::Convert(tag_part, kToken, kHex), tag_.hex_length());
        }
    }

    const std::string tag_expected = tag_.Compute(id, key_);
    const bool tag_matches = crypto::ConstantTimeEqual(tag_from_token, tag_expected);
    if (well_formed && tag_matches) {
        return id;
    }

    const ErrorKind kind = well_formed ? ErrorKind::TagMismatch : ErrorKind::MalformedToken;
    if (reason) {
        *reason = kind;
    }
    log::Debug("token rejected: " + std::string(ToString(kind)));
    return std::nullopt;
}

std::string Tokenizer::Decode(std::string_view token) const {
    std::optional<std::string> id = TryDecode(token);
    if (!id) {
        throw Error(ErrorKind::InvalidToken, "Invalid token");
    }
    return std::move(*id);
}

std::optional<std::uint64_t> Tokenizer::TryDecodeU64(std::string_view token) const {
    std::optional<std::string> id = TryDecode(token);
    if (!id || id->size() > kMaxU64Digits) {
        return std::nullopt;
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(*id));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

bool Tokenizer::Verify(std::string_view token) const {
    return TryDecode(token).has_value();
}

}  // namespace idtoken
