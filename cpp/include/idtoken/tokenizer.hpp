#pragma once

#include "idtoken/codec.hpp"
#include "idtoken/constants.hpp"
#include "idtoken/errors.hpp"
#include "idtoken/kdf.hpp"
#include "idtoken/tag.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace idtoken {

struct TokenizerOptions {
    std::string digest = std::string(constants::kDefaultDigest);
    std::size_t tag_bits = constants::kDefaultTagBits;
    codec::Base32Alphabet alphabet = codec::Base32Alphabet::kLegacy;

    // Defaults overridden by IDTOKEN_DIGEST, IDTOKEN_TAG_BITS and IDTOKEN_ALPHABET.
    static TokenizerOptions FromEnvironment();
};

/**
 * Turns integer identifiers into short tokens carrying a truncated HMAC of
 * the identifier, and verifies such tokens without any stored state.
 *
 * A token is the base-32 tag (exactly tag_length_base32() symbols) followed
 * by the base-32 identifier. The identifier is only obfuscated, not
 * encrypted. Use a distinct salt per kind of resource: tokens are valid for
 * any resource sharing the key.
 *
 * Immutable after construction; const members may be called concurrently.
 */
class Tokenizer {
public:
    // Throws Error(InvalidConfig) for an empty password, an unknown digest or
    // a tag length outside 1..digest size.
    Tokenizer(std::string_view password, std::string_view salt, TokenizerOptions options = {});

    Tokenizer(const Tokenizer&) = delete;
    Tokenizer& operator=(const Tokenizer&) = delete;
    Tokenizer(Tokenizer&&) noexcept = default;
    Tokenizer& operator=(Tokenizer&&) noexcept = default;

    // `id` is a non-negative decimal integer of any length; leading zeros are
    // ignored. Throws Error(InvalidIdentifier) otherwise.
    std::string Encode(std::string_view id) const;
    std::string Encode(std::uint64_t id) const;

    // The canonical decimal identifier, or nullopt for any token this
    // instance did not issue. `reason` receives MalformedToken or TagMismatch
    // on rejection and is meant for diagnostics only.
    std::optional<std::string> TryDecode(std::string_view token, ErrorKind* reason = nullptr) const;
    // Throws Error(InvalidToken) on rejection, with the same message for every cause.
    std::string Decode(std::string_view token) const;
    std::optional<std::uint64_t> TryDecodeU64(std::string_view token) const;
    bool Verify(std::string_view token) const;

    std::size_t tag_bits() const noexcept { return tag_.bits(); }
    std::size_t tag_length_hex() const noexcept { return tag_.hex_length(); }
    std::size_t tag_length_base32() const noexcept { return tag_.base32_length(); }
    const TokenizerOptions& options() const noexcept { return options_; }

private:
    TokenizerOptions options_;
    tag::Generator tag_;
    kdf::SecretKey key_;
};

}  // namespace idtoken
