#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace idtoken::constants {

inline constexpr std::size_t kKdfIterations = 1000;
inline constexpr std::size_t kKdfKeyLen = 32;
inline constexpr std::uint32_t kKdfBlockIndex = 1;

inline constexpr std::string_view kDefaultDigest = "sha256";
inline constexpr std::size_t kDefaultTagBits = 64;
// Below this the collision rate gets uncomfortable; accepted but warned about.
inline constexpr std::size_t kMinRecommendedTagBits = 32;

inline constexpr int kMinBase = 2;
inline constexpr int kMaxBase = 62;
inline constexpr int kTokenBase = 32;

inline constexpr std::string_view kDigitAlphabet =
    "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
inline constexpr std::string_view kCrockfordAlphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

inline constexpr std::string_view kEnvDigest = "IDTOKEN_DIGEST";
inline constexpr std::string_view kEnvTagBits = "IDTOKEN_TAG_BITS";
inline constexpr std::string_view kEnvAlphabet = "IDTOKEN_ALPHABET";
inline constexpr std::string_view kEnvPassword = "IDTOKEN_PASSWORD";
inline constexpr std::string_view kEnvSalt = "IDTOKEN_SALT";
inline constexpr std::string_view kEnvDebug = "IDTOKEN_DEBUG";

inline constexpr std::string_view kVersion = "1.0.0";

}  // namespace idtoken::constants
