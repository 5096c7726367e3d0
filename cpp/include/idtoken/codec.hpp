#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace idtoken::codec {

// Digit strings use "0-9a-zA-Z" (case-sensitive); a base-b string uses the
// first b symbols. Values have no size limit.
std::string Convert(std::string_view digits, int from_base, int to_base);
bool IsValidDigits(std::string_view digits, int base);

std::string StripLeadingZeros(std::string_view digits);
std::string PadLeft(std::string_view digits, std::size_t width);

enum class Base32Alphabet {
    kLegacy,     // same symbols as the conversion digits: 0-9a-v
    kCrockford,  // 0-9A-Z without I, L, O, U
};

Base32Alphabet ParseBase32Alphabet(std::string_view name);
std::string_view ToString(Base32Alphabet alphabet);

// Maps base-32 conversion digits to display symbols and back. FromDisplay
// throws Error(InvalidDigit) on an unknown symbol unless `ok` is given.
std::string ToDisplay(std::string_view base32_digits, Base32Alphabet alphabet);
std::string FromDisplay(std::string_view text, Base32Alphabet alphabet, bool* ok = nullptr);

}  // namespace idtoken::codec
