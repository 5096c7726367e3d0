#include "idtoken/codec.hpp"

#include "idtoken/constants.hpp"
#include "idtoken/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <vector>

namespace idtoken::codec {

namespace {

using constants::kCrockfordAlphabet;
using constants::kDigitAlphabet;

std::array<int, 256> BuildDigitTable() {
    std::array<int, 256> table{};
    table.fill(-1);
    for (std::size_t i = 0; i < kDigitAlphabet.size(); ++i) {
        table[static_cast<unsigned char>(kDigitAlphabet[i])] = static_cast<int>(i);
    }
    return table;
}

std::array<int, 256> BuildCrockfordTable() {
    std::array<int, 256> table{};
    table.fill(-1);
    for (std::size_t i = 0; i < kCrockfordAlphabet.size(); ++i) {
        unsigned char ch = static_cast<unsigned char>(kCrockfordAlphabet[i]);
        table[ch] = static_cast<int>(i);
        table[static_cast<unsigned char>(std::tolower(ch))] = static_cast<int>(i);
    }
    // Look-alikes are read as the digit they resemble.
    table['O'] = table['o'] = 0;
    table['I'] = table['i'] = 1;
    table['L'] = table['l'] = 1;
    return table;
}

const std::array<int, 256> kDigitTable = BuildDigitTable();
const std::array<int, 256> kCrockfordTable = BuildCrockfordTable();

void CheckBase(int base) {
    if (base < constants::kMinBase || base > constants::kMaxBase) {
        throw Error(ErrorKind::UnsupportedBase, "Unsupported base: " + std::to_string(base));
    }
}

int DigitValue(char ch, int base) {
    int value = kDigitTable[static_cast<unsigned char>(ch)];
    if (value < 0 || value >= base) {
        return -1;
    }
    return value;
}

}  // namespace

std::string Convert(std::string_view digits, int from_base, int to_base) {
    CheckBase(from_base);
    CheckBase(to_base);

    std::vector<int> number(digits.size());
    for (std::size_t i = 0; i < digits.size(); ++i) {
        int value = DigitValue(digits[i], from_base);
        if (value < 0) {
            throw Error(ErrorKind::InvalidDigit, "Invalid digit for base " + std::to_string(from_base));
        }
        number[i] = value;
    }

    // Long division of `number` by to_base; each pass yields one output digit
    // (the remainder) and leaves the quotient in place at the front of `number`.
    std::string result;
    std::size_t length = number.size();
    std::size_t new_length = 0;
    do {
        int divide = 0;
        new_length = 0;
        for (std::size_t i = 0; i < length; ++i) {
            divide = divide * from_base + number[i];
            if (divide >= to_base) {
                number[new_length++] = divide / to_base;
                divide %= to_base;
            } else if (new_length > 0) {
                number[new_length++] = 0;
            }
        }
        length = new_length;
        result.push_back(kDigitAlphabet[static_cast<std::size_t>(divide)]);
    } while (new_length != 0);

    std::reverse(result.begin(), result.end());
    return result;
}

bool IsValidDigits(std::string_view digits, int base) {
    if (base < constants::kMinBase || base > constants::kMaxBase) {
        return false;
    }
    return std::all_of(digits.begin(), digits.end(), [base](char ch) { return DigitValue(ch, base) >= 0; });
}

std::string StripLeadingZeros(std::string_view digits) {
    std::size_t first = digits.find_first_not_of('0');
    if (first == std::string_view::npos) {
        return "0";
    }
    return std::string(digits.substr(first));
}

std::string PadLeft(std::string_view digits, std::size_t width) {
    if (digits.size() >= width) {
        return std::string(digits);
    }
    std::string out(width - digits.size(), '0');
    out.append(digits);
    return out;
}

Base32Alphabet ParseBase32Alphabet(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lowered.empty() || lowered == "legacy") {
        return Base32Alphabet::kLegacy;
    }
    if (lowered == "crockford") {
        return Base32Alphabet::kCrockford;
    }
    throw Error(ErrorKind::InvalidConfig, "Unknown base32 alphabet: " + std::string(name));
}

std::string_view ToString(Base32Alphabet alphabet) {
    switch (alphabet) {
        case Base32Alphabet::kLegacy:
            return "legacy";
        case Base32Alphabet::kCrockford:
            return "crockford";
    }
    return "unknown";
}

std::string ToDisplay(std::string_view base32_digits, Base32Alphabet alphabet) {
    std::string out;
    out.reserve(base32_digits.size());
    for (char ch : base32_digits) {
        int value = DigitValue(ch, constants::kTokenBase);
        if (value < 0) {
            throw Error(ErrorKind::InvalidDigit, "Invalid base32 digit");
        }
        if (alphabet == Base32Alphabet::kCrockford) {
            out.push_back(kCrockfordAlphabet[static_cast<std::size_t>(value)]);
        } else {
            out.push_back(ch);
        }
    }
    return out;
}

std::string FromDisplay(std::string_view text, Base32Alphabet alphabet, bool* ok) {
    std::string out;
    out.reserve(text.size());
    bool success = true;
    for (char ch : text) {
        int value = alphabet == Base32Alphabet::kCrockford
                        ? kCrockfordTable[static_cast<unsigned char>(ch)]
                        : DigitValue(ch, constants::kTokenBase);
        if (value < 0) {
            success = false;
            break;
        }
        out.push_back(kDigitAlphabet[static_cast<std::size_t>(value)]);
    }
    if (ok) {
        *ok = success;
    } else if (!success) {
        throw Error(ErrorKind::InvalidDigit, "Invalid symbol for " + std::string(ToString(alphabet)) + " base32");
    }
    if (!success) {
        out.clear();
    }
    return out;
}

}  // namespace idtoken::codec
