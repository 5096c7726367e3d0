#include "idtoken/crypto.hpp"

#include "idtoken/errors.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <limits>
#include <string>

namespace idtoken::crypto {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw Error(ErrorKind::CryptoFailure, message);
    }
}

const EVP_MD* ResolveDigest(std::string_view digest_name) {
    std::string name(digest_name);
    const EVP_MD* md = EVP_get_digestbyname(name.c_str());
    if (!md) {
        throw Error(ErrorKind::InvalidConfig, "Unsupported digest: " + name);
    }
    if ((EVP_MD_flags(md) & EVP_MD_FLAG_XOF) != 0) {
        throw Error(ErrorKind::InvalidConfig, "Extendable-output digest not usable for HMAC: " + name);
    }
    return md;
}

// HMAC() rejects null key/data pointers on some OpenSSL versions, even with zero length.
const std::uint8_t* NonNull(const std::uint8_t* ptr) {
    static const std::uint8_t kEmpty = 0;
    return ptr ? ptr : &kEmpty;
}

}  // namespace

std::size_t DigestSize(std::string_view digest_name) {
    int size = EVP_MD_size(ResolveDigest(digest_name));
    Ensure(size > 0, "Digest size unavailable");
    return static_cast<std::size_t>(size);
}

Bytes Hmac(std::string_view digest_name, const Bytes& key, const std::uint8_t* data, std::size_t length) {
    const EVP_MD* md = ResolveDigest(digest_name);
    if (key.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw Error(ErrorKind::CryptoFailure, "HMAC key too long");
    }
    unsigned int out_len = EVP_MAX_MD_SIZE;
    Bytes out(out_len);
    if (!HMAC(md, NonNull(key.data()), static_cast<int>(key.size()), NonNull(data), length,
              out.data(), &out_len)) {
        throw Error(ErrorKind::CryptoFailure, "HMAC failed");
    }
    out.resize(out_len);
    return out;
}

Bytes Hmac(std::string_view digest_name, const Bytes& key, std::string_view data) {
    return Hmac(digest_name, key, reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}

Bytes HmacSha256(const Bytes& key, const Bytes& data) {
    unsigned int out_len = EVP_MAX_MD_SIZE;
    Bytes out(out_len);
    if (!HMAC(EVP_sha256(), NonNull(key.data()), static_cast<int>(key.size()), NonNull(data.data()), data.size(),
              out.data(), &out_len)) {
        throw Error(ErrorKind::CryptoFailure, "HMAC-SHA256 failed");
    }
    out.resize(out_len);
    return out;
}

Bytes Pbkdf2HmacSha256(std::string_view password, const Bytes& salt, std::size_t iterations, std::size_t length) {
    Bytes out(length);
    Ensure(PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()), salt.data(),
                             static_cast<int>(salt.size()), static_cast<int>(iterations), EVP_sha256(),
                             static_cast<int>(out.size()), out.data()) == 1,
           "PBKDF2 failed");
    return out;
}

bool ConstantTimeEqual(const void* a, const void* b, std::size_t length) {
    if (length == 0) {
        return true;
    }
    return CRYPTO_memcmp(a, b, length) == 0;
}

bool ConstantTimeEqual(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return ConstantTimeEqual(a.data(), b.data(), a.size());
}

void SecureWipe(Bytes& data) {
    if (!data.empty()) {
        OPENSSL_cleanse(data.data(), data.size());
    }
    data.clear();
}

std::string HexLower(const Bytes& data) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (std::uint8_t byte : data) {
        out.push_back(kHex[byte >> 4]);
        out.push_back(kHex[byte & 0x0F]);
    }
    return out;
}

Bytes ToBytes(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

}  // namespace idtoken::crypto
