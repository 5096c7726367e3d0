#include "idtoken/crypto.hpp"
#include "idtoken/errors.hpp"
#include "idtoken/kdf.hpp"
#include "idtoken/tag.hpp"

#include <iostream>
#include <string>
#include <utility>

using idtoken::crypto::Bytes;
using idtoken::crypto::HexLower;

static bool chk(const std::string& name, const std::string& got, const std::string& expected) {
    const bool ok = (got == expected);
    std::cout << (ok ? "[OK] " : "[FAIL] ") << name << "\n";
    if (!ok) {
        std::cout << "  expected: " << expected << "\n";
        std::cout << "  got     : " << got << "\n";
    }
    return ok;
}

static bool chk_true(const std::string& name, bool value) {
    std::cout << (value ? "[OK] " : "[FAIL] ") << name << "\n";
    return value;
}

static bool chk_config_error(const std::string& name, void (*fn)()) {
    bool ok = false;
    try {
        fn();
    } catch (const idtoken::Error& err) {
        ok = err.kind() == idtoken::ErrorKind::InvalidConfig;
    }
    std::cout << (ok ? "[OK] " : "[FAIL] ") << name << "\n";
    return ok;
}

int main() {
    bool ok = true;

    // RFC 4231 test case 2
    ok &= chk("hmac-sha256 rfc4231",
              HexLower(idtoken::crypto::Hmac("sha256", idtoken::crypto::ToBytes("Jefe"), "what do ya want for nothing?")),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
    ok &= chk("hmac helpers agree",
              HexLower(idtoken::crypto::HmacSha256(idtoken::crypto::ToBytes("Jefe"),
                                                   idtoken::crypto::ToBytes("what do ya want for nothing?"))),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");

    ok &= chk_true("sha256 size", idtoken::crypto::DigestSize("sha256") == 32);
    ok &= chk_true("sha512 size", idtoken::crypto::DigestSize("sha512") == 64);
    ok &= chk_true("sha1 size", idtoken::crypto::DigestSize("sha1") == 20);
    ok &= chk_config_error("unknown digest", [] { idtoken::crypto::DigestSize("not-a-digest"); });
    ok &= chk_config_error("xof digest", [] { idtoken::crypto::DigestSize("shake256"); });

    ok &= chk_true("ct equal", idtoken::crypto::ConstantTimeEqual("86c85d75660eebd4", "86c85d75660eebd4"));
    ok &= chk_true("ct differs at end", !idtoken::crypto::ConstantTimeEqual("86c85d75660eebd4", "86c85d75660eebd5"));
    ok &= chk_true("ct differs at start", !idtoken::crypto::ConstantTimeEqual("86c85d75660eebd4", "96c85d75660eebd4"));
    ok &= chk_true("ct length mismatch", !idtoken::crypto::ConstantTimeEqual("86c8", "86c85"));
    ok &= chk_true("ct empty", idtoken::crypto::ConstantTimeEqual("", ""));

    Bytes wiped = idtoken::crypto::ToBytes("secret");
    idtoken::crypto::SecureWipe(wiped);
    ok &= chk_true("wipe clears", wiped.empty());

    idtoken::kdf::SecretKey key = idtoken::kdf::DeriveKey("correct horse", "battery");
    ok &= chk("derived key", HexLower(key.bytes()),
              "df44b840395feeb3542116509be5f3aa8cba77beddec736f2e6bd22b93fce9f6");
    ok &= chk("derived key is pbkdf2",
              HexLower(key.bytes()),
              HexLower(idtoken::crypto::Pbkdf2HmacSha256("correct horse", idtoken::crypto::ToBytes("battery"), 1000, 32)));
    ok &= chk("empty salt", HexLower(idtoken::kdf::DeriveKey("pw", "").bytes()),
              "a03530222d131b47d982c9810ef8e3b6b6c6766b6b1a1bad561bacbcc7966fe0");
    ok &= chk_true("different salt, different key",
                   idtoken::kdf::DeriveKey("correct horse", "staple").bytes() != key.bytes());

    idtoken::kdf::SecretKey moved = std::move(key);
    ok &= chk_true("move transfers key", moved.size() == 32 && key.empty());

    const Bytes mac = {0xde, 0xad, 0xbe, 0xef};
    ok &= chk("truncate 32", idtoken::tag::TruncateToBits(mac, 32), "deadbeef");
    ok &= chk("truncate 16", idtoken::tag::TruncateToBits(mac, 16), "dead");
    ok &= chk("truncate 30", idtoken::tag::TruncateToBits(mac, 30), "37ab6fbb");
    ok &= chk("truncate 5", idtoken::tag::TruncateToBits(mac, 5), "1b");
    ok &= chk("truncate 1", idtoken::tag::TruncateToBits(mac, 1), "1");

    ok &= chk_true("lengths for 64 bits", idtoken::tag::HexLength(64) == 16 && idtoken::tag::Base32Length(64) == 13);
    ok &= chk_true("lengths for 33 bits", idtoken::tag::HexLength(33) == 9 && idtoken::tag::Base32Length(33) == 7);

    idtoken::tag::Generator generator("sha256", 64);
    ok &= chk("tag for 42", generator.Compute("42", moved), "86c85d75660eebd4");
    ok &= chk("tag for 0", generator.Compute("0", moved), "21d944872cfbd4bc");
    idtoken::tag::Generator full("sha256", 256);
    ok &= chk_true("full tag is the whole hmac",
                   full.Compute("42", moved) == HexLower(idtoken::crypto::Hmac("sha256", moved.bytes(), "42")));
    ok &= chk_true("tag is a prefix of the full hmac", full.Compute("42", moved).rfind("86c85d75660eebd4", 0) == 0);

    ok &= chk_config_error("zero tag bits", [] { idtoken::tag::Generator("sha256", 0); });
    ok &= chk_config_error("tag bits above digest", [] { idtoken::tag::Generator("sha256", 257); });
    ok &= chk_config_error("tag bits above sha1", [] { idtoken::tag::Generator("sha1", 161); });

    return ok ? 0 : 1;
}
