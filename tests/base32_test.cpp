#include "base32.h"
#include "totp_error.h"
#include <cassert>
#include <iostream>
#include <string>

static std::string bytes(const Secret& s) {
    return std::string(reinterpret_cast<const char*>(s.data()), s.size());
}

static bool rejects(const std::string& text) {
    try {
        base32_decode(text);
    } catch (const TotpError& e) {
        return e.code() == TotpErrc::InvalidBase32;
    }
    return false;
}

int main() {
    // RFC 4648 section 10, padding stripped
    assert(bytes(base32_decode("")) == "");
    assert(bytes(base32_decode("MY")) == "f");
    assert(bytes(base32_decode("MZXQ")) == "fo");
    assert(bytes(base32_decode("MZXW6")) == "foo");
    assert(bytes(base32_decode("MZXW6YQ")) == "foob");
    assert(bytes(base32_decode("MZXW6YTB")) == "fooba");
    assert(bytes(base32_decode("MZXW6YTBOI")) == "foobar");

    // 16 chars -> 10 bytes: "Hello!" 0xDEADBEEF
    const Secret hello = base32_decode("JBSWY3DPEHPK3PXP");
    assert(hello.size() == 10);
    assert(bytes(hello) == std::string("Hello!\xDE\xAD\xBE\xEF", 10));

    // case-insensitive
    assert(base32_decode("jbswy3dpehpk3pxp") == hello);
    assert(base32_decode("JbSwY3dPeHpK3pXp") == hello);

    // RFC 6238 seed
    assert(bytes(base32_decode("GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ")) == "12345678901234567890");

    // trailing bits that do not complete a byte are dropped
    assert(base32_decode("M").empty());
    assert(bytes(base32_decode("MZX")) == "f");

    // outside the alphabet, padding and whitespace included
    assert(rejects("INVALID!@#$"));
    assert(rejects("MY======"));
    assert(rejects("JBSW Y3DP"));
    assert(rejects("JBSWY3DP\n"));
    assert(rejects("0189"));

    try {
        base32_decode("AB1");
        assert(false && "expected failure");
    } catch (const TotpError& e) {
        assert(std::string(e.what()).find("position 2") != std::string::npos);
    }

    // encode emits canonical unpadded uppercase
    assert(base32_encode(hello) == "JBSWY3DPEHPK3PXP");
    const std::string foobar = "foobar";
    assert(base32_encode(reinterpret_cast<const unsigned char*>(foobar.data()), 4) == "MZXW6YQ");
    assert(base32_encode(Secret()) == "");
    assert(base32_encode(base32_decode("mzxw6ytboi")) == "MZXW6YTBOI");

    std::cout << "Base32 test passed.\n";
    return 0;
}
