#include "base32.h"
#include "totp_error.h"

#include <openssl/crypto.h>

#include <cctype>
#include <cstdint>
#include <vector>

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

// expects an uppercased character
int b32_val(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= '2' && c <= '7') return 26 + (c - '2');
    return -1;
}

std::string describe(char c) {
    if (std::isprint(static_cast<unsigned char>(c))) return std::string("'") + c + "'";
    return "byte " + std::to_string(static_cast<unsigned char>(c));
}

} // namespace

Secret base32_decode(const std::string& text) {
    std::vector<unsigned char> out;
    out.reserve(text.size() * 5 / 8);

    uint32_t buffer = 0;
    int bits_left = 0;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = static_cast<char>(std::toupper(static_cast<unsigned char>(text[i])));
        const int v = b32_val(c);
        if (v < 0) {
            if (!out.empty()) OPENSSL_cleanse(out.data(), out.size());
            throw TotpError(TotpErrc::InvalidBase32,
                            "invalid base32 character " + describe(text[i]) +
                            " at position " + std::to_string(i));
        }
        buffer = ((buffer << 5) | static_cast<uint32_t>(v)) & 0x1FFF; // at most 12 live bits
        bits_left += 5;
        if (bits_left >= 8) {
            bits_left -= 8;
            out.push_back(static_cast<unsigned char>((buffer >> bits_left) & 0xFF));
        }
    }
    // incomplete trailing bits are dropped
    return Secret(std::move(out));
}

std::string base32_encode(const unsigned char* data, std::size_t len) {
    std::string out;
    out.reserve((len * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits_left = 0;
    for (std::size_t i = 0; i < len; ++i) {
        buffer = ((buffer << 8) | data[i]) & 0xFFF;
        bits_left += 8;
        while (bits_left >= 5) {
            bits_left -= 5;
            out.push_back(kAlphabet[(buffer >> bits_left) & 0x1F]);
        }
    }
    if (bits_left > 0) {
        out.push_back(kAlphabet[(buffer << (5 - bits_left)) & 0x1F]);
    }
    return out;
}

std::string base32_encode(const Secret& secret) {
    return base32_encode(secret.data(), secret.size());
}
