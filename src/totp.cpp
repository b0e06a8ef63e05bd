#include "totp.h"
#include "base32.h"
#include "totp_error.h"

#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <openssl/crypto.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

const EVP_MD* md_for_algo(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::SHA1:   return EVP_sha1();
        case HashAlgo::SHA256: return EVP_sha256();
        case HashAlgo::SHA512: return EVP_sha512();
    }
    return EVP_sha1();
}

void check_digits(uint32_t digits) {
    if (digits < 1 || digits > 10) {
        throw TotpError(TotpErrc::InvalidDigits,
                        "digits must be between 1 and 10, got " + std::to_string(digits));
    }
}

uint64_t modulus_for(uint32_t digits) {
    uint64_t mod = 1;
    for (uint32_t i = 0; i < digits; ++i) mod *= 10;
    return mod;
}

} // namespace

HashAlgo hash_algo_from_string(const std::string& name) {
    std::string up;
    up.reserve(name.size());
    for (char c : name) {
        if (c == '-') continue; // "SHA-256"
        up.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (up == "SHA1")   return HashAlgo::SHA1;
    if (up == "SHA256") return HashAlgo::SHA256;
    if (up == "SHA512") return HashAlgo::SHA512;
    throw TotpError(TotpErrc::InvalidConfig, "unknown hash algorithm: " + name);
}

const char* to_string(HashAlgo algo) noexcept {
    switch (algo) {
        case HashAlgo::SHA1:   return "SHA1";
        case HashAlgo::SHA256: return "SHA256";
        case HashAlgo::SHA512: return "SHA512";
    }
    return "SHA1";
}

uint64_t unix_now() {
    using namespace std::chrono;
    const auto secs = duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
    if (secs < 0) {
        throw TotpError(TotpErrc::ClockError, "system clock is set before the unix epoch");
    }
    return static_cast<uint64_t>(secs);
}

uint64_t time_counter(uint64_t timestamp, uint64_t epoch, uint64_t interval) {
    if (interval == 0) {
        throw TotpError(TotpErrc::InvalidInterval, "interval must be a positive number of seconds");
    }
    if (timestamp < epoch) {
        throw TotpError(TotpErrc::InvalidEpoch,
                        "timestamp " + std::to_string(timestamp) +
                        " is before epoch " + std::to_string(epoch));
    }
    return (timestamp - epoch) / interval;
}

uint32_t hotp(const Secret& key, uint64_t counter, uint32_t digits, HashAlgo algo) {
    check_digits(digits);

    // counter in big-endian 8 bytes
    std::array<unsigned char, 8> msg{};
    for (int i = 7; i >= 0; --i) {
        msg[i] = static_cast<unsigned char>(counter & 0xFF);
        counter >>= 8;
    }

    const EVP_MD* md = md_for_algo(algo);
    unsigned int len = 0;
    std::array<unsigned char, EVP_MAX_MD_SIZE> mac{};

    // HMAC() rejects a null key pointer; an empty Secret has no storage
    static const unsigned char empty_key = 0;
    const unsigned char* key_data = key.empty() ? &empty_key : key.data();

    if (!HMAC(md,
              key_data, static_cast<int>(key.size()),
              msg.data(), msg.size(),
              mac.data(), &len) || len < 20) {
        throw std::runtime_error("TOTP: HMAC failed");
    }

    // dynamic truncation (RFC 4226 5.3)
    const unsigned int offset = mac[len - 1] & 0x0F;
    const uint32_t bin_code =
        (static_cast<uint32_t>(mac[offset]   & 0x7F) << 24) |
        (static_cast<uint32_t>(mac[offset+1] & 0xFF) << 16) |
        (static_cast<uint32_t>(mac[offset+2] & 0xFF) <<  8) |
        (static_cast<uint32_t>(mac[offset+3] & 0xFF) <<  0);

    OPENSSL_cleanse(mac.data(), mac.size());

    return static_cast<uint32_t>(bin_code % modulus_for(digits));
}

uint32_t compute(const Secret& key, uint32_t digits, uint64_t epoch,
                 uint64_t interval, uint64_t timestamp, HashAlgo algo) {
    return hotp(key, time_counter(timestamp, epoch, interval), digits, algo);
}

uint32_t compute_totp(const std::string& secret_base32, const TotpParams& params) {
    const Secret key = base32_decode(secret_base32);
    const uint64_t ts = params.timestamp ? *params.timestamp : unix_now();
    return compute(key, params.digits, params.epoch, params.interval, ts, params.algo);
}

std::string format_code(uint32_t code, uint32_t digits) {
    std::ostringstream oss;
    oss << std::setw(static_cast<int>(digits)) << std::setfill('0') << code;
    return oss.str();
}

bool verify(const std::string& code, const Secret& key, const TotpParams& params,
            uint32_t window_steps) {
    if (code.size() != params.digits) return false;
    if (!std::all_of(code.begin(), code.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return false;
    }

    const uint64_t ts = params.timestamp ? *params.timestamp : unix_now();
    const uint64_t ctr = time_counter(ts, params.epoch, params.interval);

    auto matches = [&](uint64_t c) {
        return format_code(hotp(key, c, params.digits, params.algo), params.digits) == code;
    };

    if (matches(ctr)) return true;
    for (uint64_t w = 1; w <= window_steps; ++w) {
        if (ctr <= std::numeric_limits<uint64_t>::max() - w && matches(ctr + w)) return true;
        if (ctr >= w && matches(ctr - w)) return true;
    }
    return false;
}

// ----------- TOTP object API -----------

TOTP::TOTP(const std::string& secret_base32, TotpParams params)
    : secret_(base32_decode(secret_base32)),
      params_(std::move(params))
{
    check_digits(params_.digits);
    if (params_.interval == 0) {
        throw TotpError(TotpErrc::InvalidInterval, "interval must be a positive number of seconds");
    }
}

uint32_t TOTP::code_at(uint64_t timestamp) const {
    return compute(secret_, params_.digits, params_.epoch, params_.interval, timestamp, params_.algo);
}

std::string TOTP::formatted_at(uint64_t timestamp) const {
    return format_code(code_at(timestamp), params_.digits);
}

std::string TOTP::now() const {
    return formatted_at(params_.timestamp ? *params_.timestamp : unix_now());
}

bool TOTP::verify(const std::string& code, uint64_t timestamp, uint32_t window_steps) const {
    TotpParams p = params_;
    p.timestamp = timestamp;
    return ::verify(code, secret_, p, window_steps);
}
