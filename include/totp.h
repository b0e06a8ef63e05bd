#pragma once
#include <string>
#include <cstdint>
#include <optional>

#include "secret.h"

enum class HashAlgo { SHA1, SHA256, SHA512 };

struct TotpParams {
    uint32_t digits = 6;
    uint64_t epoch = 0;                      // unix seconds subtracted before counting
    uint64_t interval = 30;                  // seconds per step
    std::optional<uint64_t> timestamp;       // nullopt -> wall clock
    HashAlgo algo = HashAlgo::SHA1;
};

// "SHA1" / "sha256" / ... ; throws TotpError(InvalidConfig) on unknown names
HashAlgo hash_algo_from_string(const std::string& name);
const char* to_string(HashAlgo algo) noexcept;

// Current unix time in seconds. Throws TotpError(ClockError) if the system
// clock reads before 1970-01-01.
uint64_t unix_now();

// floor((timestamp - epoch) / interval)
uint64_t time_counter(uint64_t timestamp, uint64_t epoch, uint64_t interval);

// RFC 4226: HMAC over the big-endian counter, dynamic truncation, mod 10^digits
uint32_t hotp(const Secret& key, uint64_t counter, uint32_t digits,
              HashAlgo algo = HashAlgo::SHA1);

// RFC 6238 with an explicit timestamp
uint32_t compute(const Secret& key, uint32_t digits, uint64_t epoch,
                 uint64_t interval, uint64_t timestamp,
                 HashAlgo algo = HashAlgo::SHA1);

// Decode + compute. Uses unix_now() when params.timestamp is empty.
uint32_t compute_totp(const std::string& secret_base32, const TotpParams& params = {});

// Left zero-pad to exactly `digits` characters.
std::string format_code(uint32_t code, uint32_t digits);

// Accepts codes from counters within +/- window_steps of the current one.
bool verify(const std::string& code, const Secret& key, const TotpParams& params,
            uint32_t window_steps = 1);

class TOTP {
public:
    explicit TOTP(const std::string& secret_base32, TotpParams params = {});

    uint32_t code_at(uint64_t timestamp) const;
    std::string formatted_at(uint64_t timestamp) const;
    std::string now() const;
    bool verify(const std::string& code, uint64_t timestamp, uint32_t window_steps = 1) const;

    const TotpParams& params() const noexcept { return params_; }

private:
    Secret secret_;
    TotpParams params_;
};
