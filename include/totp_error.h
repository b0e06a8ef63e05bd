#pragma once
#include <stdexcept>
#include <string>

enum class TotpErrc {
    InvalidBase32,
    InvalidInterval,
    InvalidDigits,
    InvalidEpoch,
    ClockError,
    InvalidConfig
};

// All failures of the decoder/engine/config surface as this type.
class TotpError : public std::runtime_error {
public:
    TotpError(TotpErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    TotpErrc code() const noexcept { return code_; }

private:
    TotpErrc code_;
};

const char* to_string(TotpErrc code) noexcept;
