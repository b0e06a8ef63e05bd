#include "totp_error.h"

const char* to_string(TotpErrc code) noexcept {
    switch (code) {
        case TotpErrc::InvalidBase32:   return "invalid base32";
        case TotpErrc::InvalidInterval: return "invalid interval";
        case TotpErrc::InvalidDigits:   return "invalid digits";
        case TotpErrc::InvalidEpoch:    return "invalid epoch";
        case TotpErrc::ClockError:      return "clock error";
        case TotpErrc::InvalidConfig:   return "invalid config";
    }
    return "unknown error";
}
