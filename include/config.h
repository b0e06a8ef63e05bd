#pragma once
#include <string>
#include <optional>
#include <cstdint>

#include "logger.h"
#include "totp.h"

class Config {
public:
    // Load settings from json file. Every key is optional:
    //   { "digits": 6, "epoch": 0, "interval": 30,
    //     "algorithm": "SHA1", "log_level": "WARN" }
    static Config load_from_file(const std::string& path);
    // `origin` prefixes error messages (normally the file path)
    static Config parse(const std::string& json_text, const std::string& origin = "config");

    // Built-in defaults (no file)
    Config() = default;

    // Accessors (read-only)
    uint32_t digits() const { return digits_; }
    uint64_t epoch() const { return epoch_; }
    uint64_t interval() const { return interval_; }
    HashAlgo algorithm() const { return algo_; }
    const std::optional<LogLevel>& log_level() const { return log_level_; }

    // Engine parameters with the timestamp left unset
    TotpParams params() const;

private:
    uint32_t digits_ = 6;
    uint64_t epoch_ = 0;
    uint64_t interval_ = 30;
    HashAlgo algo_ = HashAlgo::SHA1;
    std::optional<LogLevel> log_level_;
};
