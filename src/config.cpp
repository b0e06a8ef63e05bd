#include "config.h"
#include "totp_error.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace {

template<typename T>
T unsigned_field(const json& j, const char* key, T fallback, const std::string& origin) {
    if (!j.contains(key)) return fallback;
    const auto& v = j.at(key);
    if (!v.is_number_unsigned() || v.get<uint64_t>() > std::numeric_limits<T>::max()) {
        throw TotpError(TotpErrc::InvalidConfig,
                        origin + ": '" + key + "' must be a non-negative integer");
    }
    return v.get<T>();
}

std::string string_field(const json& j, const char* key, const std::string& origin) {
    const auto& v = j.at(key);
    if (!v.is_string()) {
        throw TotpError(TotpErrc::InvalidConfig, origin + ": '" + key + "' must be a string");
    }
    return v.get<std::string>();
}

} // namespace

Config Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw TotpError(TotpErrc::InvalidConfig, "config file not found: " + path);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return parse(buf.str(), path);
}

Config Config::parse(const std::string& json_text, const std::string& origin) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw TotpError(TotpErrc::InvalidConfig, origin + ": " + e.what());
    }
    if (!j.is_object()) {
        throw TotpError(TotpErrc::InvalidConfig, origin + ": top level must be an object");
    }

    Config cfg;
    cfg.digits_   = unsigned_field<uint32_t>(j, "digits", cfg.digits_, origin);
    cfg.epoch_    = unsigned_field<uint64_t>(j, "epoch", cfg.epoch_, origin);
    cfg.interval_ = unsigned_field<uint64_t>(j, "interval", cfg.interval_, origin);
    if (j.contains("algorithm")) {
        cfg.algo_ = hash_algo_from_string(string_field(j, "algorithm", origin));
    }
    if (j.contains("log_level")) {
        cfg.log_level_ = log_level_from_string(string_field(j, "log_level", origin));
    }
    return cfg;
}

TotpParams Config::params() const {
    TotpParams p;
    p.digits = digits_;
    p.epoch = epoch_;
    p.interval = interval_;
    p.algo = algo_;
    return p;
}
