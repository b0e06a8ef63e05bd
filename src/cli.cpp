#include "cli.h"
#include "base32.h"
#include "config.h"
#include "logger.h"
#include "totp.h"
#include "totp_error.h"

#include <boost/program_options.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>

namespace po = boost::program_options;

namespace {

constexpr const char* kUsage =
    "usage with an argument: totp [options] <base32 secret>\n"
    "usage reading from stdin: echo <base32 secret> | totp [options]\n";

std::string trim(const std::string& s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto b = std::find_if(s.begin(), s.end(), not_space);
    auto e = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return b < e ? std::string(b, e) : std::string();
}

// lexical_cast happily wraps "-1" into an unsigned; reject anything but digits
uint64_t parse_unsigned(const std::string& text, const char* flag) {
    if (text.empty() || text.size() > 20 ||
        !std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        throw po::error(std::string("invalid value '") + text + "' for --" + flag);
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw po::error(std::string("value '") + text + "' for --" + flag + " is out of range");
    }
}

std::optional<uint64_t> optional_unsigned(const po::variables_map& vm, const char* flag) {
    if (!vm.count(flag)) return std::nullopt;
    return parse_unsigned(vm[flag].as<std::string>(), flag);
}

// zeroes the Base32 text on every exit path of the decode
struct SecretTextWiper {
    std::string& text;
    ~SecretTextWiper() { cleanse(text); }
};

std::string read_secret(std::istream& in) {
    std::string line;
    if (!std::getline(in, line) && !in.eof()) {
        throw std::runtime_error("error reading stdin");
    }
    std::string secret = trim(line);
    cleanse(line);
    return secret;
}

} // namespace

int run_cli(int argc, const char* const argv[],
            std::istream& in, std::ostream& out, std::ostream& err) {
    Logger log("totp", err);

    po::options_description opts("options");
    opts.add_options()
        ("help,h", "print this help")
        ("digits,d", po::value<std::string>(), "number of code digits (default 6)")
        ("epoch,e", po::value<std::string>(), "unix time to start counting steps from (default 0)")
        ("interval,i", po::value<std::string>(), "seconds per time step (default 30)")
        ("time,t", po::value<std::string>(), "unix time to evaluate instead of now")
        ("algorithm,a", po::value<std::string>(), "SHA1, SHA256 or SHA512 (default SHA1)")
        ("counter,c", po::value<std::string>(), "print the HOTP code for this counter")
        ("config", po::value<std::string>(), "json file with default settings")
        ("show-key", "print the decoded secret in canonical base32 instead of a code")
        ("verbose,v", "log parameters to stderr");

    po::options_description hidden;
    hidden.add_options()("secret", po::value<std::string>());

    po::options_description all;
    all.add(opts).add(hidden);

    po::positional_options_description pos;
    pos.add("secret", 1);

    try {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(all).positional(pos).run(), vm);
        po::notify(vm);

        if (vm.count("help")) {
            out << kUsage << opts;
            return 0;
        }

        Config cfg;
        if (vm.count("config")) {
            cfg = Config::load_from_file(vm["config"].as<std::string>());
        }
        if (cfg.log_level()) log.set_level(*cfg.log_level());
        if (vm.count("verbose")) log.set_level(LogLevel::DEBUG);

        TotpParams params = cfg.params();
        if (auto v = optional_unsigned(vm, "digits")) {
            if (*v > 10) {
                throw TotpError(TotpErrc::InvalidDigits, "digits must be between 1 and 10");
            }
            params.digits = static_cast<uint32_t>(*v);
        }
        if (auto v = optional_unsigned(vm, "epoch"))    params.epoch = *v;
        if (auto v = optional_unsigned(vm, "interval")) params.interval = *v;
        if (auto v = optional_unsigned(vm, "time"))     params.timestamp = *v;
        if (vm.count("algorithm")) {
            params.algo = hash_algo_from_string(vm["algorithm"].as<std::string>());
        }
        const std::optional<uint64_t> counter = optional_unsigned(vm, "counter");

        std::string text = vm.count("secret") ? vm["secret"].as<std::string>()
                                              : read_secret(in);
        const Secret key = [&] {
            SecretTextWiper wipe_text{text};
            SecretTextWiper wipe_arg{vm.count("secret") ? vm.at("secret").as<std::string>() : text};
            return base32_decode(text);
        }();
        if (key.empty()) log.warn("secret is empty");
        log.debug_fmt("decoded secret: ", key.size(), " bytes");

        if (vm.count("show-key")) {
            out << base32_encode(key) << '\n';
            return 0;
        }

        uint32_t code = 0;
        if (counter) {
            log.debug_fmt("hotp: algorithm=", to_string(params.algo),
                          " digits=", params.digits, " counter=", *counter);
            code = hotp(key, *counter, params.digits, params.algo);
        } else {
            const uint64_t ts = params.timestamp ? *params.timestamp : unix_now();
            log.debug_fmt("totp: algorithm=", to_string(params.algo),
                          " digits=", params.digits, " epoch=", params.epoch,
                          " interval=", params.interval, " time=", ts);
            code = compute(key, params.digits, params.epoch, params.interval, ts, params.algo);
            log.debug_fmt("counter=", time_counter(ts, params.epoch, params.interval));
        }

        out << format_code(code, params.digits) << '\n';
        return 0;
    } catch (const std::exception& e) {
        err << "error: " << e.what() << ", try --help\n";
    }
    return 1;
}
