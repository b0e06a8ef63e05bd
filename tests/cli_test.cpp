#include "cli.h"
#include <cassert>
#include <cstdio>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

struct Result {
    int code;
    std::string out;
    std::string err;
};

static Result run(std::initializer_list<const char*> args, const std::string& stdin_text = "") {
    std::vector<const char*> argv{"totp"};
    argv.insert(argv.end(), args.begin(), args.end());
    std::istringstream in(stdin_text);
    std::ostringstream out, err;
    const int code = run_cli(static_cast<int>(argv.size()), argv.data(), in, out, err);
    return {code, out.str(), err.str()};
}

static const char* kSeed = "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ";

int main() {
    // secret as argument
    Result r = run({"-d", "8", "-t", "59", kSeed});
    assert(r.code == 0);
    assert(r.out == "94287082\n");
    assert(r.err.empty());

    // secret from stdin, trimmed, lowercase
    r = run({"--digits", "8", "--time", "1111111109"}, "  gezdgnbvgy3tqojqgezdgnbvgy3tqojq \r\n");
    assert(r.code == 0);
    assert(r.out == "07081804\n");

    // defaults: 6 digits, 30s
    r = run({"-t", "59", kSeed});
    assert(r.code == 0 && r.out == "287082\n");

    r = run({"-d", "8", "-t", "59", "-i", "60", kSeed});
    assert(r.code == 0 && r.out == "84755224\n");

    r = run({"-d", "8", "-t", "89", "-e", "30", kSeed});
    assert(r.code == 0 && r.out == "94287082\n");

    // HOTP mode
    r = run({"--counter", "3", kSeed});
    assert(r.code == 0 && r.out == "969429\n");

    r = run({"-a", "SHA256", "-d", "8", "-t", "59",
             "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQGEZA"});
    assert(r.code == 0 && r.out == "46119246\n");

    // canonical key
    r = run({"--show-key", "jbswy3dpehpk3pxp"});
    assert(r.code == 0 && r.out == "JBSWY3DPEHPK3PXP\n");

    // config file, overridden by flags
    const std::string path = "cli_test_config.json";
    {
        std::ofstream f(path);
        f << R"({ "digits": 8, "interval": 60 })";
    }
    r = run({"--config", path.c_str(), "-t", "59", kSeed});
    assert(r.code == 0 && r.out == "84755224\n");
    r = run({"--config", path.c_str(), "-i", "30", "-t", "59", kSeed});
    assert(r.code == 0 && r.out == "94287082\n");
    std::remove(path.c_str());

    // verbose logs to stderr only, never the secret
    r = run({"-v", "-d", "8", "-t", "59", kSeed});
    assert(r.code == 0 && r.out == "94287082\n");
    assert(r.err.find("counter=1") != std::string::npos);
    assert(r.err.find(kSeed) == std::string::npos);

    // empty stdin decodes to an empty key: still a code, plus a warning
    r = run({"-t", "59"}, "");
    assert(r.code == 0);
    assert(r.out.size() == 7 && r.out.back() == '\n');
    assert(r.err.find("[WARN] totp: secret is empty") != std::string::npos);
    Result blank = run({"-t", "59"}, "   \n");
    assert(blank.code == 0 && blank.out == r.out);

    // help
    r = run({"--help"});
    assert(r.code == 0);
    assert(r.out.find("usage") != std::string::npos);

    // errors: nothing on stdout, message on stderr, exit 1
    for (auto bad : std::vector<std::vector<const char*>>{
             {"INVALID!@#$"},
             {"-i", "0", kSeed},
             {"-d", "0", kSeed},
             {"-d", "11", kSeed},
             {"-d", "-1", kSeed},
             {"-i", "abc", kSeed},
             {"-e", "100", "-t", "99", kSeed},
             {"-a", "MD5", kSeed},
             {"--config", "does/not/exist.json", kSeed},
             {"--bogus", kSeed},
             {kSeed, "extra"},
         }) {
        std::vector<const char*> argv{"totp"};
        argv.insert(argv.end(), bad.begin(), bad.end());
        std::istringstream in;
        std::ostringstream out, err;
        const int code = run_cli(static_cast<int>(argv.size()), argv.data(), in, out, err);
        assert(code == 1);
        assert(out.str().empty());
        assert(err.str().rfind("error: ", 0) == 0);
        assert(err.str().find(", try --help") != std::string::npos);
    }

    r = run({"-t", "59", "NOT BASE32"});
    assert(r.err.find("invalid base32") != std::string::npos);

    std::cout << "CLI test passed.\n";
    return 0;
}
