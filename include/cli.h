#pragma once
#include <istream>
#include <ostream>

// Entry point of the `totp` executable with injectable streams.
// Returns the process exit code: 0 on success, 1 on any error.
// On error nothing is written to `out`.
int run_cli(int argc, const char* const argv[],
            std::istream& in, std::ostream& out, std::ostream& err);
