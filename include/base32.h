#pragma once
#include <string>
#include "secret.h"

// RFC 4648 Base32, unpadded, case-insensitive on input.
// Throws TotpError(InvalidBase32) on any character outside A-Z / 2-7
// ('=' and whitespace included). Empty input yields an empty Secret.
Secret base32_decode(const std::string& text);

// Uppercase, no '=' padding.
std::string base32_encode(const unsigned char* data, std::size_t len);
std::string base32_encode(const Secret& secret);
