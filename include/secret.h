#pragma once
#include <cstddef>
#include <string>
#include <vector>

// Overwrites the characters of `s` with zeros in place; size is kept.
void cleanse(std::string& s) noexcept;

// Owns decoded key bytes. Storage is wiped on destruction and on move-from.
class Secret {
public:
    Secret() = default;
    explicit Secret(std::vector<unsigned char> bytes);
    Secret(const unsigned char* data, std::size_t len);
    static Secret from_string(const std::string& raw); // raw bytes, not Base32

    ~Secret();

    // non-copyable, movable
    Secret(const Secret&) = delete;
    Secret& operator=(const Secret&) = delete;
    Secret(Secret&& other) noexcept;
    Secret& operator=(Secret&& other) noexcept;

    const unsigned char* data() const noexcept { return bytes_.data(); }
    std::size_t size() const noexcept { return bytes_.size(); }
    bool empty() const noexcept { return bytes_.empty(); }

    bool operator==(const Secret& other) const noexcept;
    bool operator!=(const Secret& other) const noexcept { return !(*this == other); }

private:
    std::vector<unsigned char> bytes_;

    void wipe() noexcept;
};
