#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace shared::proto {

// Stable identity assigned by the authority to a connected client.
// Players and per-player rows (equipment, inventory) are keyed by it.
struct Identity {
    std::uint64_t hi{0};
    std::uint64_t lo{0};

    bool is_null() const { return hi == 0 && lo == 0; }

    std::string to_hex() const;

    friend bool operator==(const Identity& a, const Identity& b) { return a.hi == b.hi && a.lo == b.lo; }
    friend bool operator!=(const Identity& a, const Identity& b) { return !(a == b); }
    friend bool operator<(const Identity& a, const Identity& b) {
        return a.hi != b.hi ? a.hi < b.hi : a.lo < b.lo;
    }
};

struct IdentityHash {
    std::size_t operator()(const Identity& id) const {
        std::size_t h1 = std::hash<std::uint64_t>{}(id.hi);
        std::size_t h2 = std::hash<std::uint64_t>{}(id.lo);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ull + (h1 << 6) + (h1 >> 2));
    }
};

} // namespace shared::proto
