#pragma once

#include <cerrno>
#include <climits>
#include <cstdlib>

namespace deployer {

// Parses a whole decimal string into a positive int. Rejects trailing text,
// zero, negatives and anything past INT_MAX.
inline bool ParsePositiveInt(const char* s, int& out) {
    if (!s || *s == '\0') return false;
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(s, &end, 10);
    if (!end || *end != '\0' || errno == ERANGE) return false;
    if (v <= 0 || v > INT_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

} // namespace deployer
