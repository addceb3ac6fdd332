#pragma once

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace citysuggest {

// Word separator stored in normalized keys.
constexpr char KEY_SEPARATOR = ' ';

// Number of child slots per node: separator + 'a'..'z'.
constexpr int KEY_SLOT_COUNT = 27;

// Lowercase ASCII letters, map every other byte to KEY_SEPARATOR,
// then trim separators from both ends. Inner runs are kept as-is,
// so "London, ON" becomes "london  on".
inline std::string normalize_key(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (unsigned char uc : raw) {
        if (uc >= 'A' && uc <= 'Z') out.push_back((char)(uc - 'A' + 'a'));
        else if (uc >= 'a' && uc <= 'z') out.push_back((char)uc);
        else out.push_back(KEY_SEPARATOR);
    }

    size_t start = out.find_first_not_of(KEY_SEPARATOR);
    if (start == std::string::npos) return std::string();
    size_t end = out.find_last_not_of(KEY_SEPARATOR);
    return out.substr(start, end - start + 1);
}

// Slot of a normalized character: 0 for the separator, 1..26 for a..z,
// -1 for anything else.
inline int key_slot(char c) {
    if (c == KEY_SEPARATOR) return 0;
    if (c >= 'a' && c <= 'z') return c - 'a' + 1;
    return -1;
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Whole-string decimal parse; rejects trailing junk, NaN and infinities.
inline bool parse_finite_double(const std::string& s, double& out) {
    try {
        size_t used = 0;
        double v = std::stod(s, &used);
        if (used != s.size() || !std::isfinite(v)) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// Whole-string integer parse.
inline bool parse_int64(const std::string& s, int64_t& out) {
    try {
        size_t used = 0;
        long long v = std::stoll(s, &used);
        if (used != s.size()) return false;
        out = (int64_t)v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace citysuggest
