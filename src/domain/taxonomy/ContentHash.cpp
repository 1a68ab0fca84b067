/**
 * @file ContentHash.cpp
 * @brief Implementation of ContentHash.
 */

#include "domain/taxonomy/ContentHash.hpp"

#include <cstdio>

namespace typolab::domain::taxonomy {

std::uint64_t ContentHash::Fnv1a64(std::string_view data) {
    std::uint64_t h = OffsetBasis;
    for (unsigned char c : data) {
        h ^= static_cast<std::uint64_t>(c);
        h *= Prime;
    }
    return h;
}

std::string ContentHash::ToHex(std::uint64_t value) {
    static const char digits[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<std::size_t>(i)] = digits[value & 0xF];
        value >>= 4;
    }
    return out;
}

std::string ContentHash::FormatNumber(double value) {
    if (value == 0.0) value = 0.0; // folds -0.0
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", value);
    return buf;
}

} // namespace typolab::domain::taxonomy
