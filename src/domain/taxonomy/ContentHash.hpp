/**
 * @file ContentHash.hpp
 * @brief Deterministic 64-bit FNV-1a digest used as class content identity.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace typolab::domain::taxonomy {

/**
 * @class ContentHash
 * @brief Stable, platform-independent digest of canonical text.
 */
class ContentHash {
public:
    static constexpr std::uint64_t OffsetBasis = 0xcbf29ce484222325ULL;
    static constexpr std::uint64_t Prime = 0x100000001b3ULL;

    /** @brief FNV-1a 64 over the raw bytes. */
    static std::uint64_t Fnv1a64(std::string_view data);

    /** @brief 16 lowercase hex characters, most significant nibble first. */
    static std::string ToHex(std::uint64_t value);

    /** @brief Canonical number text: %.17g, with -0 printed as 0. */
    static std::string FormatNumber(double value);

    /** @brief Convenience: ToHex(Fnv1a64(data)). */
    static std::string Digest(std::string_view data) { return ToHex(Fnv1a64(data)); }
};

} // namespace typolab::domain::taxonomy
