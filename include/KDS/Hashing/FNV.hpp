// FNV.hpp
// FNV-1a 64-bit hashing in KDS::Hashing, including an ASCII case-folding variant.
#pragma once

#include <KDS/Primitives.hpp>
#include <string_view>

namespace KDS::Hashing
{
    inline constexpr UInt64 kFNV64Offset = 14695981039346656037ull;
    inline constexpr UInt64 kFNV64Prime  = 1099511628211ull;

    /// @brief Map 'A'..'Z' to 'a'..'z'; every other byte is returned unchanged.
    [[nodiscard]] constexpr char FoldAsciiCase(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    /// @brief Compute FNV-1a 64-bit hash for a string_view.
    [[nodiscard]] constexpr UInt64 FNV1a64(std::string_view sv) noexcept
    {
        UInt64 hash = kFNV64Offset;
        for (const char c: sv)
            hash = (hash ^ static_cast<UInt8>(c)) * kFNV64Prime;
        return hash;
    }

    /// @brief FNV-1a 64-bit over the ASCII-case-folded bytes of `sv`.
    /// @details Strings that differ only in ASCII letter case hash identically.
    [[nodiscard]] constexpr UInt64 FNV1a64Folded(std::string_view sv) noexcept
    {
        UInt64 hash = kFNV64Offset;
        for (const char c: sv)
            hash = (hash ^ static_cast<UInt8>(FoldAsciiCase(c))) * kFNV64Prime;
        return hash;
    }
}// namespace KDS::Hashing
