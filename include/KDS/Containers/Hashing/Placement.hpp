/// @file Placement.hpp
/// @brief Multiplicative placement of 64-bit hashes into power-of-two slot arrays.
///
/// `Place(h) = (h * multiplier) >> shift`, with `shift = 64 - log2(capacity)`. Keeping the
/// top bits of the product means every input bit influences the slot, so identity
/// hashes of small integers or aligned pointers still spread across the table.
#pragma once

#include <KDS/Defines.hpp>
#include <KDS/Primitives.hpp>

#include <bit>

namespace KDS::Containers::Hashing
{
    /// @brief Multiplier used by a freshly constructed table (2^64 / golden ratio, odd).
    inline constexpr UInt64 kDefaultHashMultiplier = 0x9E3779B97F4A7C15ull;

    /// @brief Pick the multiplier a table uses after it is re-laid out with `shift`.
    ///
    /// The choice depends on both the previous multiplier and the new shift, so a key
    /// set that happened to cluster at one capacity sees a different scramble after growth.
    /// The result is always odd.
    [[nodiscard]] KDS_API UInt64 NextHashMultiplier(UInt64 previous, UInt32 shift) noexcept;

    struct PlacementState
    {
        UInt64 multiplier {kDefaultHashMultiplier};
        UInt32 shift {63};

        /// @pre `capacity` is a power of two and at least 2.
        [[nodiscard]] static constexpr UInt32 ShiftFor(UIntSize capacity) noexcept
        {
            return 64u - static_cast<UInt32>(std::countr_zero(capacity));
        }

        [[nodiscard]] static constexpr PlacementState ForCapacity(UIntSize capacity, UInt64 multiplier) noexcept
        {
            return PlacementState {multiplier | 1u, ShiftFor(capacity)};
        }

        [[nodiscard]] KDS_ALWAYS_INLINE constexpr UIntSize Place(UInt64 hash) const noexcept
        {
            return static_cast<UIntSize>((hash * multiplier) >> shift);
        }
    };
}// namespace KDS::Containers::Hashing
