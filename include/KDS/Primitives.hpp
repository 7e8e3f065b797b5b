/// @file Primitives.hpp
/// @brief Fixed-width aliases shared by every KDS module.
#pragma once
#include <cstddef>
#include <cstdint>

namespace KDS
{
    // Key and hash widths.
    using UInt8  = std::uint8_t;
    using UInt16 = std::uint16_t;
    using UInt32 = std::uint32_t;
    using UInt64 = std::uint64_t;
    using Int32  = std::int32_t;
    using Int64  = std::int64_t;

    // Float keys are compared by bit pattern, see BitKeyPolicy.
    using F32 = float;
    using F64 = double;

    /// @brief Slot indices, counts and capacities.
    using UIntSize = std::size_t;
    /// @brief Result of a probe: a slot index, or `~slot` for an absent key's insertion point.
    using IntSize = std::ptrdiff_t;
}// namespace KDS
