/// @file TableConfig.hpp
/// @brief Construction-time tuning shared by every hash-table-backed container.
#pragma once

#include <KDS/Primitives.hpp>
#include <KDS/Exceptions/ArgumentException.hpp>

#include <string>

namespace KDS::Containers
{
    struct TableConfig
    {
        /// Requested slot count; rounded up to a power of two, never below 2.
        UIntSize initialCapacity = 16;
        /// Fraction of slots that may be filled before the table doubles. Must lie in (0, 1].
        F32 loadFactor = 0.7f;
    };

    /// @brief Throws ArgumentException unless `0 < loadFactor <= 1`.
    inline void ValidateLoadFactor(F32 loadFactor)
    {
        if (!(loadFactor > 0.0f && loadFactor <= 1.0f))
            throw Exceptions::ArgumentException("Load factor must be greater than 0 and at most 1, got " +
                                                std::to_string(loadFactor));
    }
}// namespace KDS::Containers
