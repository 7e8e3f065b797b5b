/// @file KeyValueRef.hpp
/// @brief Key/value view yielded by map iterators.
#pragma once

namespace KDS::Containers
{
    /// @brief References into a live entry. Valid until the iterator advances or the container is mutated.
    template<class Key, class Value>
    struct KeyValueRef
    {
        const Key& key;
        Value&     value;
    };

    namespace detail
    {
        /// @brief Stand-in value type for sets. Every instance compares equal.
        struct NoValue
        {
            friend constexpr bool operator==(NoValue, NoValue) noexcept { return true; }
        };
    }// namespace detail
}// namespace KDS::Containers
