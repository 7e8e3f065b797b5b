/// @file EnumSet.hpp
/// @brief Bitset-backed sets of enum keys.
#pragma once

#include <KDS/Containers/EnumTable.hpp>
#include <KDS/Containers/HashSet.hpp>
#include <KDS/Containers/OrderedTable.hpp>

#include <span>

namespace KDS::Containers
{
    /// Iterates in ordinal order. Construct with a universe span, or default-construct
    /// when `Meta::EnumTraits<E>` is specialized.
    template<class E, Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    using EnumSet = BasicSet<EnumTable<E, void, AllocatorType>>;

    /// Enum set that iterates in insertion order instead of ordinal order.
    template<class E, Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    using EnumOrderedSet = BasicSet<OrderedTable<EnumTable<E, void, AllocatorType>>>;

    /// @brief Set holding every member of `universe`.
    template<class E, Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    [[nodiscard]] EnumSet<E, AllocatorType> AllOf(std::span<const E> universe, const AllocatorType& allocator = AllocatorType {})
    {
        EnumSet<E, AllocatorType> set(universe, allocator);
        set.FillUniverse();
        return set;
    }

    /// @brief Empty set bound to `universe`.
    template<class E, Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    [[nodiscard]] EnumSet<E, AllocatorType> NoneOf(std::span<const E> universe, const AllocatorType& allocator = AllocatorType {})
    {
        return EnumSet<E, AllocatorType>(universe, allocator);
    }
}// namespace KDS::Containers
