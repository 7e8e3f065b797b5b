/// @file EnumMap.hpp
/// @brief Maps keyed by enum ordinal, with a dense value array and a membership bitset.
#pragma once

#include <KDS/Containers/EnumTable.hpp>
#include <KDS/Containers/HashMap.hpp>
#include <KDS/Containers/OrderedTable.hpp>

namespace KDS::Containers
{
    template<class E, class Value, Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    using EnumMap = BasicMap<EnumTable<E, Value, AllocatorType>>;

    template<class E, class Value, Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    using EnumOrderedMap = BasicMap<OrderedTable<EnumTable<E, Value, AllocatorType>>>;
}// namespace KDS::Containers
