/// @file OrderedHashMap.hpp
/// @brief Hash map that remembers key insertion order and supports positional edits.
#pragma once

#include <KDS/Containers/HashMap.hpp>
#include <KDS/Containers/OrderedTable.hpp>

namespace KDS::Containers
{
    template<class Key,
             class Value,
             class Policy                          = Hashing::DefaultKeyPolicy<Key>,
             Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    using OrderedHashMap = BasicMap<OrderedTable<OpenTable<Policy, Value, AllocatorType>>>;
}// namespace KDS::Containers
