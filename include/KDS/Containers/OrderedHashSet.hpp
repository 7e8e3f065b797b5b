/// @file OrderedHashSet.hpp
/// @brief Hash set that remembers insertion order and supports positional edits.
#pragma once

#include <KDS/Containers/HashSet.hpp>
#include <KDS/Containers/OrderedTable.hpp>

namespace KDS::Containers
{
    /// Iterates in insertion order. `Add(index, key)`, `RemoveAt`, `Alter`, `AlterAt`
    /// and `Sort` act on the order; membership stays with the hash table.
    template<class Key,
             class Policy                          = Hashing::DefaultKeyPolicy<Key>,
             Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    using OrderedHashSet = BasicSet<OrderedTable<OpenTable<Policy, void, AllocatorType>>>;
}// namespace KDS::Containers
