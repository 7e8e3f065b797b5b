/// @file PrimitiveCollections.hpp
/// @brief Named instantiations for primitive, identity and case-insensitive keys.
///
/// Every primitive alias uses BitKeyPolicy: keys compare by exact bit pattern and
/// the zero key lives outside the slot array.
#pragma once

#include <KDS/Containers/HashMap.hpp>
#include <KDS/Containers/HashSet.hpp>
#include <KDS/Containers/OrderedHashMap.hpp>
#include <KDS/Containers/OrderedHashSet.hpp>

#include <string>

namespace KDS::Containers
{
    using IntSet    = HashSet<Int32>;
    using LongSet   = HashSet<Int64>;
    using FloatSet  = HashSet<F32>;
    using DoubleSet = HashSet<F64>;

    using IntIntMap   = HashMap<Int32, Int32>;
    using IntLongMap  = HashMap<Int32, Int64>;
    using IntFloatMap = HashMap<Int32, F32>;
    using LongLongMap = HashMap<Int64, Int64>;

    template<class V>
    using IntObjectMap = HashMap<Int32, V>;
    template<class V>
    using LongObjectMap = HashMap<Int64, V>;
    template<class K>
    using ObjectIntMap = HashMap<K, Int32>;
    template<class K>
    using ObjectFloatMap = HashMap<K, F32>;

    using IntOrderedSet    = OrderedHashSet<Int32>;
    using LongOrderedSet   = OrderedHashSet<Int64>;
    using FloatOrderedSet  = OrderedHashSet<F32>;
    using IntIntOrderedMap = OrderedHashMap<Int32, Int32>;
    template<class V>
    using IntObjectOrderedMap = OrderedHashMap<Int32, V>;
    template<class K>
    using ObjectIntOrderedMap = OrderedHashMap<K, Int32>;

    /// Keys are `const T*`, compared by address.
    template<class T>
    using IdentitySet = HashSet<const T*, Hashing::IdentityKeyPolicy<T>>;
    template<class T, class V>
    using IdentityMap = HashMap<const T*, V, Hashing::IdentityKeyPolicy<T>>;

    using CaseInsensitiveSet = HashSet<std::string, Hashing::CaseInsensitiveKeyPolicy>;
    template<class V>
    using CaseInsensitiveMap        = HashMap<std::string, V, Hashing::CaseInsensitiveKeyPolicy>;
    using CaseInsensitiveOrderedSet = OrderedHashSet<std::string, Hashing::CaseInsensitiveKeyPolicy>;
    template<class V>
    using CaseInsensitiveOrderedMap = OrderedHashMap<std::string, V, Hashing::CaseInsensitiveKeyPolicy>;
}// namespace KDS::Containers
