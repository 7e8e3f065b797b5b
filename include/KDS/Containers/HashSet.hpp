/// @file HashSet.hpp
/// @brief Set facade over any KDS table core, and the hash-table-backed HashSet.
#pragma once

#include <KDS/Containers/Hashing/KeyPolicy.hpp>
#include <KDS/Containers/OpenTable.hpp>
#include <KDS/Memory/AllocatorConcept.hpp>
#include <KDS/Memory/SystemAllocator.hpp>

#include <initializer_list>
#include <ranges>
#include <span>
#include <utility>

namespace KDS::Containers
{
    /// @brief Set vocabulary (Add/Remove/Contains and bulk forms) on top of a table core.
    ///
    /// `Core` is an OpenTable, EnumTable or OrderedTable instantiated with `Value = void`.
    /// Everything the core offers (iteration, capacity tuning, ordering operations) stays
    /// available unchanged.
    template<class Core>
    class BasicSet : public Core
    {
    public:
        using CoreType = Core;
        using KeyType  = typename Core::KeyType;

        static_assert(Core::kIsSet, "BasicSet requires a core without mapped values.");

        using Core::Core;

        BasicSet() = default;
        explicit BasicSet(Core core) : Core(std::move(core)) {}

        /// @brief Returns true if `key` was not yet present.
        bool Add(const KeyType& key) { return this->TryEmplace(key).second; }

        /// @brief Insert at `index` of the order, or move `key` there if already present (returns false).
        bool Add(UIntSize index, const KeyType& key)
            requires requires(Core& core, UIntSize i, const KeyType& k) { core.TryEmplaceAt(i, k); }
        {
            return this->TryEmplaceAt(index, key);
        }

        /// @brief Returns how many of `keys` were newly added.
        template<std::ranges::input_range Range>
        UIntSize AddAll(const Range& keys)
        {
            UIntSize added = 0;
            for (const auto& key: keys)
                added += Add(key) ? 1u : 0u;
            return added;
        }

        UIntSize AddAll(std::initializer_list<KeyType> keys) { return AddAll(std::span<const KeyType>(keys.begin(), keys.size())); }

        /// @brief Returns how many of `keys` were present and removed.
        template<std::ranges::input_range Range>
        UIntSize RemoveAll(const Range& keys)
        {
            UIntSize removed = 0;
            for (const auto& key: keys)
                removed += this->Remove(key) ? 1u : 0u;
            return removed;
        }

        template<std::ranges::input_range Range>
        [[nodiscard]] bool ContainsAll(const Range& keys) const
        {
            for (const auto& key: keys)
            {
                if (!this->Contains(key))
                    return false;
            }
            return true;
        }

        template<std::ranges::input_range Range>
        [[nodiscard]] bool ContainsAny(const Range& keys) const
        {
            for (const auto& key: keys)
            {
                if (this->Contains(key))
                    return true;
            }
            return false;
        }
    };

    template<class Key,
             class Policy                          = Hashing::DefaultKeyPolicy<Key>,
             Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    using HashSet = BasicSet<OpenTable<Policy, void, AllocatorType>>;
}// namespace KDS::Containers
