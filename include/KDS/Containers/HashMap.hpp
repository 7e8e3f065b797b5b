/// @file HashMap.hpp
/// @brief Map facade over any KDS table core, and the hash-table-backed HashMap.
#pragma once

#include <KDS/Containers/Hashing/KeyPolicy.hpp>
#include <KDS/Containers/OpenTable.hpp>
#include <KDS/Memory/AllocatorConcept.hpp>
#include <KDS/Memory/SystemAllocator.hpp>

#include <concepts>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace KDS::Containers
{
    /// @brief Map vocabulary on top of a table core.
    ///
    /// Every map carries a per-instance default value. It is returned by `Put` when the
    /// key was new and by `GetOr` when the key is missing. `Get` on a missing key throws
    /// `std::out_of_range`.
    template<class Core>
    class BasicMap : public Core
    {
    public:
        using CoreType   = Core;
        using KeyType    = typename Core::KeyType;
        using MappedType = typename Core::ValueType;

        static_assert(!Core::kIsSet, "BasicMap requires a core with mapped values.");
        static_assert(std::default_initializable<MappedType>, "BasicMap needs a default-constructible default value.");

        using Core::Core;

        BasicMap() = default;
        explicit BasicMap(Core core) : Core(std::move(core)) {}

        //--------------------------------------------------------------------------
        // Default value
        //--------------------------------------------------------------------------

        void SetDefaultValue(MappedType value) { m_defaultValue = std::move(value); }
        [[nodiscard]] const MappedType& GetDefaultValue() const noexcept { return m_defaultValue; }

        //--------------------------------------------------------------------------
        // Insertion
        //--------------------------------------------------------------------------

        /// @brief Insert or overwrite. Returns true when `key` was new.
        template<class V>
        bool Insert(const KeyType& key, V&& value)
        {
            return this->InsertOrAssign(key, std::forward<V>(value));
        }

        /// @brief Insert or overwrite; returns the previous value, or the default value if `key` was new.
        MappedType Put(const KeyType& key, MappedType value) { return PutOrDefault(key, std::move(value), m_defaultValue); }

        /// @brief Like Put, but returns `defaultValue` when `key` was new.
        MappedType PutOrDefault(const KeyType& key, MappedType value, const MappedType& defaultValue)
        {
            auto [stored, inserted] = this->TryEmplace(key, std::move(value));
            if (inserted)
                return defaultValue;
            MappedType previous = std::move(*stored);
            *stored             = std::move(value);
            return previous;
        }

        /// @brief Insert or overwrite at `index` of the order; an existing key is moved there.
        template<class V>
        bool PutAt(UIntSize index, const KeyType& key, V&& value)
            requires requires(Core& core, UIntSize i, const KeyType& k, V&& v) { core.InsertOrAssignAt(i, k, std::forward<V>(v)); }
        {
            return this->InsertOrAssignAt(index, key, std::forward<V>(value));
        }

        /// @brief Returns the value held before the call (or `defaultValue` if `key` was
        ///        absent) and stores that value plus `increment`.
        MappedType GetAndIncrement(const KeyType& key, MappedType defaultValue, MappedType increment)
            requires std::is_arithmetic_v<MappedType>
        {
            MappedType*      stored   = this->TryEmplace(key, defaultValue).first;
            const MappedType previous = *stored;
            *stored                   = static_cast<MappedType>(previous + increment);
            return previous;
        }

        MappedType& operator[](const KeyType& key) { return *this->TryEmplace(key).first; }

        //--------------------------------------------------------------------------
        // Lookup
        //--------------------------------------------------------------------------

        [[nodiscard]] MappedType& Get(const KeyType& key)
        {
            MappedType* p = this->Find(key);
            if (!p)
                throw std::out_of_range("Key not found in map");
            return *p;
        }

        [[nodiscard]] const MappedType& Get(const KeyType& key) const
        {
            const MappedType* p = this->Find(key);
            if (!p)
                throw std::out_of_range("Key not found in map");
            return *p;
        }

        [[nodiscard]] MappedType*       GetPtr(const KeyType& key) { return this->Find(key); }
        [[nodiscard]] const MappedType* GetPtr(const KeyType& key) const { return this->Find(key); }

        /// @brief The mapped value, or the map's default value when `key` is missing.
        [[nodiscard]] MappedType GetOr(const KeyType& key) const { return GetOrDefault(key, m_defaultValue); }

        [[nodiscard]] MappedType GetOrDefault(const KeyType& key, const MappedType& fallback) const
        {
            const MappedType* p = this->Find(key);
            return p ? *p : fallback;
        }

        [[nodiscard]] bool ContainsKey(const KeyType& key) const { return this->Contains(key); }

        /// @brief Linear search over all values.
        [[nodiscard]] bool ContainsValue(const MappedType& value) const { return FindKey(value).has_value(); }

        /// @brief Some key mapped to `value`, or std::nullopt. Linear in the size of the map.
        [[nodiscard]] std::optional<KeyType> FindKey(const MappedType& value) const
        {
            for (auto it = this->Begin(); it != this->End(); ++it)
            {
                if ((*it).value == value)
                    return (*it).key;
            }
            return std::nullopt;
        }

    private:
        MappedType m_defaultValue {};
    };

    template<class Key,
             class Value,
             class Policy                          = Hashing::DefaultKeyPolicy<Key>,
             Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    using HashMap = BasicMap<OpenTable<Policy, Value, AllocatorType>>;
}// namespace KDS::Containers
