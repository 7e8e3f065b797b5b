/// @file OpenTable.hpp
/// @brief Open-addressing hash table engine shared by every KDS set and map.
///
/// Semantics / constraints:
/// - Capacity is always a power of two (>= 2). A slot is chosen by multiplicative
///   placement (see Placement.hpp); collisions probe linearly, wrapping at the end.
/// - The table doubles as soon as an insert would bring the number of keys held in
///   the slot array up to `floor(capacity * loadFactor)`. At least one slot is
///   therefore always empty, which bounds every probe. Read-only operations never
///   reallocate.
/// - Deletion uses backward-shift (no tombstones). It can relocate other entries, so
///   any removal invalidates pointers and references to values. Iterators stay
///   usable only when the removal goes through `Erase(iterator)`.
/// - Growth, `Shrink`, `Clear(maximumCapacity)`, `SetLoadFactor` and
///   `SetHashMultiplier` re-lay out the whole table and invalidate everything.
/// - With a sentinel key policy, the key whose bits are all zero is stored out of
///   band: it never occupies a slot and never counts toward the load threshold,
///   but it is part of `Size()` and is the first entry visited by iteration.
/// - `MappedT = void` turns the table into a set.
/// - Not synchronized. Concurrent mutation during iteration is undefined.
#pragma once

#include <KDS/Defines.hpp>
#include <KDS/Primitives.hpp>
#include <KDS/Containers/Hashing/KeyPolicy.hpp>
#include <KDS/Containers/Hashing/Placement.hpp>
#include <KDS/Containers/KeyValueRef.hpp>
#include <KDS/Containers/TableConfig.hpp>
#include <KDS/Exceptions/EmptyContainerException.hpp>
#include <KDS/Memory/AllocatorConcept.hpp>
#include <KDS/Memory/SystemAllocator.hpp>

#include <algorithm>
#include <bit>
#include <cstddef>
#include <iterator>
#include <new>
#include <optional>
#include <type_traits>
#include <utility>

namespace KDS::Containers
{
    namespace detail
    {
        constexpr UIntSize NextPow2(UIntSize value) noexcept
        {
            if (value <= 1)
                return 1;
            return std::bit_ceil(value);
        }
    }// namespace detail

    template<Hashing::KeyPolicyConcept Policy,
             typename MappedT                       = void,
             Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    class OpenTable
    {
    public:
        using KeyPolicy      = Policy;
        using KeyType        = typename Policy::KeyType;
        using ValueType      = MappedT;
        using StoredValue    = std::conditional_t<std::is_void_v<MappedT>, detail::NoValue, MappedT>;
        using allocator_type = AllocatorType;
        using size_type      = UIntSize;

        static constexpr bool     kIsSet           = std::is_void_v<MappedT>;
        static constexpr bool     kUsesSentinel    = Policy::kUsesSentinel;
        static constexpr UIntSize kMinimumCapacity = 2;

        static_assert(std::is_nothrow_move_constructible_v<KeyType> && std::is_nothrow_move_constructible_v<StoredValue>,
                      "OpenTable requires nothrow move constructible keys and values (backward-shift deletion).");
        static_assert(!kUsesSentinel || std::is_trivially_copyable_v<KeyType>,
                      "Sentinel key policies require trivially copyable keys.");

    private:
        template<bool IsConst>
        class BasicIterator;

    public:
        using Iterator      = BasicIterator<false>;
        using ConstIterator = BasicIterator<true>;

        OpenTable() : OpenTable(TableConfig {}) {}

        explicit OpenTable(const TableConfig& config,
                           const Policy& policy              = Policy {},
                           const AllocatorType& allocator    = AllocatorType {})
            : m_policy(policy), m_allocator(allocator), m_loadFactor(config.loadFactor)
        {
            ValidateLoadFactor(config.loadFactor);
            Initialize_(detail::NextPow2((std::max)(config.initialCapacity, kMinimumCapacity)),
                        Hashing::kDefaultHashMultiplier);
        }

        OpenTable(UIntSize initialCapacity, F32 loadFactor)
            : OpenTable(TableConfig {initialCapacity, loadFactor})
        {
        }

        OpenTable(const OpenTable& other)
            : m_policy(other.m_policy), m_allocator(other.m_allocator), m_loadFactor(other.m_loadFactor)
        {
            Initialize_((std::max)(other.m_capacity, kMinimumCapacity), other.m_placement.multiplier);
            try
            {
                CopyEntriesFrom_(other);
            }
            catch (...)
            {
                ClearAndRelease_();
                throw;
            }
        }

        OpenTable& operator=(const OpenTable& other)
        {
            if (this != &other)
            {
                OpenTable copy(other);
                Swap(copy);
            }
            return *this;
        }

        OpenTable(OpenTable&& other) noexcept
            : m_policy(std::move(other.m_policy)),
              m_allocator(std::move(other.m_allocator)),
              m_loadFactor(other.m_loadFactor)
        {
            StealFrom_(other);
        }

        OpenTable& operator=(OpenTable&& other) noexcept
        {
            if (this != &other)
            {
                ClearAndRelease_();
                m_policy     = std::move(other.m_policy);
                m_allocator  = std::move(other.m_allocator);
                m_loadFactor = other.m_loadFactor;
                StealFrom_(other);
            }
            return *this;
        }

        ~OpenTable() { ClearAndRelease_(); }

        void Swap(OpenTable& other) noexcept
        {
            if (this == &other)
                return;
            OpenTable tmp(std::move(other));
            other = std::move(*this);
            *this = std::move(tmp);
        }

        //--------------------------------------------------------------------------
        // Lookup
        //--------------------------------------------------------------------------

        /// @brief Probe for `key` in the slot array.
        /// @return The slot index holding `key` when present (>= 0). Otherwise the bitwise
        ///         complement of the first empty slot on the key's probe path (< 0).
        /// @pre The table owns storage, and `key` is not the out-of-band zero key of a
        ///      sentinel policy (that key never lives in a slot).
        [[nodiscard]] IntSize Locate(const KeyType& key) const { return LocateHashed_(key, m_policy.Hash(key)); }

        /// @brief The slot `key` would occupy if nothing collided with it.
        [[nodiscard]] UIntSize IdealSlotOf(const KeyType& key) const { return m_placement.Place(m_policy.Hash(key)); }

        [[nodiscard]] StoredValue* Find(const KeyType& key) { return const_cast<StoredValue*>(std::as_const(*this).Find(key)); }

        [[nodiscard]] const StoredValue* Find(const KeyType& key) const
        {
            if constexpr (kUsesSentinel)
            {
                if (Policy::IsEmptyKey(key))
                    return m_zero.present ? &ZeroValue_() : nullptr;
            }
            if (!m_slots)
                return nullptr;
            const IntSize loc = Locate(key);
            return loc >= 0 ? &ValueOf_(m_slots[loc]) : nullptr;
        }

        [[nodiscard]] bool Contains(const KeyType& key) const { return Find(key) != nullptr; }

        /// @brief Any key of the table. Throws EmptyContainerException when there is none.
        [[nodiscard]] const KeyType& First() const
        {
            if (IsEmpty())
                throw Exceptions::EmptyContainerException("OpenTable::First: table is empty");
            return Begin().Key();
        }

        //--------------------------------------------------------------------------
        // Modifiers
        //--------------------------------------------------------------------------

        /// @brief Insert `key` with a value built from `args` unless the key is already present.
        /// @return Pointer to the stored value and whether an insertion happened. `args` are
        ///         left untouched when the key already exists.
        template<class... Args>
        std::pair<StoredValue*, bool> TryEmplace(const KeyType& key, Args&&... args)
        {
            return TryEmplaceImpl_(key, std::forward<Args>(args)...);
        }

        template<class... Args>
        std::pair<StoredValue*, bool> TryEmplace(KeyType&& key, Args&&... args)
        {
            return TryEmplaceImpl_(std::move(key), std::forward<Args>(args)...);
        }

        /// @brief Insert or overwrite. Returns true when `key` was new.
        template<class K, class V>
            requires(!kIsSet)
        bool InsertOrAssign(K&& key, V&& value)
        {
            auto [stored, inserted] = TryEmplace(std::forward<K>(key), std::forward<V>(value));
            if (!inserted)
                *stored = std::forward<V>(value);
            return inserted;
        }

        /// @brief Remove `key`. Removing an absent key is a no-op that returns false.
        bool Remove(const KeyType& key)
        {
            if constexpr (kUsesSentinel)
            {
                if (Policy::IsEmptyKey(key))
                {
                    if (!m_zero.present)
                        return false;
                    DestroyZero_();
                    return true;
                }
            }
            if (!m_slots)
                return false;
            const IntSize loc = Locate(key);
            if (loc < 0)
                return false;
            RemoveAt_(static_cast<UIntSize>(loc));
            return true;
        }

        /// @brief Remove `key` and hand its value back, or std::nullopt when absent.
        std::optional<StoredValue> Take(const KeyType& key)
        {
            if constexpr (kUsesSentinel)
            {
                if (Policy::IsEmptyKey(key))
                {
                    if (!m_zero.present)
                        return std::nullopt;
                    std::optional<StoredValue> out(std::move(ZeroValue_()));
                    DestroyZero_();
                    return out;
                }
            }
            if (!m_slots)
                return std::nullopt;
            const IntSize loc = Locate(key);
            if (loc < 0)
                return std::nullopt;
            std::optional<StoredValue> out(std::move(ValueOf_(m_slots[loc])));
            RemoveAt_(static_cast<UIntSize>(loc));
            return out;
        }

        /// @brief Remove the entry `it` points at. Returns an iterator to the next unvisited entry.
        /// @details The slot order is walked so that backward shifting never carries an
        ///          unvisited entry behind the cursor: no entry is skipped or seen twice.
        Iterator Erase(Iterator it)
        {
            if (it.m_step < 0)
            {
                DestroyZero_();
                it.m_step = 0;
                it.SkipEmpty_();
                return it;
            }
            const UIntSize slot = it.Slot_();
            RemoveAt_(slot);
            if (!IsOccupied_(m_slots[slot]))
            {
                ++it.m_step;
                it.SkipEmpty_();
            }
            return it;
        }

        /// @brief Remove every entry for which `predicate(*it)` is true. Returns the number removed.
        template<class Predicate>
        UIntSize RemoveIf(Predicate&& predicate)
        {
            UIntSize removed = 0;
            for (auto it = Begin(); it != End();)
            {
                if (predicate(*it))
                {
                    it = Erase(it);
                    ++removed;
                }
                else
                {
                    ++it;
                }
            }
            return removed;
        }

        /// @brief Remove arbitrary entries until at most `newSize` remain.
        void Truncate(UIntSize newSize)
        {
            if (newSize == 0)
            {
                Clear();
                return;
            }
            for (auto it = Begin(); it != End() && m_size > newSize;)
                it = Erase(it);
        }

        /// @brief Remove all entries, keeping the current capacity.
        void Clear() noexcept
        {
            if constexpr (kUsesSentinel)
            {
                if (m_zero.present)
                    DestroyZero_();
            }
            for (UIntSize i = 0; i < m_capacity; ++i)
            {
                if (IsOccupied_(m_slots[i]))
                    DestroySlot_(m_slots[i]);
            }
            m_size = 0;
        }

        /// @brief Remove all entries and, if the table is larger than needed for
        ///        `maximumCapacity` keys, reallocate it at that smaller size.
        void Clear(UIntSize maximumCapacity)
        {
            const UIntSize target = CapacityFor_(maximumCapacity);
            if (m_capacity <= target)
            {
                Clear();
                return;
            }
            Clear();
            Slot* fresh = Memory::AllocateZeroed<Slot>(m_allocator, target);
            Memory::DeallocateArray(m_allocator, m_slots, m_capacity);
            AdoptSlots_(fresh, target, Hashing::NextHashMultiplier(m_placement.multiplier, Hashing::PlacementState::ShiftFor(target)));
        }

        //--------------------------------------------------------------------------
        // Capacity
        //--------------------------------------------------------------------------

        [[nodiscard]] KDS_ALWAYS_INLINE UIntSize Size() const noexcept { return m_size; }
        [[nodiscard]] KDS_ALWAYS_INLINE bool     IsEmpty() const noexcept { return m_size == 0; }
        [[nodiscard]] KDS_ALWAYS_INLINE UIntSize Capacity() const noexcept { return m_capacity; }
        /// Number of in-array keys at which the next insert grows the table.
        [[nodiscard]] KDS_ALWAYS_INLINE UIntSize Threshold() const noexcept { return m_threshold; }
        [[nodiscard]] F32 GetLoadFactor() const noexcept { return m_loadFactor; }

        /// @brief Change the load factor; re-lays out the table if it is now over the threshold.
        /// @throws ArgumentException unless `0 < loadFactor <= 1`.
        void SetLoadFactor(F32 loadFactor)
        {
            ValidateLoadFactor(loadFactor);
            m_loadFactor = loadFactor;
            if (!m_slots)
                return;
            m_threshold = ThresholdFor_(m_capacity, m_loadFactor);
            if (ArraySize_() >= m_threshold)
                Resize_(CapacityFor_(ArraySize_()));
        }

        /// @brief Make room for `count` keys without any further growth.
        void Reserve(UIntSize count)
        {
            const UIntSize target = CapacityFor_(count);
            if (target > m_capacity)
                Resize_(target);
        }

        /// @brief Make room for `additional` more keys than are currently held.
        void EnsureCapacity(UIntSize additional) { Reserve(ArraySize_() + additional); }

        /// @brief Reduce the slot array to what `maximumCapacity` keys need, but never below what
        ///        the current contents need. Does nothing if the table is already that small.
        void Shrink(UIntSize maximumCapacity)
        {
            const UIntSize target = CapacityFor_((std::max)(maximumCapacity, ArraySize_()));
            if (m_capacity > target)
                Resize_(target);
        }

        [[nodiscard]] UInt64 GetHashMultiplier() const noexcept { return m_placement.multiplier; }

        [[nodiscard]] const AllocatorType& GetAllocator() const noexcept { return m_allocator; }

        /// @brief Use `multiplier | 1` for placement and re-place every entry.
        void SetHashMultiplier(UInt64 multiplier)
        {
            if (!m_slots)
                Initialize_(kMinimumCapacity, multiplier);
            else
                Rebuild_(m_capacity, multiplier);
        }

        //--------------------------------------------------------------------------
        // Slot inspection
        //--------------------------------------------------------------------------

        [[nodiscard]] bool IsSlotOccupied(UIntSize slot) const noexcept { return IsOccupied_(m_slots[slot]); }

        /// @pre IsSlotOccupied(slot)
        [[nodiscard]] const KeyType& SlotKey(UIntSize slot) const noexcept { return KeyOf_(m_slots[slot]); }

        /// @brief Ideal slot of the entry stored at `slot`.
        /// @pre IsSlotOccupied(slot)
        [[nodiscard]] UIntSize IdealSlotAt(UIntSize slot) const { return m_placement.Place(HashOf_(m_slots[slot])); }

        /// @brief True if the out-of-band zero key is present (always false without a sentinel policy).
        [[nodiscard]] bool HasOutOfBandKey() const noexcept
        {
            if constexpr (kUsesSentinel)
                return m_zero.present;
            else
                return false;
        }

        [[nodiscard]] const Policy& GetKeyPolicy() const noexcept { return m_policy; }

        //--------------------------------------------------------------------------
        // Iteration
        //--------------------------------------------------------------------------

        Iterator      Begin() { return Iterator(this, true); }
        Iterator      End() { return Iterator(this, false); }
        ConstIterator Begin() const { return ConstIterator(this, true); }
        ConstIterator End() const { return ConstIterator(this, false); }

        Iterator      begin() { return Begin(); }
        Iterator      end() { return End(); }
        ConstIterator begin() const { return Begin(); }
        ConstIterator end() const { return End(); }
        ConstIterator cbegin() const { return Begin(); }
        ConstIterator cend() const { return End(); }

        /// @brief Same keys (and, for maps, equal values), regardless of layout.
        friend bool operator==(const OpenTable& a, const OpenTable& b)
        {
            if (a.Size() != b.Size())
                return false;
            for (auto it = a.Begin(); it != a.End(); ++it)
            {
                const StoredValue* other = b.Find(it.Key());
                if (!other)
                    return false;
                if constexpr (!kIsSet)
                {
                    if (!(*other == it.Value()))
                        return false;
                }
            }
            return true;
        }

    private:
        //--------------------------------------------------------------------------
        // Storage layout
        //--------------------------------------------------------------------------

        struct FlaggedSlot
        {
            UInt64 hash;
            bool   occupied;

            alignas(KeyType) std::byte keyStorage[sizeof(KeyType)];
            alignas(StoredValue) std::byte valueStorage[sizeof(StoredValue)];
        };

        // The key itself marks emptiness: all-zero bits means free.
        struct SentinelSlot
        {
            KeyType key;

            alignas(StoredValue) std::byte valueStorage[sizeof(StoredValue)];
        };

        struct OutOfBandEntry
        {
            KeyType key {};
            bool    present {false};

            alignas(StoredValue) std::byte valueStorage[sizeof(StoredValue)];
        };

        struct NoOutOfBandEntry
        {
        };

        using Slot      = std::conditional_t<kUsesSentinel, SentinelSlot, FlaggedSlot>;
        using ZeroEntry = std::conditional_t<kUsesSentinel, OutOfBandEntry, NoOutOfBandEntry>;

        static_assert(std::is_trivially_default_constructible_v<Slot>);

        [[nodiscard]] static KDS_ALWAYS_INLINE bool IsOccupied_(const Slot& slot) noexcept
        {
            if constexpr (kUsesSentinel)
                return !Policy::IsEmptyKey(slot.key);
            else
                return slot.occupied;
        }

        [[nodiscard]] static KeyType& KeyOf_(Slot& slot) noexcept
        {
            if constexpr (kUsesSentinel)
                return slot.key;
            else
                return *std::launder(reinterpret_cast<KeyType*>(slot.keyStorage));
        }

        [[nodiscard]] static const KeyType& KeyOf_(const Slot& slot) noexcept
        {
            if constexpr (kUsesSentinel)
                return slot.key;
            else
                return *std::launder(reinterpret_cast<const KeyType*>(slot.keyStorage));
        }

        [[nodiscard]] static StoredValue& ValueOf_(Slot& slot) noexcept
        {
            return *std::launder(reinterpret_cast<StoredValue*>(slot.valueStorage));
        }

        [[nodiscard]] static const StoredValue& ValueOf_(const Slot& slot) noexcept
        {
            return *std::launder(reinterpret_cast<const StoredValue*>(slot.valueStorage));
        }

        [[nodiscard]] KDS_ALWAYS_INLINE UInt64 HashOf_(const Slot& slot) const
        {
            if constexpr (kUsesSentinel)
                return m_policy.Hash(slot.key);
            else
                return slot.hash;
        }

        [[nodiscard]] StoredValue& ZeroValue_() noexcept
        {
            return *std::launder(reinterpret_cast<StoredValue*>(m_zero.valueStorage));
        }

        [[nodiscard]] const StoredValue& ZeroValue_() const noexcept
        {
            return *std::launder(reinterpret_cast<const StoredValue*>(m_zero.valueStorage));
        }

        [[nodiscard]] UIntSize ArraySize_() const noexcept
        {
            if constexpr (kUsesSentinel)
                return m_size - (m_zero.present ? 1u : 0u);
            else
                return m_size;
        }

        template<class K, class... Args>
        void ConstructAt_(Slot& slot, UInt64 hash, K&& key, Args&&... args)
        {
            if constexpr (kUsesSentinel)
            {
                // Writing the key is what marks the slot used, so it goes last.
                ::new (static_cast<void*>(slot.valueStorage)) StoredValue(std::forward<Args>(args)...);
                slot.key = std::forward<K>(key);
            }
            else
            {
                ::new (static_cast<void*>(slot.keyStorage)) KeyType(std::forward<K>(key));
                try
                {
                    ::new (static_cast<void*>(slot.valueStorage)) StoredValue(std::forward<Args>(args)...);
                }
                catch (...)
                {
                    KeyOf_(slot).~KeyType();
                    throw;
                }
                slot.hash     = hash;
                slot.occupied = true;
            }
        }

        static void DestroySlot_(Slot& slot) noexcept
        {
            if constexpr (!std::is_trivially_destructible_v<StoredValue>)
                ValueOf_(slot).~StoredValue();
            if constexpr (kUsesSentinel)
            {
                slot.key = KeyType {};
            }
            else
            {
                if constexpr (!std::is_trivially_destructible_v<KeyType>)
                    KeyOf_(slot).~KeyType();
                slot.hash     = 0;
                slot.occupied = false;
            }
        }

        // Move the entry in `src` into the empty slot `dst`; `src` ends up empty.
        void RelocateSlot_(Slot& dst, Slot& src) noexcept
        {
            if constexpr (kUsesSentinel)
            {
                ::new (static_cast<void*>(dst.valueStorage)) StoredValue(std::move(ValueOf_(src)));
                dst.key = src.key;
            }
            else
            {
                ::new (static_cast<void*>(dst.keyStorage)) KeyType(std::move(KeyOf_(src)));
                ::new (static_cast<void*>(dst.valueStorage)) StoredValue(std::move(ValueOf_(src)));
                dst.hash     = src.hash;
                dst.occupied = true;
            }
            DestroySlot_(src);
        }

        void DestroyZero_() noexcept
        {
            if constexpr (kUsesSentinel)
            {
                if constexpr (!std::is_trivially_destructible_v<StoredValue>)
                    ZeroValue_().~StoredValue();
                m_zero.present = false;
                --m_size;
            }
        }

        //--------------------------------------------------------------------------
        // Sizing
        //--------------------------------------------------------------------------

        [[nodiscard]] static UIntSize ThresholdFor_(UIntSize capacity, F32 loadFactor) noexcept
        {
            const auto raw = static_cast<UIntSize>(static_cast<F64>(capacity) * static_cast<F64>(loadFactor));
            return std::clamp<UIntSize>(raw, 1, capacity - 1);
        }

        // Smallest legal capacity whose threshold is strictly above `count`.
        [[nodiscard]] UIntSize CapacityFor_(UIntSize count) const noexcept
        {
            const auto estimate = static_cast<UIntSize>(static_cast<F64>(count) / static_cast<F64>(m_loadFactor)) + 1;
            UIntSize   capacity = detail::NextPow2((std::max)(estimate, kMinimumCapacity));
            while (ThresholdFor_(capacity, m_loadFactor) <= count)
                capacity <<= 1;
            return capacity;
        }

        void Initialize_(UIntSize capacity, UInt64 multiplier)
        {
            AdoptSlots_(Memory::AllocateZeroed<Slot>(m_allocator, capacity), capacity, multiplier);
        }

        void AdoptSlots_(Slot* slots, UIntSize capacity, UInt64 multiplier) noexcept
        {
            m_slots     = slots;
            m_capacity  = capacity;
            m_mask      = capacity - 1;
            m_threshold = ThresholdFor_(capacity, m_loadFactor);
            m_placement = Hashing::PlacementState::ForCapacity(capacity, multiplier);
        }

        void Resize_(UIntSize newCapacity)
        {
            Rebuild_(newCapacity,
                     Hashing::NextHashMultiplier(m_placement.multiplier, Hashing::PlacementState::ShiftFor(newCapacity)));
        }

        // Re-place every in-array entry into a fresh slot array. Keys are known to be
        // distinct, so each one only needs the first free slot from its ideal position.
        void Rebuild_(UIntSize newCapacity, UInt64 multiplier)
        {
            Slot*          oldSlots    = m_slots;
            const UIntSize oldCapacity = m_capacity;

            AdoptSlots_(Memory::AllocateZeroed<Slot>(m_allocator, newCapacity), newCapacity, multiplier);

            for (UIntSize i = 0; i < oldCapacity; ++i)
            {
                Slot& src = oldSlots[i];
                if (!IsOccupied_(src))
                    continue;
                UIntSize dst = m_placement.Place(HashOf_(src));
                while (IsOccupied_(m_slots[dst]))
                    dst = (dst + 1) & m_mask;
                RelocateSlot_(m_slots[dst], src);
            }
            Memory::DeallocateArray(m_allocator, oldSlots, oldCapacity);
        }

        void Grow_(UIntSize requiredCount)
        {
            UIntSize capacity = m_capacity << 1;
            while (ThresholdFor_(capacity, m_loadFactor) <= requiredCount)
                capacity <<= 1;
            Resize_(capacity);
        }

        //--------------------------------------------------------------------------
        // Core algorithms
        //--------------------------------------------------------------------------

        [[nodiscard]] IntSize LocateHashed_(const KeyType& key, UInt64 hash) const
        {
            UIntSize index = m_placement.Place(hash);
            for (;;)
            {
                const Slot& slot = m_slots[index];
                if (!IsOccupied_(slot))
                    return ~static_cast<IntSize>(index);
                if constexpr (kUsesSentinel)
                {
                    if (m_policy.Equal(slot.key, key))
                        return static_cast<IntSize>(index);
                }
                else
                {
                    if (slot.hash == hash && m_policy.Equal(KeyOf_(slot), key))
                        return static_cast<IntSize>(index);
                }
                index = (index + 1) & m_mask;
            }
        }

        template<class K, class... Args>
        std::pair<StoredValue*, bool> TryEmplaceImpl_(K&& key, Args&&... args)
        {
            if (!m_slots)
                Initialize_(kMinimumCapacity, m_placement.multiplier);

            if constexpr (kUsesSentinel)
            {
                if (Policy::IsEmptyKey(key))
                {
                    if (m_zero.present)
                        return {&ZeroValue_(), false};
                    ::new (static_cast<void*>(m_zero.valueStorage)) StoredValue(std::forward<Args>(args)...);
                    m_zero.present = true;
                    ++m_size;
                    return {&ZeroValue_(), true};
                }
            }
            const UInt64 hash = m_policy.Hash(key);
            IntSize      loc  = LocateHashed_(key, hash);
            if (loc >= 0)
                return {&ValueOf_(m_slots[loc]), false};

            if (ArraySize_() + 1 >= m_threshold)
            {
                Grow_(ArraySize_() + 1);
                loc = LocateHashed_(key, hash);
            }

            Slot& slot = m_slots[static_cast<UIntSize>(~loc)];
            ConstructAt_(slot, hash, std::forward<K>(key), std::forward<Args>(args)...);
            ++m_size;
            return {&ValueOf_(slot), true};
        }

        // Backward-shift deletion. Returns the slot that is empty once the cluster is repaired.
        UIntSize RemoveAt_(UIntSize index) noexcept
        {
            DestroySlot_(m_slots[index]);
            --m_size;

            UIntSize hole = index;
            UIntSize next = (hole + 1) & m_mask;
            while (IsOccupied_(m_slots[next]))
            {
                const UIntSize ideal = m_placement.Place(HashOf_(m_slots[next]));
                if (((next - ideal) & m_mask) > ((hole - ideal) & m_mask))
                {
                    RelocateSlot_(m_slots[hole], m_slots[next]);
                    hole = next;
                }
                next = (next + 1) & m_mask;
            }
            return hole;
        }

        [[nodiscard]] UIntSize FirstEmptySlot_() const noexcept
        {
            UIntSize index = 0;
            while (IsOccupied_(m_slots[index]))
                ++index;
            return index;
        }

        void CopyEntriesFrom_(const OpenTable& other)
        {
            // Same capacity and multiplier: every entry can keep its slot index.
            for (UIntSize i = 0; i < other.m_capacity; ++i)
            {
                const Slot& src = other.m_slots[i];
                if (!IsOccupied_(src))
                    continue;
                ConstructAt_(m_slots[i], other.HashOf_(src), KeyOf_(src), ValueOf_(src));
                ++m_size;
            }
            if constexpr (kUsesSentinel)
            {
                if (other.m_zero.present)
                {
                    ::new (static_cast<void*>(m_zero.valueStorage)) StoredValue(other.ZeroValue_());
                    m_zero.present = true;
                    ++m_size;
                }
            }
        }

        void StealFrom_(OpenTable& other) noexcept
        {
            m_slots     = std::exchange(other.m_slots, nullptr);
            m_capacity  = std::exchange(other.m_capacity, 0);
            m_mask      = std::exchange(other.m_mask, 0);
            m_threshold = std::exchange(other.m_threshold, 0);
            m_size      = std::exchange(other.m_size, 0);
            m_placement = other.m_placement;
            if constexpr (kUsesSentinel)
            {
                if (other.m_zero.present)
                {
                    ::new (static_cast<void*>(m_zero.valueStorage)) StoredValue(std::move(other.ZeroValue_()));
                    if constexpr (!std::is_trivially_destructible_v<StoredValue>)
                        other.ZeroValue_().~StoredValue();
                    other.m_zero.present = false;
                    m_zero.present       = true;
                }
            }
        }

        void ClearAndRelease_() noexcept
        {
            if constexpr (kUsesSentinel)
            {
                if (m_zero.present)
                    DestroyZero_();
            }
            if (!m_slots)
                return;
            Clear();
            Memory::DeallocateArray(m_allocator, m_slots, m_capacity);
            m_slots     = nullptr;
            m_capacity  = 0;
            m_mask      = 0;
            m_threshold = 0;
            m_size      = 0;
        }

        //--------------------------------------------------------------------------
        // Iterator
        //--------------------------------------------------------------------------

        // Walks slots cyclically starting just past an empty slot, so no probe cluster
        // straddles the starting point. The out-of-band entry, if any, comes first (step -1).
        template<bool IsConst>
        class BasicIterator
        {
        public:
            using TablePointer = std::conditional_t<IsConst, const OpenTable*, OpenTable*>;
            using MappedType   = std::conditional_t<IsConst, const StoredValue, StoredValue>;

            using difference_type   = std::ptrdiff_t;
            using reference         = std::conditional_t<kIsSet, const KeyType&, KeyValueRef<KeyType, MappedType>>;
            using value_type        = std::conditional_t<kIsSet, KeyType, KeyValueRef<KeyType, MappedType>>;
            using pointer           = void;
            using iterator_category = std::forward_iterator_tag;

            BasicIterator() = default;

            template<bool OtherConst>
                requires(IsConst && !OtherConst)
            BasicIterator(const BasicIterator<OtherConst>& other) noexcept
                : m_table(other.m_table), m_start(other.m_start), m_step(other.m_step)
            {
            }

            reference operator*() const
            {
                if constexpr (kIsSet)
                    return Key();
                else
                    return reference {Key(), Value()};
            }

            [[nodiscard]] const KeyType& Key() const
            {
                if constexpr (kUsesSentinel)
                {
                    if (m_step < 0)
                        return m_table->m_zero.key;
                }
                return KeyOf_(m_table->m_slots[Slot_()]);
            }

            [[nodiscard]] MappedType& Value() const
            {
                if constexpr (kUsesSentinel)
                {
                    if (m_step < 0)
                        return m_table->ZeroValue_();
                }
                return ValueOf_(m_table->m_slots[Slot_()]);
            }

            BasicIterator& operator++()
            {
                ++m_step;
                SkipEmpty_();
                return *this;
            }

            BasicIterator operator++(int)
            {
                BasicIterator copy = *this;
                ++*this;
                return copy;
            }

            bool operator==(const BasicIterator& other) const noexcept
            {
                return m_table == other.m_table && m_step == other.m_step;
            }

        private:
            friend class OpenTable;
            template<bool>
            friend class BasicIterator;

            BasicIterator(TablePointer table, bool atBegin) : m_table(table)
            {
                const auto capacity = static_cast<IntSize>(table->m_capacity);
                if (!atBegin || capacity == 0)
                {
                    m_step = capacity;
                    return;
                }
                m_start = (table->FirstEmptySlot_() + 1) & table->m_mask;
                if (table->HasOutOfBandKey())
                {
                    m_step = -1;
                    return;
                }
                m_step = 0;
                SkipEmpty_();
            }

            [[nodiscard]] UIntSize Slot_() const noexcept
            {
                return (m_start + static_cast<UIntSize>(m_step)) & m_table->m_mask;
            }

            void SkipEmpty_() noexcept
            {
                const auto capacity = static_cast<IntSize>(m_table->m_capacity);
                while (m_step < capacity && !IsOccupied_(m_table->m_slots[Slot_()]))
                    ++m_step;
            }

            TablePointer m_table {nullptr};
            UIntSize     m_start {0};
            IntSize      m_step {0};
        };

        //--------------------------------------------------------------------------
        // State
        //--------------------------------------------------------------------------

        [[no_unique_address]] Policy        m_policy {};
        [[no_unique_address]] AllocatorType m_allocator {};

        Slot*                   m_slots {nullptr};
        UIntSize                m_capacity {0};
        UIntSize                m_mask {0};
        UIntSize                m_size {0};
        UIntSize                m_threshold {0};
        F32                     m_loadFactor {0.7f};
        Hashing::PlacementState m_placement {};

        [[no_unique_address]] ZeroEntry m_zero {};
    };
}// namespace KDS::Containers
