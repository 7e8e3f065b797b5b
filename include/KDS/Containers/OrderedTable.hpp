/// @file OrderedTable.hpp
/// @brief Insertion-order layer kept in lock-step with a membership table.
///
/// `OrderedTable<Backend>` pairs any membership table (OpenTable or EnumTable) with a
/// `Vector` of its keys. The backend alone decides whether a key exists; the order
/// list only decides where it sits. Every operation keeps them in agreement: the
/// list holds exactly the table's keys, each once.
///
/// The list stores keys rather than slot indices, so backend growth or backward
/// shifting never disturbs it. Positional operations (`KeyAt`, `RemoveAt`, `AlterAt`)
/// are O(1) on the list. Key-addressed removal has to find the key's position,
/// which is a linear scan.
#pragma once

#include <KDS/Defines.hpp>
#include <KDS/Primitives.hpp>
#include <KDS/Algorithms/StableSort.hpp>
#include <KDS/Containers/KeyValueRef.hpp>
#include <KDS/Containers/Vector.hpp>
#include <KDS/Exceptions/EmptyContainerException.hpp>
#include <KDS/Exceptions/KeyDomainException.hpp>

#include <algorithm>
#include <compare>
#include <concepts>
#include <cstddef>
#include <iterator>
#include <optional>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace KDS::Containers
{
    /// @brief What removal does to the positions of the remaining keys.
    enum class OrderType
    {
        /// Later keys shift down by one; relative order is always preserved.
        List,
        /// The last key moves into the hole. O(1), but removal reorders.
        Bag,
    };

    namespace detail
    {
        template<class B>
        concept TunableTable = requires(B& table, const B& constTable, UIntSize count, F32 loadFactor, UInt64 multiplier) {
            table.Reserve(count);
            table.EnsureCapacity(count);
            table.Shrink(count);
            table.Clear(count);
            table.SetLoadFactor(loadFactor);
            { constTable.GetLoadFactor() } -> std::convertible_to<F32>;
            table.SetHashMultiplier(multiplier);
            { constTable.GetHashMultiplier() } -> std::convertible_to<UInt64>;
        };

        template<class B>
        concept UniverseTable = requires(B& table, const B& constTable, typename B::KeyType key) {
            { constTable.Universe() } -> std::convertible_to<std::span<const typename B::KeyType>>;
            table.ClearToUniverse(constTable.Universe());
            { constTable.Ordinal(key) } -> std::convertible_to<IntSize>;
        };
    }// namespace detail

    template<class Backend>
    class OrderedTable
    {
    public:
        using BackendType    = Backend;
        using KeyType        = typename Backend::KeyType;
        using ValueType      = typename Backend::ValueType;
        using StoredValue    = typename Backend::StoredValue;
        using allocator_type = typename Backend::allocator_type;
        using OrderList      = Vector<KeyType, allocator_type>;
        using size_type      = UIntSize;

        static constexpr bool kIsSet = Backend::kIsSet;

    private:
        template<bool IsConst>
        class BasicIterator;

    public:
        using Iterator      = BasicIterator<false>;
        using ConstIterator = BasicIterator<true>;

        OrderedTable() = default;

        /// @brief Forward `args` to the backend constructor; the order type is List.
        template<class... Args>
            requires std::constructible_from<Backend, Args...>
        explicit OrderedTable(Args&&... args)
            : m_table(std::forward<Args>(args)...)
        {
        }

        template<class... Args>
            requires std::constructible_from<Backend, Args...>
        explicit OrderedTable(OrderType orderType, Args&&... args)
            : m_table(std::forward<Args>(args)...), m_orderType(orderType)
        {
        }

        //--------------------------------------------------------------------------
        // Lookup
        //--------------------------------------------------------------------------

        [[nodiscard]] bool               Contains(const KeyType& key) const { return m_table.Contains(key); }
        [[nodiscard]] StoredValue*       Find(const KeyType& key) { return m_table.Find(key); }
        [[nodiscard]] const StoredValue* Find(const KeyType& key) const { return m_table.Find(key); }

        /// @brief Position of `key` in the order, or -1. Uses the backend's notion of key equality.
        [[nodiscard]] IntSize IndexOf(const KeyType& key) const
        {
            if (!m_table.Contains(key))
                return -1;
            return ScanFor_(key);
        }

        /// @throws std::out_of_range if `index >= Size()`.
        [[nodiscard]] const KeyType& KeyAt(UIntSize index) const { return m_order.At(index); }

        [[nodiscard]] StoredValue& ValueAt(UIntSize index)
            requires(!kIsSet)
        {
            return *m_table.Find(m_order.At(index));
        }

        [[nodiscard]] const StoredValue& ValueAt(UIntSize index) const
            requires(!kIsSet)
        {
            return *m_table.Find(m_order.At(index));
        }

        /// @brief First key in order. Throws EmptyContainerException when there is none.
        [[nodiscard]] const KeyType& First() const
        {
            if (m_order.IsEmpty())
                throw Exceptions::EmptyContainerException("OrderedTable::First: table is empty");
            return m_order[0];
        }

        //--------------------------------------------------------------------------
        // Insertion
        //--------------------------------------------------------------------------

        /// @brief Append `key` unless present. A present key keeps its position.
        template<class... Args>
        std::pair<StoredValue*, bool> TryEmplace(const KeyType& key, Args&&... args)
        {
            ReserveOrderSlot_();
            auto result = m_table.TryEmplace(key, std::forward<Args>(args)...);
            if (result.second)
                AppendOrRollBack_(m_order.Size(), key);
            return result;
        }

        template<class V>
            requires(!kIsSet)
        bool InsertOrAssign(const KeyType& key, V&& value)
        {
            auto [stored, inserted] = TryEmplace(key, std::forward<V>(value));
            if (!inserted)
                *stored = std::forward<V>(value);
            return inserted;
        }

        /// @brief Place `key` at `index`. A new key is inserted there; an existing key is
        ///        moved there and false is returned ("moved, not duplicated").
        /// @throws std::out_of_range if `index > Size()`.
        template<class... Args>
        bool TryEmplaceAt(UIntSize index, const KeyType& key, Args&&... args)
        {
            if (index > m_order.Size())
                throw std::out_of_range("OrderedTable::TryEmplaceAt: index out of range");
            if (m_table.Contains(key))
            {
                MoveWithinOrder_(static_cast<UIntSize>(ScanFor_(key)), index);
                return false;
            }
            ReserveOrderSlot_();
            m_table.TryEmplace(key, std::forward<Args>(args)...);
            AppendOrRollBack_(index, key);
            return true;
        }

        /// @brief Insert or overwrite, placing the key at `index` either way.
        template<class V>
            requires(!kIsSet)
        bool InsertOrAssignAt(UIntSize index, const KeyType& key, V&& value)
        {
            if (index > m_order.Size())
                throw std::out_of_range("OrderedTable::InsertOrAssignAt: index out of range");
            if (StoredValue* stored = m_table.Find(key))
            {
                *stored = std::forward<V>(value);
                MoveWithinOrder_(static_cast<UIntSize>(ScanFor_(key)), index);
                return false;
            }
            return TryEmplaceAt(index, key, std::forward<V>(value));
        }

        //--------------------------------------------------------------------------
        // Removal
        //--------------------------------------------------------------------------

        bool Remove(const KeyType& key)
        {
            if (!m_table.Contains(key))
                return false;
            const IntSize index = ScanFor_(key);
            m_table.Remove(key);
            RemoveFromOrder_(static_cast<UIntSize>(index));
            return true;
        }

        std::optional<StoredValue> Take(const KeyType& key)
        {
            if (!m_table.Contains(key))
                return std::nullopt;
            const IntSize index = ScanFor_(key);
            auto          value = m_table.Take(key);
            RemoveFromOrder_(static_cast<UIntSize>(index));
            return value;
        }

        /// @brief Remove the key at `index` and return it.
        /// @throws std::out_of_range if `index >= Size()`.
        KeyType RemoveAt(UIntSize index)
        {
            KeyType key = m_order.At(index);
            m_table.Remove(key);
            RemoveFromOrder_(index);
            return key;
        }

        /// @brief Remove the entry at `index` and return its key and value.
        std::pair<KeyType, StoredValue> TakeAt(UIntSize index)
            requires(!kIsSet)
        {
            KeyType key   = m_order.At(index);
            auto    value = m_table.Take(key);
            RemoveFromOrder_(index);
            return {std::move(key), std::move(*value)};
        }

        /// @brief Remove the keys at positions [start, end).
        void RemoveRange(UIntSize start, UIntSize end)
        {
            if (start > end || end > m_order.Size())
                throw std::out_of_range("OrderedTable::RemoveRange: range out of bounds");
            for (UIntSize i = start; i < end; ++i)
                m_table.Remove(m_order[i]);
            m_order.RemoveRange(start, end);
        }

        /// @brief Keep only the first `newSize` keys in order.
        void Truncate(UIntSize newSize)
        {
            if (newSize < m_order.Size())
                RemoveRange(newSize, m_order.Size());
        }

        Iterator Erase(Iterator it)
        {
            RemoveAt(it.m_index);
            return it;
        }

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

        void Clear()
        {
            m_table.Clear();
            m_order.Clear();
        }

        void Clear(UIntSize maximumCapacity)
            requires detail::TunableTable<Backend>
        {
            m_table.Clear(maximumCapacity);
            m_order.Clear();
        }

        //--------------------------------------------------------------------------
        // Reordering
        //--------------------------------------------------------------------------

        /// @brief Replace `before` with `after` at the same position, keeping the mapped value.
        /// @return false, with nothing changed, if `before` is absent or `after` already present.
        /// @throws KeyDomainException if the backend can never hold `after`.
        bool Alter(const KeyType& before, const KeyType& after)
        {
            if (m_table.Contains(after) || !m_table.Contains(before))
                return false;
            RequireStorable_(after);
            ReplaceAt_(static_cast<UIntSize>(ScanFor_(before)), after);
            return true;
        }

        /// @brief Replace the key at `index` with `after`, keeping the mapped value.
        /// @return false, with nothing changed, if `index` is out of range or `after` already present.
        bool AlterAt(UIntSize index, const KeyType& after)
        {
            if (index >= m_order.Size() || m_table.Contains(after))
                return false;
            RequireStorable_(after);
            ReplaceAt_(index, after);
            return true;
        }

        /// @brief Overwrite the value at `index` and return the previous one.
        StoredValue SetAt(UIntSize index, StoredValue value)
            requires(!kIsSet)
        {
            StoredValue& stored = ValueAt(index);
            StoredValue  old    = std::move(stored);
            stored              = std::move(value);
            return old;
        }

        /// @brief Stable sort of the order by natural key ordering. Slots are not touched.
        void Sort() { Algorithms::StableSort(m_order.begin(), m_order.end()); }

        /// @brief Stable sort of the order with a bool "less" or three-way comparator over keys.
        template<class Compare>
        void Sort(Compare compare)
        {
            Algorithms::StableSort(m_order.begin(), m_order.end(), std::move(compare));
        }

        /// @brief Stable sort of the order by mapped value.
        template<class Compare = std::compare_three_way>
        void SortByValue(Compare compare = Compare {})
            requires(!kIsSet)
        {
            Algorithms::StableSort(m_order.begin(),
                                   m_order.end(),
                                   [this, &compare](const KeyType& a, const KeyType& b) -> decltype(auto) {
                                       return compare(*m_table.Find(a), *m_table.Find(b));
                                   });
        }

        [[nodiscard]] OrderType GetOrderType() const noexcept { return m_orderType; }
        void                    SetOrderType(OrderType orderType) noexcept { m_orderType = orderType; }

        //--------------------------------------------------------------------------
        // Capacity
        //--------------------------------------------------------------------------

        [[nodiscard]] KDS_ALWAYS_INLINE UIntSize Size() const noexcept { return m_order.Size(); }
        [[nodiscard]] KDS_ALWAYS_INLINE bool     IsEmpty() const noexcept { return m_order.IsEmpty(); }
        [[nodiscard]] UIntSize                   Capacity() const noexcept { return m_table.Capacity(); }

        void Reserve(UIntSize count)
            requires detail::TunableTable<Backend>
        {
            m_table.Reserve(count);
            m_order.Reserve(count);
        }

        void EnsureCapacity(UIntSize additional)
            requires detail::TunableTable<Backend>
        {
            m_table.EnsureCapacity(additional);
            m_order.Reserve(m_order.Size() + additional);
        }

        void Shrink(UIntSize maximumCapacity)
            requires detail::TunableTable<Backend>
        {
            m_table.Shrink(maximumCapacity);
            m_order.ShrinkToFit();
        }

        void SetLoadFactor(F32 loadFactor)
            requires detail::TunableTable<Backend>
        {
            m_table.SetLoadFactor(loadFactor);
        }

        [[nodiscard]] F32 GetLoadFactor() const
            requires detail::TunableTable<Backend>
        {
            return m_table.GetLoadFactor();
        }

        void SetHashMultiplier(UInt64 multiplier)
            requires detail::TunableTable<Backend>
        {
            m_table.SetHashMultiplier(multiplier);
        }

        [[nodiscard]] UInt64 GetHashMultiplier() const
            requires detail::TunableTable<Backend>
        {
            return m_table.GetHashMultiplier();
        }

        [[nodiscard]] std::span<const KeyType> Universe() const
            requires detail::UniverseTable<Backend>
        {
            return m_table.Universe();
        }

        void ClearToUniverse(std::span<const KeyType> universe)
            requires detail::UniverseTable<Backend>
        {
            m_table.ClearToUniverse(universe);
            m_order.Clear();
        }

        /// @brief Read-only access to the membership table, e.g. for probe diagnostics.
        [[nodiscard]] const Backend& Table() const noexcept { return m_table; }
        /// @brief Read-only access to the order list.
        [[nodiscard]] const OrderList& Order() const noexcept { return m_order; }

        //--------------------------------------------------------------------------
        // Iteration (in order)
        //--------------------------------------------------------------------------

        Iterator      Begin() { return Iterator(this, 0); }
        Iterator      End() { return Iterator(this, m_order.Size()); }
        ConstIterator Begin() const { return ConstIterator(this, 0); }
        ConstIterator End() const { return ConstIterator(this, m_order.Size()); }

        Iterator      begin() { return Begin(); }
        Iterator      end() { return End(); }
        ConstIterator begin() const { return Begin(); }
        ConstIterator end() const { return End(); }

        /// @brief Same keys (and values); order is not compared.
        friend bool operator==(const OrderedTable& a, const OrderedTable& b) { return a.m_table == b.m_table; }

    private:
        [[nodiscard]] bool KeysEqual_(const KeyType& a, const KeyType& b) const
        {
            if constexpr (requires { m_table.GetKeyPolicy().Equal(a, b); })
                return m_table.GetKeyPolicy().Equal(a, b);
            else
                return a == b;
        }

        // Linear scan; only meaningful when the key is known to be present.
        [[nodiscard]] IntSize ScanFor_(const KeyType& key) const
        {
            for (UIntSize i = 0; i < m_order.Size(); ++i)
            {
                if (KeysEqual_(m_order[i], key))
                    return static_cast<IntSize>(i);
            }
            return -1;
        }

        // Room for one more key, grown geometrically, so the PushAt that follows a
        // successful table insert cannot fail on allocation.
        void ReserveOrderSlot_()
        {
            if (m_order.Size() == m_order.Capacity())
                m_order.Reserve(m_order.Capacity() ? m_order.Capacity() * 2 : 4);
        }

        // The table already holds `key`; put it in the order or undo the table insert.
        void AppendOrRollBack_(UIntSize index, const KeyType& key)
        {
            try
            {
                m_order.PushAt(index, key);
            }
            catch (...)
            {
                m_table.Remove(key);
                throw;
            }
        }

        void RemoveFromOrder_(UIntSize index)
        {
            if (m_orderType == OrderType::Bag)
                m_order.SwapRemove(index);
            else
                m_order.Erase(index);
        }

        void MoveWithinOrder_(UIntSize from, UIntSize to)
        {
            if (to >= m_order.Size())
                to = m_order.Size() - 1;
            auto* base = m_order.data();
            if (from < to)
                std::rotate(base + from, base + from + 1, base + to + 1);
            else if (to < from)
                std::rotate(base + to, base + from, base + from + 1);
        }

        void RequireStorable_(const KeyType& key) const
        {
            if constexpr (detail::UniverseTable<Backend>)
            {
                if (m_table.Ordinal(key) < 0)
                    throw Exceptions::KeyDomainException("OrderedTable: replacement key is not a member of the bound universe");
            }
        }

        // Copies of `after` are made before `before` leaves the table; from Take onward
        // only nothrow key moves remain.
        void ReplaceAt_(UIntSize index, const KeyType& after)
        {
            if constexpr (detail::TunableTable<Backend>)
                m_table.EnsureCapacity(1);
            KeyType tableKey(after);
            KeyType orderKey(after);
            auto    value = m_table.Take(m_order[index]);
            m_table.TryEmplace(std::move(tableKey), std::move(*value));
            m_order[index] = std::move(orderKey);
        }

        template<bool IsConst>
        class BasicIterator
        {
        public:
            using TablePointer = std::conditional_t<IsConst, const OrderedTable*, OrderedTable*>;
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
                : m_table(other.m_table), m_index(other.m_index)
            {
            }

            reference operator*() const
            {
                if constexpr (kIsSet)
                    return Key();
                else
                    return reference {Key(), Value()};
            }

            [[nodiscard]] const KeyType& Key() const { return m_table->m_order[m_index]; }
            [[nodiscard]] MappedType&    Value() const { return *m_table->m_table.Find(Key()); }
            [[nodiscard]] UIntSize       Index() const noexcept { return m_index; }

            BasicIterator& operator++()
            {
                ++m_index;
                return *this;
            }

            BasicIterator operator++(int)
            {
                BasicIterator copy = *this;
                ++m_index;
                return copy;
            }

            bool operator==(const BasicIterator& other) const noexcept
            {
                return m_table == other.m_table && m_index == other.m_index;
            }

        private:
            friend class OrderedTable;
            template<bool>
            friend class BasicIterator;

            BasicIterator(TablePointer table, UIntSize index) : m_table(table), m_index(index) {}

            TablePointer m_table {nullptr};
            UIntSize     m_index {0};
        };

        Backend   m_table {};
        OrderList m_order = OrderList(m_table.GetAllocator());
        OrderType m_orderType {OrderType::List};
    };
}// namespace KDS::Containers
