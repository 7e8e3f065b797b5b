/// @file EnumTable.hpp
/// @brief Enum-indexed table: a key's ordinal is its slot and membership is a bitset.
///
/// The table is bound to a *universe*, the ordered list of every valid key. It is
/// held by reference as a `std::span<const E>`, so one universe can be shared by any
/// number of tables and must outlive all of them. A key is a member of the universe
/// when `universe[to_underlying(key)] == key`.
///
/// Inserting a key outside the universe throws KeyDomainException. Querying or
/// removing one reports absence. Iteration visits keys in ordinal order.
#pragma once

#include <KDS/Defines.hpp>
#include <KDS/Primitives.hpp>
#include <KDS/Containers/KeyValueRef.hpp>
#include <KDS/Exceptions/EmptyContainerException.hpp>
#include <KDS/Exceptions/KeyDomainException.hpp>
#include <KDS/Memory/AllocatorConcept.hpp>
#include <KDS/Memory/SystemAllocator.hpp>
#include <KDS/Meta/EnumTraits.hpp>

#include <algorithm>
#include <bit>
#include <cstddef>
#include <iterator>
#include <new>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <utility>

namespace KDS::Containers
{
    template<typename E, typename MappedT = void, Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
        requires std::is_enum_v<E>
    class EnumTable
    {
    public:
        using KeyType        = E;
        using ValueType      = MappedT;
        using StoredValue    = std::conditional_t<std::is_void_v<MappedT>, detail::NoValue, MappedT>;
        using allocator_type = AllocatorType;
        using size_type      = UIntSize;

        static constexpr bool kIsSet = std::is_void_v<MappedT>;

    private:
        template<bool IsConst>
        class BasicIterator;

    public:
        using Iterator      = BasicIterator<false>;
        using ConstIterator = BasicIterator<true>;

        /// @brief Bound to `EnumUniverse<E>::All()` when E has EnumTraits, otherwise to an empty universe.
        EnumTable() : EnumTable(DefaultUniverse_()) {}

        explicit EnumTable(std::span<const E> universe, const AllocatorType& allocator = AllocatorType {})
            : m_allocator(allocator)
        {
            Bind_(universe);
        }

        EnumTable(const EnumTable& other) : m_allocator(other.m_allocator)
        {
            Bind_(other.m_universe);
            try
            {
                for (auto it = other.Begin(); it != other.End(); ++it)
                {
                    if constexpr (kIsSet)
                        TryEmplace(*it);
                    else
                        TryEmplace(it.Key(), it.Value());
                }
            }
            catch (...)
            {
                Release_();
                throw;
            }
        }

        EnumTable& operator=(const EnumTable& other)
        {
            if (this != &other)
            {
                EnumTable copy(other);
                *this = std::move(copy);
            }
            return *this;
        }

        EnumTable(EnumTable&& other) noexcept : m_allocator(std::move(other.m_allocator)) { StealFrom_(other); }

        EnumTable& operator=(EnumTable&& other) noexcept
        {
            if (this != &other)
            {
                Release_();
                m_allocator = std::move(other.m_allocator);
                StealFrom_(other);
            }
            return *this;
        }

        ~EnumTable() { Release_(); }

        //--------------------------------------------------------------------------
        // Universe
        //--------------------------------------------------------------------------

        [[nodiscard]] std::span<const E> Universe() const noexcept { return m_universe; }
        [[nodiscard]] const AllocatorType& GetAllocator() const noexcept { return m_allocator; }

        /// @brief Position of `key` in `universe`, or -1 when it is not a member.
        [[nodiscard]] static IntSize OrdinalIn(std::span<const E> universe, E key) noexcept
        {
            using Underlying   = std::underlying_type_t<E>;
            const auto raw     = static_cast<Underlying>(key);
            if constexpr (std::is_signed_v<Underlying>)
            {
                if (raw < 0)
                    return -1;
            }
            const auto ordinal = static_cast<UIntSize>(raw);
            if (ordinal >= universe.size() || universe[ordinal] != key)
                return -1;
            return static_cast<IntSize>(ordinal);
        }

        [[nodiscard]] IntSize Ordinal(E key) const noexcept { return OrdinalIn(m_universe, key); }

        /// @brief Drop every entry and rebind to `universe`.
        void ClearToUniverse(std::span<const E> universe)
        {
            Release_();
            Bind_(universe);
        }

        //--------------------------------------------------------------------------
        // Lookup
        //--------------------------------------------------------------------------

        [[nodiscard]] bool Contains(E key) const noexcept
        {
            const IntSize ordinal = Ordinal(key);
            return ordinal >= 0 && TestBit_(static_cast<UIntSize>(ordinal));
        }

        [[nodiscard]] StoredValue* Find(E key) noexcept { return const_cast<StoredValue*>(std::as_const(*this).Find(key)); }

        [[nodiscard]] const StoredValue* Find(E key) const noexcept
        {
            const IntSize ordinal = Ordinal(key);
            if (ordinal < 0 || !TestBit_(static_cast<UIntSize>(ordinal)))
                return nullptr;
            return &ValueAt_(static_cast<UIntSize>(ordinal));
        }

        /// @brief Smallest present ordinal that is >= `minOrdinal`, or -1.
        [[nodiscard]] IntSize NextOrdinal(UIntSize minOrdinal) const noexcept
        {
            const UIntSize count = m_universe.size();
            if (minOrdinal >= count)
                return -1;
            UIntSize word = minOrdinal >> 6;
            UInt64   bits = m_words[word] & (~UInt64 {0} << (minOrdinal & 63));
            for (;;)
            {
                if (bits != 0)
                {
                    const UIntSize ordinal = (word << 6) + static_cast<UIntSize>(std::countr_zero(bits));
                    return ordinal < count ? static_cast<IntSize>(ordinal) : -1;
                }
                if (++word >= WordCount_())
                    return -1;
                bits = m_words[word];
            }
        }

        /// @brief Lowest-ordinal key present. Throws EmptyContainerException when there is none.
        [[nodiscard]] const E& First() const
        {
            if (m_size == 0)
                throw Exceptions::EmptyContainerException("EnumTable::First: table is empty");
            return m_universe[static_cast<UIntSize>(NextOrdinal(0))];
        }

        //--------------------------------------------------------------------------
        // Modifiers
        //--------------------------------------------------------------------------

        /// @brief Insert `key` unless present.
        /// @throws KeyDomainException if `key` is not a member of the bound universe.
        template<class... Args>
        std::pair<StoredValue*, bool> TryEmplace(E key, Args&&... args)
        {
            const UIntSize ordinal = RequireOrdinal_(key);
            if (TestBit_(ordinal))
                return {&ValueAt_(ordinal), false};
            if constexpr (!kIsSet)
                ::new (static_cast<void*>(m_values[ordinal].storage)) StoredValue(std::forward<Args>(args)...);
            SetBit_(ordinal);
            ++m_size;
            return {&ValueAt_(ordinal), true};
        }

        template<class V>
            requires(!kIsSet)
        bool InsertOrAssign(E key, V&& value)
        {
            auto [stored, inserted] = TryEmplace(key, std::forward<V>(value));
            if (!inserted)
                *stored = std::forward<V>(value);
            return inserted;
        }

        bool Remove(E key) noexcept
        {
            const IntSize ordinal = Ordinal(key);
            if (ordinal < 0 || !TestBit_(static_cast<UIntSize>(ordinal)))
                return false;
            RemoveOrdinal_(static_cast<UIntSize>(ordinal));
            return true;
        }

        std::optional<StoredValue> Take(E key)
        {
            const IntSize ordinal = Ordinal(key);
            if (ordinal < 0 || !TestBit_(static_cast<UIntSize>(ordinal)))
                return std::nullopt;
            std::optional<StoredValue> out(std::move(ValueAt_(static_cast<UIntSize>(ordinal))));
            RemoveOrdinal_(static_cast<UIntSize>(ordinal));
            return out;
        }

        Iterator Erase(Iterator it)
        {
            const UIntSize ordinal = it.m_ordinal;
            RemoveOrdinal_(ordinal);
            it.m_ordinal = NextOrdinalOrEnd_(ordinal + 1);
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

        /// @brief Keep only the `newSize` lowest-ordinal keys.
        void Truncate(UIntSize newSize)
        {
            UIntSize kept = 0;
            for (auto it = Begin(); it != End();)
            {
                if (kept < newSize)
                {
                    ++kept;
                    ++it;
                }
                else
                {
                    it = Erase(it);
                }
            }
        }

        void Clear() noexcept
        {
            if constexpr (!kIsSet && !std::is_trivially_destructible_v<StoredValue>)
            {
                for (IntSize ordinal = NextOrdinal(0); ordinal >= 0; ordinal = NextOrdinal(static_cast<UIntSize>(ordinal) + 1))
                    ValueAt_(static_cast<UIntSize>(ordinal)).~StoredValue();
            }
            for (UIntSize i = 0; i < WordCount_(); ++i)
                m_words[i] = 0;
            m_size = 0;
        }

        /// @brief Insert every member of the universe.
        void FillUniverse()
            requires kIsSet
        {
            for (UIntSize ordinal = 0; ordinal < m_universe.size(); ++ordinal)
                SetBit_(ordinal);
            m_size = m_universe.size();
        }

        /// @brief Flip membership of every member of the universe.
        void Complement()
            requires kIsSet
        {
            const UIntSize count = m_universe.size();
            for (UIntSize i = 0; i < WordCount_(); ++i)
                m_words[i] = ~m_words[i];
            if (count & 63)
                m_words[WordCount_() - 1] &= (UInt64 {1} << (count & 63)) - 1;
            m_size = count - m_size;
        }

        //--------------------------------------------------------------------------
        // Capacity
        //--------------------------------------------------------------------------

        [[nodiscard]] KDS_ALWAYS_INLINE UIntSize Size() const noexcept { return m_size; }
        [[nodiscard]] KDS_ALWAYS_INLINE bool     IsEmpty() const noexcept { return m_size == 0; }
        /// The universe size; an enum table never grows past it.
        [[nodiscard]] KDS_ALWAYS_INLINE UIntSize Capacity() const noexcept { return m_universe.size(); }

        //--------------------------------------------------------------------------
        // Iteration
        //--------------------------------------------------------------------------

        Iterator      Begin() { return Iterator(this, NextOrdinalOrEnd_(0)); }
        Iterator      End() { return Iterator(this, m_universe.size()); }
        ConstIterator Begin() const { return ConstIterator(this, NextOrdinalOrEnd_(0)); }
        ConstIterator End() const { return ConstIterator(this, m_universe.size()); }

        Iterator      begin() { return Begin(); }
        Iterator      end() { return End(); }
        ConstIterator begin() const { return Begin(); }
        ConstIterator end() const { return End(); }

        friend bool operator==(const EnumTable& a, const EnumTable& b)
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
        struct ValueSlot
        {
            alignas(StoredValue) std::byte storage[sizeof(StoredValue)];
        };

        [[nodiscard]] static std::span<const E> DefaultUniverse_() noexcept
        {
            if constexpr (Meta::HasEnumTraits<E>)
                return Meta::EnumUniverse<E>::All();
            else
                return {};
        }

        [[nodiscard]] UIntSize WordCount_() const noexcept { return (m_universe.size() + 63) >> 6; }

        [[nodiscard]] bool TestBit_(UIntSize ordinal) const noexcept
        {
            return (m_words[ordinal >> 6] >> (ordinal & 63)) & 1u;
        }
        void SetBit_(UIntSize ordinal) noexcept { m_words[ordinal >> 6] |= UInt64 {1} << (ordinal & 63); }
        void ClearBit_(UIntSize ordinal) noexcept { m_words[ordinal >> 6] &= ~(UInt64 {1} << (ordinal & 63)); }

        [[nodiscard]] StoredValue& ValueAt_(UIntSize ordinal) const noexcept
        {
            if constexpr (kIsSet)
            {
                static detail::NoValue unit;
                return unit;
            }
            else
            {
                return *std::launder(reinterpret_cast<StoredValue*>(m_values[ordinal].storage));
            }
        }

        [[nodiscard]] UIntSize NextOrdinalOrEnd_(UIntSize from) const noexcept
        {
            const IntSize next = NextOrdinal(from);
            return next < 0 ? m_universe.size() : static_cast<UIntSize>(next);
        }

        UIntSize RequireOrdinal_(E key) const
        {
            const IntSize ordinal = Ordinal(key);
            if (ordinal < 0)
                throw Exceptions::KeyDomainException(
                        "EnumTable: key with underlying value " +
                        std::to_string(static_cast<long long>(static_cast<std::underlying_type_t<E>>(key))) +
                        " is not a member of the bound universe of " + std::to_string(m_universe.size()) + " keys");
            return static_cast<UIntSize>(ordinal);
        }

        void RemoveOrdinal_(UIntSize ordinal) noexcept
        {
            if constexpr (!kIsSet && !std::is_trivially_destructible_v<StoredValue>)
                ValueAt_(ordinal).~StoredValue();
            ClearBit_(ordinal);
            --m_size;
        }

        void Bind_(std::span<const E> universe)
        {
            m_universe = universe;
            m_size     = 0;
            m_words    = Memory::AllocateZeroed<UInt64>(m_allocator, (std::max)(WordCount_(), UIntSize {1}));
            if constexpr (!kIsSet)
            {
                try
                {
                    m_values = Memory::AllocateZeroed<ValueSlot>(m_allocator, (std::max)(universe.size(), UIntSize {1}));
                }
                catch (...)
                {
                    Memory::DeallocateArray(m_allocator, m_words, (std::max)(WordCount_(), UIntSize {1}));
                    m_words    = nullptr;
                    m_universe = {};
                    throw;
                }
            }
        }

        void Release_() noexcept
        {
            if (!m_words)
                return;
            Clear();
            Memory::DeallocateArray(m_allocator, m_words, (std::max)(WordCount_(), UIntSize {1}));
            if constexpr (!kIsSet)
                Memory::DeallocateArray(m_allocator, m_values, (std::max)(m_universe.size(), UIntSize {1}));
            m_words    = nullptr;
            m_values   = nullptr;
            m_universe = {};
            m_size     = 0;
        }

        void StealFrom_(EnumTable& other) noexcept
        {
            m_universe = std::exchange(other.m_universe, std::span<const E> {});
            m_words    = std::exchange(other.m_words, nullptr);
            m_values   = std::exchange(other.m_values, nullptr);
            m_size     = std::exchange(other.m_size, 0);
        }

        template<bool IsConst>
        class BasicIterator
        {
        public:
            using TablePointer = std::conditional_t<IsConst, const EnumTable*, EnumTable*>;
            using MappedType   = std::conditional_t<IsConst, const StoredValue, StoredValue>;

            using difference_type   = std::ptrdiff_t;
            using reference         = std::conditional_t<kIsSet, const E&, KeyValueRef<E, MappedType>>;
            using value_type        = std::conditional_t<kIsSet, E, KeyValueRef<E, MappedType>>;
            using pointer           = void;
            using iterator_category = std::forward_iterator_tag;

            BasicIterator() = default;

            template<bool OtherConst>
                requires(IsConst && !OtherConst)
            BasicIterator(const BasicIterator<OtherConst>& other) noexcept
                : m_table(other.m_table), m_ordinal(other.m_ordinal)
            {
            }

            reference operator*() const
            {
                if constexpr (kIsSet)
                    return Key();
                else
                    return reference {Key(), Value()};
            }

            [[nodiscard]] const E&    Key() const { return m_table->m_universe[m_ordinal]; }
            [[nodiscard]] MappedType& Value() const { return m_table->ValueAt_(m_ordinal); }

            BasicIterator& operator++()
            {
                m_ordinal = m_table->NextOrdinalOrEnd_(m_ordinal + 1);
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
                return m_table == other.m_table && m_ordinal == other.m_ordinal;
            }

        private:
            friend class EnumTable;
            template<bool>
            friend class BasicIterator;

            BasicIterator(TablePointer table, UIntSize ordinal) : m_table(table), m_ordinal(ordinal) {}

            TablePointer m_table {nullptr};
            UIntSize     m_ordinal {0};
        };

        [[no_unique_address]] AllocatorType m_allocator {};

        std::span<const E> m_universe {};
        UInt64*            m_words {nullptr};
        ValueSlot*         m_values {nullptr};
        UIntSize           m_size {0};
    };
}// namespace KDS::Containers
