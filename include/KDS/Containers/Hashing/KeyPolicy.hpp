/// @file KeyPolicy.hpp
/// @brief Key policies: how a table hashes, compares and marks empty slots for one key representation.
///
/// A policy is a small (possibly stateful) object exposing:
/// - `KeyType`
/// - `kUsesSentinel`: true when the all-zero key doubles as the empty-slot marker.
///   Such tables keep the real zero key outside the slot array.
/// - `Hash(key) -> UInt64` and `Equal(a, b) -> bool`
/// - for sentinel policies, `static IsEmptyKey(key)`.
#pragma once

#include <KDS/Defines.hpp>
#include <KDS/Primitives.hpp>
#include <KDS/Hashing/FNV.hpp>

#include <bit>
#include <concepts>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>

namespace KDS::Containers::Hashing
{
    template<class P>
    concept KeyPolicyConcept = requires(const P& policy, const typename P::KeyType& key) {
        { P::kUsesSentinel } -> std::convertible_to<bool>;
        { policy.Hash(key) } -> std::convertible_to<UInt64>;
        { policy.Equal(key, key) } -> std::convertible_to<bool>;
    };

    template<class P>
    concept SentinelKeyPolicyConcept = KeyPolicyConcept<P> && P::kUsesSentinel &&
                                       requires(const typename P::KeyType& key) {
                                           { P::IsEmptyKey(key) } -> std::convertible_to<bool>;
                                       };

    /// @brief Keys hashed and compared through user functors. Slots carry an explicit occupied flag.
    template<typename Key, typename Hasher = std::hash<Key>, typename KeyEqual = std::equal_to<Key>>
    class ObjectKeyPolicy
    {
    public:
        using KeyType = Key;

        static constexpr bool kUsesSentinel = false;

        ObjectKeyPolicy() = default;
        explicit ObjectKeyPolicy(const Hasher& hash, const KeyEqual& equal = KeyEqual {})
            : m_hash(hash), m_equal(equal)
        {
        }

        [[nodiscard]] UInt64 Hash(const Key& key) const { return static_cast<UInt64>(m_hash(key)); }
        [[nodiscard]] bool   Equal(const Key& a, const Key& b) const { return m_equal(a, b); }

    private:
        [[no_unique_address]] Hasher   m_hash {};
        [[no_unique_address]] KeyEqual m_equal {};
    };

    namespace detail
    {
        template<UIntSize Size>
        struct UnsignedOfSize;
        template<>
        struct UnsignedOfSize<1>
        {
            using Type = UInt8;
        };
        template<>
        struct UnsignedOfSize<2>
        {
            using Type = UInt16;
        };
        template<>
        struct UnsignedOfSize<4>
        {
            using Type = UInt32;
        };
        template<>
        struct UnsignedOfSize<8>
        {
            using Type = UInt64;
        };
    }// namespace detail

    template<class T>
    concept BitKey = (std::is_arithmetic_v<T> || std::is_pointer_v<T>) && !std::is_same_v<T, bool> &&
                     (sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8);

    /// @brief Primitive keys (integers, floats, pointers) compared by their exact bit pattern.
    ///
    /// @details
    /// The all-zero pattern (`0`, `+0.0`, `nullptr`) marks an empty slot, so tables keep
    /// that key out of band. Floating-point keys are compared bit for bit: `-0.0` and
    /// `+0.0` are different keys, and a NaN equals only a NaN with the same payload.
    template<BitKey Key>
    class BitKeyPolicy
    {
    public:
        using KeyType = Key;
        using Bits    = typename detail::UnsignedOfSize<sizeof(Key)>::Type;

        static constexpr bool kUsesSentinel = true;

        [[nodiscard]] static KDS_ALWAYS_INLINE Bits ToBits(const Key& key) noexcept { return std::bit_cast<Bits>(key); }

        [[nodiscard]] static KDS_ALWAYS_INLINE bool IsEmptyKey(const Key& key) noexcept { return ToBits(key) == 0; }

        [[nodiscard]] KDS_ALWAYS_INLINE UInt64 Hash(const Key& key) const noexcept
        {
            return static_cast<UInt64>(ToBits(key));
        }

        [[nodiscard]] KDS_ALWAYS_INLINE bool Equal(const Key& a, const Key& b) const noexcept
        {
            return ToBits(a) == ToBits(b);
        }
    };

    /// @brief Pointer keys compared by address, never by pointee.
    template<typename T>
    using IdentityKeyPolicy = BitKeyPolicy<const T*>;

    /// @brief std::string keys where ASCII letter case is ignored for hashing and equality.
    /// @details The stored key keeps the spelling it was first inserted with.
    class CaseInsensitiveKeyPolicy
    {
    public:
        using KeyType = std::string;

        static constexpr bool kUsesSentinel = false;

        [[nodiscard]] UInt64 Hash(const std::string& key) const noexcept { return KDS::Hashing::FNV1a64Folded(key); }

        [[nodiscard]] bool Equal(const std::string& a, const std::string& b) const noexcept
        {
            if (a.size() != b.size())
                return false;
            for (UIntSize i = 0; i < a.size(); ++i)
            {
                if (KDS::Hashing::FoldAsciiCase(a[i]) != KDS::Hashing::FoldAsciiCase(b[i]))
                    return false;
            }
            return true;
        }
    };

    namespace detail
    {
        template<class Key>
        struct DefaultKeyPolicySelector
        {
            using Type = ObjectKeyPolicy<Key>;
        };

        template<BitKey Key>
        struct DefaultKeyPolicySelector<Key>
        {
            using Type = BitKeyPolicy<Key>;
        };
    }// namespace detail

    /// @brief BitKeyPolicy for primitive keys, ObjectKeyPolicy for everything else.
    template<class Key>
    using DefaultKeyPolicy = typename detail::DefaultKeyPolicySelector<Key>::Type;

    static_assert(KeyPolicyConcept<ObjectKeyPolicy<std::string>>);
    static_assert(SentinelKeyPolicyConcept<BitKeyPolicy<float>>);
    static_assert(KeyPolicyConcept<CaseInsensitiveKeyPolicy>);
}// namespace KDS::Containers::Hashing
