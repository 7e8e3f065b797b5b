#pragma once
#include <KDS/Primitives.hpp>

#include <array>
#include <concepts>
#include <span>
#include <type_traits>
#include <utility>

namespace KDS::Meta
{
    /// @brief Compile-time description of an enum type.
    ///
    /// @details
    /// Specialize this template for an enum whose enumerators are the dense range
    /// `0 .. Count-1` to let enum-indexed containers build their universe on their own:
    ///
    /// @code
    /// template<> struct KDS::Meta::EnumTraits<Color> { static constexpr UIntSize Count = 3; };
    /// @endcode
    ///
    /// The primary template is intentionally empty so `HasEnumTraits` can detect a
    /// missing specialization without a hard error.
    template<typename T>
    struct EnumTraits
    {
    };

    template<typename T>
    concept HasEnumTraits = std::is_enum_v<T> && requires {
        { EnumTraits<T>::Count } -> std::convertible_to<UIntSize>;
    };

    /// @brief The full, shared universe of an enum with EnumTraits.
    template<HasEnumTraits E>
    struct EnumUniverse
    {
        static constexpr UIntSize Count = static_cast<UIntSize>(EnumTraits<E>::Count);

        /// @brief Every enumerator in ordinal order. The storage is static and never changes.
        [[nodiscard]] static std::span<const E> All() noexcept
        {
            static constexpr std::array<E, Count> values = [] {
                std::array<E, Count> out {};
                for (UIntSize i = 0; i < Count; ++i)
                    out[i] = static_cast<E>(i);
                return out;
            }();
            return std::span<const E>(values);
        }
    };
}// namespace KDS::Meta
