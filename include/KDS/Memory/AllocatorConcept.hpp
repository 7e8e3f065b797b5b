/// @file AllocatorConcept.hpp
/// @brief Allocator concept and typed array helpers used by every KDS container.
#pragma once

#include <KDS/Primitives.hpp>

#include <concepts>
#include <cstring>
#include <limits>
#include <new>
#include <type_traits>

namespace KDS::Memory
{
    // -------------------------------------------------------------------------
    // Core allocator concept
    // -------------------------------------------------------------------------
    //
    // Only Allocate/Deallocate are required. Allocate may return nullptr on failure;
    // containers translate that into std::bad_alloc.

    template<class A>
    concept AllocatorConcept =
            requires(A a, std::size_t n, std::size_t align, void* p) {
                { a.Allocate(n, align) } -> std::same_as<void*>;
                { a.Deallocate(p, n, align) } noexcept;
            };

    /// @brief Allocate storage for `count` objects of `T`, with every byte set to zero.
    ///
    /// @details
    /// No constructors run. Containers use the zeroed block as raw slot storage whose
    /// "empty" marker is the all-zero pattern (an `occupied` flag or a zero key).
    /// @throws std::bad_alloc when the allocator refuses or the byte count overflows.
    template<class T, AllocatorConcept A>
    [[nodiscard]] T* AllocateZeroed(A& allocator, UIntSize count)
    {
        static_assert(std::is_trivially_default_constructible_v<T>,
                      "AllocateZeroed is only used for raw slot and word storage.");
        if (count > std::numeric_limits<UIntSize>::max() / sizeof(T))
            throw std::bad_alloc();
        const UIntSize bytes = count * sizeof(T);
        void*          mem   = allocator.Allocate(bytes, alignof(T));
        if (!mem)
            throw std::bad_alloc();
        std::memset(mem, 0, bytes);
        return static_cast<T*>(mem);
    }

    /// @brief Allocate uninitialized storage for `count` objects of `T`.
    template<class T, AllocatorConcept A>
    [[nodiscard]] T* AllocateUninitialized(A& allocator, UIntSize count)
    {
        if (count > std::numeric_limits<UIntSize>::max() / sizeof(T))
            throw std::bad_alloc();
        void* mem = allocator.Allocate(count * sizeof(T), alignof(T));
        if (!mem)
            throw std::bad_alloc();
        return static_cast<T*>(mem);
    }

    /// @brief Release storage obtained from AllocateZeroed/AllocateUninitialized. Null is ignored.
    template<class T, AllocatorConcept A>
    void DeallocateArray(A& allocator, T* ptr, UIntSize count) noexcept
    {
        if (!ptr)
            return;
        allocator.Deallocate(ptr, count * sizeof(T), alignof(T));
    }
}// namespace KDS::Memory
