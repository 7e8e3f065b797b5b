/// @file SystemAllocator.hpp
/// @brief Stateless aligned allocator backed by the C runtime.
#pragma once

#include <KDS/Primitives.hpp>

#include <cstddef>
#include <cstdlib>

namespace KDS::Memory
{
    struct SystemAllocator
    {
        [[nodiscard]] void* Allocate(UIntSize size, UIntSize alignment) noexcept
        {
            if (size == 0)
                return nullptr;
            if (alignment == 0 || (alignment & (alignment - 1)) != 0)
                alignment = alignof(std::max_align_t);

#if defined(_WIN32) || defined(_WIN64)
            return _aligned_malloc(size, alignment);
#else
            if (alignment < sizeof(void*))
                alignment = sizeof(void*);
            void* p = nullptr;
            if (posix_memalign(&p, alignment, size) != 0)
                return nullptr;
            return p;
#endif
        }

        void Deallocate(void* ptr, UIntSize, UIntSize) noexcept
        {
#if defined(_WIN32) || defined(_WIN64)
            _aligned_free(ptr);
#else
            std::free(ptr);
#endif
        }

        friend constexpr bool operator==(const SystemAllocator&, const SystemAllocator&) noexcept { return true; }
    };
}// namespace KDS::Memory
