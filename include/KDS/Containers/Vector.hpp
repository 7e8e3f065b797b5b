/// @file Vector.hpp
/// @brief Contiguous growable array used as the order list of ordered tables.
/// @details
/// Elements live in a single block obtained from a value-stored allocator. Besides
/// the usual append/insert/erase it offers the positional operations an order list
/// needs: linear `IndexOf`, O(1) `SwapRemove`, and bulk `RemoveRange`.
#pragma once

#include <KDS/Primitives.hpp>
#include <KDS/Memory/AllocatorConcept.hpp>
#include <KDS/Memory/SystemAllocator.hpp>

#include <initializer_list>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace KDS::Containers
{
    /// @tparam T Element type
    /// @tparam Alloc Allocator satisfying AllocatorConcept (value-stored). Defaults to SystemAllocator.
    template<class T, Memory::AllocatorConcept Alloc = Memory::SystemAllocator>
    class Vector
    {
    public:
        using Value     = T;
        using AllocType = Alloc;

        Vector() noexcept = default;
        explicit Vector(Alloc alloc) noexcept : alloc_(std::move(alloc)) {}
        explicit Vector(UIntSize initialCapacity, Alloc alloc = Alloc {}) : alloc_(std::move(alloc))
        {
            if (initialCapacity)
                Reserve(initialCapacity);
        }
        Vector(std::initializer_list<T> init, Alloc alloc = Alloc {}) : alloc_(std::move(alloc))
        {
            Reserve(init.size());
            for (const auto& v: init)
                ::new (static_cast<void*>(data_ + size_++)) T(v);
        }
        Vector(const Vector& other) : alloc_(other.alloc_)
        {
            CopyFrom_(other);
        }
        Vector& operator=(const Vector& other)
        {
            if (this != &other)
            {
                Release_();
                CopyFrom_(other);
            }
            return *this;
        }
        Vector(Vector&& other) noexcept
            : alloc_(std::move(other.alloc_)), data_(other.data_), size_(other.size_), capacity_(other.capacity_)
        {
            other.data_ = nullptr;
            other.size_ = other.capacity_ = 0;
        }
        Vector& operator=(Vector&& other) noexcept
        {
            if (this != &other)
            {
                Release_();
                alloc_      = std::move(other.alloc_);
                data_       = other.data_;
                size_       = other.size_;
                capacity_   = other.capacity_;
                other.data_ = nullptr;
                other.size_ = other.capacity_ = 0;
            }
            return *this;
        }
        ~Vector() { Release_(); }

        //=== Element modifiers ===//

        void PushBack(const T& value) { EmplaceBack(value); }
        void PushBack(T&& value) { EmplaceBack(std::move(value)); }

        /// @brief In-place construct at the end.
        template<typename... Args>
        T& EmplaceBack(Args&&... args)
        {
            EnsureCapacityForOne_();
            T* slot = ::new (static_cast<void*>(data_ + size_)) T(std::forward<Args>(args)...);
            ++size_;
            return *slot;
        }

        void PushAt(UIntSize index, const T& value) { EmplaceAt(index, value); }
        void PushAt(UIntSize index, T&& value) { EmplaceAt(index, std::move(value)); }

        /// @brief In-place insert at index (shifts the tail right by one).
        template<typename... Args>
        void EmplaceAt(UIntSize index, Args&&... args)
        {
            if (index > size_)
                throw std::out_of_range("Vector::EmplaceAt: index out of range");
            // Build first: args may alias an element that the shift is about to move.
            T value(std::forward<Args>(args)...);
            EnsureCapacityForOne_();
            OpenGap_(index);
            ::new (static_cast<void*>(data_ + index)) T(std::move(value));
            ++size_;
        }

        /// @brief Pop the last element.
        void PopBack()
        {
            if (size_ == 0)
                throw std::out_of_range("Vector::PopBack: vector is empty");
            data_[--size_].~T();
        }

        /// @brief Erase at index, preserving the order of the remaining elements.
        void Erase(UIntSize index)
        {
            if (index >= size_)
                throw std::out_of_range("Vector::Erase: index out of range");
            RemoveRange(index, index + 1);
        }

        /// @brief Erase at index by moving the last element into the hole. Does not preserve order.
        void SwapRemove(UIntSize index)
        {
            if (index >= size_)
                throw std::out_of_range("Vector::SwapRemove: index out of range");
            const UIntSize last = size_ - 1;
            if (index != last)
                data_[index] = std::move(data_[last]);
            data_[last].~T();
            --size_;
        }

        /// @brief Erase the half-open range [start, end), shifting the tail down.
        void RemoveRange(UIntSize start, UIntSize end)
        {
            if (start > end || end > size_)
                throw std::out_of_range("Vector::RemoveRange: range out of bounds");
            const UIntSize count = end - start;
            if (count == 0)
                return;
            for (UIntSize i = end; i < size_; ++i)
                data_[i - count] = std::move(data_[i]);
            for (UIntSize i = size_ - count; i < size_; ++i)
                data_[i].~T();
            size_ -= count;
        }

        /// @brief Remove all elements (capacity remains).
        void Clear() noexcept
        {
            for (UIntSize i = 0; i < size_; ++i)
                data_[i].~T();
            size_ = 0;
        }

        //=== Capacity management ===//

        /// @brief Ensure at least `newCapacity` slots.
        void Reserve(UIntSize newCapacity)
        {
            if (newCapacity <= capacity_)
                return;
            Reallocate_(newCapacity);
        }

        /// @brief Shrink capacity to match size.
        void ShrinkToFit()
        {
            if (size_ == capacity_)
                return;
            if (size_ == 0)
            {
                Memory::DeallocateArray(alloc_, data_, capacity_);
                data_     = nullptr;
                capacity_ = 0;
                return;
            }
            Reallocate_(size_);
        }

        //=== Observers ===//

        [[nodiscard]] UIntSize Size() const noexcept { return size_; }
        [[nodiscard]] UIntSize Capacity() const noexcept { return capacity_; }
        [[nodiscard]] bool IsEmpty() const noexcept { return size_ == 0; }
        [[nodiscard]] const Alloc& GetAllocator() const noexcept { return alloc_; }

        /// @brief Position of the first element equal to `value`, or -1.
        template<class U>
        [[nodiscard]] IntSize IndexOf(const U& value) const
        {
            for (UIntSize i = 0; i < size_; ++i)
            {
                if (data_[i] == value)
                    return static_cast<IntSize>(i);
            }
            return -1;
        }

        T& At(UIntSize idx)
        {
            if (idx >= size_)
                throw std::out_of_range("Vector::At: index out of range");
            return data_[idx];
        }
        const T& At(UIntSize idx) const
        {
            if (idx >= size_)
                throw std::out_of_range("Vector::At: index out of range");
            return data_[idx];
        }

        T& operator[](UIntSize idx) { return data_[idx]; }
        const T& operator[](UIntSize idx) const { return data_[idx]; }

        //=== Iterators & data ===//

        [[nodiscard]] T* data() noexcept { return data_; }
        [[nodiscard]] const T* data() const noexcept { return data_; }
        [[nodiscard]] T* begin() noexcept { return data_; }
        [[nodiscard]] const T* begin() const noexcept { return data_; }
        [[nodiscard]] T* end() noexcept { return data_ + size_; }
        [[nodiscard]] const T* end() const noexcept { return data_ + size_; }

    private:
        void EnsureCapacityForOne_()
        {
            if (size_ >= capacity_)
                Reserve(capacity_ ? capacity_ * 2 : 4);
        }

        // Move-constructs [index, size) one slot to the right; slot `index` ends up destroyed.
        void OpenGap_(UIntSize index)
        {
            for (UIntSize i = size_; i > index; --i)
            {
                ::new (static_cast<void*>(data_ + i)) T(std::move(data_[i - 1]));
                data_[i - 1].~T();
            }
        }

        void Reallocate_(UIntSize newCapacity)
        {
            T*       newData = Memory::AllocateUninitialized<T>(alloc_, newCapacity);
            UIntSize i       = 0;
            try
            {
                for (; i < size_; ++i)
                    ::new (static_cast<void*>(newData + i)) T(std::move_if_noexcept(data_[i]));
            }
            catch (...)
            {
                for (UIntSize j = 0; j < i; ++j)
                    newData[j].~T();
                Memory::DeallocateArray(alloc_, newData, newCapacity);
                throw;
            }
            for (UIntSize j = 0; j < size_; ++j)
                data_[j].~T();
            Memory::DeallocateArray(alloc_, data_, capacity_);
            data_     = newData;
            capacity_ = newCapacity;
        }

        void CopyFrom_(const Vector& other)
        {
            Reserve(other.size_);
            for (; size_ < other.size_; ++size_)
                ::new (static_cast<void*>(data_ + size_)) T(other.data_[size_]);
        }

        void Release_() noexcept
        {
            Clear();
            Memory::DeallocateArray(alloc_, data_, capacity_);
            data_     = nullptr;
            capacity_ = 0;
        }

        Alloc    alloc_ {};
        T*       data_ {nullptr};
        UIntSize size_ {0};
        UIntSize capacity_ {0};
    };
}// namespace KDS::Containers
