/// @file StableSort.hpp
/// @brief In-place stable merge sort that never allocates.
///
/// Halves are merged by rotation (the classic buffer-less merge), giving
/// O(n log^2 n) comparisons and moves in the worst case. Equal elements keep their
/// relative order.
///
/// The comparator may be either a strict "less" predicate returning bool, or a
/// three-way comparator whose result is compared against 0 (std::strong_ordering,
/// std::weak_ordering or a plain int). Without a comparator, natural ordering
/// (`std::compare_three_way`) is used.
#pragma once

#include <algorithm>
#include <compare>
#include <functional>
#include <iterator>
#include <type_traits>
#include <utility>

namespace KDS::Algorithms
{
    namespace detail
    {
        inline constexpr std::ptrdiff_t kInsertionSortCutoff = 12;

        template<class Compare>
        class LessAdapter
        {
        public:
            explicit LessAdapter(Compare& compare) : m_compare(compare) {}

            template<class A, class B>
            bool operator()(const A& a, const B& b) const
            {
                using Result = std::invoke_result_t<Compare&, const A&, const B&>;
                if constexpr (std::is_same_v<std::remove_cvref_t<Result>, bool>)
                    return std::invoke(m_compare, a, b);
                else
                    return std::invoke(m_compare, a, b) < 0;
            }

        private:
            Compare& m_compare;
        };

        template<class It, class Less>
        void InsertionSort(It first, It last, const Less& less)
        {
            if (first == last)
                return;
            for (It i = std::next(first); i != last; ++i)
            {
                for (It j = i; j != first;)
                {
                    It prev = std::prev(j);
                    if (!less(*j, *prev))
                        break;
                    std::iter_swap(j, prev);
                    j = prev;
                }
            }
        }

        template<class It, class Less>
        void MergeWithoutBuffer(It first, It middle, It last, std::ptrdiff_t len1, std::ptrdiff_t len2, const Less& less)
        {
            if (len1 == 0 || len2 == 0)
                return;
            if (len1 + len2 == 2)
            {
                if (less(*middle, *first))
                    std::iter_swap(first, middle);
                return;
            }

            It             cut1;
            It             cut2;
            std::ptrdiff_t half1;
            std::ptrdiff_t half2;
            if (len1 > len2)
            {
                half1 = len1 / 2;
                cut1  = std::next(first, half1);
                cut2  = std::lower_bound(middle, last, *cut1, less);
                half2 = std::distance(middle, cut2);
            }
            else
            {
                half2 = len2 / 2;
                cut2  = std::next(middle, half2);
                cut1  = std::upper_bound(first, middle, *cut2, less);
                half1 = std::distance(first, cut1);
            }

            It newMiddle = std::rotate(cut1, middle, cut2);
            MergeWithoutBuffer(first, cut1, newMiddle, half1, half2, less);
            MergeWithoutBuffer(newMiddle, cut2, last, len1 - half1, len2 - half2, less);
        }

        template<class It, class Less>
        void MergeSort(It first, It last, std::ptrdiff_t length, const Less& less)
        {
            if (length <= kInsertionSortCutoff)
            {
                InsertionSort(first, last, less);
                return;
            }
            const std::ptrdiff_t half   = length / 2;
            It                   middle = std::next(first, half);
            MergeSort(first, middle, half, less);
            MergeSort(middle, last, length - half, less);
            if (!less(*middle, *std::prev(middle)))
                return;
            MergeWithoutBuffer(first, middle, last, half, length - half, less);
        }
    }// namespace detail

    /// @brief Stable, in-place, allocation-free sort of [first, last).
    template<std::random_access_iterator It, class Compare>
    void StableSort(It first, It last, Compare compare)
    {
        const detail::LessAdapter<Compare> less(compare);
        detail::MergeSort(first, last, std::distance(first, last), less);
    }

    template<std::random_access_iterator It>
    void StableSort(It first, It last)
    {
        StableSort(first, last, std::compare_three_way {});
    }
}// namespace KDS::Algorithms
