/// @file StableSortTest.cpp
/// @brief Tests for KDS::Algorithms::StableSort using Catch2.

#include <KDS/Algorithms/StableSort.hpp>
#include <KDS/Containers/Vector.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <functional>
#include <random>
#include <string>
#include <utility>
#include <vector>

using KDS::Algorithms::StableSort;

namespace
{
    struct Tagged
    {
        int key;
        int sequence;

        bool operator==(const Tagged&) const = default;
    };

    bool KeyLess(const Tagged& a, const Tagged& b) { return a.key < b.key; }
}// namespace

TEST_CASE("StableSort handles trivial ranges", "[Algorithms][StableSort]")
{
    std::vector<int> empty;
    StableSort(empty.begin(), empty.end());
    CHECK(empty.empty());

    std::vector<int> one {42};
    StableSort(one.begin(), one.end());
    CHECK(one == std::vector<int> {42});

    std::vector<int> two {2, 1};
    StableSort(two.begin(), two.end());
    CHECK(two == std::vector<int> {1, 2});
}

TEST_CASE("StableSort natural ordering", "[Algorithms][StableSort]")
{
    std::vector<std::string> words {"pear", "apple", "fig", "banana", "cherry"};
    StableSort(words.begin(), words.end());
    CHECK(words == std::vector<std::string> {"apple", "banana", "cherry", "fig", "pear"});
}

TEST_CASE("StableSort accepts bool and three-way comparators", "[Algorithms][StableSort]")
{
    std::vector<int> values {3, 1, 4, 1, 5, 9, 2, 6, 5, 3, 5, 8, 9, 7, 9};

    auto descending = values;
    StableSort(descending.begin(), descending.end(), std::greater<> {});
    CHECK(std::is_sorted(descending.begin(), descending.end(), std::greater<> {}));

    auto ascending = values;
    StableSort(ascending.begin(), ascending.end(), [](int a, int b) { return a <=> b; });
    CHECK(std::is_sorted(ascending.begin(), ascending.end()));

    auto byInt = values;
    StableSort(byInt.begin(), byInt.end(), [](int a, int b) { return a - b; });
    CHECK(byInt == ascending);
}

TEST_CASE("StableSort keeps equal elements in order", "[Algorithms][StableSort]")
{
    std::mt19937                       rng(1234u);
    std::uniform_int_distribution<int> keyDist(0, 15);

    for (int length: {5, 13, 64, 257, 1000})
    {
        std::vector<Tagged> input;
        for (int i = 0; i < length; ++i)
            input.push_back({keyDist(rng), i});

        auto expected = input;
        std::stable_sort(expected.begin(), expected.end(), KeyLess);

        auto actual = input;
        StableSort(actual.begin(), actual.end(), KeyLess);
        CHECK(actual == expected);
    }
}

TEST_CASE("StableSort on presorted and reversed input", "[Algorithms][StableSort]")
{
    std::vector<int> sorted(500);
    for (int i = 0; i < 500; ++i)
        sorted[static_cast<std::size_t>(i)] = i;

    auto copy = sorted;
    StableSort(copy.begin(), copy.end());
    CHECK(copy == sorted);

    std::vector<int> reversed(sorted.rbegin(), sorted.rend());
    StableSort(reversed.begin(), reversed.end());
    CHECK(reversed == sorted);
}

TEST_CASE("StableSort over a KDS Vector", "[Algorithms][StableSort]")
{
    KDS::Containers::Vector<std::pair<std::string, int>> entries;
    entries.PushBack({"b", 1});
    entries.PushBack({"a", 2});
    entries.PushBack({"b", 0});
    entries.PushBack({"a", 1});

    StableSort(entries.begin(), entries.end(), [](const auto& x, const auto& y) { return x.first < y.first; });
    CHECK(entries[0] == std::pair<std::string, int> {"a", 2});
    CHECK(entries[1] == std::pair<std::string, int> {"a", 1});
    CHECK(entries[2] == std::pair<std::string, int> {"b", 1});
    CHECK(entries[3] == std::pair<std::string, int> {"b", 0});
}
