/// @file HashSetTest.cpp
/// @brief Tests for KDS::Containers::HashSet using Catch2.

#include <KDS/Containers/HashSet.hpp>
#include <KDS/Exceptions/EmptyContainerException.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <vector>

using KDS::Containers::HashSet;
using KDS::Containers::TableConfig;

TEST_CASE("HashSet default construction", "[Containers][HashSet]")
{
    HashSet<std::string> set;
    CHECK(set.Size() == 0U);
    CHECK(set.IsEmpty());
    CHECK(set.Capacity() >= 16U);
}

TEST_CASE("HashSet add and contains", "[Containers][HashSet]")
{
    HashSet<std::string> set;
    CHECK(set.Add("red"));
    CHECK(set.Add("green"));
    CHECK_FALSE(set.Add("red"));
    CHECK(set.Size() == 2U);
    CHECK(set.Contains("red"));
    CHECK(set.Contains("green"));
    CHECK_FALSE(set.Contains("blue"));
}

TEST_CASE("HashSet remove", "[Containers][HashSet]")
{
    HashSet<int> set;
    set.Add(1);
    set.Add(2);
    CHECK(set.Remove(1));
    CHECK_FALSE(set.Remove(1));
    CHECK(set.Size() == 1U);
    CHECK_FALSE(set.Contains(1));
    CHECK(set.Contains(2));
}

TEST_CASE("HashSet bulk operations", "[Containers][HashSet]")
{
    HashSet<int> set;
    CHECK(set.AddAll({1, 2, 3, 2}) == 3U);

    const std::vector<int> more {3, 4, 5};
    CHECK(set.AddAll(more) == 2U);
    CHECK(set.Size() == 5U);

    CHECK(set.ContainsAll(std::vector<int> {1, 4, 5}));
    CHECK_FALSE(set.ContainsAll(std::vector<int> {1, 9}));
    CHECK(set.ContainsAny(std::vector<int> {9, 8, 2}));
    CHECK_FALSE(set.ContainsAny(std::vector<int> {9, 8}));

    CHECK(set.RemoveAll(std::vector<int> {1, 2, 42}) == 2U);
    CHECK(set.Size() == 3U);
}

TEST_CASE("HashSet iteration", "[Containers][HashSet]")
{
    HashSet<std::string> set;
    set.AddAll({"a", "b", "c"});

    std::vector<std::string> keys(set.begin(), set.end());
    std::sort(keys.begin(), keys.end());
    CHECK(keys == std::vector<std::string> {"a", "b", "c"});

    std::size_t count = 0;
    for (const auto& key: set)
    {
        CHECK(set.Contains(key));
        ++count;
    }
    CHECK(count == 3U);
}

TEST_CASE("HashSet with a tuned configuration", "[Containers][HashSet]")
{
    HashSet<int> set(TableConfig {4, 0.5f});
    CHECK(set.Capacity() == 4U);
    set.AddAll({10, 20, 30, 40, 50});
    CHECK(set.Capacity() == 16U);
    CHECK(set.GetLoadFactor() == 0.5f);
}

TEST_CASE("HashSet equality and copies", "[Containers][HashSet]")
{
    HashSet<std::string> a;
    a.AddAll({"x", "y", "z"});
    HashSet<std::string> b;
    b.AddAll({"z", "y", "x"});
    CHECK(a == b);

    HashSet<std::string> c = a;
    c.Remove("x");
    CHECK_FALSE(a == c);
    CHECK(a.Contains("x"));
}

TEST_CASE("HashSet First", "[Containers][HashSet]")
{
    HashSet<int> set;
    CHECK_THROWS_AS(set.First(), KDS::Exceptions::EmptyContainerException);
    set.Add(5);
    CHECK(set.First() == 5);
}
