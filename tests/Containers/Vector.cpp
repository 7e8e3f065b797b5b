/// @file VectorTest.cpp
/// @brief Tests for KDS::Containers::Vector using Catch2.

#include <KDS/Containers/Vector.hpp>
#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <stdexcept>
#include <string>

using KDS::Containers::Vector;

namespace
{
    // Counts live instances so leaks and double destruction show up.
    struct Tracked
    {
        static inline int live = 0;

        int value;

        explicit Tracked(int v = 0) : value(v) { ++live; }
        Tracked(const Tracked& other) : value(other.value) { ++live; }
        Tracked(Tracked&& other) noexcept : value(other.value) { ++live; }
        Tracked& operator=(const Tracked&) = default;
        Tracked& operator=(Tracked&&) noexcept = default;
        ~Tracked() { --live; }
    };
}// namespace

TEST_CASE("Vector default construction", "[Containers][Vector]")
{
    Vector<int> vec;
    CHECK(vec.Size() == 0U);
    CHECK(vec.Capacity() == 0U);
    CHECK(vec.IsEmpty());
    CHECK(vec.begin() == vec.end());
}

TEST_CASE("Vector reserves capacity at construction", "[Containers][Vector]")
{
    Vector<int> vec(10);
    CHECK(vec.Size() == 0U);
    CHECK(vec.Capacity() >= 10U);

    Vector<int> listed {1, 2, 3};
    CHECK(listed.Size() == 3U);
    CHECK(listed[2] == 3);
}

TEST_CASE("Vector push back grows", "[Containers][Vector]")
{
    Vector<int> vec(2);
    for (int i = 0; i < 100; ++i)
        vec.PushBack(i);
    REQUIRE(vec.Size() == 100U);
    CHECK(vec.Capacity() >= 100U);
    CHECK(vec[0] == 0);
    CHECK(vec[99] == 99);
}

TEST_CASE("Vector insert at index", "[Containers][Vector]")
{
    Vector<std::string> vec;
    vec.PushBack("a");
    vec.PushBack("b");
    vec.PushBack("d");
    vec.PushAt(2, "c");
    vec.EmplaceAt(0, "_");
    vec.PushAt(vec.Size(), "e");
    REQUIRE(vec.Size() == 6U);
    CHECK(vec[0] == "_");
    CHECK(vec[3] == "c");
    CHECK(vec[5] == "e");
    CHECK_THROWS_AS(vec.PushAt(9, "x"), std::out_of_range);
}

TEST_CASE("Vector insert of an aliased element", "[Containers][Vector]")
{
    Vector<std::string> vec;
    vec.PushBack("first");
    vec.PushBack("second");
    vec.PushAt(0, vec[1]);
    CHECK(vec[0] == "second");
    CHECK(vec[2] == "second");
}

TEST_CASE("Vector EmplaceBack returns the new element", "[Containers][Vector]")
{
    Vector<std::string> vec;
    auto&               ref = vec.EmplaceBack(3, 'x');
    CHECK(ref == "xxx");
    ref += "y";
    CHECK(vec[0] == "xxxy");
}

TEST_CASE("Vector pop back", "[Containers][Vector]")
{
    Vector<int> vec {10, 20, 30};
    vec.PopBack();
    CHECK(vec.Size() == 2U);
    CHECK(vec[1] == 20);
    vec.PopBack();
    vec.PopBack();
    CHECK_THROWS_AS(vec.PopBack(), std::out_of_range);
}

TEST_CASE("Vector removal preserves or swaps order", "[Containers][Vector]")
{
    SECTION("Erase")
    {
        Vector<int> vec {5, 10, 15, 20};
        vec.Erase(1);
        CHECK(vec.Size() == 3U);
        CHECK(vec[1] == 15);
        CHECK(vec[2] == 20);
        CHECK_THROWS_AS(vec.Erase(5), std::out_of_range);
    }

    SECTION("SwapRemove")
    {
        Vector<int> vec {5, 10, 15, 20};
        vec.SwapRemove(0);
        CHECK(vec.Size() == 3U);
        CHECK(vec[0] == 20);
        vec.SwapRemove(2);
        CHECK(vec.Size() == 2U);
        CHECK(vec[1] == 10);
        CHECK_THROWS_AS(vec.SwapRemove(2), std::out_of_range);
    }

    SECTION("RemoveRange")
    {
        Vector<int> vec {0, 1, 2, 3, 4, 5};
        vec.RemoveRange(1, 4);
        REQUIRE(vec.Size() == 3U);
        CHECK(vec[0] == 0);
        CHECK(vec[1] == 4);
        CHECK(vec[2] == 5);
        vec.RemoveRange(1, 1);
        CHECK(vec.Size() == 3U);
        CHECK_THROWS_AS(vec.RemoveRange(2, 1), std::out_of_range);
        CHECK_THROWS_AS(vec.RemoveRange(0, 4), std::out_of_range);
    }
}

TEST_CASE("Vector lookup", "[Containers][Vector]")
{
    Vector<std::string> vec;
    vec.PushBack("x");
    vec.PushBack("y");
    CHECK(vec.IndexOf(std::string("y")) == 1);
    CHECK(vec.IndexOf(std::string("z")) == -1);
    CHECK(vec.At(0) == "x");
    CHECK_THROWS_AS(vec.At(2), std::out_of_range);

    const auto& constVec = vec;
    CHECK(constVec.At(1) == "y");
    CHECK_THROWS_AS(constVec.At(7), std::out_of_range);
}

TEST_CASE("Vector capacity management", "[Containers][Vector]")
{
    Vector<int> vec;
    vec.Reserve(64);
    CHECK(vec.Capacity() == 64U);
    vec.Reserve(8);
    CHECK(vec.Capacity() == 64U);

    vec.PushBack(1);
    vec.PushBack(2);
    vec.ShrinkToFit();
    CHECK(vec.Capacity() == 2U);
    CHECK(vec[1] == 2);

    vec.Clear();
    CHECK(vec.Size() == 0U);
    CHECK(vec.Capacity() == 2U);
    vec.ShrinkToFit();
    CHECK(vec.Capacity() == 0U);
    CHECK(vec.data() == nullptr);
}

TEST_CASE("Vector copy semantics", "[Containers][Vector]")
{
    Vector<int> original {7, 8};
    Vector<int> copy(original);
    CHECK(copy.Size() == original.Size());
    CHECK(copy[0] == 7);
    copy[0] = 70;
    CHECK(original[0] == 7);

    Vector<int> assigned {1, 2, 3, 4};
    assigned = original;
    CHECK(assigned.Size() == 2U);
    CHECK(assigned[1] == 8);
}

TEST_CASE("Vector move semantics", "[Containers][Vector]")
{
    Vector<std::unique_ptr<int>> source;
    source.PushBack(std::make_unique<int>(42));
    Vector<std::unique_ptr<int>> moved(std::move(source));
    CHECK(moved.Size() == 1U);
    CHECK(*moved[0] == 42);
    CHECK(source.Size() == 0U);

    Vector<std::unique_ptr<int>> target;
    target = std::move(moved);
    CHECK(target.Size() == 1U);
    CHECK(*target[0] == 42);
}

TEST_CASE("Vector destroys every element it constructs", "[Containers][Vector]")
{
    Tracked::live = 0;
    {
        Vector<Tracked> vec;
        for (int i = 0; i < 20; ++i)
            vec.EmplaceBack(i);
        vec.PushAt(3, Tracked(-1));
        vec.Erase(0);
        vec.SwapRemove(4);
        vec.RemoveRange(2, 6);
        CHECK(Tracked::live == static_cast<int>(vec.Size()));

        Vector<Tracked> copy(vec);
        CHECK(Tracked::live == static_cast<int>(2 * vec.Size()));
        vec.ShrinkToFit();
        CHECK(Tracked::live == static_cast<int>(2 * vec.Size()));
    }
    CHECK(Tracked::live == 0);
}
