/// @file PlacementTest.cpp
/// @brief Tests for multiplicative placement and the FNV helpers.

#include <KDS/Containers/Hashing/Placement.hpp>
#include <KDS/Hashing/FNV.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <random>
#include <set>

using KDS::Containers::Hashing::kDefaultHashMultiplier;
using KDS::Containers::Hashing::NextHashMultiplier;
using KDS::Containers::Hashing::PlacementState;

TEST_CASE("Placement shift follows the capacity", "[Hashing][Placement]")
{
    CHECK(PlacementState::ShiftFor(2) == 63U);
    CHECK(PlacementState::ShiftFor(16) == 60U);
    CHECK(PlacementState::ShiftFor(std::size_t {1} << 20) == 44U);
}

TEST_CASE("Placement stays inside the slot array", "[Hashing][Placement]")
{
    std::mt19937_64 rng(5u);
    for (std::size_t capacity: {std::size_t {2}, std::size_t {64}, std::size_t {1} << 16})
    {
        const auto placement = PlacementState::ForCapacity(capacity, kDefaultHashMultiplier);
        for (int i = 0; i < 1000; ++i)
            CHECK(placement.Place(rng()) < capacity);
        CHECK(placement.Place(0) == 0U);
    }
}

TEST_CASE("Placement forces an odd multiplier", "[Hashing][Placement]")
{
    const auto placement = PlacementState::ForCapacity(8, 0x1000);
    CHECK(placement.multiplier == 0x1001U);
    CHECK(placement.shift == 61U);
}

TEST_CASE("Placement spreads consecutive keys", "[Hashing][Placement]")
{
    const auto            placement = PlacementState::ForCapacity(64, kDefaultHashMultiplier);
    std::set<std::size_t> slots;
    for (std::uint64_t key = 1; key <= 32; ++key)
        slots.insert(placement.Place(key));
    CHECK(slots.size() == 32U);
}

TEST_CASE("NextHashMultiplier changes the multiplier", "[Hashing][Placement]")
{
    std::uint64_t multiplier = kDefaultHashMultiplier;
    for (std::uint32_t shift = 63; shift >= 40; --shift)
    {
        const auto next = NextHashMultiplier(multiplier, shift);
        CHECK((next & 1u) == 1u);
        CHECK(next != multiplier);
        CHECK(NextHashMultiplier(multiplier, shift) == next);
        multiplier = next;
    }
}

TEST_CASE("FNV-1a hashing", "[Hashing][FNV]")
{
    using namespace KDS::Hashing;
    CHECK(FNV1a64("") == kFNV64Offset);
    CHECK(FNV1a64("a") == 0xAF63DC4C8601EC8CULL);
    CHECK(FNV1a64("abc") != FNV1a64("ABC"));
    CHECK(FNV1a64Folded("ABC") == FNV1a64("abc"));
    CHECK(FNV1a64Folded("MiXeD-Case_1") == FNV1a64Folded("mixed-case_1"));
    static_assert(FoldAsciiCase('Q') == 'q');
    static_assert(FoldAsciiCase('[') == '[');
}
