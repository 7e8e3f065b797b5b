/// @file EnumSetTest.cpp
/// @brief Tests for KDS::Containers::EnumSet and EnumOrderedSet using Catch2.

#include <KDS/Containers/EnumSet.hpp>
#include <KDS/Exceptions/EmptyContainerException.hpp>
#include <KDS/Exceptions/KeyDomainException.hpp>
#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstdint>
#include <vector>

using KDS::Containers::EnumOrderedSet;
using KDS::Containers::EnumSet;
using KDS::Exceptions::KeyDomainException;

namespace
{
    enum class Color : std::uint8_t
    {
        Red,
        Green,
        Blue,
    };

    enum class Flag : int
    {
        Negative = -1,
        A        = 0,
        B        = 1,
        C        = 2,
        Unused   = 10,
    };

    constexpr std::array<Flag, 3> kFlags {Flag::A, Flag::B, Flag::C};

    enum class Wide : std::uint16_t
    {
    };

    std::array<Wide, 70> MakeWideUniverse()
    {
        std::array<Wide, 70> out {};
        for (std::uint16_t i = 0; i < out.size(); ++i)
            out[i] = static_cast<Wide>(i);
        return out;
    }

    template<class Set>
    std::vector<typename Set::KeyType> InOrder(const Set& set)
    {
        return std::vector<typename Set::KeyType>(set.begin(), set.end());
    }
}// namespace

namespace KDS::Meta
{
    template<>
    struct EnumTraits<Color>
    {
        static constexpr UIntSize Count = 3;
    };
}// namespace KDS::Meta

TEST_CASE("EnumSet default universe from EnumTraits", "[Containers][EnumSet]")
{
    EnumSet<Color> set;
    CHECK(set.Capacity() == 3U);
    CHECK(set.Universe().size() == 3U);
    CHECK(set.IsEmpty());

    CHECK(set.Add(Color::Blue));
    CHECK(set.Add(Color::Red));
    CHECK_FALSE(set.Add(Color::Blue));
    CHECK(set.Size() == 2U);
    CHECK(InOrder(set) == std::vector<Color> {Color::Red, Color::Blue});
}

TEST_CASE("EnumSet bound to an explicit universe", "[Containers][EnumSet]")
{
    EnumSet<Flag> set(kFlags);
    CHECK(set.Capacity() == 3U);
    set.AddAll({Flag::C, Flag::A});
    CHECK(set.Contains(Flag::A));
    CHECK_FALSE(set.Contains(Flag::B));
    CHECK(set.First() == Flag::A);
}

TEST_CASE("EnumSet rejects keys outside its universe", "[Containers][EnumSet]")
{
    EnumSet<Flag> set(kFlags);
    CHECK_THROWS_AS(set.Add(Flag::Unused), KeyDomainException);
    CHECK_THROWS_AS(set.Add(Flag::Negative), KeyDomainException);
    CHECK_FALSE(set.Contains(Flag::Unused));
    CHECK_FALSE(set.Contains(Flag::Negative));
    CHECK_FALSE(set.Remove(Flag::Unused));
    CHECK(set.IsEmpty());
}

TEST_CASE("EnumSet without traits has an empty universe", "[Containers][EnumSet]")
{
    EnumSet<Flag> set;
    CHECK(set.Capacity() == 0U);
    CHECK(set.Begin() == set.End());
    CHECK_FALSE(set.Contains(Flag::A));
    CHECK_THROWS_AS(set.Add(Flag::A), KeyDomainException);
}

TEST_CASE("EnumSet FillUniverse and Complement", "[Containers][EnumSet]")
{
    EnumSet<Color> set;
    set.FillUniverse();
    CHECK(set.Size() == 3U);

    set.Remove(Color::Green);
    set.Complement();
    CHECK(set.Size() == 1U);
    CHECK(InOrder(set) == std::vector<Color> {Color::Green});
}

TEST_CASE("EnumSet AllOf and NoneOf factories", "[Containers][EnumSet]")
{
    const auto all = KDS::Containers::AllOf<Flag>(kFlags);
    CHECK(all.Size() == 3U);
    CHECK(InOrder(all) == std::vector<Flag> {Flag::A, Flag::B, Flag::C});

    auto none = KDS::Containers::NoneOf<Flag>(kFlags);
    CHECK(none.IsEmpty());
    none.Add(Flag::C);
    CHECK(none.Contains(Flag::C));
    CHECK_THROWS_AS(none.Add(Flag::Unused), KeyDomainException);
}

TEST_CASE("EnumSet spans several bitset words", "[Containers][EnumSet]")
{
    const auto    universe = MakeWideUniverse();
    EnumSet<Wide> set(universe);
    set.Add(static_cast<Wide>(3));
    set.Add(static_cast<Wide>(64));
    set.Add(static_cast<Wide>(69));
    CHECK(set.NextOrdinal(4) == 64);
    CHECK(set.NextOrdinal(65) == 69);
    CHECK(set.NextOrdinal(70) == -1);

    set.Complement();
    CHECK(set.Size() == 67U);
    CHECK_FALSE(set.Contains(static_cast<Wide>(3)));
    CHECK(set.Contains(static_cast<Wide>(68)));
    CHECK_FALSE(set.Contains(static_cast<Wide>(70)));

    std::size_t visited = 0;
    for (Wide key: set)
    {
        CHECK(static_cast<int>(key) < 70);
        ++visited;
    }
    CHECK(visited == 67U);
}

TEST_CASE("EnumSet erase during iteration and truncate", "[Containers][EnumSet]")
{
    EnumSet<Color> set;
    set.FillUniverse();
    for (auto it = set.Begin(); it != set.End();)
    {
        if (*it == Color::Green)
            it = set.Erase(it);
        else
            ++it;
    }
    CHECK(InOrder(set) == std::vector<Color> {Color::Red, Color::Blue});

    set.Truncate(1);
    CHECK(InOrder(set) == std::vector<Color> {Color::Red});
}

TEST_CASE("EnumSet ClearToUniverse rebinds", "[Containers][EnumSet]")
{
    constexpr std::array<Flag, 2> small {Flag::A, Flag::B};

    EnumSet<Flag> set(kFlags);
    set.Add(Flag::C);
    set.ClearToUniverse(small);
    CHECK(set.IsEmpty());
    CHECK(set.Capacity() == 2U);
    CHECK_THROWS_AS(set.Add(Flag::C), KeyDomainException);
    CHECK(set.Add(Flag::B));
}

TEST_CASE("EnumSet First, copies and moves", "[Containers][EnumSet]")
{
    EnumSet<Color> set;
    CHECK_THROWS_AS(set.First(), KDS::Exceptions::EmptyContainerException);
    set.Add(Color::Green);

    EnumSet<Color> copy = set;
    CHECK(copy == set);
    copy.Add(Color::Red);
    CHECK_FALSE(copy == set);

    EnumSet<Color> moved(std::move(copy));
    CHECK(moved.Size() == 2U);
    CHECK(copy.IsEmpty());
    CHECK_FALSE(copy.Contains(Color::Red));
}

TEST_CASE("EnumOrderedSet keeps insertion order", "[Containers][EnumSet]")
{
    EnumOrderedSet<Color> set;
    set.AddAll({Color::Blue, Color::Red, Color::Green});
    CHECK(InOrder(set) == std::vector<Color> {Color::Blue, Color::Red, Color::Green});

    CHECK_FALSE(set.Add(0, Color::Green));
    CHECK(InOrder(set) == std::vector<Color> {Color::Green, Color::Blue, Color::Red});

    set.Sort();
    CHECK(InOrder(set) == std::vector<Color> {Color::Red, Color::Green, Color::Blue});
    CHECK(set.Universe().size() == 3U);
}

TEST_CASE("EnumOrderedSet alter to a foreign key throws", "[Containers][EnumSet]")
{
    EnumOrderedSet<Flag> set(kFlags);
    set.Add(Flag::A);
    CHECK_THROWS_AS(set.Alter(Flag::A, Flag::Unused), KeyDomainException);
    CHECK_THROWS_AS(set.AlterAt(0, Flag::Unused), KeyDomainException);
    CHECK(InOrder(set) == std::vector<Flag> {Flag::A});

    CHECK(set.AlterAt(0, Flag::C));
    CHECK(set.Contains(Flag::C));
    CHECK_FALSE(set.Contains(Flag::A));

    set.ClearToUniverse(kFlags);
    CHECK(set.IsEmpty());
}
