/// @file ContainerAllocationTests.cpp
/// @brief Allocation behaviour of KDS containers observed through a counting allocator.

#include <KDS/Containers/EnumMap.hpp>
#include <KDS/Containers/EnumSet.hpp>
#include <KDS/Containers/HashMap.hpp>
#include <KDS/Containers/OrderedHashSet.hpp>
#include <KDS/Memory/SystemAllocator.hpp>
#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstddef>
#include <string>

namespace
{
    struct AllocationStats
    {
        std::size_t allocations {0};
        std::size_t deallocations {0};
        std::size_t currentBytes {0};
    };

    // Forwards to SystemAllocator and records traffic in a shared stats block.
    class CountingAllocator
    {
    public:
        CountingAllocator() = default;
        explicit CountingAllocator(AllocationStats* stats) noexcept : m_stats(stats) {}

        void* Allocate(std::size_t size, std::size_t alignment) noexcept
        {
            void* p = m_backend.Allocate(size, alignment);
            if (p && m_stats)
            {
                ++m_stats->allocations;
                m_stats->currentBytes += size;
            }
            return p;
        }

        void Deallocate(void* ptr, std::size_t size, std::size_t alignment) noexcept
        {
            if (ptr && m_stats)
            {
                ++m_stats->deallocations;
                m_stats->currentBytes -= size;
            }
            m_backend.Deallocate(ptr, size, alignment);
        }

        friend bool operator==(const CountingAllocator& a, const CountingAllocator& b) noexcept
        {
            return a.m_stats == b.m_stats;
        }

    private:
        KDS::Memory::SystemAllocator m_backend {};
        AllocationStats*             m_stats {nullptr};
    };

    static_assert(KDS::Memory::AllocatorConcept<CountingAllocator>);

    using CountingMap = KDS::Containers::HashMap<std::string,
                                                 int,
                                                 KDS::Containers::Hashing::ObjectKeyPolicy<std::string>,
                                                 CountingAllocator>;

    using CountingOrderedSet = KDS::Containers::OrderedHashSet<int,
                                                               KDS::Containers::Hashing::BitKeyPolicy<int>,
                                                               CountingAllocator>;

    enum class Slot
    {
        Head,
        Chest,
        Legs,
    };

    constexpr std::array<Slot, 3> kSlots {Slot::Head, Slot::Chest, Slot::Legs};
}// namespace

TEST_CASE("Hash map releases all storage", "[Memory][ContainerAllocation]")
{
    AllocationStats stats;
    {
        CountingMap map(KDS::Containers::TableConfig {}, {}, CountingAllocator {&stats});
        for (int i = 0; i < 500; ++i)
            map.Insert("key" + std::to_string(i), i);
        for (int i = 0; i < 500; i += 2)
            map.Remove("key" + std::to_string(i));
        CHECK(stats.currentBytes > 0U);

        CountingMap copy(map);
        CHECK(copy.Size() == 250U);
    }
    CHECK(stats.currentBytes == 0U);
    CHECK(stats.allocations == stats.deallocations);
}

TEST_CASE("Lookups and iteration never allocate", "[Memory][ContainerAllocation]")
{
    AllocationStats stats;
    CountingMap     map(KDS::Containers::TableConfig {}, {}, CountingAllocator {&stats});
    for (int i = 0; i < 100; ++i)
        map.Insert("key" + std::to_string(i), i);

    const std::string present = "key42";
    const std::string absent  = "nope";
    const auto        before  = stats.allocations;

    CHECK(map.Contains(present));
    CHECK_FALSE(map.Contains(absent));
    CHECK(map.Get(present) == 42);
    CHECK(map.Find(absent) == nullptr);
    CHECK(map.Locate(absent) < 0);
    int sum = 0;
    for (auto entry: map)
        sum += entry.value;
    CHECK(sum == 4950);
    CHECK(map.Remove(absent) == false);

    CHECK(stats.allocations == before);
}

TEST_CASE("Ordered set releases all storage", "[Memory][ContainerAllocation]")
{
    AllocationStats stats;
    {
        CountingOrderedSet set(KDS::Containers::TableConfig {}, KDS::Containers::Hashing::BitKeyPolicy<int> {},
                               CountingAllocator {&stats});
        for (int i = 0; i < 300; ++i)
            set.Add(i);
        set.Sort([](int a, int b) { return a > b; });
        set.Shrink(0);
        CHECK(set.KeyAt(0) == 299);
    }
    CHECK(stats.currentBytes == 0U);
}

TEST_CASE("Ordered set order list uses the supplied allocator", "[Memory][ContainerAllocation]")
{
    AllocationStats stats;
    // Large enough that the table itself never grows during the loop.
    CountingOrderedSet set(KDS::Containers::TableConfig {std::size_t {1} << 15, 0.7f},
                           KDS::Containers::Hashing::BitKeyPolicy<int> {}, CountingAllocator {&stats});
    const auto afterTable = stats.allocations;

    set.Add(1);
    CHECK(stats.allocations == afterTable + 1);
    CHECK(set.Order().GetAllocator() == set.Table().GetAllocator());
}

TEST_CASE("Ordered set appends grow the order list geometrically", "[Memory][ContainerAllocation]")
{
    AllocationStats stats;
    CountingOrderedSet set(KDS::Containers::TableConfig {std::size_t {1} << 15, 0.7f},
                           KDS::Containers::Hashing::BitKeyPolicy<int> {}, CountingAllocator {&stats});
    const auto afterTable = stats.allocations;

    for (int i = 1; i <= 10000; ++i)
        set.Add(i);
    REQUIRE(set.Size() == 10000U);
    const auto appendAllocations = stats.allocations - afterTable;
    CHECK(appendAllocations >= 1U);
    CHECK(appendAllocations <= 20U);

    const auto afterAppends = stats.allocations;
    for (int i = 0; i < 1000; ++i)
        set.Add(0, -i - 1);
    CHECK(stats.allocations - afterAppends <= 2U);
    CHECK(set.KeyAt(0) == -1000);
}

TEST_CASE("Enum ordered set keeps its order list in the supplied allocator", "[Memory][ContainerAllocation]")
{
    AllocationStats stats;
    {
        KDS::Containers::EnumOrderedSet<Slot, CountingAllocator> worn(kSlots, CountingAllocator {&stats});
        const auto afterBind = stats.allocations;
        worn.Add(Slot::Legs);
        worn.Add(Slot::Head);
        CHECK(stats.allocations == afterBind + 1);
    }
    CHECK(stats.currentBytes == 0U);
    CHECK(stats.allocations == stats.deallocations);
}

TEST_CASE("Enum map allocates once per binding", "[Memory][ContainerAllocation]")
{
    AllocationStats stats;
    {
        KDS::Containers::EnumMap<Slot, std::string, CountingAllocator> gear(kSlots, CountingAllocator {&stats});
        const auto afterBind = stats.allocations;
        gear.Insert(Slot::Head, "helm");
        gear.Insert(Slot::Legs, "greaves");
        gear.Remove(Slot::Head);
        CHECK(stats.allocations == afterBind);
    }
    CHECK(stats.currentBytes == 0U);
}
