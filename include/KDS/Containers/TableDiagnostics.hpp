/// @file TableDiagnostics.hpp
/// @brief Probe-length and cluster statistics for open-addressing tables.
///
/// Works on anything exposing `Capacity()`, `Size()`, `IsSlotOccupied(i)` and
/// `IdealSlotAt(i)`. The walk is a single pass over the slot array; nothing is
/// allocated and the table is not modified.
#pragma once

#include <KDS/Primitives.hpp>

#include <algorithm>
#include <concepts>
#include <ostream>

namespace KDS::Containers
{
    struct ProbeStatistics
    {
        UIntSize size {0};
        UIntSize capacity {0};
        UIntSize clusterCount {0};
        UIntSize longestCluster {0};
        /// Slots examined to reach the worst-placed key (1 = found at its ideal slot).
        UIntSize maxProbeLength {0};
        F64      averageProbeLength {0.0};
        /// Every slotted key is reachable from its ideal slot without crossing an empty slot.
        bool probeInvariantHolds {true};
    };

    template<class Table>
    concept InspectableTable = requires(const Table& table, UIntSize slot) {
        { table.Capacity() } -> std::convertible_to<UIntSize>;
        { table.Size() } -> std::convertible_to<UIntSize>;
        { table.IsSlotOccupied(slot) } -> std::convertible_to<bool>;
        { table.IdealSlotAt(slot) } -> std::convertible_to<UIntSize>;
    };

    template<InspectableTable Table>
    [[nodiscard]] ProbeStatistics CollectProbeStatistics(const Table& table)
    {
        ProbeStatistics stats;
        stats.size     = table.Size();
        stats.capacity = table.Capacity();
        if (stats.capacity == 0)
            return stats;

        const UIntSize mask = stats.capacity - 1;

        UIntSize start = 0;
        while (start < stats.capacity && table.IsSlotOccupied(start))
            ++start;
        if (start == stats.capacity)
        {
            // A full table has no cluster boundary; the load threshold forbids this state.
            stats.probeInvariantHolds = false;
            return stats;
        }

        UIntSize run          = 0;
        UIntSize slotted      = 0;
        UIntSize totalProbing = 0;
        for (UIntSize step = 1; step <= stats.capacity; ++step)
        {
            const UIntSize slot = (start + step) & mask;
            if (!table.IsSlotOccupied(slot))
            {
                run = 0;
                continue;
            }
            if (run == 0)
                ++stats.clusterCount;
            ++run;
            stats.longestCluster = (std::max)(stats.longestCluster, run);

            // Slots [slot - run + 1, slot] are occupied and the one before them is empty.
            const UIntSize displacement = (slot - table.IdealSlotAt(slot)) & mask;
            if (displacement >= run)
                stats.probeInvariantHolds = false;

            ++slotted;
            totalProbing += displacement + 1;
            stats.maxProbeLength = (std::max)(stats.maxProbeLength, displacement + 1);
        }
        if (slotted)
            stats.averageProbeLength = static_cast<F64>(totalProbing) / static_cast<F64>(slotted);
        return stats;
    }

    template<InspectableTable Table>
    [[nodiscard]] bool VerifyProbeInvariant(const Table& table)
    {
        return CollectProbeStatistics(table).probeInvariantHolds;
    }

    inline std::ostream& operator<<(std::ostream& os, const ProbeStatistics& stats)
    {
        return os << "size=" << stats.size << " capacity=" << stats.capacity << " clusters=" << stats.clusterCount
                  << " longestCluster=" << stats.longestCluster << " maxProbe=" << stats.maxProbeLength
                  << " avgProbe=" << stats.averageProbeLength
                  << " invariant=" << (stats.probeInvariantHolds ? "ok" : "BROKEN");
    }
}// namespace KDS::Containers
