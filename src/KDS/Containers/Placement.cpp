#include <KDS/Containers/Hashing/Placement.hpp>

#include <array>

namespace KDS::Containers::Hashing
{
    namespace
    {
        // Odd 64-bit multipliers with strong avalanche on the high product bits.
        constexpr std::array<UInt64, 16> kMultipliers {
                0x9E3779B97F4A7C15ull,
                0xD1B54A32D192ED03ull,
                0xF1357AEA2E62A9C5ull,
                0xC13FA9A902A6328Full,
                0x91E10DA5C79E7B1Dull,
                0xDB4F0B9175AE2165ull,
                0xAEF17502108EF2D9ull,
                0xE7037ED1A0B428DBull,
                0xD6E8FEB86659FD93ull,
                0xA0761D6478BD642Full,
                0x8EBC6AF09C88C6E3ull,
                0x9FB21C651E98DF25ull,
                0xBF58476D1CE4E5B9ull,
                0x94D049BB133111EBull,
                0xFF51AFD7ED558CCDull,
                0xC4CEB9FE1A85EC53ull,
        };

        static_assert([] {
            for (const UInt64 m: kMultipliers)
            {
                if ((m & 1u) == 0)
                    return false;
            }
            return true;
        }());
    }// namespace

    UInt64 NextHashMultiplier(UInt64 previous, UInt32 shift) noexcept
    {
        const UIntSize index = static_cast<UIntSize>((shift + (previous >> 58)) & (kMultipliers.size() - 1));
        UInt64         next  = kMultipliers[index];
        if (next == previous)
            next = kMultipliers[(index + 1) & (kMultipliers.size() - 1)];
        return next;
    }
}// namespace KDS::Containers::Hashing
