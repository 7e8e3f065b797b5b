// main.cpp
#include <iostream>
#include <string>

#include <KDS/KDS.hpp>

using namespace KDS::Containers;

namespace
{
    enum class Stage
    {
        Lex,
        Parse,
        Check,
        Emit,
    };
}// namespace

namespace KDS::Meta
{
    template<>
    struct EnumTraits<Stage>
    {
        static constexpr UIntSize Count = 4;
    };
}// namespace KDS::Meta

namespace
{
    const char* StageName(Stage stage)
    {
        switch (stage)
        {
            case Stage::Lex: return "Lex";
            case Stage::Parse: return "Parse";
            case Stage::Check: return "Check";
            case Stage::Emit: return "Emit";
        }
        return "?";
    }

    // Watch the table double as it fills, and how the probe lengths behave.
    void GrowthDemo()
    {
        std::cout << "-- Growth --\n";
        IntSet        set(TableConfig {4, 0.75f});
        KDS::UIntSize lastCapacity = set.Capacity();
        std::cout << "[Growth] start capacity=" << lastCapacity << " threshold=" << set.Threshold() << "\n";
        for (int i = 1; i <= 5000; ++i)
        {
            set.Add(i * 31);
            if (set.Capacity() != lastCapacity)
            {
                std::cout << "[Growth] size=" << set.Size() << " capacity " << lastCapacity << " -> " << set.Capacity()
                          << " multiplier=0x" << std::hex << set.GetHashMultiplier() << std::dec << "\n";
                lastCapacity = set.Capacity();
            }
        }
        std::cout << "[Growth] " << CollectProbeStatistics(set) << "\n";

        set.RemoveIf([](int key) { return key % 2 == 0; });
        std::cout << "[Growth] after removing evens: " << CollectProbeStatistics(set) << "\n";
        set.Shrink(0);
        std::cout << "[Growth] after shrink: " << CollectProbeStatistics(set) << "\n\n";
    }

    void OrderedDemo()
    {
        std::cout << "-- Ordered map --\n";
        OrderedHashMap<std::string, int> scores;
        scores.Insert("carol", 72);
        scores.Insert("alice", 90);
        scores.Insert("bob", 72);
        scores.PutAt(0, "dave", 85);
        scores.Alter("carol", "caroline");

        auto print = [&scores](const char* label) {
            std::cout << "[Ordered] " << label << ":";
            for (auto entry: scores)
                std::cout << " " << entry.key << "=" << entry.value;
            std::cout << "\n";
        };
        print("insertion order");
        scores.SortByValue();
        print("by score");
        scores.Sort();
        print("by name");
        std::cout << "\n";
    }

    void EnumDemo()
    {
        std::cout << "-- Enum map --\n";
        EnumMap<Stage, double> timings;
        timings.Insert(Stage::Emit, 0.4);
        timings.Insert(Stage::Lex, 1.25);
        timings.GetAndIncrement(Stage::Check, 0.0, 2.5);
        for (auto entry: timings)
            std::cout << "[Enum] " << StageName(entry.key) << " " << entry.value << "ms\n";

        EnumSet<Stage> pending;
        pending.Add(Stage::Parse);
        pending.Complement();
        std::cout << "[Enum] complement of {Parse} has " << pending.Size() << " stages\n\n";
    }

    void KeyPolicyDemo()
    {
        std::cout << "-- Key policies --\n";
        DoubleSet doubles;
        doubles.Add(0.0);
        doubles.Add(-0.0);
        std::cout << "[Keys] +0.0 and -0.0 stored separately: size=" << doubles.Size() << "\n";

        CaseInsensitiveMap<std::string> headers;
        headers.Insert("Content-Type", "text/plain");
        std::cout << "[Keys] content-type -> " << headers.Get("content-type") << "\n\n";
    }
}// namespace

int main()
{
    try
    {
        GrowthDemo();
        OrderedDemo();
        EnumDemo();
        KeyPolicyDemo();

        std::cout << "-- Errors --\n";
        EnumSet<Stage> stages;
        stages.Add(static_cast<Stage>(9));
    }
    catch (const KDS::Exceptions::Exception& e)
    {
        std::cerr << "[Sandbox] " << e.GetMessage() << "\n";
    }
    catch (const std::exception& e)
    {
        std::cerr << "[Sandbox] unexpected: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
