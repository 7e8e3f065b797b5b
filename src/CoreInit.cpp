#include <KDS/Defines.hpp>
#include <KDS/KDS.hpp>

namespace KDS::detail
{
    // Linker anchor: keeps the umbrella header compiling as part of the library build.
    KDS_LOCAL void CoreLinkAnchor() noexcept {}
}// namespace KDS::detail
