#pragma once

#include <KDS/Defines.hpp>
#include <KDS/Primitives.hpp>

#include <KDS/Algorithms/StableSort.hpp>

#include <KDS/Containers/EnumMap.hpp>
#include <KDS/Containers/EnumSet.hpp>
#include <KDS/Containers/HashMap.hpp>
#include <KDS/Containers/HashSet.hpp>
#include <KDS/Containers/OrderedHashMap.hpp>
#include <KDS/Containers/OrderedHashSet.hpp>
#include <KDS/Containers/PrimitiveCollections.hpp>
#include <KDS/Containers/TableDiagnostics.hpp>
#include <KDS/Containers/Vector.hpp>

#include <KDS/Exceptions/ArgumentException.hpp>
#include <KDS/Exceptions/EmptyContainerException.hpp>
#include <KDS/Exceptions/KeyDomainException.hpp>

#include <KDS/Meta/EnumTraits.hpp>
