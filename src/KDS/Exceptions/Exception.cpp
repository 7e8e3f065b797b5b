#include <KDS/Exceptions/ArgumentException.hpp>
#include <KDS/Exceptions/EmptyContainerException.hpp>
#include <KDS/Exceptions/Exception.hpp>
#include <KDS/Exceptions/KeyDomainException.hpp>

namespace KDS::Exceptions
{
    Exception::~Exception() noexcept                               = default;
    ArgumentException::~ArgumentException() noexcept               = default;
    EmptyContainerException::~EmptyContainerException() noexcept   = default;
    KeyDomainException::~KeyDomainException() noexcept             = default;
}// namespace KDS::Exceptions
