#pragma once

/// @file KeyDomainException.hpp
/// @brief Declares the KeyDomainException class.

#include <KDS/Exceptions/Exception.hpp>

namespace KDS::Exceptions
{
    /// @class KeyDomainException
    /// @brief Exception thrown when a key cannot be stored because it lies outside the container's key domain.
    ///
    /// @details
    /// Enum-indexed containers only accept members of the universe they are bound to.
    /// Inserting anything else throws; querying or removing it simply reports absence.
    class KDS_API KeyDomainException : public Exception
    {
    public:
        /// @brief Constructor with a C-style string message.
        /// @param message The exception message.
        explicit KeyDomainException(const char* message)
            : Exception(message)
        {
        }

        /// @brief Constructor with a std::string message.
        /// @param message The exception message.
        explicit KeyDomainException(const std::string& message)
            : Exception(message)
        {
        }

        ~KeyDomainException() noexcept override;
    };
}// namespace KDS::Exceptions
