#pragma once

/// @file ArgumentException.hpp
/// @brief Declares the ArgumentException class.

#include <KDS/Exceptions/Exception.hpp>

namespace KDS::Exceptions
{
    /// @class ArgumentException
    /// @brief Exception thrown when a configuration argument is outside its legal range.
    ///
    /// @details
    /// Raised eagerly, for example by a table constructed with a load factor that is
    /// not in `(0, 1]`. The container is left unchanged.
    class KDS_API ArgumentException : public Exception
    {
    public:
        /// @brief Constructor with a C-style string message.
        /// @param message The exception message.
        explicit ArgumentException(const char* message)
            : Exception(message)
        {
        }

        /// @brief Constructor with a std::string message.
        /// @param message The exception message.
        explicit ArgumentException(const std::string& message)
            : Exception(message)
        {
        }

        ~ArgumentException() noexcept override;
    };
}// namespace KDS::Exceptions
