#pragma once

/// @file EmptyContainerException.hpp
/// @brief Declares the EmptyContainerException class.

#include <KDS/Exceptions/Exception.hpp>

namespace KDS::Exceptions
{
    /// @class EmptyContainerException
    /// @brief Exception thrown when an element is requested from a container that holds none.
    ///
    /// @details
    /// `First()` on an empty set or map throws this. It is kept distinct from
    /// `std::out_of_range` so "nothing there at all" can be told apart from "no such key".
    class KDS_API EmptyContainerException : public Exception
    {
    public:
        /// @brief Constructor with a C-style string message.
        /// @param message The exception message.
        explicit EmptyContainerException(const char* message)
            : Exception(message)
        {
        }

        ~EmptyContainerException() noexcept override;
    };
}// namespace KDS::Exceptions
