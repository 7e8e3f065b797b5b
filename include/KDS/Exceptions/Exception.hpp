#pragma once

/// @file Exception.hpp
/// @brief Declares the root of the KDS exception hierarchy.

#include <KDS/Defines.hpp>

#include <stdexcept>
#include <string>

namespace KDS::Exceptions
{
    /// @class Exception
    /// @brief Base class for all exceptions thrown by KDS containers.
    ///
    /// @details
    /// Missing keys and bad positions are reported with `std::out_of_range`, as the
    /// standard containers do. Everything else a KDS container rejects (an invalid
    /// configuration, a key outside its domain, access to an empty container) derives
    /// from this class so callers can catch the library's own failures in one place.
    class KDS_API Exception : public std::runtime_error
    {
    public:
        /// @brief Constructor with a C-style string message.
        explicit Exception(const char* message)
            : std::runtime_error(message)
        {
        }

        /// @brief Constructor with a std::string message.
        explicit Exception(const std::string& message)
            : std::runtime_error(message)
        {
        }

        /// @brief Destructor. Defined out of line so the vtable has a single home.
        ~Exception() noexcept override;

        /// @brief Returns the exception message.
        [[nodiscard]] const char* GetMessage() const noexcept { return this->what(); }
    };
}// namespace KDS::Exceptions
