#pragma once

#include <expected>
#include <string>
#include <stdexcept>

namespace warden
{

    /**
     * Error categories for Warden operations
     */
    enum class ErrorCode
    {
        ConfigError,
        CryptoError,
        LicenseError,
        NetworkError,
        InvalidInput,
        IOError,
        ParsingError,
        Cancelled
    };

    inline std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::ConfigError:
            return "config";
        case ErrorCode::CryptoError:
            return "crypto";
        case ErrorCode::LicenseError:
            return "license";
        case ErrorCode::NetworkError:
            return "network";
        case ErrorCode::InvalidInput:
            return "invalid_input";
        case ErrorCode::IOError:
            return "io";
        case ErrorCode::ParsingError:
            return "parsing";
        case ErrorCode::Cancelled:
            return "cancelled";
        }
        return "unknown";
    }

    /**
     * Warden error with code and message
     */
    class WardenError : public std::runtime_error
    {
    public:
        ErrorCode code;

        WardenError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static WardenError config(const std::string &msg)
        {
            return WardenError(ErrorCode::ConfigError, msg);
        }

        static WardenError crypto(const std::string &msg)
        {
            return WardenError(ErrorCode::CryptoError, msg);
        }

        static WardenError license(const std::string &msg)
        {
            return WardenError(ErrorCode::LicenseError, msg);
        }

        static WardenError network(const std::string &msg)
        {
            return WardenError(ErrorCode::NetworkError, msg);
        }

        static WardenError invalid_input(const std::string &msg)
        {
            return WardenError(ErrorCode::InvalidInput, msg);
        }

        static WardenError io(const std::string &msg)
        {
            return WardenError(ErrorCode::IOError, msg);
        }

        static WardenError parsing(const std::string &msg)
        {
            return WardenError(ErrorCode::ParsingError, msg);
        }

        static WardenError cancelled(const std::string &msg)
        {
            return WardenError(ErrorCode::Cancelled, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, WardenError>;

} // namespace warden
