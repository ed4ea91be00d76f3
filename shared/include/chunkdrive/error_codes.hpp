/**
 * ChunkDrive - Shared error codes used across client and server layers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace chunkdrive
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidConfiguration = 1,
        InvalidPayload = 2,
        TransientTransportFailure = 3,
        ChunkDeliveryExhausted = 4,
        ReassemblyFailure = 5,
        UnknownSession = 6,
        Conflict = 7,
        Unsupported = 8,
        InternalError = 9
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept;

    // Base for every exception that crosses a module boundary.
    class Error : public std::runtime_error
    {
    public:
        Error(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    class ConfigurationError : public Error
    {
    public:
        explicit ConfigurationError(std::string message);
    };

} // namespace chunkdrive
