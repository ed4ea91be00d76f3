#include "chunkdrive/error_codes.hpp"

#include <array>

namespace chunkdrive
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 10> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidConfiguration, "invalid_configuration"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::TransientTransportFailure, "transient_transport_failure"},
            {ErrorCode::ChunkDeliveryExhausted, "chunk_delivery_exhausted"},
            {ErrorCode::ReassemblyFailure, "reassembly_failure"},
            {ErrorCode::UnknownSession, "unknown_session"},
            {ErrorCode::Conflict, "conflict"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.description == value)
            {
                return entry.code;
            }
        }
        return std::nullopt;
    }

    Error::Error(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    ConfigurationError::ConfigurationError(std::string message)
        : Error(ErrorCode::InvalidConfiguration, std::move(message)) {}

} // namespace chunkdrive
