#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "chunkdrive/client/endpoint.hpp"
#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/protocol.hpp"

namespace chunkdrive::client
{

    /// One failed transmission attempt: network error or non-success status.
    class TransportError : public chunkdrive::Error
    {
    public:
        explicit TransportError(std::string message, unsigned status = 0);

        /// HTTP status of the failed response, 0 when no response arrived.
        unsigned status() const noexcept { return status_; }

    private:
        unsigned status_;
    };

    class ChunkTransport
    {
    public:
        virtual ~ChunkTransport() = default;

        /// Delivers one chunk. Throws TransportError when the attempt fails.
        virtual void send_chunk(const Endpoint &endpoint, const protocol::ChunkMetadata &metadata,
                                std::string_view data) = 0;

        /// Returns std::nullopt when the server does not know the upload.
        virtual std::optional<protocol::StatusResponse> query_status(const Endpoint &status_endpoint,
                                                                     const std::string &upload_id) = 0;
    };

} // namespace chunkdrive::client
