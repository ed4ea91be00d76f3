#pragma once

#include <chrono>

#include <boost/asio/io_context.hpp>

#include "chunkdrive/client/transport.hpp"

namespace chunkdrive::client
{

    /// Blocking HTTP/1.1 transport, one connection per request.
    class HttpTransport : public ChunkTransport
    {
    public:
        explicit HttpTransport(std::chrono::seconds timeout = std::chrono::seconds(30));

        void send_chunk(const Endpoint &endpoint, const protocol::ChunkMetadata &metadata,
                        std::string_view data) override;

        std::optional<protocol::StatusResponse> query_status(const Endpoint &status_endpoint,
                                                             const std::string &upload_id) override;

    private:
        struct Reply
        {
            unsigned status{};
            std::string body;
        };

        Reply perform(const Endpoint &endpoint, const std::string &target, bool post, std::string content_type,
                      std::string body);

        boost::asio::io_context io_context_;
        std::chrono::seconds timeout_;
    };

} // namespace chunkdrive::client
