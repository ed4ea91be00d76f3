#include "chunkdrive/client/http_transport.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>

#include "chunkdrive/multipart.hpp"
#include "chunkdrive/version.hpp"

namespace chunkdrive::client
{

    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    TransportError::TransportError(std::string message, unsigned status)
        : Error(ErrorCode::TransientTransportFailure, std::move(message)), status_(status) {}

    HttpTransport::HttpTransport(std::chrono::seconds timeout) : timeout_(timeout) {}

    void HttpTransport::send_chunk(const Endpoint &endpoint, const protocol::ChunkMetadata &metadata,
                                   std::string_view data)
    {
        const auto boundary = multipart::generate_boundary();
        std::vector<multipart::Part> parts;
        parts.push_back(multipart::Part{
            .name = std::string(protocol::kChunkField),
            .filename = std::string("blob"),
            .content_type = "application/octet-stream",
            .data = std::string(data),
        });
        parts.push_back(multipart::Part{
            .name = std::string(protocol::kMetadataField),
            .data = nlohmann::json(metadata).dump(),
        });

        const auto reply = perform(endpoint, endpoint.target, true, multipart::content_type_header(boundary),
                                   multipart::encode(parts, boundary));
        if (reply.status < 200 || reply.status >= 300)
        {
            std::string message = "Upload failed with status " + std::to_string(reply.status);
            try
            {
                const auto body = nlohmann::json::parse(reply.body).get<protocol::UploadResponse>();
                if (!body.message.empty())
                {
                    message += ": " + body.message;
                }
            }
            catch (const nlohmann::json::exception &)
            {
                // Non-JSON error page; the status code is all there is.
            }
            throw TransportError(message, reply.status);
        }
    }

    std::optional<protocol::StatusResponse> HttpTransport::query_status(const Endpoint &status_endpoint,
                                                                        const std::string &upload_id)
    {
        auto target = status_endpoint.target;
        if (target.empty() || target.back() != '/')
        {
            target += '/';
        }
        target += upload_id;

        const auto reply = perform(status_endpoint, target, false, {}, {});
        if (reply.status == 404)
        {
            return std::nullopt;
        }
        if (reply.status < 200 || reply.status >= 300)
        {
            throw TransportError("Status query failed with status " + std::to_string(reply.status), reply.status);
        }
        try
        {
            return nlohmann::json::parse(reply.body).get<protocol::StatusResponse>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw TransportError(std::string("Malformed status response: ") + ex.what(), reply.status);
        }
    }

    HttpTransport::Reply HttpTransport::perform(const Endpoint &endpoint, const std::string &target, bool post,
                                                std::string content_type, std::string body)
    {
        try
        {
            tcp::resolver resolver(io_context_);
            beast::tcp_stream stream(io_context_);

            stream.expires_after(timeout_);
            stream.connect(resolver.resolve(endpoint.host, endpoint.port));

            http::request<http::string_body> request{post ? http::verb::post : http::verb::get, target, 11};
            request.set(http::field::host, endpoint.host);
            request.set(http::field::user_agent, "chunkdrive/" + std::string(chunkdrive::version()));
            if (post)
            {
                request.set(http::field::content_type, content_type);
                request.body() = std::move(body);
            }
            request.prepare_payload();

            stream.expires_after(timeout_);
            http::write(stream, request);

            beast::flat_buffer buffer;
            http::response<http::string_body> response;
            http::read(stream, buffer, response);

            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);

            return Reply{
                .status = response.result_int(),
                .body = std::move(response.body()),
            };
        }
        catch (const boost::system::system_error &ex)
        {
            throw TransportError("Network error talking to " + to_string(endpoint) + ": " + ex.code().message());
        }
    }

} // namespace chunkdrive::client
