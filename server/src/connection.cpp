#include "chunkdrive/server/connection.hpp"

#include <chrono>

#include <boost/asio/dispatch.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chunkdrive/protocol.hpp"

namespace chunkdrive::server
{

    namespace beast = boost::beast;
    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    namespace
    {
        constexpr auto kIdleTimeout = std::chrono::seconds(60);

        std::string describe_endpoint(const tcp::socket &socket)
        {
            beast::error_code ec;
            const auto endpoint = socket.remote_endpoint(ec);
            if (ec)
            {
                return "unknown";
            }
            return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
        }

    } // namespace

    Connection::Connection(tcp::socket socket, UploadHandler &handler, std::uint64_t body_limit)
        : stream_(std::move(socket)), handler_(handler), body_limit_(body_limit)
    {
        remote_ = describe_endpoint(stream_.socket());
    }

    void Connection::start()
    {
        spdlog::debug("Client connected from {}", remote_);
        net::dispatch(stream_.get_executor(), beast::bind_front_handler(&Connection::read_request, shared_from_this()));
    }

    void Connection::read_request()
    {
        parser_.emplace();
        parser_->body_limit(body_limit_);
        stream_.expires_after(kIdleTimeout);
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Connection::on_read, shared_from_this()));
    }

    void Connection::on_read(beast::error_code ec, std::size_t /*bytes_transferred*/)
    {
        if (ec == http::error::end_of_stream)
        {
            close();
            return;
        }
        if (ec == http::error::body_limit)
        {
            const auto &header = parser_->get();
            HttpResponse response{http::status::payload_too_large, header.version()};
            response.set(http::field::content_type, "application/json");
            response.set(http::field::access_control_allow_origin, "*");
            response.body() = nlohmann::json(protocol::UploadResponse{
                                                 .success = false,
                                                 .message = "Chunk exceeds the configured size limit",
                                                 .error = ErrorCode::InvalidPayload,
                                             })
                                  .dump();
            response.prepare_payload();
            send_response(std::move(response), true);
            return;
        }
        if (ec)
        {
            if (ec != beast::error::timeout)
            {
                spdlog::debug("Read from {} failed: {}", remote_, ec.message());
            }
            close();
            return;
        }

        const auto request = parser_->release();
        const auto method = request.method_string();
        const auto target = request.target();
        spdlog::debug("{} -> {} {}", remote_, std::string(method.data(), method.size()),
                      std::string(target.data(), target.size()));
        auto response = handler_.handle(request);
        const bool close_after = response.need_eof();
        send_response(std::move(response), close_after);
    }

    void Connection::send_response(HttpResponse response, bool close_after)
    {
        response_ = std::make_shared<HttpResponse>(std::move(response));
        http::async_write(stream_, *response_,
                          beast::bind_front_handler(&Connection::on_write, shared_from_this(), close_after));
    }

    void Connection::on_write(bool close_after, beast::error_code ec, std::size_t /*bytes_transferred*/)
    {
        if (ec)
        {
            spdlog::debug("Write to {} failed: {}", remote_, ec.message());
            return;
        }
        if (close_after)
        {
            close();
            return;
        }
        response_.reset();
        read_request();
    }

    void Connection::close()
    {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

} // namespace chunkdrive::server
