#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "chunkdrive/server/upload_handler.hpp"

namespace chunkdrive::server
{

    /// One keep-alive HTTP connection. Requests on a connection are handled one
    /// at a time; different connections run concurrently on the worker pool.
    class Connection : public std::enable_shared_from_this<Connection>
    {
    public:
        Connection(boost::asio::ip::tcp::socket socket, UploadHandler &handler, std::uint64_t body_limit);

        void start();

    private:
        void read_request();
        void on_read(boost::beast::error_code ec, std::size_t bytes_transferred);
        void send_response(HttpResponse response, bool close_after);
        void on_write(bool close_after, boost::beast::error_code ec, std::size_t bytes_transferred);
        void close();

        boost::beast::tcp_stream stream_;
        boost::beast::flat_buffer buffer_;
        std::optional<http::request_parser<http::string_body>> parser_;
        std::shared_ptr<HttpResponse> response_;
        UploadHandler &handler_;
        std::uint64_t body_limit_;
        std::string remote_;
    };

} // namespace chunkdrive::server
