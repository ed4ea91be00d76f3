#pragma once

#include <string>
#include <string_view>

#include <boost/beast/http.hpp>

#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/server/session_registry.hpp"

namespace chunkdrive::server
{

    namespace http = boost::beast::http;

    using HttpRequest = http::request<http::string_body>;
    using HttpResponse = http::response<http::string_body>;

    http::status status_for(ErrorCode code) noexcept;

    /// Maps the HTTP surface onto the session registry:
    ///   POST /upload                  multipart chunk delivery
    ///   GET  /upload-status/<id>      session progress
    ///   OPTIONS *                     CORS preflight
    class UploadHandler
    {
    public:
        explicit UploadHandler(SessionRegistry &registry);

        HttpResponse handle(const HttpRequest &request);

    private:
        HttpResponse handle_upload(const HttpRequest &request);
        HttpResponse handle_status(const HttpRequest &request, std::string_view upload_id);
        HttpResponse handle_preflight(const HttpRequest &request);

        SessionRegistry &registry_;
    };

} // namespace chunkdrive::server
