#pragma once

#include <string>
#include <string_view>

namespace chunkdrive::client
{

    struct Endpoint
    {
        std::string host;
        std::string port{"80"};
        std::string target{"/"};
    };

    /// Parses http://host[:port][/path]. Throws ConfigurationError otherwise.
    Endpoint parse_endpoint(std::string_view url);

    std::string to_string(const Endpoint &endpoint);

    /// Same host and port as the upload endpoint, with the status path as target.
    Endpoint status_endpoint_for(const Endpoint &upload_endpoint);

} // namespace chunkdrive::client
