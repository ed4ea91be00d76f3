#include "chunkdrive/client/endpoint.hpp"

#include <algorithm>

#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/protocol.hpp"

namespace chunkdrive::client
{

    Endpoint parse_endpoint(std::string_view url)
    {
        constexpr std::string_view kScheme = "http://";
        if (url.substr(0, kScheme.size()) != kScheme)
        {
            throw ConfigurationError("Only http:// endpoints are supported: " + std::string(url));
        }
        url.remove_prefix(kScheme.size());

        Endpoint endpoint;
        const auto slash = url.find('/');
        const auto authority = url.substr(0, slash);
        if (slash != std::string_view::npos)
        {
            endpoint.target = std::string(url.substr(slash));
        }

        const auto colon = authority.rfind(':');
        if (colon != std::string_view::npos)
        {
            endpoint.host = std::string(authority.substr(0, colon));
            endpoint.port = std::string(authority.substr(colon + 1));
            const bool numeric = !endpoint.port.empty() && std::all_of(endpoint.port.begin(), endpoint.port.end(), [](char ch)
                                                                         { return ch >= '0' && ch <= '9'; });
            if (!numeric)
            {
                throw ConfigurationError("Invalid port in endpoint: " + std::string(authority));
            }
        }
        else
        {
            endpoint.host = std::string(authority);
        }

        if (endpoint.host.empty())
        {
            throw ConfigurationError("Endpoint is missing a host");
        }
        return endpoint;
    }

    std::string to_string(const Endpoint &endpoint)
    {
        return "http://" + endpoint.host + ":" + endpoint.port + endpoint.target;
    }

    Endpoint status_endpoint_for(const Endpoint &upload_endpoint)
    {
        Endpoint status = upload_endpoint;
        status.target = std::string(protocol::kStatusPath);
        return status;
    }

} // namespace chunkdrive::client
