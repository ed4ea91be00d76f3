#include "chunkdrive/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace chunkdrive::client
{

    namespace
    {
        constexpr auto kUsage =
            "Usage: chunkdrive_client <upload-url> <file> [--chunk-size <bytes>] [--retries <N>] "
            "[--upload-id <ID>] [--resume] [--status-url <URL>] [--log <file>]";

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 3)
        {
            throw std::runtime_error(kUsage);
        }

        ClientConfig config;
        int index = 1;
        config.upload_url = argv[index++];
        config.file = std::filesystem::path(argv[index++]);

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--chunk-size")
            {
                const auto value = std::stoull(require_value(index, argc, argv, arg));
                if (value == 0)
                {
                    throw std::runtime_error("--chunk-size must be positive");
                }
                config.chunk_size = value;
            }
            else if (arg == "--retries")
            {
                const auto value = std::stoul(require_value(index, argc, argv, arg));
                if (value == 0)
                {
                    throw std::runtime_error("--retries must be positive");
                }
                config.max_retries = static_cast<std::uint32_t>(value);
            }
            else if (arg == "--upload-id")
            {
                config.upload_id = require_value(index, argc, argv, arg);
            }
            else if (arg == "--resume")
            {
                config.resume = true;
            }
            else if (arg == "--status-url")
            {
                config.status_url = require_value(index, argc, argv, arg);
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg + "\n" + kUsage);
            }
        }

        return config;
    }

} // namespace chunkdrive::client
