#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "chunkdrive/crypto.hpp"
#include "chunkdrive/server/server.hpp"
#include "chunkdrive/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "ChunkDrive server " << chunkdrive::version() << "\n"
                  << "Usage: " << program_name
                  << " [--port <PORT>] [--root <DIR>] [--address <ADDRESS>] [--threads <N>]"
                     " [--session-timeout <seconds>] [--sweep-interval <seconds>] [--max-chunk-bytes <N>]"
                     " [--log <FILE>]\n"
                  << "The PORT environment variable is used when --port is absent.\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

} // namespace

int main(int argc, char *argv[])
{
    using chunkdrive::server::Server;
    using chunkdrive::server::ServerConfig;

    ServerConfig config;
    if (const char *env_port = std::getenv("PORT"))
    {
        const auto port = chunkdrive::server::parse_port(env_port);
        if (!port)
        {
            std::cerr << "Invalid PORT environment value: " << env_port << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        config.port = *port;
    }

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            }

            auto value = read_option(i, argc, argv);
            if (!value)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }

            if (arg == "--port")
            {
                const auto port = chunkdrive::server::parse_port(*value);
                if (!port)
                {
                    std::cerr << "Port must be between 1 and 65535: " << *value << std::endl;
                    print_usage(argv[0]);
                    return EXIT_FAILURE;
                }
                config.port = *port;
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(*value);
            }
            else if (arg == "--address")
            {
                config.address = *value;
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--session-timeout")
            {
                config.session_timeout = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--sweep-interval")
            {
                config.sweep_interval = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--max-chunk-bytes")
            {
                config.max_chunk_bytes = std::stoull(*value);
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(*value);
            }
            else
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Invalid argument value: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.port == 0 || config.root.empty())
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting ChunkDrive server {} on {}:{}", chunkdrive::version(), config.address, config.port);

        chunkdrive::crypto::ensure_sodium_init();
        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
