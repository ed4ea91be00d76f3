#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace chunkdrive::client
{

    struct ClientConfig
    {
        std::string upload_url;
        std::filesystem::path file;
        std::optional<std::string> status_url;
        std::optional<std::uint64_t> chunk_size;
        std::uint32_t max_retries{3};
        std::optional<std::string> upload_id;
        bool resume{};
        std::optional<std::filesystem::path> log_path;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace chunkdrive::client
