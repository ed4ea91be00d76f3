#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace chunkdrive::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{3000};
        std::filesystem::path root{"uploads"};
        std::size_t worker_threads{0};
        std::chrono::seconds session_timeout{std::chrono::seconds{3600}};
        std::chrono::seconds sweep_interval{std::chrono::seconds{60}};
        std::uint64_t max_chunk_bytes{64ULL * 1024 * 1024};
        std::optional<std::filesystem::path> log_file;

        std::filesystem::path staging_dir() const { return root / "chunks"; }
        std::filesystem::path files_dir() const { return root / "files"; }
    };

    /// Decimal TCP port in 1..65535; std::nullopt for anything else.
    std::optional<std::uint16_t> parse_port(std::string_view text) noexcept;

} // namespace chunkdrive::server
