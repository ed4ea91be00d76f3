#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/server/chunk_store.hpp"

namespace chunkdrive::server
{

    struct ArtifactInfo
    {
        std::string name;
        std::filesystem::path path;
        std::uint64_t size{};
    };

    class ReassemblyError : public chunkdrive::Error
    {
    public:
        explicit ReassemblyError(std::string message);
    };

    class ReassemblyEngine
    {
    public:
        using Clock = std::chrono::system_clock;

        ReassemblyEngine(std::filesystem::path files_dir, ChunkStore &chunk_store);

        const std::filesystem::path &directory() const noexcept { return files_dir_; }

        /// Concatenates staged chunks 0..total_chunks-1 into a new artifact and
        /// purges them. On failure nothing is purged and ReassemblyError is thrown.
        ArtifactInfo reassemble(const std::string &upload_id, const std::string &file_name, std::uint64_t file_size,
                                std::uint64_t total_chunks);

        /// First 16 hex digits of sha256(file_name + epoch milliseconds) followed
        /// by the original extension.
        static std::string artifact_name(const std::string &file_name, Clock::time_point when);

    private:
        ArtifactInfo publish(const std::filesystem::path &partial, const std::string &file_name);

        std::filesystem::path files_dir_;
        ChunkStore &chunk_store_;
    };

} // namespace chunkdrive::server
