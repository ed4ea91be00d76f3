/**
 * ChunkDrive - Chunk boundary planning shared by the uploader and the server.
 */
#pragma once

#include <cstdint>
#include <vector>

namespace chunkdrive
{

    inline constexpr std::uint64_t kDefaultChunkSize = 1024 * 1024;

    struct ChunkRange
    {
        std::uint64_t index{};
        std::uint64_t offset{};
        std::uint64_t length{};
    };

    /// ceil(file_size / chunk_size); zero for an empty file.
    /// Throws ConfigurationError when chunk_size is zero.
    std::uint64_t total_chunks(std::uint64_t file_size, std::uint64_t chunk_size);

    /// Byte range of one chunk. The final chunk may be shorter than chunk_size.
    /// Throws std::out_of_range when index >= total_chunks(file_size, chunk_size).
    ChunkRange chunk_range(std::uint64_t index, std::uint64_t file_size, std::uint64_t chunk_size);

    std::vector<ChunkRange> plan_chunks(std::uint64_t file_size, std::uint64_t chunk_size);

} // namespace chunkdrive
