#include "chunkdrive/chunk_plan.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "chunkdrive/error_codes.hpp"

namespace chunkdrive
{

    std::uint64_t total_chunks(std::uint64_t file_size, std::uint64_t chunk_size)
    {
        if (chunk_size == 0)
        {
            throw ConfigurationError("Chunk size must be positive");
        }
        return file_size / chunk_size + (file_size % chunk_size == 0 ? 0 : 1);
    }

    ChunkRange chunk_range(std::uint64_t index, std::uint64_t file_size, std::uint64_t chunk_size)
    {
        const auto total = total_chunks(file_size, chunk_size);
        if (index >= total)
        {
            throw std::out_of_range("Chunk index " + std::to_string(index) + " outside of " + std::to_string(total) +
                                    " chunks");
        }
        const auto offset = index * chunk_size;
        return ChunkRange{
            .index = index,
            .offset = offset,
            .length = std::min(chunk_size, file_size - offset),
        };
    }

    std::vector<ChunkRange> plan_chunks(std::uint64_t file_size, std::uint64_t chunk_size)
    {
        const auto total = total_chunks(file_size, chunk_size);
        std::vector<ChunkRange> ranges;
        ranges.reserve(static_cast<std::size_t>(total));
        for (std::uint64_t index = 0; index < total; ++index)
        {
            ranges.push_back(chunk_range(index, file_size, chunk_size));
        }
        return ranges;
    }

} // namespace chunkdrive
