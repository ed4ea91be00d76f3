#include "chunkdrive/server/chunk_store.hpp"

#include <fstream>

#include "chunkdrive/error_codes.hpp"

namespace chunkdrive::server
{

    ChunkStore::ChunkStore(std::filesystem::path staging_dir) : staging_dir_(std::move(staging_dir))
    {
        std::filesystem::create_directories(staging_dir_);
    }

    std::filesystem::path ChunkStore::chunk_path(const std::string &upload_id, std::uint64_t chunk_index) const
    {
        return staging_dir_ / (upload_id + "-chunk-" + std::to_string(chunk_index));
    }

    void ChunkStore::put(const std::string &upload_id, std::uint64_t chunk_index, std::string_view data)
    {
        const auto target = chunk_path(upload_id, chunk_index);
        auto temp = target;
        temp += ".tmp";
        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw Error(ErrorCode::InternalError, "Could not stage chunk " + std::to_string(chunk_index));
            }
            out.write(data.data(), static_cast<std::streamsize>(data.size()));
            out.flush();
            if (!out)
            {
                out.close();
                std::error_code ec;
                std::filesystem::remove(temp, ec);
                throw Error(ErrorCode::InternalError, "Could not write chunk " + std::to_string(chunk_index));
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp, target, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            throw Error(ErrorCode::InternalError, "Could not store chunk " + std::to_string(chunk_index) + ": " +
                                                      ec.message());
        }
    }

    bool ChunkStore::contains(const std::string &upload_id, std::uint64_t chunk_index) const
    {
        std::error_code ec;
        return std::filesystem::is_regular_file(chunk_path(upload_id, chunk_index), ec);
    }

    std::size_t ChunkStore::remove(const std::string &upload_id, std::uint64_t total_chunks)
    {
        std::size_t removed = 0;
        for (std::uint64_t index = 0; index < total_chunks; ++index)
        {
            std::error_code ec;
            if (std::filesystem::remove(chunk_path(upload_id, index), ec))
            {
                ++removed;
            }
        }
        return removed;
    }

} // namespace chunkdrive::server
