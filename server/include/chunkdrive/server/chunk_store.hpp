#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace chunkdrive::server
{

    // Staged chunk files live at <staging>/<uploadId>-chunk-<index> until reassembly.
    class ChunkStore
    {
    public:
        explicit ChunkStore(std::filesystem::path staging_dir);

        const std::filesystem::path &directory() const noexcept { return staging_dir_; }

        std::filesystem::path chunk_path(const std::string &upload_id, std::uint64_t chunk_index) const;

        /// Writes the chunk through a temporary file and renames it over any
        /// previous bytes for the same key. Throws chunkdrive::Error on I/O failure.
        void put(const std::string &upload_id, std::uint64_t chunk_index, std::string_view data);

        bool contains(const std::string &upload_id, std::uint64_t chunk_index) const;

        /// Removes chunks [0, total_chunks) of the upload; returns how many existed.
        std::size_t remove(const std::string &upload_id, std::uint64_t total_chunks);

    private:
        std::filesystem::path staging_dir_;
    };

} // namespace chunkdrive::server
