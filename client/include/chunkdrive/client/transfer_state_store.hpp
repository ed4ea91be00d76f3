#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chunkdrive::client
{

    /// JSON journal of unfinished uploads so an interrupted transfer can be
    /// resumed from a later process.
    class TransferStateStore
    {
    public:
        struct Entry
        {
            std::string upload_id;
            std::filesystem::path local_path;
            std::string upload_url;
            std::uint64_t chunk_size{};
            std::uint64_t total_chunks{};
            std::set<std::uint64_t> completed_chunks;
        };

        TransferStateStore();
        explicit TransferStateStore(std::filesystem::path state_path);

        const std::vector<Entry> &entries() const noexcept { return entries_; }

        std::optional<Entry> find(const std::string &upload_id) const;

        std::optional<Entry> find_for_file(const std::filesystem::path &local_path, const std::string &upload_url) const;

        void upsert(Entry entry);

        void mark_chunk_complete(const std::string &upload_id, std::uint64_t chunk_index);

        void remove(const std::string &upload_id);

        static std::filesystem::path default_state_path();

    private:
        void load();
        void save() const;
        std::vector<Entry>::iterator find_entry(const std::string &upload_id);
        static std::filesystem::path normalize_path(const std::filesystem::path &path);

        std::filesystem::path state_path_;
        std::vector<Entry> entries_;
    };

} // namespace chunkdrive::client
