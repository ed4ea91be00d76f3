#include "chunkdrive/client/transfer_state_store.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include <nlohmann/json.hpp>

namespace chunkdrive::client
{

    TransferStateStore::TransferStateStore() : TransferStateStore(default_state_path()) {}

    TransferStateStore::TransferStateStore(std::filesystem::path state_path) : state_path_(std::move(state_path))
    {
        load();
    }

    std::optional<TransferStateStore::Entry> TransferStateStore::find(const std::string &upload_id) const
    {
        const auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                                     { return entry.upload_id == upload_id; });
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    std::optional<TransferStateStore::Entry> TransferStateStore::find_for_file(const std::filesystem::path &local_path,
                                                                               const std::string &upload_url) const
    {
        const auto normalized = normalize_path(local_path);
        const auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                                     { return entry.local_path == normalized && entry.upload_url == upload_url; });
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    void TransferStateStore::upsert(Entry entry)
    {
        entry.local_path = normalize_path(entry.local_path);
        auto it = find_entry(entry.upload_id);
        if (it == entries_.end())
        {
            entries_.push_back(std::move(entry));
        }
        else
        {
            *it = std::move(entry);
        }
        save();
    }

    void TransferStateStore::mark_chunk_complete(const std::string &upload_id, std::uint64_t chunk_index)
    {
        auto it = find_entry(upload_id);
        if (it != entries_.end())
        {
            it->completed_chunks.insert(chunk_index);
            save();
        }
    }

    void TransferStateStore::remove(const std::string &upload_id)
    {
        auto it = find_entry(upload_id);
        if (it != entries_.end())
        {
            entries_.erase(it);
            save();
        }
    }

    std::filesystem::path TransferStateStore::default_state_path()
    {
#ifdef _WIN32
        if (const char *appdata = std::getenv("APPDATA"))
        {
            return std::filesystem::path(appdata) / "ChunkDrive" / "uploads.json";
        }
#endif
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".chunkdrive" / "uploads.json";
        }
        return std::filesystem::path(".chunkdrive") / "uploads.json";
    }

    void TransferStateStore::load()
    {
        entries_.clear();
        if (!std::filesystem::exists(state_path_))
        {
            return;
        }
        std::ifstream in(state_path_);
        if (!in.is_open())
        {
            return;
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (!json.is_array())
        {
            return;
        }
        for (const auto &item : json)
        {
            if (!item.is_object())
            {
                continue;
            }
            const auto id = item.find("upload_id");
            const auto chunk_size = item.find("chunk_size");
            if (id == item.end() || !id->is_string() || chunk_size == item.end() || !chunk_size->is_number_unsigned())
            {
                continue;
            }

            Entry entry;
            entry.upload_id = id->get<std::string>();
            entry.chunk_size = chunk_size->get<std::uint64_t>();
            if (const auto local = item.find("local"); local != item.end() && local->is_string())
            {
                entry.local_path = normalize_path(std::filesystem::path(local->get<std::string>()));
            }
            if (const auto url = item.find("url"); url != item.end() && url->is_string())
            {
                entry.upload_url = url->get<std::string>();
            }
            if (const auto total = item.find("total_chunks"); total != item.end() && total->is_number_unsigned())
            {
                entry.total_chunks = total->get<std::uint64_t>();
            }
            if (const auto completed = item.find("completed"); completed != item.end() && completed->is_array())
            {
                for (const auto &index : *completed)
                {
                    if (index.is_number_unsigned())
                    {
                        entry.completed_chunks.insert(index.get<std::uint64_t>());
                    }
                }
            }
            if (!entry.upload_id.empty() && entry.chunk_size > 0)
            {
                entries_.push_back(std::move(entry));
            }
        }
    }

    void TransferStateStore::save() const
    {
        const auto dir = state_path_.parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
        }
        nlohmann::json json = nlohmann::json::array();
        for (const auto &entry : entries_)
        {
            json.push_back({{"upload_id", entry.upload_id},
                            {"local", entry.local_path.generic_string()},
                            {"url", entry.upload_url},
                            {"chunk_size", entry.chunk_size},
                            {"total_chunks", entry.total_chunks},
                            {"completed", entry.completed_chunks}});
        }
        std::ofstream out(state_path_, std::ios::trunc);
        if (out.is_open())
        {
            out << json.dump(2);
        }
    }

    std::vector<TransferStateStore::Entry>::iterator TransferStateStore::find_entry(const std::string &upload_id)
    {
        return std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                            { return entry.upload_id == upload_id; });
    }

    std::filesystem::path TransferStateStore::normalize_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec)
        {
            absolute = path;
        }
        return absolute.lexically_normal();
    }

} // namespace chunkdrive::client
