#include "chunkdrive/server/session_registry.hpp"

#include <spdlog/spdlog.h>

namespace chunkdrive::server
{

    SessionError::SessionError(ErrorCode code, std::string message) : Error(code, std::move(message)) {}

    SessionRegistry::SessionRegistry(ChunkStore &chunk_store, ReassemblyEngine &reassembly_engine)
        : chunk_store_(chunk_store), reassembly_engine_(reassembly_engine) {}

    void SessionRegistry::validate(const protocol::ChunkMetadata &metadata, std::string_view data)
    {
        if (!protocol::is_valid_upload_id(metadata.upload_id))
        {
            throw SessionError(ErrorCode::InvalidPayload, "Invalid upload id");
        }
        if (metadata.total_chunks == 0)
        {
            throw SessionError(ErrorCode::InvalidPayload, "Upload must have at least one chunk");
        }
        if (metadata.chunk_index >= metadata.total_chunks)
        {
            throw SessionError(ErrorCode::InvalidPayload, "Chunk index " + std::to_string(metadata.chunk_index) +
                                                              " out of range");
        }
        if (data.size() != metadata.chunk_size)
        {
            throw SessionError(ErrorCode::InvalidPayload, "Chunk size " + std::to_string(data.size()) +
                                                              " does not match declared " +
                                                              std::to_string(metadata.chunk_size));
        }
        if (metadata.chunk_size > metadata.file_size)
        {
            throw SessionError(ErrorCode::InvalidPayload, "Chunk larger than declared file size");
        }
    }

    ReceiveResult SessionRegistry::receive_chunk(const protocol::ChunkMetadata &metadata, std::string_view data)
    {
        validate(metadata, data);

        while (true)
        {
            auto entry = find_or_create(metadata);
            std::unique_lock entry_lock(entry->mutex);
            if (entry->closed)
            {
                // Completed or evicted between lookup and lock.
                continue;
            }

            auto &session = entry->session;
            if (session.total_chunks != metadata.total_chunks || session.file_size != metadata.file_size ||
                session.file_name != metadata.file_name)
            {
                throw SessionError(ErrorCode::Conflict, "Chunk metadata does not match upload " + session.upload_id);
            }

            try
            {
                chunk_store_.put(session.upload_id, metadata.chunk_index, data);
            }
            catch (const std::exception &)
            {
                if (session.received_chunks.empty())
                {
                    entry->closed = true;
                    erase(session.upload_id, entry.get());
                }
                throw;
            }

            session.received_chunks.insert(metadata.chunk_index);
            session.last_update = Clock::now();
            spdlog::debug("Upload {}: chunk {} stored ({}/{})", session.upload_id, metadata.chunk_index,
                          session.received_chunks.size(), session.total_chunks);

            ReceiveResult result{
                .completed = false,
                .received_count = session.received_chunks.size(),
                .total_chunks = session.total_chunks,
            };
            if (session.received_chunks.size() == session.total_chunks)
            {
                result.artifact = reassembly_engine_.reassemble(session.upload_id, session.file_name,
                                                                session.file_size, session.total_chunks);
                result.completed = true;
                entry->closed = true;
                erase(session.upload_id, entry.get());
                spdlog::info("Upload {} completed as {}", session.upload_id, result.artifact->name);
            }
            return result;
        }
    }

    std::optional<SessionStatus> SessionRegistry::status(const std::string &upload_id) const
    {
        std::shared_ptr<Entry> entry;
        {
            std::lock_guard lock(mutex_);
            auto it = sessions_.find(upload_id);
            if (it == sessions_.end())
            {
                return std::nullopt;
            }
            entry = it->second;
        }

        std::lock_guard entry_lock(entry->mutex);
        if (entry->closed)
        {
            return std::nullopt;
        }
        const auto &session = entry->session;
        SessionStatus status{
            .upload_id = session.upload_id,
            .total_chunks = session.total_chunks,
            .received_chunks = std::vector<std::uint64_t>(session.received_chunks.begin(),
                                                          session.received_chunks.end()),
            .progress_percentage = static_cast<double>(session.received_chunks.size()) * 100.0 /
                                   static_cast<double>(session.total_chunks),
        };
        return status;
    }

    std::size_t SessionRegistry::cleanup_expired(std::chrono::seconds max_age, Clock::time_point now)
    {
        std::size_t evicted = 0;
        std::lock_guard lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();)
        {
            auto &entry = *it->second;
            std::unique_lock entry_lock(entry.mutex, std::try_to_lock);
            if (!entry_lock.owns_lock() || entry.closed || now - entry.session.last_update <= max_age)
            {
                ++it;
                continue;
            }
            entry.closed = true;
            const auto removed = chunk_store_.remove(entry.session.upload_id, entry.session.total_chunks);
            spdlog::info("Evicted idle upload {} ({}/{} chunks, {} staged files removed)", entry.session.upload_id,
                         entry.session.received_chunks.size(), entry.session.total_chunks, removed);
            entry_lock.unlock();
            it = sessions_.erase(it);
            ++evicted;
        }
        return evicted;
    }

    std::size_t SessionRegistry::size() const
    {
        std::lock_guard lock(mutex_);
        return sessions_.size();
    }

    std::shared_ptr<SessionRegistry::Entry> SessionRegistry::find_or_create(const protocol::ChunkMetadata &metadata)
    {
        std::lock_guard lock(mutex_);
        auto &slot = sessions_[metadata.upload_id];
        if (!slot)
        {
            slot = std::make_shared<Entry>();
            slot->session.upload_id = metadata.upload_id;
            slot->session.file_name = metadata.file_name;
            slot->session.file_size = metadata.file_size;
            slot->session.total_chunks = metadata.total_chunks;
            slot->session.last_update = Clock::now();
            spdlog::info("New upload session {} for {} ({} bytes, {} chunks)", metadata.upload_id, metadata.file_name,
                         metadata.file_size, metadata.total_chunks);
        }
        return slot;
    }

    void SessionRegistry::erase(const std::string &upload_id, const Entry *entry)
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(upload_id);
        if (it != sessions_.end() && it->second.get() == entry)
        {
            sessions_.erase(it);
        }
    }

} // namespace chunkdrive::server
