#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/protocol.hpp"
#include "chunkdrive/server/chunk_store.hpp"
#include "chunkdrive/server/reassembler.hpp"

namespace chunkdrive::server
{

    struct UploadSession
    {
        std::string upload_id;
        std::string file_name;
        std::uint64_t file_size{};
        std::uint64_t total_chunks{};
        std::set<std::uint64_t> received_chunks;
        std::chrono::steady_clock::time_point last_update{};
    };

    struct SessionStatus
    {
        std::string upload_id;
        std::uint64_t total_chunks{};
        std::vector<std::uint64_t> received_chunks;
        double progress_percentage{};
    };

    struct ReceiveResult
    {
        bool completed{};
        std::uint64_t received_count{};
        std::uint64_t total_chunks{};
        std::optional<ArtifactInfo> artifact{};
    };

    class SessionError : public chunkdrive::Error
    {
    public:
        SessionError(ErrorCode code, std::string message);
    };

    /// In-memory table of upload sessions. Each session carries its own mutex so
    /// staging, received-set insertion and the completeness check for one upload
    /// id run as a unit while other uploads proceed in parallel.
    class SessionRegistry
    {
    public:
        using Clock = std::chrono::steady_clock;

        SessionRegistry(ChunkStore &chunk_store, ReassemblyEngine &reassembly_engine);

        /// Throws SessionError for invalid or conflicting metadata, chunkdrive::Error
        /// when staging fails and ReassemblyError when the final concatenation fails.
        /// A failed reassembly leaves the session and its staged chunks in place.
        ReceiveResult receive_chunk(const protocol::ChunkMetadata &metadata, std::string_view data);

        std::optional<SessionStatus> status(const std::string &upload_id) const;

        /// Evicts sessions idle longer than max_age, together with their staged chunks.
        /// Sessions busy with a chunk are skipped until the next sweep.
        std::size_t cleanup_expired(std::chrono::seconds max_age, Clock::time_point now = Clock::now());

        std::size_t size() const;

    private:
        struct Entry
        {
            std::mutex mutex;
            UploadSession session;
            bool closed{false};
        };

        static void validate(const protocol::ChunkMetadata &metadata, std::string_view data);
        std::shared_ptr<Entry> find_or_create(const protocol::ChunkMetadata &metadata);
        void erase(const std::string &upload_id, const Entry *entry);

        ChunkStore &chunk_store_;
        ReassemblyEngine &reassembly_engine_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<Entry>> sessions_;
    };

} // namespace chunkdrive::server
