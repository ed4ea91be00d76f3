#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "chunkdrive/chunk_plan.hpp"
#include "chunkdrive/client/endpoint.hpp"
#include "chunkdrive/client/logger.hpp"
#include "chunkdrive/client/retry_policy.hpp"
#include "chunkdrive/client/transport.hpp"
#include "chunkdrive/error_codes.hpp"

namespace chunkdrive::client
{

    struct UploadProgress
    {
        std::uint64_t uploaded_bytes{};
        std::uint64_t total_bytes{};
        double percentage{};
        std::uint64_t current_chunk{}; // 1-based
        std::uint64_t total_chunks{};
    };

    struct UploadOptions
    {
        std::uint64_t chunk_size{kDefaultChunkSize};
        std::uint32_t max_retries{RetryPolicy::kDefaultMaxRetries};
        std::chrono::milliseconds backoff_base{std::chrono::seconds(1)};
        RetryPolicy::Sleeper sleeper{};
        std::function<void(const UploadProgress &)> on_progress{};
        std::function<void(std::uint64_t, std::uint64_t)> on_chunk_complete{};
        RetryPolicy::ErrorObserver on_error{};
    };

    struct UploadResult
    {
        bool success{};
        std::string upload_id;
        std::string message;
        ErrorCode error{ErrorCode::Ok};
    };

    enum class TransferState : std::uint8_t
    {
        Idle,
        SendingChunk,
        Verifying,
        Retrying,
        Completed,
        Failed
    };

    std::string_view to_string(TransferState state) noexcept;

    /// Drives one file through the transport chunk by chunk. Chunks are sent
    /// strictly in index order and a chunk is never started before the previous
    /// one succeeded or exhausted its retries; an exhausted chunk ends the transfer.
    class UploadOrchestrator
    {
    public:
        /// Throws ConfigurationError for a zero chunk size or retry count.
        UploadOrchestrator(UploadOptions options, ChunkTransport &transport, Logger logger = Logger{});

        UploadResult upload_file(const std::filesystem::path &file, const Endpoint &endpoint,
                                 std::optional<std::string> upload_id = std::nullopt);

        /// Same as upload_file but skips every index in completed_chunks. The chunk
        /// size must match the one the session was started with.
        UploadResult resume_upload(const std::filesystem::path &file, const Endpoint &endpoint,
                                   const std::string &upload_id, const std::vector<std::uint64_t> &completed_chunks);

        std::uint64_t calculate_total_chunks(std::uint64_t file_size) const;

        std::uint64_t chunk_size() const noexcept { return options_.chunk_size; }

        TransferState state() const noexcept { return state_.load(); }

        /// "upload-<epoch ms>-<random hex>"
        static std::string generate_upload_id();

    private:
        UploadResult transfer(const std::filesystem::path &file, const Endpoint &endpoint, const std::string &upload_id,
                              const std::set<std::uint64_t> &skip, bool resuming);
        void set_state(TransferState state) noexcept { state_.store(state); }

        UploadOptions options_;
        RetryPolicy retry_policy_;
        ChunkTransport &transport_;
        Logger logger_;
        std::atomic<TransferState> state_{TransferState::Idle};
    };

} // namespace chunkdrive::client
