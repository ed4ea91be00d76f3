#include "chunkdrive/client/upload_orchestrator.hpp"

#include <array>
#include <fstream>

#include "chunkdrive/crypto.hpp"

namespace chunkdrive::client
{

    namespace
    {

        struct StateLabel
        {
            TransferState state;
            std::string_view label;
        };

        constexpr std::array<StateLabel, 6> kStateLabels{{
            {TransferState::Idle, "idle"},
            {TransferState::SendingChunk, "sending_chunk"},
            {TransferState::Verifying, "verifying"},
            {TransferState::Retrying, "retrying"},
            {TransferState::Completed, "completed"},
            {TransferState::Failed, "failed"},
        }};

        UploadOptions validated(UploadOptions options)
        {
            if (options.chunk_size == 0)
            {
                throw ConfigurationError("Chunk size must be positive");
            }
            return options;
        }

    } // namespace

    std::string_view to_string(TransferState state) noexcept
    {
        for (const auto &entry : kStateLabels)
        {
            if (entry.state == state)
            {
                return entry.label;
            }
        }
        return "unknown";
    }

    UploadOrchestrator::UploadOrchestrator(UploadOptions options, ChunkTransport &transport, Logger logger)
        : options_(validated(std::move(options))),
          retry_policy_(options_.max_retries, options_.backoff_base, options_.sleeper),
          transport_(transport),
          logger_(std::move(logger)) {}

    std::string UploadOrchestrator::generate_upload_id()
    {
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::system_clock::now().time_since_epoch())
                                .count();
        return "upload-" + std::to_string(millis) + "-" + crypto::random_hex(6);
    }

    std::uint64_t UploadOrchestrator::calculate_total_chunks(std::uint64_t file_size) const
    {
        return total_chunks(file_size, options_.chunk_size);
    }

    UploadResult UploadOrchestrator::upload_file(const std::filesystem::path &file, const Endpoint &endpoint,
                                                 std::optional<std::string> upload_id)
    {
        const auto id = upload_id && !upload_id->empty() ? *upload_id : generate_upload_id();
        return transfer(file, endpoint, id, {}, false);
    }

    UploadResult UploadOrchestrator::resume_upload(const std::filesystem::path &file, const Endpoint &endpoint,
                                                   const std::string &upload_id,
                                                   const std::vector<std::uint64_t> &completed_chunks)
    {
        const std::set<std::uint64_t> skip(completed_chunks.begin(), completed_chunks.end());
        return transfer(file, endpoint, upload_id, skip, true);
    }

    UploadResult UploadOrchestrator::transfer(const std::filesystem::path &file, const Endpoint &endpoint,
                                              const std::string &upload_id, const std::set<std::uint64_t> &skip,
                                              bool resuming)
    {
        set_state(TransferState::Idle);
        UploadResult result{.success = false, .upload_id = upload_id};

        std::error_code ec;
        const auto file_size = std::filesystem::file_size(file, ec);
        std::ifstream in(file, std::ios::binary);
        if (ec || !in.is_open())
        {
            set_state(TransferState::Failed);
            result.message = "Could not open " + file.string();
            result.error = ErrorCode::InvalidPayload;
            return result;
        }
        if (file_size == 0)
        {
            set_state(TransferState::Failed);
            result.message = "File is empty";
            result.error = ErrorCode::InvalidPayload;
            return result;
        }

        const auto total = calculate_total_chunks(file_size);
        const auto file_name = file.filename().string();

        std::uint64_t uploaded_bytes = 0;
        for (const auto index : skip)
        {
            if (index < total)
            {
                uploaded_bytes += chunk_range(index, file_size, options_.chunk_size).length;
            }
        }

        logger_.log(resuming ? "resume" : "upload", file.string(), " as ", upload_id, ": ", file_size, " bytes in ",
                    total, " chunks to ", to_string(endpoint));

        try
        {
            std::string buffer;
            for (std::uint64_t index = 0; index < total; ++index)
            {
                if (skip.count(index) != 0)
                {
                    continue;
                }

                const auto range = chunk_range(index, file_size, options_.chunk_size);
                buffer.resize(static_cast<std::size_t>(range.length));
                in.seekg(static_cast<std::streamoff>(range.offset));
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                if (static_cast<std::uint64_t>(in.gcount()) != range.length)
                {
                    throw Error(ErrorCode::InternalError, "Short read on chunk " + std::to_string(index) + " of " +
                                                              file.string());
                }

                const protocol::ChunkMetadata metadata{
                    .chunk_index = index,
                    .total_chunks = total,
                    .file_name = file_name,
                    .file_size = file_size,
                    .chunk_size = range.length,
                    .upload_id = upload_id,
                };

                retry_policy_.execute(
                    index,
                    [&]
                    {
                        set_state(TransferState::SendingChunk);
                        transport_.send_chunk(endpoint, metadata, buffer);
                        set_state(TransferState::Verifying);
                    },
                    options_.on_error,
                    [&](std::uint32_t attempt, std::chrono::milliseconds delay, const std::exception &ex)
                    {
                        set_state(TransferState::Retrying);
                        logger_.warn("retry", "chunk ", index, " attempt ", attempt + 1, " failed: ", ex.what(),
                                     "; waiting ", delay.count(), " ms");
                    });

                uploaded_bytes += range.length;
                if (options_.on_progress)
                {
                    options_.on_progress(UploadProgress{
                        .uploaded_bytes = uploaded_bytes,
                        .total_bytes = file_size,
                        .percentage = static_cast<double>(uploaded_bytes) * 100.0 / static_cast<double>(file_size),
                        .current_chunk = index + 1,
                        .total_chunks = total,
                    });
                }
                if (options_.on_chunk_complete)
                {
                    options_.on_chunk_complete(index, total);
                }
                set_state(TransferState::Idle);
            }
        }
        catch (const chunkdrive::Error &ex)
        {
            set_state(TransferState::Failed);
            logger_.warn("upload", upload_id, " aborted: ", ex.what());
            result.message = ex.what();
            result.error = ex.code();
            return result;
        }
        catch (const std::exception &ex)
        {
            set_state(TransferState::Failed);
            logger_.warn("upload", upload_id, " aborted: ", ex.what());
            result.message = ex.what();
            result.error = ErrorCode::InternalError;
            return result;
        }

        set_state(TransferState::Completed);
        logger_.log(resuming ? "resume" : "upload", upload_id, " completed");
        result.success = true;
        result.message = resuming ? "File upload resumed and completed successfully" : "File uploaded successfully";
        return result;
    }

} // namespace chunkdrive::client
