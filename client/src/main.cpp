#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "chunkdrive/client/config.hpp"
#include "chunkdrive/client/endpoint.hpp"
#include "chunkdrive/client/http_transport.hpp"
#include "chunkdrive/client/logger.hpp"
#include "chunkdrive/client/transfer_state_store.hpp"
#include "chunkdrive/client/upload_orchestrator.hpp"
#include "chunkdrive/crypto.hpp"
#include "chunkdrive/protocol.hpp"
#include "chunkdrive/version.hpp"

namespace
{

    using chunkdrive::client::TransferStateStore;

    std::vector<std::uint64_t> to_vector(const std::set<std::uint64_t> &indices)
    {
        return {indices.begin(), indices.end()};
    }

} // namespace

int main(int argc, char *argv[])
{
    using namespace chunkdrive::client;

    ClientConfig config;
    try
    {
        config = parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ChunkDrive client " << chunkdrive::version() << "\n"
                  << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    Logger logger(config.log_path);

    try
    {
        chunkdrive::crypto::ensure_sodium_init();
        const auto endpoint = parse_endpoint(config.upload_url);
        const auto status_endpoint =
            config.status_url ? parse_endpoint(*config.status_url) : status_endpoint_for(endpoint);

        if (config.upload_id && !chunkdrive::protocol::is_valid_upload_id(*config.upload_id))
        {
            std::cerr << "ERROR: upload id may only contain letters, digits, '-' and '_' (at most "
                      << chunkdrive::protocol::kMaxUploadIdLength << " characters)" << std::endl;
            return EXIT_FAILURE;
        }

        TransferStateStore journal;
        HttpTransport transport;

        std::optional<TransferStateStore::Entry> pending;
        if (config.resume)
        {
            pending = config.upload_id ? journal.find(*config.upload_id)
                                       : journal.find_for_file(config.file, config.upload_url);
            if (!config.upload_id && !pending)
            {
                std::cerr << "ERROR: no interrupted upload recorded for " << config.file.string()
                          << "; pass --upload-id to resume a known session." << std::endl;
                return EXIT_FAILURE;
            }
        }

        const std::string upload_id =
            config.upload_id.value_or(pending ? pending->upload_id : UploadOrchestrator::generate_upload_id());

        UploadOptions options;
        options.chunk_size = config.chunk_size.value_or(pending ? pending->chunk_size : chunkdrive::kDefaultChunkSize);
        options.max_retries = config.max_retries;
        options.on_progress = [](const UploadProgress &progress)
        {
            std::cout << "\rUploaded " << progress.uploaded_bytes << " / " << progress.total_bytes << " bytes ("
                      << std::fixed << std::setprecision(1) << progress.percentage << "%), chunk "
                      << progress.current_chunk << "/" << progress.total_chunks << std::flush;
        };
        options.on_chunk_complete = [&journal, &upload_id](std::uint64_t chunk_index, std::uint64_t /*total*/)
        { journal.mark_chunk_complete(upload_id, chunk_index); };
        options.on_error = [](const std::exception &ex, std::uint64_t chunk_index)
        { std::cerr << "\nError uploading chunk " << chunk_index << ": " << ex.what() << std::endl; };

        UploadOrchestrator orchestrator(options, transport, logger);

        std::error_code ec;
        const auto file_size = std::filesystem::file_size(config.file, ec);
        if (!ec && file_size > 0)
        {
            journal.upsert(TransferStateStore::Entry{
                .upload_id = upload_id,
                .local_path = config.file,
                .upload_url = config.upload_url,
                .chunk_size = options.chunk_size,
                .total_chunks = orchestrator.calculate_total_chunks(file_size),
                .completed_chunks = pending ? pending->completed_chunks : std::set<std::uint64_t>{},
            });
        }

        UploadResult result;
        if (config.resume)
        {
            std::optional<std::vector<std::uint64_t>> completed;
            try
            {
                if (const auto status = transport.query_status(status_endpoint, upload_id))
                {
                    completed = status->received_chunks;
                    std::cout << "Server holds " << status->received_chunks.size() << "/" << status->total_chunks
                              << " chunks of " << upload_id << std::endl;
                }
                else
                {
                    std::cout << "Server has no record of " << upload_id << "; sending the whole file" << std::endl;
                }
            }
            catch (const TransportError &ex)
            {
                std::cerr << "Status query failed: " << ex.what() << std::endl;
                logger.warn("status", upload_id, ": ", ex.what());
                if (pending)
                {
                    completed = to_vector(pending->completed_chunks);
                }
            }

            result = completed ? orchestrator.resume_upload(config.file, endpoint, upload_id, *completed)
                               : orchestrator.upload_file(config.file, endpoint, upload_id);
        }
        else
        {
            result = orchestrator.upload_file(config.file, endpoint, upload_id);
        }
        std::cout << std::endl;

        if (!result.success)
        {
            std::cerr << "ERROR: " << chunkdrive::to_string(result.error) << "\n"
                      << result.message << std::endl;
            std::cerr << "Resume with: --resume --upload-id " << result.upload_id << std::endl;
            return EXIT_FAILURE;
        }

        journal.remove(upload_id);
        std::cout << "OK " << result.upload_id << ": " << result.message << std::endl;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Client failed: " << ex.what() << std::endl;
        logger.warn("fatal", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
