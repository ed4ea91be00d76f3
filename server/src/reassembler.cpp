#include "chunkdrive/server/reassembler.hpp"

#include <array>
#include <fstream>

#include <spdlog/spdlog.h>

#include "chunkdrive/crypto.hpp"

namespace chunkdrive::server
{

    namespace
    {
        constexpr std::size_t kNameDigestLength = 16;
        constexpr std::size_t kCopyBufferSize = 64 * 1024;

        void remove_quietly(const std::filesystem::path &path)
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }

    } // namespace

    ReassemblyError::ReassemblyError(std::string message)
        : Error(ErrorCode::ReassemblyFailure, std::move(message)) {}

    ReassemblyEngine::ReassemblyEngine(std::filesystem::path files_dir, ChunkStore &chunk_store)
        : files_dir_(std::move(files_dir)), chunk_store_(chunk_store)
    {
        std::filesystem::create_directories(files_dir_);
    }

    std::string ReassemblyEngine::artifact_name(const std::string &file_name, Clock::time_point when)
    {
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count();
        const auto digest = crypto::sha256_hex(file_name + std::to_string(millis));
        return digest.substr(0, kNameDigestLength) + std::filesystem::path(file_name).extension().string();
    }

    ArtifactInfo ReassemblyEngine::publish(const std::filesystem::path &partial, const std::string &file_name)
    {
        // create_hard_link never replaces an existing file, so each artifact name is claimed once.
        auto when = Clock::now();
        ArtifactInfo artifact;
        while (true)
        {
            artifact.name = artifact_name(file_name, when);
            artifact.path = files_dir_ / artifact.name;

            std::error_code ec;
            std::filesystem::create_hard_link(partial, artifact.path, ec);
            if (!ec)
            {
                break;
            }
            if (ec != std::errc::file_exists)
            {
                remove_quietly(partial);
                throw ReassemblyError("Could not publish artifact " + artifact.name + ": " + ec.message());
            }
            when += std::chrono::milliseconds(1);
        }
        remove_quietly(partial);
        return artifact;
    }

    ArtifactInfo ReassemblyEngine::reassemble(const std::string &upload_id, const std::string &file_name,
                                              std::uint64_t file_size, std::uint64_t total_chunks)
    {
        // One reassembly per upload id at a time, so the partial file is private to this call.
        const auto partial = files_dir_ / (upload_id + ".part");

        std::uint64_t written = 0;
        {
            std::ofstream out(partial, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw ReassemblyError("Could not create partial artifact for " + upload_id);
            }

            std::array<char, kCopyBufferSize> buffer{};
            for (std::uint64_t index = 0; index < total_chunks; ++index)
            {
                std::ifstream in(chunk_store_.chunk_path(upload_id, index), std::ios::binary);
                if (!in.is_open())
                {
                    out.close();
                    remove_quietly(partial);
                    throw ReassemblyError("Missing staged chunk " + std::to_string(index) + " of " + upload_id);
                }
                while (in)
                {
                    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                    const auto read_count = in.gcount();
                    if (read_count > 0)
                    {
                        out.write(buffer.data(), read_count);
                        written += static_cast<std::uint64_t>(read_count);
                    }
                }
                if (in.bad() || !out)
                {
                    out.close();
                    remove_quietly(partial);
                    throw ReassemblyError("I/O error while appending chunk " + std::to_string(index) + " of " +
                                          upload_id);
                }
            }
            out.close();
            if (!out)
            {
                remove_quietly(partial);
                throw ReassemblyError("Could not finalize partial artifact for " + upload_id);
            }
        }

        if (written != file_size)
        {
            remove_quietly(partial);
            throw ReassemblyError("Reassembled " + std::to_string(written) + " bytes for " + upload_id + ", expected " +
                                  std::to_string(file_size));
        }

        ArtifactInfo artifact = publish(partial, file_name);
        artifact.size = written;
        chunk_store_.remove(upload_id, total_chunks);
        spdlog::info("File merged successfully: {} ({} -> {}, {} bytes)", artifact.path.string(), file_name,
                     artifact.name, artifact.size);
        return artifact;
    }

} // namespace chunkdrive::server
