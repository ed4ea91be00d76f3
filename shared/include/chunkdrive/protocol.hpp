/**
 * ChunkDrive - Shared protocol schema and serialization helpers.
 *
 * The HTTP contract between the uploader and the server:
 *   POST /upload                     multipart/form-data with fields "chunk" and "metadata"
 *   GET  /upload-status/<uploadId>   JSON status of an in-flight session
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkdrive/error_codes.hpp"

namespace chunkdrive::protocol
{

    inline constexpr std::string_view kUploadPath = "/upload";
    inline constexpr std::string_view kStatusPath = "/upload-status";
    inline constexpr std::string_view kChunkField = "chunk";
    inline constexpr std::string_view kMetadataField = "metadata";
    inline constexpr std::size_t kMaxUploadIdLength = 128;

    /// Upload ids name staged files, so only [A-Za-z0-9_-] is accepted.
    bool is_valid_upload_id(std::string_view upload_id) noexcept;

    struct ChunkMetadata
    {
        std::uint64_t chunk_index{};
        std::uint64_t total_chunks{};
        std::string file_name;
        std::uint64_t file_size{};
        std::uint64_t chunk_size{};
        std::string upload_id;
    };

    void to_json(nlohmann::json &json, const ChunkMetadata &metadata);
    void from_json(const nlohmann::json &json, ChunkMetadata &metadata);

    struct UploadResponse
    {
        bool success{};
        std::string message;
        std::optional<std::string> upload_id{};
        bool completed{};
        std::optional<std::string> artifact{};
        ErrorCode error{ErrorCode::Ok};
    };

    void to_json(nlohmann::json &json, const UploadResponse &response);
    void from_json(const nlohmann::json &json, UploadResponse &response);

    struct StatusResponse
    {
        bool success{};
        std::string upload_id;
        std::uint64_t total_chunks{};
        std::vector<std::uint64_t> received_chunks;
        double progress{};
    };

    void to_json(nlohmann::json &json, const StatusResponse &response);
    void from_json(const nlohmann::json &json, StatusResponse &response);

} // namespace chunkdrive::protocol
