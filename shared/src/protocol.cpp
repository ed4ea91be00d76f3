#include "chunkdrive/protocol.hpp"

#include <algorithm>

namespace chunkdrive::protocol
{

    bool is_valid_upload_id(std::string_view upload_id) noexcept
    {
        if (upload_id.empty() || upload_id.size() > kMaxUploadIdLength)
        {
            return false;
        }
        return std::all_of(upload_id.begin(), upload_id.end(), [](char ch)
                           { return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
                                    ch == '-' || ch == '_'; });
    }

    void to_json(nlohmann::json &json, const ChunkMetadata &metadata)
    {
        json = {
            {"chunkIndex", metadata.chunk_index},
            {"totalChunks", metadata.total_chunks},
            {"fileName", metadata.file_name},
            {"fileSize", metadata.file_size},
            {"chunkSize", metadata.chunk_size},
            {"uploadId", metadata.upload_id},
        };
    }

    void from_json(const nlohmann::json &json, ChunkMetadata &metadata)
    {
        metadata.chunk_index = json.at("chunkIndex").get<std::uint64_t>();
        metadata.total_chunks = json.at("totalChunks").get<std::uint64_t>();
        metadata.file_name = json.at("fileName").get<std::string>();
        metadata.file_size = json.at("fileSize").get<std::uint64_t>();
        metadata.chunk_size = json.at("chunkSize").get<std::uint64_t>();
        metadata.upload_id = json.at("uploadId").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadResponse &response)
    {
        json = {
            {"success", response.success},
            {"message", response.message},
        };
        if (response.upload_id)
        {
            json["uploadId"] = *response.upload_id;
        }
        if (response.success)
        {
            json["completed"] = response.completed;
        }
        if (response.artifact)
        {
            json["artifact"] = *response.artifact;
        }
        if (response.error != ErrorCode::Ok)
        {
            json["error"] = to_string(response.error);
        }
    }

    void from_json(const nlohmann::json &json, UploadResponse &response)
    {
        response.success = json.at("success").get<bool>();
        response.message = json.value("message", std::string{});
        if (json.contains("uploadId"))
        {
            response.upload_id = json.at("uploadId").get<std::string>();
        }
        response.completed = json.value("completed", false);
        if (json.contains("artifact"))
        {
            response.artifact = json.at("artifact").get<std::string>();
        }
        response.error = ErrorCode::Ok;
        if (json.contains("error"))
        {
            response.error = error_code_from_string(json.at("error").get<std::string>()).value_or(ErrorCode::InternalError);
        }
    }

    void to_json(nlohmann::json &json, const StatusResponse &response)
    {
        json = {
            {"success", response.success},
            {"uploadId", response.upload_id},
            {"totalChunks", response.total_chunks},
            {"receivedChunks", response.received_chunks},
            {"progress", response.progress},
        };
    }

    void from_json(const nlohmann::json &json, StatusResponse &response)
    {
        response.success = json.at("success").get<bool>();
        response.upload_id = json.at("uploadId").get<std::string>();
        response.total_chunks = json.at("totalChunks").get<std::uint64_t>();
        response.received_chunks = json.at("receivedChunks").get<std::vector<std::uint64_t>>();
        response.progress = json.value("progress", 0.0);
    }

} // namespace chunkdrive::protocol
