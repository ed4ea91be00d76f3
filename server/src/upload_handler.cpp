#include "chunkdrive/server/upload_handler.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chunkdrive/multipart.hpp"
#include "chunkdrive/protocol.hpp"

namespace chunkdrive::server
{

    namespace
    {

        std::string_view strip_query(std::string_view target)
        {
            const auto pos = target.find('?');
            return pos == std::string_view::npos ? target : target.substr(0, pos);
        }

        HttpResponse json_response(http::status status, const HttpRequest &request, const nlohmann::json &body)
        {
            HttpResponse response{status, request.version()};
            response.set(http::field::content_type, "application/json");
            response.set(http::field::access_control_allow_origin, "*");
            response.keep_alive(request.keep_alive());
            response.body() = body.dump();
            response.prepare_payload();
            return response;
        }

        HttpResponse error_response(ErrorCode code, const HttpRequest &request, std::string message,
                                    std::optional<std::string> upload_id = std::nullopt)
        {
            const protocol::UploadResponse body{
                .success = false,
                .message = std::move(message),
                .upload_id = std::move(upload_id),
                .error = code,
            };
            return json_response(status_for(code), request, body);
        }

    } // namespace

    http::status status_for(ErrorCode code) noexcept
    {
        switch (code)
        {
        case ErrorCode::Ok:
            return http::status::ok;
        case ErrorCode::InvalidPayload:
        case ErrorCode::InvalidConfiguration:
            return http::status::bad_request;
        case ErrorCode::UnknownSession:
            return http::status::not_found;
        case ErrorCode::Conflict:
            return http::status::conflict;
        case ErrorCode::Unsupported:
            return http::status::method_not_allowed;
        default:
            return http::status::internal_server_error;
        }
    }

    UploadHandler::UploadHandler(SessionRegistry &registry) : registry_(registry) {}

    HttpResponse UploadHandler::handle(const HttpRequest &request)
    {
        const auto path = strip_query(std::string_view(request.target().data(), request.target().size()));

        if (request.method() == http::verb::options)
        {
            return handle_preflight(request);
        }

        if (path == protocol::kUploadPath)
        {
            if (request.method() != http::verb::post)
            {
                return error_response(ErrorCode::Unsupported, request, "Method not allowed");
            }
            return handle_upload(request);
        }

        const std::string status_prefix = std::string(protocol::kStatusPath) + "/";
        if (path.rfind(status_prefix, 0) == 0)
        {
            if (request.method() != http::verb::get)
            {
                return error_response(ErrorCode::Unsupported, request, "Method not allowed");
            }
            return handle_status(request, path.substr(status_prefix.size()));
        }

        return error_response(ErrorCode::UnknownSession, request, "Not found");
    }

    HttpResponse UploadHandler::handle_upload(const HttpRequest &request)
    {
        std::optional<std::string> upload_id;
        try
        {
            const auto content_type = request[http::field::content_type];
            const auto boundary =
                multipart::boundary_from_content_type(std::string_view(content_type.data(), content_type.size()));
            if (!boundary)
            {
                return error_response(ErrorCode::InvalidPayload, request, "Expected multipart/form-data body");
            }

            const auto parts = multipart::decode(request.body(), *boundary);
            const auto *chunk = multipart::find_part(parts, protocol::kChunkField);
            const auto *metadata_part = multipart::find_part(parts, protocol::kMetadataField);
            if (chunk == nullptr || metadata_part == nullptr)
            {
                return error_response(ErrorCode::InvalidPayload, request, "Missing chunk or metadata field");
            }

            const auto metadata = nlohmann::json::parse(metadata_part->data).get<protocol::ChunkMetadata>();
            upload_id = metadata.upload_id;

            const auto result = registry_.receive_chunk(metadata, chunk->data);

            protocol::UploadResponse body{
                .success = true,
                .upload_id = metadata.upload_id,
                .completed = result.completed,
            };
            if (result.completed)
            {
                body.message = "File upload completed";
                body.artifact = result.artifact->name;
            }
            else
            {
                body.message = "Chunk " + std::to_string(metadata.chunk_index + 1) + "/" +
                               std::to_string(metadata.total_chunks) + " received";
            }
            return json_response(http::status::ok, request, body);
        }
        catch (const ReassemblyError &ex)
        {
            spdlog::error("Reassembly of {} failed: {}", upload_id.value_or("?"), ex.what());
            return error_response(ex.code(), request, ex.what(), upload_id);
        }
        catch (const chunkdrive::Error &ex)
        {
            spdlog::warn("Rejected chunk for {}: {}", upload_id.value_or("?"), ex.what());
            return error_response(ex.code(), request, ex.what(), upload_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            return error_response(ErrorCode::InvalidPayload, request, std::string("Invalid metadata: ") + ex.what(),
                                  upload_id);
        }
        catch (const std::invalid_argument &ex)
        {
            return error_response(ErrorCode::InvalidPayload, request, ex.what(), upload_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Upload error: {}", ex.what());
            return error_response(ErrorCode::InternalError, request, "Chunk upload failed", upload_id);
        }
    }

    HttpResponse UploadHandler::handle_status(const HttpRequest &request, std::string_view upload_id)
    {
        const auto status = registry_.status(std::string(upload_id));
        if (!status)
        {
            return error_response(ErrorCode::UnknownSession, request, "Upload not found");
        }

        const protocol::StatusResponse body{
            .success = true,
            .upload_id = status->upload_id,
            .total_chunks = status->total_chunks,
            .received_chunks = status->received_chunks,
            .progress = status->progress_percentage,
        };
        return json_response(http::status::ok, request, body);
    }

    HttpResponse UploadHandler::handle_preflight(const HttpRequest &request)
    {
        HttpResponse response{http::status::no_content, request.version()};
        response.set(http::field::access_control_allow_origin, "*");
        response.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
        response.set(http::field::access_control_allow_headers, "Content-Type");
        response.keep_alive(request.keep_alive());
        response.prepare_payload();
        return response;
    }

} // namespace chunkdrive::server
