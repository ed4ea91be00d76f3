/**
 * ChunkDrive - multipart/form-data encoding and decoding for chunk uploads.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chunkdrive::multipart
{

    struct Part
    {
        std::string name;
        std::optional<std::string> filename{};
        std::string content_type{};
        std::string data;
    };

    std::string generate_boundary();

    std::string content_type_header(std::string_view boundary);

    std::optional<std::string> boundary_from_content_type(std::string_view content_type);

    std::string encode(const std::vector<Part> &parts, std::string_view boundary);

    /// Throws std::invalid_argument on a malformed body.
    std::vector<Part> decode(std::string_view body, std::string_view boundary);

    const Part *find_part(const std::vector<Part> &parts, std::string_view name) noexcept;

} // namespace chunkdrive::multipart
