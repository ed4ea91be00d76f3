#include "chunkdrive/multipart.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "chunkdrive/crypto.hpp"

namespace chunkdrive::multipart
{

    namespace
    {
        constexpr std::string_view kCrlf = "\r\n";
        constexpr std::string_view kHeaderTerminator = "\r\n\r\n";

        std::string to_lower(std::string_view value)
        {
            std::string result(value);
            for (auto &ch : result)
            {
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            return result;
        }

        std::string_view trim(std::string_view value)
        {
            const auto begin = value.find_first_not_of(" \t");
            if (begin == std::string_view::npos)
            {
                return {};
            }
            const auto end = value.find_last_not_of(" \t");
            return value.substr(begin, end - begin + 1);
        }

        std::string unquote(std::string_view value)
        {
            value = trim(value);
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
            {
                value = value.substr(1, value.size() - 2);
            }
            return std::string(value);
        }

        void apply_disposition(std::string_view value, Part &part)
        {
            std::size_t start = 0;
            while (start <= value.size())
            {
                const auto end = std::min(value.find(';', start), value.size());
                const auto parameter = trim(value.substr(start, end - start));
                const auto eq = parameter.find('=');
                if (eq != std::string_view::npos)
                {
                    const auto key = to_lower(trim(parameter.substr(0, eq)));
                    if (key == "name")
                    {
                        part.name = unquote(parameter.substr(eq + 1));
                    }
                    else if (key == "filename")
                    {
                        part.filename = unquote(parameter.substr(eq + 1));
                    }
                }
                start = end + 1;
            }
        }

        Part parse_headers(std::string_view block)
        {
            Part part;
            std::size_t start = 0;
            while (start < block.size())
            {
                auto end = block.find(kCrlf, start);
                if (end == std::string_view::npos)
                {
                    end = block.size();
                }
                const auto line = block.substr(start, end - start);
                const auto colon = line.find(':');
                if (colon != std::string_view::npos)
                {
                    const auto header = to_lower(trim(line.substr(0, colon)));
                    const auto value = trim(line.substr(colon + 1));
                    if (header == "content-disposition")
                    {
                        apply_disposition(value, part);
                    }
                    else if (header == "content-type")
                    {
                        part.content_type = std::string(value);
                    }
                }
                start = end + kCrlf.size();
            }
            if (part.name.empty())
            {
                throw std::invalid_argument("Multipart part without a field name");
            }
            return part;
        }

    } // namespace

    std::string generate_boundary()
    {
        return "----chunkdrive" + crypto::random_hex(12);
    }

    std::string content_type_header(std::string_view boundary)
    {
        return "multipart/form-data; boundary=" + std::string(boundary);
    }

    std::optional<std::string> boundary_from_content_type(std::string_view content_type)
    {
        const auto lowered = to_lower(content_type);
        if (lowered.rfind("multipart/form-data", 0) != 0)
        {
            return std::nullopt;
        }
        constexpr std::string_view kKey = "boundary=";
        const auto pos = lowered.find(kKey);
        if (pos == std::string::npos)
        {
            return std::nullopt;
        }
        const auto value_begin = pos + kKey.size();
        const auto value_end = std::min(content_type.find(';', value_begin), content_type.size());
        auto boundary = unquote(content_type.substr(value_begin, value_end - value_begin));
        if (boundary.empty())
        {
            return std::nullopt;
        }
        return boundary;
    }

    std::string encode(const std::vector<Part> &parts, std::string_view boundary)
    {
        std::string body;
        for (const auto &part : parts)
        {
            body.append("--").append(boundary).append(kCrlf);
            body.append("Content-Disposition: form-data; name=\"").append(part.name).append("\"");
            if (part.filename)
            {
                body.append("; filename=\"").append(*part.filename).append("\"");
            }
            body.append(kCrlf);
            if (!part.content_type.empty())
            {
                body.append("Content-Type: ").append(part.content_type).append(kCrlf);
            }
            body.append(kCrlf);
            body.append(part.data);
            body.append(kCrlf);
        }
        body.append("--").append(boundary).append("--").append(kCrlf);
        return body;
    }

    std::vector<Part> decode(std::string_view body, std::string_view boundary)
    {
        if (boundary.empty())
        {
            throw std::invalid_argument("Empty multipart boundary");
        }
        const std::string delimiter = "--" + std::string(boundary);
        const std::string part_terminator = std::string(kCrlf) + delimiter;

        auto pos = body.find(delimiter);
        if (pos == std::string_view::npos)
        {
            throw std::invalid_argument("Multipart boundary not found");
        }
        pos += delimiter.size();

        std::vector<Part> parts;
        while (true)
        {
            const auto marker = body.substr(pos, 2);
            if (marker == "--")
            {
                return parts;
            }
            if (marker != kCrlf)
            {
                throw std::invalid_argument("Malformed multipart delimiter");
            }
            pos += kCrlf.size();

            const auto header_end = body.find(kHeaderTerminator, pos);
            if (header_end == std::string_view::npos)
            {
                throw std::invalid_argument("Unterminated multipart headers");
            }
            auto part = parse_headers(body.substr(pos, header_end - pos));

            const auto content_begin = header_end + kHeaderTerminator.size();
            const auto content_end = body.find(part_terminator, content_begin);
            if (content_end == std::string_view::npos)
            {
                throw std::invalid_argument("Unterminated multipart part");
            }
            part.data.assign(body.substr(content_begin, content_end - content_begin));
            parts.push_back(std::move(part));
            pos = content_end + part_terminator.size();
        }
    }

    const Part *find_part(const std::vector<Part> &parts, std::string_view name) noexcept
    {
        const auto it = std::find_if(parts.begin(), parts.end(), [&](const Part &part)
                                     { return part.name == name; });
        return it == parts.end() ? nullptr : &*it;
    }

} // namespace chunkdrive::multipart
