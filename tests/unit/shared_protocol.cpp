#include <cassert>
#include <iostream>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkdrive/chunk_plan.hpp"
#include "chunkdrive/crypto.hpp"
#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/multipart.hpp"
#include "chunkdrive/protocol.hpp"

using namespace chunkdrive;
using namespace chunkdrive::protocol;

void run_server_component_tests();
void run_client_component_tests();

namespace
{

    void test_chunk_plan()
    {
        assert(total_chunks(2'500'000, 1'000'000) == 3);
        assert(total_chunks(2'000'000, 1'000'000) == 2);
        assert(total_chunks(1, kDefaultChunkSize) == 1);
        assert(total_chunks(0, 1024) == 0);

        const auto plan = plan_chunks(2'500'000, 1'000'000);
        assert(plan.size() == 3);
        assert(plan[0].offset == 0 && plan[0].length == 1'000'000);
        assert(plan[1].offset == 1'000'000 && plan[1].length == 1'000'000);
        assert(plan[2].offset == 2'000'000 && plan[2].length == 500'000);

        const auto sum = std::accumulate(plan.begin(), plan.end(), std::uint64_t{0},
                                         [](std::uint64_t acc, const ChunkRange &range)
                                         { return acc + range.length; });
        assert(sum == 2'500'000);
        for (std::size_t i = 0; i < plan.size(); ++i)
        {
            assert(plan[i].index == i);
        }

        // chunk_size larger than the file: one chunk covering all of it
        const auto single = chunk_range(0, 10, 4096);
        assert(single.offset == 0 && single.length == 10);

        bool threw = false;
        try
        {
            (void)total_chunks(100, 0);
        }
        catch (const ConfigurationError &ex)
        {
            threw = ex.code() == ErrorCode::InvalidConfiguration;
        }
        assert(threw);

        threw = false;
        try
        {
            (void)chunk_range(3, 2'500'000, 1'000'000);
        }
        catch (const std::out_of_range &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_metadata_json()
    {
        const ChunkMetadata metadata{
            .chunk_index = 2,
            .total_chunks = 3,
            .file_name = "report.pdf",
            .file_size = 2'500'000,
            .chunk_size = 500'000,
            .upload_id = "upload-1700000000000-abc123",
        };

        const nlohmann::json json = metadata;
        assert(json.at("chunkIndex") == 2);
        assert(json.at("totalChunks") == 3);
        assert(json.at("fileName") == "report.pdf");
        assert(json.at("fileSize") == 2'500'000);
        assert(json.at("chunkSize") == 500'000);
        assert(json.at("uploadId") == "upload-1700000000000-abc123");

        const auto decoded = json.get<ChunkMetadata>();
        assert(decoded.chunk_index == metadata.chunk_index);
        assert(decoded.upload_id == metadata.upload_id);

        bool threw = false;
        try
        {
            (void)nlohmann::json::parse(R"({"chunkIndex":0,"totalChunks":1})").get<ChunkMetadata>();
        }
        catch (const nlohmann::json::exception &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_response_json()
    {
        UploadResponse failure{
            .success = false,
            .message = "Chunk upload failed",
            .upload_id = std::string("u1"),
            .error = ErrorCode::ReassemblyFailure,
        };
        const nlohmann::json json = failure;
        assert(json.at("success") == false);
        assert(json.at("error") == "reassembly_failure");
        assert(!json.contains("completed"));

        const auto decoded = json.get<UploadResponse>();
        assert(decoded.error == ErrorCode::ReassemblyFailure);
        assert(decoded.upload_id == std::optional<std::string>("u1"));

        const auto status = nlohmann::json::parse(
                                R"({"success":true,"uploadId":"u1","totalChunks":5,"receivedChunks":[0,1],"progress":40})")
                                .get<StatusResponse>();
        assert(status.total_chunks == 5);
        assert((status.received_chunks == std::vector<std::uint64_t>{0, 1}));
        assert(status.progress == 40.0);
    }

    void test_error_codes()
    {
        for (std::uint16_t value = 0; value <= to_int(ErrorCode::InternalError); ++value)
        {
            const auto code = error_code_from_int(value);
            assert(to_int(code) == value);
            assert(error_code_from_string(to_string(code)) == code);
        }
        assert(to_string(ErrorCode::ChunkDeliveryExhausted) == "chunk_delivery_exhausted");
        assert(!error_code_from_string("no_such_code").has_value());

        const Error error(ErrorCode::Conflict, "busy");
        assert(error.code() == ErrorCode::Conflict);
        assert(std::string(error.what()) == "busy");
    }

    void test_upload_id_validation()
    {
        assert(is_valid_upload_id("upload-1700000000000-a1b2c3"));
        assert(is_valid_upload_id("A_b-9"));
        assert(!is_valid_upload_id(""));
        assert(!is_valid_upload_id("../etc/passwd"));
        assert(!is_valid_upload_id("with space"));
        assert(is_valid_upload_id(std::string(kMaxUploadIdLength, 'x')));
        assert(!is_valid_upload_id(std::string(kMaxUploadIdLength + 1, 'x')));
    }

    void test_multipart()
    {
        std::string binary;
        for (int i = 0; i < 256; ++i)
        {
            binary.push_back(static_cast<char>(i));
        }
        binary += "\r\n--not-the-boundary\r\n";

        const auto boundary = multipart::generate_boundary();
        assert(boundary.rfind("----chunkdrive", 0) == 0);

        const std::vector<multipart::Part> parts{
            {.name = "chunk", .filename = std::string("blob"), .content_type = "application/octet-stream",
             .data = binary},
            {.name = "metadata", .data = R"({"chunkIndex":0})"},
        };
        const auto body = multipart::encode(parts, boundary);

        const auto header = multipart::content_type_header(boundary);
        assert(multipart::boundary_from_content_type(header) == boundary);
        assert(multipart::boundary_from_content_type("multipart/form-data; boundary=\"abc\"") == std::string("abc"));
        assert(!multipart::boundary_from_content_type("application/json").has_value());

        const auto decoded = multipart::decode(body, boundary);
        assert(decoded.size() == 2);
        const auto *chunk = multipart::find_part(decoded, "chunk");
        assert(chunk != nullptr);
        assert(chunk->data == binary);
        assert(chunk->filename == std::optional<std::string>("blob"));
        assert(chunk->content_type == "application/octet-stream");
        const auto *metadata = multipart::find_part(decoded, "metadata");
        assert(metadata != nullptr && metadata->data == R"({"chunkIndex":0})");
        assert(multipart::find_part(decoded, "missing") == nullptr);

        bool threw = false;
        try
        {
            (void)multipart::decode("garbage without delimiters", boundary);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);

        threw = false;
        try
        {
            (void)multipart::decode(body.substr(0, body.size() / 2), boundary);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_crypto()
    {
        crypto::ensure_sodium_init();
        crypto::ensure_sodium_init();
        assert(crypto::sha256_hex(std::string_view("abc")) ==
               "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

        const auto token = crypto::random_hex(6);
        assert(token.size() == 12);
        assert(token.find_first_not_of("0123456789abcdef") == std::string::npos);
        assert(token != crypto::random_hex(6));
    }

} // namespace

int main()
{
    try
    {
        test_chunk_plan();
        test_metadata_json();
        test_response_json();
        test_error_codes();
        test_upload_id_validation();
        test_multipart();
        test_crypto();
        run_server_component_tests();
        run_client_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All ChunkDrive unit tests passed\n";
    return 0;
}
