#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <map>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkdrive/client/endpoint.hpp"
#include "chunkdrive/client/http_transport.hpp"
#include "chunkdrive/client/retry_policy.hpp"
#include "chunkdrive/client/transfer_state_store.hpp"
#include "chunkdrive/client/upload_orchestrator.hpp"
#include "chunkdrive/multipart.hpp"
#include "chunkdrive/protocol.hpp"
#include "chunkdrive/server/chunk_store.hpp"
#include "chunkdrive/server/reassembler.hpp"
#include "chunkdrive/server/server.hpp"
#include "chunkdrive/server/session_registry.hpp"
#include "chunkdrive/server/upload_handler.hpp"

using namespace chunkdrive;
using namespace chunkdrive::client;
using std::chrono::milliseconds;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string random_bytes(std::size_t size, unsigned seed)
    {
        std::mt19937 engine(seed);
        std::uniform_int_distribution<int> dist(0, 255);
        std::string bytes(size, '\0');
        for (auto &ch : bytes)
        {
            ch = static_cast<char>(dist(engine));
        }
        return bytes;
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    std::filesystem::path write_temp_file(const std::string &name, const std::string &content)
    {
        const auto path = std::filesystem::temp_directory_path() / name;
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        return path;
    }

    std::vector<std::filesystem::path> files_in(const std::filesystem::path &dir)
    {
        std::vector<std::filesystem::path> files;
        for (const auto &entry : std::filesystem::directory_iterator(dir))
        {
            if (entry.is_regular_file())
            {
                files.push_back(entry.path());
            }
        }
        return files;
    }

    const Endpoint kEndpoint{.host = "127.0.0.1", .port = "3000", .target = "/upload"};

    void no_sleep(milliseconds) {}

    // Records every attempt; fails an index as many times as failures_[index] says.
    class RecordingTransport : public ChunkTransport
    {
    public:
        void send_chunk(const Endpoint &, const protocol::ChunkMetadata &metadata, std::string_view data) override
        {
            attempts.push_back(metadata.chunk_index);
            auto it = failures.find(metadata.chunk_index);
            if (it != failures.end() && it->second > 0)
            {
                --it->second;
                throw TransportError("simulated outage", 503);
            }
            delivered.push_back(metadata);
            payload_sizes.push_back(data.size());
        }

        std::optional<protocol::StatusResponse> query_status(const Endpoint &, const std::string &) override
        {
            return std::nullopt;
        }

        std::map<std::uint64_t, int> failures;
        std::vector<std::uint64_t> attempts;
        std::vector<protocol::ChunkMetadata> delivered;
        std::vector<std::size_t> payload_sizes;
    };

    // Speaks the wire format straight into an UploadHandler, without sockets.
    class InProcessTransport : public ChunkTransport
    {
    public:
        explicit InProcessTransport(server::UploadHandler &handler) : handler_(handler) {}

        void send_chunk(const Endpoint &endpoint, const protocol::ChunkMetadata &metadata,
                        std::string_view data) override
        {
            if (fail_from && metadata.chunk_index >= *fail_from)
            {
                throw TransportError("connection reset");
            }
            const auto boundary = multipart::generate_boundary();
            server::HttpRequest request{server::http::verb::post, endpoint.target, 11};
            request.set(server::http::field::content_type, multipart::content_type_header(boundary));
            request.body() = multipart::encode(
                {
                    multipart::Part{.name = "chunk",
                                    .filename = std::string("blob"),
                                    .content_type = "application/octet-stream",
                                    .data = std::string(data)},
                    multipart::Part{.name = "metadata", .data = nlohmann::json(metadata).dump()},
                },
                boundary);
            request.prepare_payload();

            const auto response = handler_.handle(request);
            if (response.result_int() != 200)
            {
                throw TransportError("Upload failed with status " + std::to_string(response.result_int()),
                                     response.result_int());
            }
            last_response = nlohmann::json::parse(response.body()).get<protocol::UploadResponse>();
        }

        std::optional<protocol::StatusResponse> query_status(const Endpoint &status_endpoint,
                                                             const std::string &upload_id) override
        {
            server::HttpRequest request{server::http::verb::get, status_endpoint.target + "/" + upload_id, 11};
            request.prepare_payload();
            const auto response = handler_.handle(request);
            if (response.result_int() == 404)
            {
                return std::nullopt;
            }
            return nlohmann::json::parse(response.body()).get<protocol::StatusResponse>();
        }

        std::optional<std::uint64_t> fail_from;
        std::optional<protocol::UploadResponse> last_response;

    private:
        server::UploadHandler &handler_;
    };

    UploadOptions quick_options(std::uint64_t chunk_size, std::uint32_t max_retries = 3)
    {
        UploadOptions options;
        options.chunk_size = chunk_size;
        options.max_retries = max_retries;
        options.sleeper = no_sleep;
        return options;
    }

    void test_retry_policy_recovers()
    {
        std::vector<milliseconds> sleeps;
        RetryPolicy policy(3, std::chrono::seconds(1), [&](milliseconds delay)
                           { sleeps.push_back(delay); });

        int calls = 0;
        policy.execute(4, [&]
                       {
            ++calls;
            if (calls < 3) {
                throw TransportError("flaky");
            } });

        assert(calls == 3);
        assert((sleeps == std::vector<milliseconds>{milliseconds(1000), milliseconds(2000)}));
        assert(policy.delay_for(2) == milliseconds(4000));
    }

    void test_retry_policy_exhausts()
    {
        std::vector<milliseconds> sleeps;
        RetryPolicy policy(3, std::chrono::seconds(1), [&](milliseconds delay)
                           { sleeps.push_back(delay); });

        int calls = 0;
        int observed = 0;
        std::uint64_t observed_index = 0;
        bool threw = false;
        try
        {
            policy.execute(
                7, [&]
                {
                    ++calls;
                    throw TransportError("down"); },
                [&](const std::exception &ex, std::uint64_t index)
                {
                    ++observed;
                    observed_index = index;
                    assert(std::string(ex.what()) == "down");
                });
        }
        catch (const DeliveryExhaustedError &ex)
        {
            threw = ex.code() == ErrorCode::ChunkDeliveryExhausted && ex.chunk_index() == 7 && ex.attempts() == 3;
        }

        assert(threw);
        assert(calls == 3);
        assert(observed == 1 && observed_index == 7);
        assert(sleeps.size() == 2);

        bool rejected = false;
        try
        {
            RetryPolicy invalid(0);
        }
        catch (const ConfigurationError &)
        {
            rejected = true;
        }
        assert(rejected);
    }

    void test_retry_policy_bounds()
    {
        const auto rejects = [](std::uint32_t max_retries, milliseconds base_delay)
        {
            try
            {
                RetryPolicy policy(max_retries, base_delay, no_sleep);
            }
            catch (const ConfigurationError &)
            {
                return true;
            }
            return false;
        };

        assert(rejects(RetryPolicy::kMaxRetries + 1, std::chrono::seconds(1)));
        assert(rejects(1000, std::chrono::seconds(1)));
        assert(rejects(3, milliseconds(-1)));
        assert(rejects(RetryPolicy::kMaxRetries, milliseconds(std::numeric_limits<milliseconds::rep>::max() / 2)));

        const RetryPolicy longest(RetryPolicy::kMaxRetries, std::chrono::seconds(1), no_sleep);
        assert(longest.delay_for(RetryPolicy::kMaxRetries - 1) ==
               milliseconds(1000) * (std::int64_t{1} << (RetryPolicy::kMaxRetries - 1)));

        bool threw = false;
        try
        {
            (void)longest.delay_for(RetryPolicy::kMaxRetries);
        }
        catch (const std::out_of_range &)
        {
            threw = true;
        }
        assert(threw);

        bool orchestrator_rejected = false;
        RecordingTransport transport;
        try
        {
            UploadOrchestrator orchestrator(quick_options(10, 500), transport);
        }
        catch (const ConfigurationError &)
        {
            orchestrator_rejected = true;
        }
        assert(orchestrator_rejected);
    }

    void test_orchestrator_sequential_upload()
    {
        const auto content = random_bytes(25, 21);
        const auto file = write_temp_file("chunkdrive_sequential.bin", content);

        RecordingTransport transport;
        auto options = quick_options(10);
        std::vector<UploadProgress> progress;
        std::vector<std::uint64_t> completed;
        options.on_progress = [&](const UploadProgress &p)
        { progress.push_back(p); };
        options.on_chunk_complete = [&](std::uint64_t index, std::uint64_t total)
        {
            assert(total == 3);
            completed.push_back(index);
        };

        UploadOrchestrator orchestrator(options, transport);
        assert(orchestrator.state() == TransferState::Idle);
        assert(orchestrator.calculate_total_chunks(content.size()) == 3);

        const auto result = orchestrator.upload_file(file, kEndpoint, std::string("u-seq"));
        assert(result.success);
        assert(result.upload_id == "u-seq");
        assert(result.message == "File uploaded successfully");
        assert(orchestrator.state() == TransferState::Completed);

        assert((transport.attempts == std::vector<std::uint64_t>{0, 1, 2}));
        assert((transport.payload_sizes == std::vector<std::size_t>{10, 10, 5}));
        for (const auto &metadata : transport.delivered)
        {
            assert(metadata.total_chunks == 3);
            assert(metadata.file_size == 25);
            assert(metadata.file_name == "chunkdrive_sequential.bin");
            assert(metadata.upload_id == "u-seq");
        }
        assert(transport.delivered.back().chunk_size == 5);

        assert(progress.size() == 3);
        assert(progress[0].uploaded_bytes == 10 && progress[0].current_chunk == 1);
        assert(progress[2].uploaded_bytes == 25 && progress[2].percentage == 100.0);
        assert((completed == std::vector<std::uint64_t>{0, 1, 2}));

        const auto generated = orchestrator.upload_file(file, kEndpoint);
        assert(generated.success);
        assert(generated.upload_id.rfind("upload-", 0) == 0);
        assert(protocol::is_valid_upload_id(generated.upload_id));

        std::filesystem::remove(file);
    }

    void test_orchestrator_retries_then_aborts()
    {
        const auto content = random_bytes(30, 22);
        const auto file = write_temp_file("chunkdrive_abort.bin", content);

        RecordingTransport transport;
        transport.failures[0] = 1;
        transport.failures[1] = 100;

        auto options = quick_options(10, 2);
        std::vector<std::uint64_t> errors;
        options.on_error = [&](const std::exception &, std::uint64_t index)
        { errors.push_back(index); };

        UploadOrchestrator orchestrator(options, transport);
        const auto result = orchestrator.upload_file(file, kEndpoint, std::string("u-abort"));

        assert(!result.success);
        assert(result.error == ErrorCode::ChunkDeliveryExhausted);
        assert(orchestrator.state() == TransferState::Failed);
        assert((transport.attempts == std::vector<std::uint64_t>{0, 0, 1, 1}));
        assert(transport.delivered.size() == 1);
        assert((errors == std::vector<std::uint64_t>{1}));

        std::filesystem::remove(file);
    }

    void test_orchestrator_resume_skips_completed()
    {
        const auto content = random_bytes(35, 23);
        const auto file = write_temp_file("chunkdrive_resume.bin", content);

        RecordingTransport transport;
        auto options = quick_options(10);
        std::vector<UploadProgress> progress;
        options.on_progress = [&](const UploadProgress &p)
        { progress.push_back(p); };

        UploadOrchestrator orchestrator(options, transport);
        const auto result = orchestrator.resume_upload(file, kEndpoint, "u-resume", {0, 2});

        assert(result.success);
        assert(result.message == "File upload resumed and completed successfully");
        assert((transport.attempts == std::vector<std::uint64_t>{1, 3}));
        assert(progress.size() == 2);
        assert(progress[0].uploaded_bytes == 30);
        assert(progress[1].uploaded_bytes == 35);

        std::filesystem::remove(file);
    }

    void test_orchestrator_rejects_bad_input()
    {
        RecordingTransport transport;
        UploadOrchestrator orchestrator(quick_options(10), transport);

        const auto empty = write_temp_file("chunkdrive_empty.bin", "");
        auto result = orchestrator.upload_file(empty, kEndpoint);
        assert(!result.success);
        assert(result.error == ErrorCode::InvalidPayload);
        assert(transport.attempts.empty());
        std::filesystem::remove(empty);

        result = orchestrator.upload_file(std::filesystem::temp_directory_path() / "chunkdrive_missing.bin", kEndpoint);
        assert(!result.success);
        assert(result.error == ErrorCode::InvalidPayload);

        bool threw = false;
        try
        {
            UploadOrchestrator invalid(quick_options(0), transport);
        }
        catch (const ConfigurationError &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_in_process_round_trip()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkdrive_in_process_test";
        cleanup_path(root);
        server::ChunkStore store(root / "chunks");
        server::ReassemblyEngine engine(root / "files", store);
        server::SessionRegistry registry(store, engine);
        server::UploadHandler handler(registry);

        const std::uint64_t chunk_size = 1'000'000;
        const auto content = random_bytes(2'500'000, 24);
        const auto file = write_temp_file("chunkdrive_round_trip.bin", content);

        InProcessTransport transport(handler);
        UploadOrchestrator orchestrator(quick_options(chunk_size), transport);

        auto result = orchestrator.upload_file(file, kEndpoint, std::string("u-full"));
        assert(result.success);
        assert(transport.last_response && transport.last_response->completed);
        assert(read_file(engine.directory() / *transport.last_response->artifact) == content);

        // Interrupted after two chunks, then resumed from the server's view of the session.
        transport.fail_from = 2;
        result = orchestrator.upload_file(file, kEndpoint, std::string("u-partial"));
        assert(!result.success);
        assert(result.error == ErrorCode::ChunkDeliveryExhausted);

        const auto status = transport.query_status(status_endpoint_for(kEndpoint), "u-partial");
        assert(status.has_value());
        assert((status->received_chunks == std::vector<std::uint64_t>{0, 1}));

        transport.fail_from.reset();
        result = orchestrator.resume_upload(file, kEndpoint, "u-partial", status->received_chunks);
        assert(result.success);
        assert(transport.last_response && transport.last_response->completed);
        assert(read_file(engine.directory() / *transport.last_response->artifact) == content);
        assert(!transport.query_status(status_endpoint_for(kEndpoint), "u-partial").has_value());
        assert(files_in(engine.directory()).size() == 2);

        std::filesystem::remove(file);
        cleanup_path(root);
    }

    void test_http_loopback()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkdrive_loopback_test";
        cleanup_path(root);

        server::ServerConfig config;
        config.address = "127.0.0.1";
        config.port = 0;
        config.root = root;
        config.worker_threads = 2;

        server::Server upload_server(config);
        std::thread runner([&upload_server]
                           { upload_server.run(); });

        const Endpoint endpoint{.host = "127.0.0.1", .port = std::to_string(upload_server.port()), .target = "/upload"};
        const auto status_endpoint = status_endpoint_for(endpoint);

        HttpTransport transport(std::chrono::seconds(5));
        assert(!transport.query_status(status_endpoint, "u-nobody").has_value());

        const auto content = random_bytes(70'000, 25);
        const auto file = write_temp_file("chunkdrive_loopback.dat", content);

        const auto first = chunk_range(0, content.size(), 32'768);
        transport.send_chunk(endpoint,
                             protocol::ChunkMetadata{
                                 .chunk_index = 0,
                                 .total_chunks = total_chunks(content.size(), 32'768),
                                 .file_name = "chunkdrive_loopback.dat",
                                 .file_size = content.size(),
                                 .chunk_size = first.length,
                                 .upload_id = "u-loopback",
                             },
                             std::string_view(content).substr(first.offset, first.length));

        const auto status = transport.query_status(status_endpoint, "u-loopback");
        assert(status.has_value());
        assert(status->total_chunks == 3);
        assert((status->received_chunks == std::vector<std::uint64_t>{0}));

        bool rejected = false;
        try
        {
            transport.send_chunk(endpoint,
                                 protocol::ChunkMetadata{
                                     .chunk_index = 5,
                                     .total_chunks = 3,
                                     .file_name = "x",
                                     .file_size = 1,
                                     .chunk_size = 1,
                                     .upload_id = "u-bad",
                                 },
                                 "z");
        }
        catch (const TransportError &ex)
        {
            rejected = ex.status() == 400;
        }
        assert(rejected);

        UploadOrchestrator orchestrator(quick_options(32'768), transport);
        const auto result = orchestrator.resume_upload(file, endpoint, "u-loopback", status->received_chunks);
        assert(result.success);

        const auto artifacts = files_in(config.files_dir());
        assert(artifacts.size() == 1);
        assert(artifacts.front().extension() == ".dat");
        assert(read_file(artifacts.front()) == content);

        upload_server.stop();
        runner.join();

        bool unreachable = false;
        try
        {
            transport.send_chunk(endpoint, protocol::ChunkMetadata{}, "");
        }
        catch (const TransportError &ex)
        {
            unreachable = ex.status() == 0 && ex.code() == ErrorCode::TransientTransportFailure;
        }
        assert(unreachable);

        std::filesystem::remove(file);
        cleanup_path(root);
    }

    void test_endpoint_parsing()
    {
        const auto endpoint = parse_endpoint("http://localhost:3000/upload");
        assert(endpoint.host == "localhost");
        assert(endpoint.port == "3000");
        assert(endpoint.target == "/upload");
        assert(to_string(endpoint) == "http://localhost:3000/upload");
        assert(status_endpoint_for(endpoint).target == "/upload-status");

        const auto bare = parse_endpoint("http://example.com");
        assert(bare.port == "80" && bare.target == "/");

        for (const char *bad : {"https://example.com/upload", "ftp://x", "http://:80/upload", "http://host:port/"})
        {
            bool threw = false;
            try
            {
                (void)parse_endpoint(bad);
            }
            catch (const ConfigurationError &)
            {
                threw = true;
            }
            assert(threw);
        }
    }

    void test_transfer_state_store()
    {
        const auto dir = std::filesystem::temp_directory_path() / "chunkdrive_journal_test";
        cleanup_path(dir);
        const auto path = dir / "uploads.json";
        const auto local = write_temp_file("chunkdrive_journal.bin", "payload");

        {
            TransferStateStore store(path);
            assert(store.entries().empty());
            store.upsert(TransferStateStore::Entry{
                .upload_id = "u-journal",
                .local_path = local,
                .upload_url = "http://localhost:3000/upload",
                .chunk_size = 4,
                .total_chunks = 2,
            });
            store.mark_chunk_complete("u-journal", 0);
            store.mark_chunk_complete("u-unknown", 0);
        }

        {
            TransferStateStore store(path);
            assert(store.entries().size() == 1);
            const auto entry = store.find_for_file(local, "http://localhost:3000/upload");
            assert(entry.has_value());
            assert(entry->upload_id == "u-journal");
            assert(entry->chunk_size == 4);
            assert((entry->completed_chunks == std::set<std::uint64_t>{0}));
            assert(!store.find_for_file(local, "http://elsewhere/upload").has_value());
            store.remove("u-journal");
        }

        assert(!TransferStateStore(path).find("u-journal").has_value());

        // Damaged entries are skipped; intact ones survive.
        {
            std::ofstream out(path, std::ios::trunc);
            out << R"([
                42,
                "not an object",
                {"upload_id": 7, "chunk_size": 4},
                {"upload_id": "u-bad-size", "chunk_size": "four"},
                {"upload_id": "u-kept", "local": 5, "url": "http://localhost:3000/upload", "chunk_size": 4,
                 "total_chunks": "two", "completed": [0, "one", -3, 2]}
            ])";
        }
        {
            TransferStateStore store(path);
            assert(store.entries().size() == 1);
            const auto entry = store.find("u-kept");
            assert(entry.has_value());
            assert(entry->chunk_size == 4);
            assert(entry->total_chunks == 0);
            assert((entry->completed_chunks == std::set<std::uint64_t>{0, 2}));
        }

        std::filesystem::remove(local);
        cleanup_path(dir);
    }

} // namespace

void run_client_component_tests()
{
    test_retry_policy_recovers();
    test_retry_policy_exhausts();
    test_retry_policy_bounds();
    test_orchestrator_sequential_upload();
    test_orchestrator_retries_then_aborts();
    test_orchestrator_resume_skips_completed();
    test_orchestrator_rejects_bad_input();
    test_in_process_round_trip();
    test_http_loopback();
    test_endpoint_parsing();
    test_transfer_state_store();
}
