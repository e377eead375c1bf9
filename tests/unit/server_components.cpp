#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkyard/crypto.hpp"
#include "chunkyard/server/blob_store.hpp"
#include "chunkyard/server/byte_stream.hpp"
#include "chunkyard/server/config.hpp"
#include "chunkyard/server/file_catalog.hpp"
#include "chunkyard/server/mime_types.hpp"
#include "chunkyard/server/records.hpp"
#include "chunkyard/server/registry.hpp"
#include "chunkyard/server/service_error.hpp"

using namespace chunkyard;
using namespace chunkyard::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string read_blob(const BlobStore &store, const std::string &key, std::uint64_t offset, std::uint64_t length)
    {
        auto source = store.open_range(key, offset, length);
        MemorySink sink;
        copy_stream(*source, sink);
        return sink.take();
    }

    void test_local_blob_store()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkyard_blob_test";
        cleanup_path(root);

        LocalBlobStore store(root);
        store.write("staging/u1/chunk_0", as_byte_span("hello "));
        store.write("staging/u1/chunk_1", as_byte_span("world"));

        assert(store.stat("staging/u1/chunk_0")->size == 6);
        assert(!store.stat("staging/u1/chunk_9").has_value());
        assert(read_blob(store, "staging/u1/chunk_1", 1, 3) == "orl");
        assert(store.local_path("staging/u1/chunk_1").has_value());

        // Writes only become visible on commit.
        {
            auto writer = store.open_writer("files/abandoned");
            writer->write(as_byte_span("partial"));
        }
        assert(!store.stat("files/abandoned").has_value());

        assert(store.remove_prefix("staging/u1") == 2);
        assert(!store.stat("staging/u1/chunk_0").has_value());
        assert(!store.remove("staging/u1/chunk_0"));

        cleanup_path(root);
    }

    void test_registry_update_is_atomic()
    {
        InMemoryRegistry<UploadSession> registry;
        UploadSession session{};
        session.upload_id = "u-1";
        session.total_chunks = 3;
        registry.put(session);

        registry.update("u-1", [](UploadSession &record)
                        { record.chunks[0] = ChunkReceipt{.size = 4, .checksum = "a"}; });
        registry.update("u-1", [](UploadSession &record)
                        { record.chunks[2] = ChunkReceipt{.size = 4, .checksum = "c"}; });
        assert(registry.get("u-1")->chunks.size() == 2);

        bool threw = false;
        try
        {
            registry.update("u-1", [](UploadSession &record)
                            {
                record.chunks.clear();
                throw std::runtime_error("rejected"); });
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
        assert(registry.get("u-1")->chunks.size() == 2);
        assert(!registry.update("missing", [](UploadSession &) {}).has_value());
        assert(registry.remove("u-1"));
        assert(registry.size() == 0);
    }

    void test_json_registry_reload()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkyard_registry_test";
        cleanup_path(root);

        {
            auto registry = make_registry<UploadSession>(RegistryBackend::JsonFiles, root);
            UploadSession session{};
            session.upload_id = "u-42";
            session.filename = "movie.mp4";
            session.total_size = 10;
            session.chunk_size = 4;
            session.total_chunks = 3;
            session.chunks[1] = ChunkReceipt{.size = 4, .checksum = "abc"};
            session.assembling = true;
            session.created_at = Clock::now();
            session.expires_at = session.created_at + std::chrono::hours(1);
            registry->put(session);
        }

        auto reloaded = make_registry<UploadSession>(RegistryBackend::JsonFiles, root);
        const auto session = reloaded->get("u-42");
        assert(session.has_value());
        assert(session->filename == "movie.mp4");
        assert(session->chunks.size() == 1 && session->chunks.at(1).checksum == "abc");
        // An assembly cannot survive a restart.
        assert(!session->assembling);

        assert(reloaded->remove("u-42"));
        auto empty = make_registry<UploadSession>(RegistryBackend::JsonFiles, root);
        assert(empty->size() == 0);

        cleanup_path(root);
    }

    void test_file_catalog()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkyard_catalog_test";
        cleanup_path(root);

        LocalBlobStore store(root);
        InMemoryRegistry<FileRecord> registry;
        FileCatalog catalog(store, registry, FileConfig{.retention = std::chrono::hours(1)});

        auto ingest = catalog.begin_file(NewFile{.filename = "report.pdf"});
        ingest->write(as_byte_span("ab"));
        ingest->write(as_byte_span("c"));
        const auto file = ingest->commit();

        assert(file.size == 3);
        assert(file.mime_type == "application/pdf");
        assert(file.checksum == crypto::sha256_hex(std::string_view("abc")));
        assert(file.expires_at - file.created_at == std::chrono::hours(1));
        assert(catalog.count() == 1);
        assert(catalog.compute_checksum(file.file_id, crypto::DigestAlgorithm::Sha256) == file.checksum);

        const auto extended = catalog.extend_expiry(file.file_id, std::chrono::seconds(60));
        assert(extended.expires_at == file.expires_at + std::chrono::seconds(60));

        const auto view = public_view(file);
        assert(!view.contains("storage_key"));
        assert(view["origin"] == "upload");

        assert(catalog.remove(file.file_id));
        assert(!catalog.remove(file.file_id));
        bool not_found = false;
        try
        {
            catalog.require(file.file_id);
        }
        catch (const ServiceError &ex)
        {
            not_found = ex.code() == ErrorCode::NotFound;
        }
        assert(not_found);

        cleanup_path(root);
    }

    void test_config_json()
    {
        ServerConfig config;
        apply_config_json(nlohmann::json::parse(R"({
            "registry": "json",
            "upload": {"chunk_size": 1048576, "expiry_seconds": 600},
            "transform": {"max_concurrent_heavy": 1, "tools": {"qpdf": "/opt/qpdf"}},
            "retention": {"sweep_interval_seconds": 30},
            "cloud": {"max_attempts": 5, "retry_base_delay_ms": 50}
        })"),
                          config);
        assert(config.registry == RegistryBackend::JsonFiles);
        assert(config.upload.default_chunk_size == 1048576);
        assert(config.upload.expiry == std::chrono::seconds(600));
        assert(config.transform.max_concurrent_heavy == 1);
        assert(config.transform.tools.qpdf == "/opt/qpdf");
        assert(config.retention.sweep_interval == std::chrono::seconds(30));
        assert(config.cloud.max_attempts == 5);
        assert(config.cloud.retry_base_delay == std::chrono::milliseconds(50));

        bool rejected = false;
        try
        {
            apply_config_json(nlohmann::json{{"upload", {{"chunk_size", 0}}}}, config);
        }
        catch (const std::invalid_argument &)
        {
            rejected = true;
        }
        assert(rejected);
    }

    void test_parse_arguments()
    {
        ServerConfig config;
        std::vector<std::string> args{"chunkyard_server", "--port", "9000", "--root", "/tmp/chunkyard",
                                      "--log-level", "debug"};
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        assert(parse_arguments(static_cast<int>(argv.size()), argv.data(), config) == ParseOutcome::Run);
        assert(config.port == 9000);
        assert(config.root == "/tmp/chunkyard");
        assert(config.log_level == "debug");

        std::vector<std::string> help_args{"chunkyard_server", "--help"};
        std::vector<char *> help_argv{help_args[0].data(), help_args[1].data()};
        ServerConfig other;
        assert(parse_arguments(2, help_argv.data(), other) == ParseOutcome::ShowHelp);
    }

    void test_mime_types()
    {
        assert(mime_type_for("clip.MP4") == "video/mp4");
        assert(mime_type_for("archive.tar.gz") == "application/gzip");
        assert(mime_type_for("noextension") == kDefaultMimeType);
        assert(is_media_type("audio/mpeg"));
        assert(!is_media_type("application/pdf"));
    }

    void test_service_error_details()
    {
        const MissingChunksError missing({2, 5});
        assert(missing.code() == ErrorCode::MissingChunks);
        assert(missing.details()["missing"] == nlohmann::json::array({2, 5}));

        const ProviderError provider("s3", "SlowDown: reduce your request rate", 503);
        const auto annotated = provider.with_bytes_transferred(1024);
        assert(annotated.details()["provider"] == "s3");
        assert(annotated.details()["http_status"] == 503);
        assert(annotated.details()["bytes_transferred"] == 1024);
        assert(!provider.details().contains("bytes_transferred"));
    }

} // namespace

void run_server_component_tests()
{
    test_local_blob_store();
    test_registry_update_is_atomic();
    test_json_registry_reload();
    test_file_catalog();
    test_config_json();
    test_parse_arguments();
    test_mime_types();
    test_service_error_details();
}
