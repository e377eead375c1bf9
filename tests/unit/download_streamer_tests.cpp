#include <cassert>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkyard/server/blob_store.hpp"
#include "chunkyard/server/byte_stream.hpp"
#include "chunkyard/server/download_streamer.hpp"
#include "chunkyard/server/file_catalog.hpp"
#include "chunkyard/server/registry.hpp"
#include "chunkyard/server/service_error.hpp"

using namespace chunkyard;
using namespace chunkyard::server;

namespace
{

    struct DownloadFixture
    {
        explicit DownloadFixture(const char *name)
            : root(std::filesystem::temp_directory_path() / name),
              store((std::filesystem::remove_all(root), root)),
              catalog(store, files, FileConfig{}),
              streamer(catalog, DownloadConfig{.default_chunk_size = 4})
        {
        }

        ~DownloadFixture()
        {
            std::error_code ec;
            std::filesystem::remove_all(root, ec);
        }

        FileRecord add(const std::string &filename, const std::string &content)
        {
            auto ingest = catalog.begin_file(NewFile{.filename = filename});
            if (!content.empty())
            {
                ingest->write(as_byte_span(content));
            }
            return ingest->commit();
        }

        static std::string drain(RangeStream &stream)
        {
            MemorySink sink;
            copy_stream(*stream.body, sink);
            return sink.take();
        }

        std::filesystem::path root;
        LocalBlobStore store;
        InMemoryRegistry<FileRecord> files;
        FileCatalog catalog;
        DownloadStreamer streamer;
    };

    ErrorCode error_of(const std::function<void()> &action)
    {
        try
        {
            action();
        }
        catch (const ServiceError &ex)
        {
            return ex.code();
        }
        return ErrorCode::Ok;
    }

    void test_full_and_explicit_range_match()
    {
        DownloadFixture fixture("chunkyard_download_full");
        const std::string content = "The quick brown fox jumps over the lazy dog";
        const auto file = fixture.add("fox.txt", content);

        auto whole = fixture.streamer.stream_range(file.file_id);
        assert(whole.status == StreamStatus::Complete);
        assert(whole.length == content.size());
        assert(DownloadFixture::drain(whole) == content);

        auto explicit_range = fixture.streamer.stream_range(file.file_id, 0, content.size() - 1);
        assert(explicit_range.status == StreamStatus::Partial);
        assert(explicit_range.content_range() == "bytes 0-42/43");
        assert(DownloadFixture::drain(explicit_range) == content);
    }

    void test_partial_ranges()
    {
        DownloadFixture fixture("chunkyard_download_partial");
        const auto file = fixture.add("digits.bin", "0123456789");

        auto middle = fixture.streamer.stream_range(file.file_id, 2, 5);
        assert(middle.length == 4);
        assert(middle.content_range() == "bytes 2-5/10");
        assert(DownloadFixture::drain(middle) == "2345");

        // An end past the file is clamped to the last byte.
        auto clamped = fixture.streamer.stream_range(file.file_id, 7, 500);
        assert(clamped.end == 9);
        assert(DownloadFixture::drain(clamped) == "789");

        auto open_ended = fixture.streamer.stream_range(file.file_id, 8, std::nullopt);
        assert(DownloadFixture::drain(open_ended) == "89");
    }

    void test_invalid_ranges()
    {
        DownloadFixture fixture("chunkyard_download_invalid");
        const auto file = fixture.add("digits.bin", "0123456789");

        assert(error_of([&]
                        { fixture.streamer.stream_range(file.file_id, 6, 3); }) == ErrorCode::InvalidRange);
        assert(error_of([&]
                        { fixture.streamer.stream_range(file.file_id, 10, std::nullopt); }) == ErrorCode::InvalidRange);
        assert(error_of([&]
                        { fixture.streamer.stream_range("missing", 0, 1); }) == ErrorCode::NotFound);

        try
        {
            fixture.streamer.stream_range(file.file_id, 6, 3);
        }
        catch (const ServiceError &ex)
        {
            assert(ex.details()["size"] == 10);
        }
    }

    void test_empty_file()
    {
        DownloadFixture fixture("chunkyard_download_empty");
        const auto file = fixture.add("empty.txt", "");

        auto whole = fixture.streamer.stream_range(file.file_id);
        assert(whole.length == 0);
        assert(whole.content_range() == "bytes */0");
        assert(DownloadFixture::drain(whole).empty());

        assert(error_of([&]
                        { fixture.streamer.stream_range(file.file_id, 0, 0); }) == ErrorCode::InvalidRange);
        assert(fixture.streamer.plan_chunked_download(file.file_id).total_chunks == 0);
    }

    void test_range_header()
    {
        auto range = parse_range_header("bytes=0-99", 1000);
        assert(range.start == 0u && range.end == 99u);

        range = parse_range_header("bytes=500-", 1000);
        assert(range.start == 500u && !range.end.has_value());

        range = parse_range_header("bytes=-100", 1000);
        assert(range.start == 900u && range.end == 999u);

        // A suffix longer than the file covers the whole file.
        range = parse_range_header("bytes=-5000", 1000);
        assert(range.start == 0u && range.end == 999u);

        for (const auto *header : {"items=0-1", "bytes=0-1,5-6", "bytes=abc", "bytes=-0", "bytes=x-5", "bytes=1-y"})
        {
            assert(error_of([&]
                            { parse_range_header(header, 1000); }) == ErrorCode::InvalidRange);
        }
        assert(error_of([]
                        { parse_range_header("bytes=-10", 0); }) == ErrorCode::InvalidRange);
    }

    void test_chunk_manifest_covers_file()
    {
        DownloadFixture fixture("chunkyard_download_manifest");
        const auto file = fixture.add("letters.txt", "abcdefghijk");

        const auto manifest = fixture.streamer.plan_chunked_download(file.file_id);
        assert(manifest.chunk_size == 4);
        assert(manifest.total_chunks == 3);
        assert(manifest.total_size == 11);
        assert(manifest.mime_type == "text/plain");

        std::uint64_t next = 0;
        for (const auto &chunk : manifest.chunks)
        {
            assert(chunk.byte_start == next);
            assert(chunk.byte_end >= chunk.byte_start);
            next = chunk.byte_end + 1;
        }
        assert(next == file.size);

        // Fetching each span as a range reproduces the file.
        std::string rebuilt;
        for (const auto &chunk : manifest.chunks)
        {
            auto part = fixture.streamer.stream_range(file.file_id, chunk.byte_start, chunk.byte_end);
            rebuilt += DownloadFixture::drain(part);
        }
        assert(rebuilt == "abcdefghijk");

        const auto custom = fixture.streamer.plan_chunked_download(file.file_id, 11);
        assert(custom.total_chunks == 1 && custom.chunks.front().byte_end == 10);

        const auto json = nlohmann::json(manifest);
        assert(json["chunks"].size() == 3);
        assert(json["chunks"][2]["byte_end"] == 10);

        assert(error_of([&]
                        { fixture.streamer.plan_chunked_download(file.file_id, 0); }) == ErrorCode::ValidationError);
    }

} // namespace

void run_download_streamer_tests()
{
    test_full_and_explicit_range_match();
    test_partial_ranges();
    test_invalid_ranges();
    test_empty_file();
    test_range_header();
    test_chunk_manifest_covers_file();
}
