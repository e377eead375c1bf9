#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkyard/server/byte_stream.hpp"
#include "chunkyard/server/config.hpp"
#include "chunkyard/server/file_catalog.hpp"
#include "chunkyard/server/records.hpp"

namespace chunkyard::server
{

    enum class StreamStatus
    {
        Complete,
        Partial
    };

    std::string_view to_string(StreamStatus status) noexcept;

    struct RangeStream
    {
        FileRecord file;
        StreamStatus status{StreamStatus::Complete};
        std::uint64_t start{};
        // Inclusive; meaningless when length is 0.
        std::uint64_t end{};
        std::uint64_t length{};
        std::unique_ptr<ByteSource> body;

        // "bytes <start>-<end>/<size>"
        std::string content_range() const;
    };

    struct ChunkSpan
    {
        std::uint64_t index{};
        std::uint64_t byte_start{};
        std::uint64_t byte_end{};
    };

    struct DownloadManifest
    {
        std::string download_id;
        std::string file_id;
        std::string filename;
        std::string mime_type;
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        std::vector<ChunkSpan> chunks;
    };

    void to_json(nlohmann::json &json, const ChunkSpan &span);
    void to_json(nlohmann::json &json, const DownloadManifest &manifest);

    struct RequestedRange
    {
        std::optional<std::uint64_t> start{};
        std::optional<std::uint64_t> end{};
    };

    // Parses "bytes=a-b", "bytes=a-" and "bytes=-n" against a file of the given size.
    RequestedRange parse_range_header(std::string_view header, std::uint64_t size);

    class DownloadStreamer
    {
    public:
        DownloadStreamer(const FileCatalog &files, DownloadConfig config);

        // Without bounds the whole file is streamed with status Complete.
        RangeStream stream_range(const std::string &file_id, std::optional<std::uint64_t> range_start = std::nullopt,
                                 std::optional<std::uint64_t> range_end = std::nullopt) const;

        DownloadManifest plan_chunked_download(const std::string &file_id,
                                               std::optional<std::uint64_t> chunk_size = std::nullopt) const;

    private:
        const FileCatalog &files_;
        DownloadConfig config_;
    };

} // namespace chunkyard::server
