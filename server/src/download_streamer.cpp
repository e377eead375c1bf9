#include "chunkyard/server/download_streamer.hpp"

#include <algorithm>
#include <charconv>

#include <spdlog/spdlog.h>

#include "chunkyard/crypto.hpp"
#include "chunkyard/server/service_error.hpp"

namespace chunkyard::server
{

    namespace
    {
        std::optional<std::uint64_t> parse_number(std::string_view text)
        {
            if (text.empty())
            {
                return std::nullopt;
            }
            std::uint64_t value = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size())
            {
                return std::nullopt;
            }
            return value;
        }
    } // namespace

    std::string_view to_string(StreamStatus status) noexcept
    {
        return status == StreamStatus::Partial ? "partial" : "complete";
    }

    std::string RangeStream::content_range() const
    {
        if (length == 0)
        {
            return "bytes */" + std::to_string(file.size);
        }
        return "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" + std::to_string(file.size);
    }

    void to_json(nlohmann::json &json, const ChunkSpan &span)
    {
        json = {
            {"index", span.index},
            {"byte_start", span.byte_start},
            {"byte_end", span.byte_end},
        };
    }

    void to_json(nlohmann::json &json, const DownloadManifest &manifest)
    {
        json = {
            {"download_id", manifest.download_id},
            {"file_id", manifest.file_id},
            {"filename", manifest.filename},
            {"mime_type", manifest.mime_type},
            {"total_size", manifest.total_size},
            {"chunk_size", manifest.chunk_size},
            {"total_chunks", manifest.total_chunks},
            {"chunks", manifest.chunks},
        };
    }

    RequestedRange parse_range_header(std::string_view header, std::uint64_t size)
    {
        constexpr std::string_view kPrefix = "bytes=";
        if (!header.starts_with(kPrefix))
        {
            throw InvalidRangeError("Unsupported range unit: " + std::string(header), size);
        }
        const auto range_set = header.substr(kPrefix.size());
        if (range_set.find(',') != std::string_view::npos)
        {
            throw InvalidRangeError("Multiple ranges are not supported", size);
        }
        const auto dash = range_set.find('-');
        if (dash == std::string_view::npos)
        {
            throw InvalidRangeError("Malformed range: " + std::string(header), size);
        }
        const auto first = range_set.substr(0, dash);
        const auto second = range_set.substr(dash + 1);

        if (first.empty())
        {
            const auto suffix = parse_number(second);
            if (!suffix || *suffix == 0)
            {
                throw InvalidRangeError("Malformed suffix range: " + std::string(header), size);
            }
            if (size == 0)
            {
                throw InvalidRangeError("Range not satisfiable for an empty file", size);
            }
            return RequestedRange{
                .start = size - std::min(*suffix, size),
                .end = size - 1,
            };
        }

        RequestedRange range{.start = parse_number(first)};
        if (!range.start)
        {
            throw InvalidRangeError("Malformed range: " + std::string(header), size);
        }
        if (!second.empty())
        {
            range.end = parse_number(second);
            if (!range.end)
            {
                throw InvalidRangeError("Malformed range: " + std::string(header), size);
            }
        }
        return range;
    }

    DownloadStreamer::DownloadStreamer(const FileCatalog &files, DownloadConfig config)
        : files_(files), config_(config)
    {
    }

    RangeStream DownloadStreamer::stream_range(const std::string &file_id, std::optional<std::uint64_t> range_start,
                                               std::optional<std::uint64_t> range_end) const
    {
        RangeStream stream{};
        stream.file = files_.require(file_id);
        const auto size = stream.file.size;

        if (!range_start && !range_end)
        {
            stream.status = StreamStatus::Complete;
            stream.start = 0;
            stream.length = size;
            stream.end = size == 0 ? 0 : size - 1;
        }
        else
        {
            const auto start = range_start.value_or(0);
            if (start >= size)
            {
                throw InvalidRangeError("Range start " + std::to_string(start) + " is beyond end of file", size);
            }
            const auto end = std::min(range_end.value_or(size - 1), size - 1);
            if (start > end)
            {
                throw InvalidRangeError("Range start " + std::to_string(start) + " is after range end " +
                                            std::to_string(end),
                                        size);
            }
            stream.status = StreamStatus::Partial;
            stream.start = start;
            stream.end = end;
            stream.length = end - start + 1;
        }

        stream.body = files_.open(stream.file, stream.start, stream.length);
        spdlog::debug("Streaming file {} bytes {}-{} ({})", file_id, stream.start, stream.end, to_string(stream.status));
        return stream;
    }

    DownloadManifest DownloadStreamer::plan_chunked_download(const std::string &file_id,
                                                             std::optional<std::uint64_t> chunk_size) const
    {
        const auto resolved_chunk = chunk_size.value_or(config_.default_chunk_size);
        if (resolved_chunk == 0)
        {
            throw_validation("chunk_size must be positive");
        }
        const auto file = files_.require(file_id);

        DownloadManifest manifest{
            .download_id = crypto::random_uuid(),
            .file_id = file.file_id,
            .filename = file.filename,
            .mime_type = file.mime_type,
            .total_size = file.size,
            .chunk_size = resolved_chunk,
            .total_chunks = (file.size + resolved_chunk - 1) / resolved_chunk,
        };
        manifest.chunks.reserve(static_cast<std::size_t>(manifest.total_chunks));
        for (std::uint64_t index = 0; index < manifest.total_chunks; ++index)
        {
            const auto byte_start = index * resolved_chunk;
            manifest.chunks.push_back(ChunkSpan{
                .index = index,
                .byte_start = byte_start,
                .byte_end = std::min(byte_start + resolved_chunk, file.size) - 1,
            });
        }
        return manifest;
    }

} // namespace chunkyard::server
