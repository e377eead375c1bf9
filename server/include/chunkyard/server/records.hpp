#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkyard/time_format.hpp"

namespace chunkyard::server
{

    struct ChunkReceipt
    {
        std::uint64_t size{};
        std::string checksum;
    };

    struct UploadSession
    {
        std::string upload_id;
        std::string filename;
        std::uint64_t total_size{};
        std::string mime_type;
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        // Keys form the received set; always within [0, total_chunks).
        std::map<std::uint64_t, ChunkReceipt> chunks;
        nlohmann::json metadata{nlohmann::json::object()};
        bool assembling{false};
        TimePoint created_at{};
        TimePoint expires_at{};
    };

    std::string record_id(const UploadSession &session);
    void to_json(nlohmann::json &json, const UploadSession &session);
    void from_json(const nlohmann::json &json, UploadSession &session);

    enum class FileOrigin : std::uint8_t
    {
        Upload,
        Transform,
        Cloud
    };

    std::string_view to_string(FileOrigin origin) noexcept;
    std::optional<FileOrigin> file_origin_from_string(std::string_view value) noexcept;

    struct FileRecord
    {
        std::string file_id;
        std::string filename;
        std::string storage_key;
        std::uint64_t size{};
        std::string mime_type;
        std::string checksum;
        nlohmann::json metadata{nlohmann::json::object()};
        FileOrigin origin{FileOrigin::Upload};
        TimePoint created_at{};
        TimePoint expires_at{};
    };

    std::string record_id(const FileRecord &file);
    void to_json(nlohmann::json &json, const FileRecord &file);
    void from_json(const nlohmann::json &json, FileRecord &file);

    // Client-facing description; omits the storage key.
    nlohmann::json public_view(const FileRecord &file);

    enum class TransformKind : std::uint8_t
    {
        SplitPdf,
        MergePdf,
        Compress,
        Transcode,
        ExtractAudio,
        Thumbnail,
        Checksum
    };

    std::string_view to_string(TransformKind kind) noexcept;
    std::optional<TransformKind> transform_kind_from_string(std::string_view value) noexcept;

    // Kinds that run an encoder and count against the heavy-job ceiling.
    bool is_heavy(TransformKind kind) noexcept;

    enum class JobStatus : std::uint8_t
    {
        Queued,
        Processing,
        Completed,
        Failed
    };

    std::string_view to_string(JobStatus status) noexcept;
    std::optional<JobStatus> job_status_from_string(std::string_view value) noexcept;

    constexpr bool is_terminal(JobStatus status) noexcept
    {
        return status == JobStatus::Completed || status == JobStatus::Failed;
    }

    struct TransformJob
    {
        std::string job_id;
        TransformKind kind{TransformKind::Checksum};
        JobStatus status{JobStatus::Queued};
        int progress{0};
        std::vector<std::string> input_file_ids;
        std::vector<std::string> output_file_ids;
        nlohmann::json params{nlohmann::json::object()};
        nlohmann::json result{};
        std::string error;
        TimePoint created_at{};
        std::optional<TimePoint> started_at{};
        std::optional<TimePoint> completed_at{};
    };

    std::string record_id(const TransformJob &job);
    void to_json(nlohmann::json &json, const TransformJob &job);
    void from_json(const nlohmann::json &json, TransformJob &job);

} // namespace chunkyard::server
