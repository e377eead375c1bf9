/**
 * Chunkyard - Wire protocol schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkyard/error_codes.hpp"

namespace chunkyard::protocol
{

    enum class Command : std::uint8_t
    {
        UploadInit,
        UploadChunk,
        UploadStatus,
        UploadComplete,
        UploadCancel,
        Download,
        DownloadInit,
        CloudUpload,
        CloudDownload,
        CloudCopy,
        CloudPresign,
        TransformSubmit,
        TransformStatus,
        FileChecksum,
        FileMetadata,
        FileDelete,
        FileExtend,
        Health,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1,
        Continue = 2
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    struct UploadInitRequest
    {
        std::string filename;
        std::uint64_t total_size{};
        std::optional<std::string> mime_type{};
        std::optional<std::uint64_t> chunk_size{};
        nlohmann::json metadata{nlohmann::json::object()};
    };

    void to_json(nlohmann::json &json, const UploadInitRequest &request);
    void from_json(const nlohmann::json &json, UploadInitRequest &request);

    struct UploadChunkRequest
    {
        std::string upload_id;
        std::uint64_t chunk_index{};
        std::string data_base64;
    };

    void to_json(nlohmann::json &json, const UploadChunkRequest &request);
    void from_json(const nlohmann::json &json, UploadChunkRequest &request);

    struct UploadCompleteRequest
    {
        std::string upload_id;
        // Either an index-aligned array of digests or an {"index": digest} object.
        std::optional<nlohmann::json> checksums{};
    };

    void to_json(nlohmann::json &json, const UploadCompleteRequest &request);
    void from_json(const nlohmann::json &json, UploadCompleteRequest &request);

    struct UploadRefRequest
    {
        std::string upload_id;
    };

    void to_json(nlohmann::json &json, const UploadRefRequest &request);
    void from_json(const nlohmann::json &json, UploadRefRequest &request);

    struct DownloadRequest
    {
        std::string file_id;
        std::optional<std::uint64_t> range_start{};
        std::optional<std::uint64_t> range_end{};
        // HTTP style "bytes=start-end"; used only when no explicit bounds are given.
        std::optional<std::string> range{};
    };

    void to_json(nlohmann::json &json, const DownloadRequest &request);
    void from_json(const nlohmann::json &json, DownloadRequest &request);

    struct DownloadChunkFrame
    {
        std::uint64_t offset{};
        std::uint64_t bytes{};
        std::string data_base64;
    };

    void to_json(nlohmann::json &json, const DownloadChunkFrame &frame);
    void from_json(const nlohmann::json &json, DownloadChunkFrame &frame);

    struct DownloadInitRequest
    {
        std::string file_id;
        std::optional<std::uint64_t> chunk_size{};
    };

    void to_json(nlohmann::json &json, const DownloadInitRequest &request);
    void from_json(const nlohmann::json &json, DownloadInitRequest &request);

    struct FileRequest
    {
        std::string file_id;
        std::optional<std::string> algorithm{};
        std::optional<std::int64_t> extend_seconds{};
    };

    void to_json(nlohmann::json &json, const FileRequest &request);
    void from_json(const nlohmann::json &json, FileRequest &request);

    struct TransformSubmitRequest
    {
        std::string kind;
        std::vector<std::string> file_ids;
        nlohmann::json params{nlohmann::json::object()};
    };

    void to_json(nlohmann::json &json, const TransformSubmitRequest &request);
    void from_json(const nlohmann::json &json, TransformSubmitRequest &request);

    struct JobRequest
    {
        std::string job_id;
    };

    void to_json(nlohmann::json &json, const JobRequest &request);
    void from_json(const nlohmann::json &json, JobRequest &request);

} // namespace chunkyard::protocol
