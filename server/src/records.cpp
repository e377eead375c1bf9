#include "chunkyard/server/records.hpp"

#include <array>
#include <stdexcept>

namespace chunkyard::server
{

    namespace
    {

        template <typename Enum>
        struct Label
        {
            Enum value;
            std::string_view label;
        };

        constexpr std::array<Label<FileOrigin>, 3> kOriginLabels{{
            {FileOrigin::Upload, "upload"},
            {FileOrigin::Transform, "transform"},
            {FileOrigin::Cloud, "cloud"},
        }};

        constexpr std::array<Label<TransformKind>, 7> kKindLabels{{
            {TransformKind::SplitPdf, "split-pdf"},
            {TransformKind::MergePdf, "merge-pdf"},
            {TransformKind::Compress, "compress"},
            {TransformKind::Transcode, "transcode"},
            {TransformKind::ExtractAudio, "extract-audio"},
            {TransformKind::Thumbnail, "thumbnail"},
            {TransformKind::Checksum, "checksum"},
        }};

        constexpr std::array<Label<JobStatus>, 4> kStatusLabels{{
            {JobStatus::Queued, "queued"},
            {JobStatus::Processing, "processing"},
            {JobStatus::Completed, "completed"},
            {JobStatus::Failed, "failed"},
        }};

        template <typename Enum, std::size_t N>
        std::string_view label_of(const std::array<Label<Enum>, N> &labels, Enum value) noexcept
        {
            for (const auto &entry : labels)
            {
                if (entry.value == value)
                {
                    return entry.label;
                }
            }
            return "unknown";
        }

        template <typename Enum, std::size_t N>
        std::optional<Enum> value_of(const std::array<Label<Enum>, N> &labels, std::string_view label) noexcept
        {
            for (const auto &entry : labels)
            {
                if (entry.label == label)
                {
                    return entry.value;
                }
            }
            return std::nullopt;
        }

        TimePoint time_field(const nlohmann::json &json, const char *key)
        {
            const auto text = json.at(key).get<std::string>();
            auto parsed = parse_iso8601(text);
            if (!parsed)
            {
                throw std::invalid_argument(std::string("Malformed timestamp in ") + key + ": " + text);
            }
            return *parsed;
        }

        std::optional<TimePoint> optional_time_field(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return time_field(json, key);
            }
            return std::nullopt;
        }

    } // namespace

    std::string record_id(const UploadSession &session)
    {
        return session.upload_id;
    }

    void to_json(nlohmann::json &json, const UploadSession &session)
    {
        auto chunks = nlohmann::json::array();
        for (const auto &[index, receipt] : session.chunks)
        {
            chunks.push_back({{"index", index}, {"size", receipt.size}, {"checksum", receipt.checksum}});
        }
        json = {
            {"upload_id", session.upload_id},
            {"filename", session.filename},
            {"total_size", session.total_size},
            {"mime_type", session.mime_type},
            {"chunk_size", session.chunk_size},
            {"total_chunks", session.total_chunks},
            {"chunks", std::move(chunks)},
            {"metadata", session.metadata},
            {"created_at", format_iso8601(session.created_at)},
            {"expires_at", format_iso8601(session.expires_at)},
        };
    }

    void from_json(const nlohmann::json &json, UploadSession &session)
    {
        session.upload_id = json.at("upload_id").get<std::string>();
        session.filename = json.at("filename").get<std::string>();
        session.total_size = json.at("total_size").get<std::uint64_t>();
        session.mime_type = json.value("mime_type", std::string{"application/octet-stream"});
        session.chunk_size = json.at("chunk_size").get<std::uint64_t>();
        session.total_chunks = json.at("total_chunks").get<std::uint64_t>();
        session.chunks.clear();
        for (const auto &chunk : json.value("chunks", nlohmann::json::array()))
        {
            session.chunks[chunk.at("index").get<std::uint64_t>()] = ChunkReceipt{
                .size = chunk.value("size", 0ULL),
                .checksum = chunk.value("checksum", std::string{}),
            };
        }
        session.metadata = json.value("metadata", nlohmann::json::object());
        // An assembly interrupted by a restart is never resumed implicitly.
        session.assembling = false;
        session.created_at = time_field(json, "created_at");
        session.expires_at = time_field(json, "expires_at");
    }

    std::string_view to_string(FileOrigin origin) noexcept
    {
        return label_of(kOriginLabels, origin);
    }

    std::optional<FileOrigin> file_origin_from_string(std::string_view value) noexcept
    {
        return value_of(kOriginLabels, value);
    }

    std::string record_id(const FileRecord &file)
    {
        return file.file_id;
    }

    void to_json(nlohmann::json &json, const FileRecord &file)
    {
        json = public_view(file);
        json["storage_key"] = file.storage_key;
    }

    void from_json(const nlohmann::json &json, FileRecord &file)
    {
        file.file_id = json.at("file_id").get<std::string>();
        file.filename = json.at("filename").get<std::string>();
        file.storage_key = json.at("storage_key").get<std::string>();
        file.size = json.value("size", 0ULL);
        file.mime_type = json.value("mime_type", std::string{"application/octet-stream"});
        file.checksum = json.value("checksum", std::string{});
        file.metadata = json.value("metadata", nlohmann::json::object());
        file.origin = file_origin_from_string(json.value("origin", std::string{"upload"})).value_or(FileOrigin::Upload);
        file.created_at = time_field(json, "created_at");
        file.expires_at = time_field(json, "expires_at");
    }

    nlohmann::json public_view(const FileRecord &file)
    {
        return {
            {"file_id", file.file_id},
            {"filename", file.filename},
            {"size", file.size},
            {"mime_type", file.mime_type},
            {"checksum", file.checksum},
            {"metadata", file.metadata},
            {"origin", to_string(file.origin)},
            {"created_at", format_iso8601(file.created_at)},
            {"expires_at", format_iso8601(file.expires_at)},
        };
    }

    std::string_view to_string(TransformKind kind) noexcept
    {
        return label_of(kKindLabels, kind);
    }

    std::optional<TransformKind> transform_kind_from_string(std::string_view value) noexcept
    {
        return value_of(kKindLabels, value);
    }

    bool is_heavy(TransformKind kind) noexcept
    {
        return kind == TransformKind::Transcode || kind == TransformKind::ExtractAudio ||
               kind == TransformKind::Thumbnail;
    }

    std::string_view to_string(JobStatus status) noexcept
    {
        return label_of(kStatusLabels, status);
    }

    std::optional<JobStatus> job_status_from_string(std::string_view value) noexcept
    {
        return value_of(kStatusLabels, value);
    }

    std::string record_id(const TransformJob &job)
    {
        return job.job_id;
    }

    void to_json(nlohmann::json &json, const TransformJob &job)
    {
        json = {
            {"job_id", job.job_id},
            {"kind", to_string(job.kind)},
            {"status", to_string(job.status)},
            {"progress", job.progress},
            {"input_file_ids", job.input_file_ids},
            {"params", job.params},
            {"created_at", format_iso8601(job.created_at)},
        };
        if (job.status == JobStatus::Completed)
        {
            json["output_file_ids"] = job.output_file_ids;
            json["result"] = job.result.is_null() ? nlohmann::json::object() : job.result;
        }
        if (job.status == JobStatus::Failed)
        {
            json["error"] = job.error;
        }
        if (job.started_at)
        {
            json["started_at"] = format_iso8601(*job.started_at);
        }
        if (job.completed_at)
        {
            json["completed_at"] = format_iso8601(*job.completed_at);
        }
    }

    void from_json(const nlohmann::json &json, TransformJob &job)
    {
        job.job_id = json.at("job_id").get<std::string>();
        const auto kind_label = json.at("kind").get<std::string>();
        auto kind = transform_kind_from_string(kind_label);
        if (!kind)
        {
            throw std::invalid_argument("Unknown transform kind: " + kind_label);
        }
        job.kind = *kind;
        const auto status_label = json.at("status").get<std::string>();
        auto status = job_status_from_string(status_label);
        if (!status)
        {
            throw std::invalid_argument("Unknown job status: " + status_label);
        }
        job.status = *status;
        job.progress = json.value("progress", 0);
        job.input_file_ids = json.value("input_file_ids", std::vector<std::string>{});
        job.output_file_ids = json.value("output_file_ids", std::vector<std::string>{});
        job.params = json.value("params", nlohmann::json::object());
        job.result = json.value("result", nlohmann::json{});
        job.error = json.value("error", std::string{});
        job.created_at = time_field(json, "created_at");
        job.started_at = optional_time_field(json, "started_at");
        job.completed_at = optional_time_field(json, "completed_at");
    }

} // namespace chunkyard::server
