#include "chunkyard/protocol.hpp"

#include <array>
#include <stdexcept>
#include <string>

namespace chunkyard::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 19> kCommandMappings{{
            {Command::UploadInit, "UPLOAD_INIT"},
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::UploadStatus, "UPLOAD_STATUS"},
            {Command::UploadComplete, "UPLOAD_COMPLETE"},
            {Command::UploadCancel, "UPLOAD_CANCEL"},
            {Command::Download, "DOWNLOAD"},
            {Command::DownloadInit, "DOWNLOAD_INIT"},
            {Command::CloudUpload, "CLOUD_UPLOAD"},
            {Command::CloudDownload, "CLOUD_DOWNLOAD"},
            {Command::CloudCopy, "CLOUD_COPY"},
            {Command::CloudPresign, "CLOUD_PRESIGN"},
            {Command::TransformSubmit, "TRANSFORM_SUBMIT"},
            {Command::TransformStatus, "TRANSFORM_STATUS"},
            {Command::FileChecksum, "FILE_CHECKSUM"},
            {Command::FileMetadata, "FILE_METADATA"},
            {Command::FileDelete, "FILE_DELETE"},
            {Command::FileExtend, "FILE_EXTEND"},
            {Command::Health, "HEALTH"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 3> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
            {ResponseKind::Continue, "CONTINUE"},
        }};

        template <typename T>
        std::optional<T> optional_field(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return it->get<T>();
            }
            return std::nullopt;
        }

        // JSON integers are accepted only when non-negative; nlohmann would otherwise wrap -5 to 2^64 - 5.
        std::optional<std::uint64_t> optional_count(const nlohmann::json &json, const char *key)
        {
            auto it = json.find(key);
            if (it == json.end() || it->is_null())
            {
                return std::nullopt;
            }
            if (!it->is_number_unsigned())
            {
                throw std::invalid_argument(std::string(key) + " must be a non-negative integer");
            }
            return it->get<std::uint64_t>();
        }

        template <typename T>
        void put_optional(nlohmann::json &json, const char *key, const std::optional<T> &value)
        {
            if (value)
            {
                json[key] = *value;
            }
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        put_optional(json, "id", envelope.request_id);
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = optional_field<std::string>(json, "id");
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.kind == ResponseKind::Error)
        {
            json["error_kind"] = to_string(envelope.error);
        }
        put_optional(json, "id", envelope.request_id);
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = optional_field<std::string>(json, "id");
    }

    void to_json(nlohmann::json &json, const UploadInitRequest &request)
    {
        json = {
            {"filename", request.filename},
            {"total_size", request.total_size},
            {"metadata", request.metadata},
        };
        put_optional(json, "mime_type", request.mime_type);
        put_optional(json, "chunk_size", request.chunk_size);
    }

    void from_json(const nlohmann::json &json, UploadInitRequest &request)
    {
        request.filename = json.value("filename", std::string{});
        request.total_size = optional_count(json, "total_size").value_or(0);
        request.mime_type = optional_field<std::string>(json, "mime_type");
        request.chunk_size = optional_count(json, "chunk_size");
        request.metadata = json.value("metadata", nlohmann::json::object());
        if (!request.metadata.is_object())
        {
            throw std::invalid_argument("metadata must be an object");
        }
    }

    void to_json(nlohmann::json &json, const UploadChunkRequest &request)
    {
        json = {
            {"upload_id", request.upload_id},
            {"chunk_index", request.chunk_index},
            {"data", request.data_base64},
        };
    }

    void from_json(const nlohmann::json &json, UploadChunkRequest &request)
    {
        request.upload_id = json.at("upload_id").get<std::string>();
        const auto chunk_index = optional_count(json, "chunk_index");
        if (!chunk_index)
        {
            throw std::invalid_argument("chunk_index is required");
        }
        request.chunk_index = *chunk_index;
        request.data_base64 = json.value("data", std::string{});
    }

    void to_json(nlohmann::json &json, const UploadCompleteRequest &request)
    {
        json = {{"upload_id", request.upload_id}};
        put_optional(json, "checksums", request.checksums);
    }

    void from_json(const nlohmann::json &json, UploadCompleteRequest &request)
    {
        request.upload_id = json.at("upload_id").get<std::string>();
        request.checksums = optional_field<nlohmann::json>(json, "checksums");
    }

    void to_json(nlohmann::json &json, const UploadRefRequest &request)
    {
        json = {{"upload_id", request.upload_id}};
    }

    void from_json(const nlohmann::json &json, UploadRefRequest &request)
    {
        request.upload_id = json.at("upload_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const DownloadRequest &request)
    {
        json = {{"file_id", request.file_id}};
        put_optional(json, "start", request.range_start);
        put_optional(json, "end", request.range_end);
        put_optional(json, "range", request.range);
    }

    void from_json(const nlohmann::json &json, DownloadRequest &request)
    {
        request.file_id = json.at("file_id").get<std::string>();
        request.range_start = optional_count(json, "start");
        request.range_end = optional_count(json, "end");
        request.range = optional_field<std::string>(json, "range");
    }

    void to_json(nlohmann::json &json, const DownloadChunkFrame &frame)
    {
        json = {
            {"offset", frame.offset},
            {"bytes", frame.bytes},
            {"data", frame.data_base64},
        };
    }

    void from_json(const nlohmann::json &json, DownloadChunkFrame &frame)
    {
        frame.offset = json.value("offset", 0ULL);
        frame.bytes = json.value("bytes", 0ULL);
        frame.data_base64 = json.value("data", std::string{});
    }

    void to_json(nlohmann::json &json, const DownloadInitRequest &request)
    {
        json = {{"file_id", request.file_id}};
        put_optional(json, "chunk_size", request.chunk_size);
    }

    void from_json(const nlohmann::json &json, DownloadInitRequest &request)
    {
        request.file_id = json.at("file_id").get<std::string>();
        request.chunk_size = optional_count(json, "chunk_size");
    }

    void to_json(nlohmann::json &json, const FileRequest &request)
    {
        json = {{"file_id", request.file_id}};
        put_optional(json, "algorithm", request.algorithm);
        put_optional(json, "seconds", request.extend_seconds);
    }

    void from_json(const nlohmann::json &json, FileRequest &request)
    {
        request.file_id = json.at("file_id").get<std::string>();
        request.algorithm = optional_field<std::string>(json, "algorithm");
        request.extend_seconds = optional_field<std::int64_t>(json, "seconds");
    }

    void to_json(nlohmann::json &json, const TransformSubmitRequest &request)
    {
        json = {
            {"kind", request.kind},
            {"file_ids", request.file_ids},
            {"params", request.params},
        };
    }

    void from_json(const nlohmann::json &json, TransformSubmitRequest &request)
    {
        request.kind = json.at("kind").get<std::string>();
        request.file_ids.clear();
        if (auto it = json.find("file_ids"); it != json.end())
        {
            request.file_ids = it->get<std::vector<std::string>>();
        }
        else if (auto single = json.find("file_id"); single != json.end())
        {
            request.file_ids.push_back(single->get<std::string>());
        }
        request.params = json.value("params", nlohmann::json::object());
    }

    void to_json(nlohmann::json &json, const JobRequest &request)
    {
        json = {{"job_id", request.job_id}};
    }

    void from_json(const nlohmann::json &json, JobRequest &request)
    {
        request.job_id = json.at("job_id").get<std::string>();
    }

} // namespace chunkyard::protocol
