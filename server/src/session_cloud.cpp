#include "chunkyard/server/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "session_common.hpp"

namespace chunkyard::server
{

    namespace
    {
        cloud::CloudTarget target_of(const nlohmann::json &payload, const char *key, const CloudConfig &config)
        {
            return cloud::parse_cloud_target(session_common::require_object(payload, key), config);
        }
    } // namespace

    nlohmann::json Session::handle_cloud_upload(const Envelope &envelope)
    {
        const auto &payload = envelope.payload;
        auto &broker = services_.cloud;
        const auto destination = target_of(payload, "destination", broker.config());
        const auto content_type = session_common::optional_string(payload, "content_type");
        const auto file_id = session_common::optional_string(payload, "file_id");
        const auto source_url = session_common::optional_string(payload, "source_url");
        if (file_id.has_value() == source_url.has_value())
        {
            throw_validation("Exactly one of file_id or source_url is required");
        }

        const auto outcome = file_id ? broker.upload_file(*file_id, destination, content_type)
                                     : broker.upload_url(*source_url, destination, content_type);
        spdlog::info("Uploaded {} bytes to {}", outcome.size, outcome.uri);
        return outcome;
    }

    nlohmann::json Session::handle_cloud_download(const Envelope &envelope)
    {
        const auto &payload = envelope.payload;
        auto &broker = services_.cloud;
        const auto source = target_of(payload, "source", broker.config());
        if (payload.contains("destination") && !payload["destination"].is_null())
        {
            const auto outcome = broker.copy(source, target_of(payload, "destination", broker.config()));
            nlohmann::json result = outcome;
            result["mode"] = "copy";
            return result;
        }

        const auto file = broker.download_to_file(source, session_common::optional_string(payload, "filename"));
        spdlog::info("Downloaded {} from {} as file {}", file.filename, to_string(source.provider), file.file_id);
        auto result = public_view(file);
        result["mode"] = "file";
        return result;
    }

    nlohmann::json Session::handle_cloud_copy(const Envelope &envelope)
    {
        auto &broker = services_.cloud;
        const auto source = target_of(envelope.payload, "source", broker.config());
        const auto destination = target_of(envelope.payload, "destination", broker.config());
        const auto outcome = broker.copy(source, destination);
        spdlog::info("Copied {}:{}/{} to {}", to_string(source.provider), source.bucket, source.key, outcome.uri);
        return outcome;
    }

    nlohmann::json Session::handle_cloud_presign(const Envelope &envelope)
    {
        const auto &payload = envelope.payload;
        auto &broker = services_.cloud;
        const auto target = target_of(payload, "target", broker.config());

        const auto operation_label = session_common::optional_string(payload, "operation").value_or("read");
        const auto operation = cloud::presign_operation_from_string(operation_label);
        if (!operation)
        {
            throw_validation("operation must be read or write");
        }

        std::optional<std::chrono::seconds> expiry;
        if (const auto it = payload.find("expiry_seconds"); it != payload.end() && !it->is_null())
        {
            if (!it->is_number_integer() || it->get<std::int64_t>() <= 0)
            {
                throw_validation("expiry_seconds must be a positive integer");
            }
            expiry = std::chrono::seconds(it->get<std::int64_t>());
        }
        return broker.presign(target, *operation, expiry, session_common::optional_string(payload, "content_type"));
    }

} // namespace chunkyard::server
