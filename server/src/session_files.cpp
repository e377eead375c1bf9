#include "chunkyard/server/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chunkyard/crypto.hpp"
#include "chunkyard/server/mime_types.hpp"
#include "chunkyard/server/transform/media_probe.hpp"
#include "chunkyard/time_format.hpp"
#include "chunkyard/version.hpp"
#include "session_common.hpp"

namespace chunkyard::server
{

    nlohmann::json Session::handle_file_checksum(const Envelope &envelope)
    {
        const auto request = session_common::parse_payload<chunkyard::protocol::FileRequest>(envelope.payload);
        const auto name = request.algorithm.value_or("sha256");
        const auto algorithm = crypto::digest_algorithm_from_string(name);
        if (!algorithm)
        {
            throw_validation("Unsupported checksum algorithm: " + name);
        }
        return nlohmann::json{
            {"file_id", request.file_id},
            {"algorithm", std::string(crypto::to_string(*algorithm))},
            {"checksum", services_.files.compute_checksum(request.file_id, *algorithm)},
        };
    }

    nlohmann::json Session::handle_file_metadata(const Envelope &envelope)
    {
        const auto request = session_common::parse_payload<chunkyard::protocol::FileRequest>(envelope.payload);
        const auto file = services_.files.require(request.file_id);
        auto payload = public_view(file);
        if (is_media_type(file.mime_type))
        {
            if (const auto path = services_.files.store().local_path(file.storage_key))
            {
                if (auto info = transform::probe_media(services_.config.transform.tools.ffprobe, *path))
                {
                    payload["media_info"] = std::move(*info);
                }
            }
        }
        return payload;
    }

    nlohmann::json Session::handle_file_delete(const Envelope &envelope)
    {
        const auto request = session_common::parse_payload<chunkyard::protocol::FileRequest>(envelope.payload);
        services_.files.require(request.file_id);
        switch (services_.jobs.remove_unpinned_file(request.file_id))
        {
        case FileRemoval::Removed:
            break;
        case FileRemoval::Pinned:
            throw ServiceError(chunkyard::ErrorCode::Conflict, "File is an input of an active transform job",
                               nlohmann::json{{"file_id", request.file_id}});
        case FileRemoval::Missing:
            throw_not_found("File not found: " + request.file_id);
        }
        spdlog::info("{} deleted file {}", remote_endpoint(), request.file_id);
        return nlohmann::json{{"file_id", request.file_id}, {"deleted", true}};
    }

    nlohmann::json Session::handle_file_extend(const Envelope &envelope)
    {
        const auto request = session_common::parse_payload<chunkyard::protocol::FileRequest>(envelope.payload);
        if (!request.extend_seconds || *request.extend_seconds <= 0)
        {
            throw_validation("seconds must be a positive integer");
        }
        const auto file = services_.files.extend_expiry(request.file_id, std::chrono::seconds(*request.extend_seconds));
        return nlohmann::json{{"file_id", file.file_id}, {"expires_at", format_iso8601(file.expires_at)}};
    }

    nlohmann::json Session::handle_health(const Envelope & /*envelope*/)
    {
        return nlohmann::json{
            {"status", "ok"},
            {"timestamp", format_iso8601(Clock::now())},
            {"active_uploads", services_.uploads.active_count()},
            {"stored_files", services_.files.count()},
            {"pending_jobs", services_.jobs.pending_count()},
            {"version", std::string(chunkyard::version())},
        };
    }

} // namespace chunkyard::server
