#include "chunkyard/server/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chunkyard/encoding/base64.hpp"
#include "session_common.hpp"

namespace chunkyard::server
{

    nlohmann::json Session::handle_upload_init(const Envelope &envelope)
    {
        const auto request = session_common::parse_payload<chunkyard::protocol::UploadInitRequest>(envelope.payload);
        const auto result = services_.uploads.init(InitUploadRequest{
            .filename = request.filename,
            .total_size = request.total_size,
            .mime_type = request.mime_type,
            .chunk_size = request.chunk_size,
            .metadata = request.metadata,
        });
        return result;
    }

    nlohmann::json Session::handle_upload_chunk(const Envelope &envelope)
    {
        const auto request = session_common::parse_payload<chunkyard::protocol::UploadChunkRequest>(envelope.payload);
        const auto data = chunkyard::encoding::decode_base64(request.data_base64);
        if (!data)
        {
            throw_validation("Chunk data is not valid base64");
        }
        return services_.uploads.put_chunk(request.upload_id, request.chunk_index, *data);
    }

    nlohmann::json Session::handle_upload_status(const Envelope &envelope)
    {
        const auto request = session_common::parse_payload<chunkyard::protocol::UploadRefRequest>(envelope.payload);
        return services_.uploads.status(request.upload_id);
    }

    nlohmann::json Session::handle_upload_complete(const Envelope &envelope)
    {
        const auto request = session_common::parse_payload<chunkyard::protocol::UploadCompleteRequest>(envelope.payload);
        return services_.uploads.complete(request.upload_id, request.checksums.value_or(nlohmann::json()));
    }

    nlohmann::json Session::handle_upload_cancel(const Envelope &envelope)
    {
        const auto request = session_common::parse_payload<chunkyard::protocol::UploadRefRequest>(envelope.payload);
        services_.uploads.cancel(request.upload_id);
        return nlohmann::json{{"upload_id", request.upload_id}, {"cancelled", true}};
    }

} // namespace chunkyard::server
