#include "chunkyard/server/session.hpp"

#include <nlohmann/json.hpp>

#include "session_common.hpp"

namespace chunkyard::server
{

    nlohmann::json Session::handle_transform_submit(const Envelope &envelope)
    {
        const auto request = session_common::parse_payload<chunkyard::protocol::TransformSubmitRequest>(envelope.payload);
        const auto job = services_.jobs.submit(request.kind, request.file_ids, request.params);
        return nlohmann::json{
            {"job_id", job.job_id},
            {"status", std::string(to_string(job.status))},
            {"status_url", "/transform/status/" + job.job_id},
        };
    }

    nlohmann::json Session::handle_transform_status(const Envelope &envelope)
    {
        const auto request = session_common::parse_payload<chunkyard::protocol::JobRequest>(envelope.payload);
        return services_.jobs.status(request.job_id);
    }

} // namespace chunkyard::server
