#include "session_common.hpp"

namespace chunkyard::server::session_common
{

    chunkyard::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                           const std::optional<std::string> &request_id)
    {
        chunkyard::protocol::ResponseEnvelope envelope;
        envelope.kind = chunkyard::protocol::ResponseKind::Ok;
        envelope.payload = std::move(payload);
        envelope.error = chunkyard::ErrorCode::Ok;
        envelope.request_id = request_id;
        return envelope;
    }

    chunkyard::protocol::ResponseEnvelope make_continue_response(nlohmann::json payload,
                                                                 const std::optional<std::string> &request_id)
    {
        auto envelope = make_ok_response(std::move(payload), request_id);
        envelope.kind = chunkyard::protocol::ResponseKind::Continue;
        return envelope;
    }

    const nlohmann::json &require_object(const nlohmann::json &payload, const char *key)
    {
        const auto it = payload.find(key);
        if (it == payload.end() || !it->is_object())
        {
            throw_validation(std::string(key) + " must be an object");
        }
        return *it;
    }

    std::optional<std::string> optional_string(const nlohmann::json &payload, const char *key)
    {
        const auto it = payload.find(key);
        if (it == payload.end() || it->is_null())
        {
            return std::nullopt;
        }
        if (!it->is_string())
        {
            throw_validation(std::string(key) + " must be a string");
        }
        return it->get<std::string>();
    }

} // namespace chunkyard::server::session_common
