#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "chunkyard/protocol.hpp"
#include "chunkyard/server/service_error.hpp"

namespace chunkyard::server::session_common
{

    chunkyard::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                           const std::optional<std::string> &request_id);

    chunkyard::protocol::ResponseEnvelope make_continue_response(nlohmann::json payload,
                                                                 const std::optional<std::string> &request_id);

    // Payload decoding failures surface as ValidationError instead of a JSON exception.
    template <typename T>
    T parse_payload(const nlohmann::json &payload)
    {
        try
        {
            return payload.get<T>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw_validation(std::string("Malformed payload: ") + ex.what());
        }
        catch (const std::invalid_argument &ex)
        {
            throw_validation(ex.what());
        }
    }

    const nlohmann::json &require_object(const nlohmann::json &payload, const char *key);

    std::optional<std::string> optional_string(const nlohmann::json &payload, const char *key);

} // namespace chunkyard::server::session_common
