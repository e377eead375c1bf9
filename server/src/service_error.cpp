#include "chunkyard/server/service_error.hpp"

namespace chunkyard::server
{

    namespace
    {
        nlohmann::json provider_details(const std::string &provider, const std::string &cause,
                                        std::optional<long> http_status, std::optional<std::uint64_t> bytes)
        {
            nlohmann::json details{{"provider", provider}, {"cause", cause}};
            if (http_status)
            {
                details["http_status"] = *http_status;
            }
            if (bytes)
            {
                details["bytes_transferred"] = *bytes;
            }
            return details;
        }
    } // namespace

    ServiceError::ServiceError(chunkyard::ErrorCode code, std::string message, nlohmann::json details)
        : std::runtime_error(std::move(message)), code_(code), details_(std::move(details))
    {
    }

    MissingChunksError::MissingChunksError(std::vector<std::uint64_t> missing)
        : ServiceError(chunkyard::ErrorCode::MissingChunks,
                       "Upload is missing " + std::to_string(missing.size()) + " chunk(s)",
                       nlohmann::json{{"missing", missing}}),
          missing_(std::move(missing))
    {
    }

    ChecksumMismatchError::ChecksumMismatchError(std::uint64_t chunk_index)
        : ServiceError(chunkyard::ErrorCode::ChecksumMismatch,
                       "Checksum mismatch for chunk " + std::to_string(chunk_index),
                       nlohmann::json{{"chunk_index", chunk_index}}),
          chunk_index_(chunk_index)
    {
    }

    InvalidRangeError::InvalidRangeError(std::string message, std::uint64_t size)
        : ServiceError(chunkyard::ErrorCode::InvalidRange, std::move(message), nlohmann::json{{"size", size}})
    {
    }

    ProviderError::ProviderError(std::string provider, std::string cause, std::optional<long> http_status,
                                 std::optional<std::uint64_t> bytes_transferred)
        : ServiceError(chunkyard::ErrorCode::ProviderError, provider + ": " + cause,
                       provider_details(provider, cause, http_status, bytes_transferred)),
          provider_(std::move(provider)),
          cause_(std::move(cause)),
          http_status_(http_status),
          bytes_transferred_(bytes_transferred)
    {
    }

    ProviderError ProviderError::with_bytes_transferred(std::uint64_t bytes) const
    {
        return ProviderError(provider_, cause_, http_status_, bytes);
    }

    void throw_validation(std::string message)
    {
        throw ServiceError(chunkyard::ErrorCode::ValidationError, std::move(message));
    }

    void throw_not_found(std::string message)
    {
        throw ServiceError(chunkyard::ErrorCode::NotFound, std::move(message));
    }

} // namespace chunkyard::server
