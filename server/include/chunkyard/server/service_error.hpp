#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkyard/error_codes.hpp"

namespace chunkyard::server
{

    // Every component reports failures with this type; the session layer maps it onto an ERROR frame.
    class ServiceError : public std::runtime_error
    {
    public:
        ServiceError(chunkyard::ErrorCode code, std::string message, nlohmann::json details = nlohmann::json::object());

        chunkyard::ErrorCode code() const noexcept { return code_; }
        const nlohmann::json &details() const noexcept { return details_; }

    private:
        chunkyard::ErrorCode code_;
        nlohmann::json details_;
    };

    class MissingChunksError : public ServiceError
    {
    public:
        explicit MissingChunksError(std::vector<std::uint64_t> missing);

        const std::vector<std::uint64_t> &missing() const noexcept { return missing_; }

    private:
        std::vector<std::uint64_t> missing_;
    };

    class ChecksumMismatchError : public ServiceError
    {
    public:
        explicit ChecksumMismatchError(std::uint64_t chunk_index);

        std::uint64_t chunk_index() const noexcept { return chunk_index_; }

    private:
        std::uint64_t chunk_index_;
    };

    class InvalidRangeError : public ServiceError
    {
    public:
        InvalidRangeError(std::string message, std::uint64_t size);
    };

    class ProviderError : public ServiceError
    {
    public:
        ProviderError(std::string provider, std::string cause, std::optional<long> http_status = std::nullopt,
                      std::optional<std::uint64_t> bytes_transferred = std::nullopt);

        const std::string &provider() const noexcept { return provider_; }
        std::optional<long> http_status() const noexcept { return http_status_; }
        std::optional<std::uint64_t> bytes_transferred() const noexcept { return bytes_transferred_; }

        // Same failure, annotated with how far a stream got before it broke.
        ProviderError with_bytes_transferred(std::uint64_t bytes) const;

    private:
        std::string provider_;
        std::string cause_;
        std::optional<long> http_status_;
        std::optional<std::uint64_t> bytes_transferred_;
    };

    [[noreturn]] void throw_validation(std::string message);
    [[noreturn]] void throw_not_found(std::string message);

} // namespace chunkyard::server
