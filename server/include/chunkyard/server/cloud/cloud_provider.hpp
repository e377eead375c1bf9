#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "chunkyard/server/byte_stream.hpp"
#include "chunkyard/server/config.hpp"
#include "chunkyard/time_format.hpp"

namespace chunkyard::server::cloud
{

    enum class Provider : std::uint8_t
    {
        S3,
        Azure,
        Gcs
    };

    std::string_view to_string(Provider provider) noexcept;

    // Throws ServiceError(UnsupportedProvider) for anything but "s3", "azure" and "gcs".
    Provider provider_from_string(std::string_view value);

    // Never logged and never persisted.
    struct CloudCredentials
    {
        std::string access_key_id;
        std::string secret_access_key;
        std::string session_token;
        std::string region;
        std::string account_name;
        std::string account_key;
        std::string connection_string;
        std::string endpoint;
    };

    struct CloudTarget
    {
        Provider provider{Provider::S3};
        // Bucket, or container for Azure.
        std::string bucket;
        // Object key, or blob name for Azure.
        std::string key;
        CloudCredentials credentials;
    };

    // Reads {provider, bucket|container, key|blob, credentials{...}} and fills gaps from the configured defaults.
    CloudTarget parse_cloud_target(const nlohmann::json &json, const CloudConfig &config);

    struct ObjectInfo
    {
        std::uint64_t size{};
        std::string content_type;
        std::string etag;
    };

    struct UploadOutcome
    {
        std::string uri;
        std::uint64_t size{};
    };

    void to_json(nlohmann::json &json, const ObjectInfo &info);
    void to_json(nlohmann::json &json, const UploadOutcome &outcome);

    enum class PresignOperation : std::uint8_t
    {
        Read,
        Write
    };

    std::string_view to_string(PresignOperation operation) noexcept;
    std::optional<PresignOperation> presign_operation_from_string(std::string_view value) noexcept;

    struct PresignedUrl
    {
        std::string url;
        std::string method;
        TimePoint expires_at;
        // Headers the caller has to send with the request for the signature to hold.
        std::map<std::string, std::string> headers;
    };

    void to_json(nlohmann::json &json, const PresignedUrl &presigned);

    class CloudProvider
    {
    public:
        virtual ~CloudProvider() = default;

        virtual Provider kind() const noexcept = 0;

        virtual ObjectInfo head(const CloudTarget &target) = 0;

        // Reads exactly content_length bytes from source.
        virtual UploadOutcome upload(const CloudTarget &target, ByteSource &source, std::uint64_t content_length,
                                     const std::string &content_type) = 0;

        // Returns the number of bytes written into sink.
        virtual std::uint64_t download(const CloudTarget &target, ByteSink &sink) = 0;

        virtual bool supports_native_copy() const noexcept = 0;

        // Server-side copy between two targets of this provider.
        virtual UploadOutcome copy(const CloudTarget &source, const CloudTarget &destination) = 0;

        virtual PresignedUrl presign(const CloudTarget &target, PresignOperation operation,
                                     std::chrono::seconds expiry, const std::optional<std::string> &content_type,
                                     TimePoint now) = 0;

        virtual std::string uri(const CloudTarget &target) const = 0;
    };

} // namespace chunkyard::server::cloud
