#include "chunkyard/server/cloud/cloud_provider.hpp"

#include <array>

#include "chunkyard/server/service_error.hpp"

namespace chunkyard::server::cloud
{

    namespace
    {

        struct ProviderMapping
        {
            Provider provider;
            std::string_view label;
        };

        constexpr std::array<ProviderMapping, 3> kProviderMappings{{
            {Provider::S3, "s3"},
            {Provider::Azure, "azure"},
            {Provider::Gcs, "gcs"},
        }};

        std::string string_field(const nlohmann::json &json, std::initializer_list<const char *> keys)
        {
            for (const auto *key : keys)
            {
                if (auto it = json.find(key); it != json.end() && it->is_string())
                {
                    return it->get<std::string>();
                }
            }
            return {};
        }

        void fill(std::string &field, const std::string &fallback)
        {
            if (field.empty())
            {
                field = fallback;
            }
        }

    } // namespace

    std::string_view to_string(Provider provider) noexcept
    {
        for (const auto &mapping : kProviderMappings)
        {
            if (mapping.provider == provider)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    Provider provider_from_string(std::string_view value)
    {
        for (const auto &mapping : kProviderMappings)
        {
            if (mapping.label == value)
            {
                return mapping.provider;
            }
        }
        throw ServiceError(ErrorCode::UnsupportedProvider, "Unsupported provider: " + std::string(value),
                           nlohmann::json{{"provider", std::string(value)}});
    }

    CloudTarget parse_cloud_target(const nlohmann::json &json, const CloudConfig &config)
    {
        if (!json.is_object())
        {
            throw_validation("Cloud target must be an object");
        }
        CloudTarget target{
            .provider = provider_from_string(string_field(json, {"provider"})),
            .bucket = string_field(json, {"bucket", "container"}),
            .key = string_field(json, {"key", "blob", "path"}),
        };
        while (target.key.starts_with('/'))
        {
            target.key.erase(0, 1);
        }
        if (target.bucket.empty())
        {
            throw_validation("Cloud target requires a bucket or container");
        }
        if (target.key.empty())
        {
            throw_validation("Cloud target requires an object key");
        }

        const auto credentials_json = json.value("credentials", nlohmann::json::object());
        if (!credentials_json.is_object())
        {
            throw_validation("credentials must be an object");
        }
        auto &credentials = target.credentials;
        credentials.access_key_id = string_field(credentials_json, {"access_key_id", "hmac_access_id"});
        credentials.secret_access_key = string_field(credentials_json, {"secret_access_key", "hmac_secret"});
        credentials.session_token = string_field(credentials_json, {"session_token"});
        credentials.region = string_field(credentials_json, {"region"});
        credentials.account_name = string_field(credentials_json, {"account_name"});
        credentials.account_key = string_field(credentials_json, {"account_key"});
        credentials.connection_string = string_field(credentials_json, {"connection_string"});
        credentials.endpoint = string_field(credentials_json, {"endpoint"});

        switch (target.provider)
        {
        case Provider::S3:
            if (credentials.access_key_id.empty())
            {
                credentials.access_key_id = config.s3.access_key_id;
                credentials.secret_access_key = config.s3.secret_access_key;
                credentials.session_token = config.s3.session_token;
            }
            fill(credentials.region, config.s3.region);
            fill(credentials.endpoint, config.s3.endpoint);
            if (credentials.access_key_id.empty() || credentials.secret_access_key.empty())
            {
                throw_validation("No S3 credentials supplied and none configured");
            }
            break;
        case Provider::Gcs:
            if (credentials.access_key_id.empty())
            {
                credentials.access_key_id = config.gcs.hmac_access_id;
                credentials.secret_access_key = config.gcs.hmac_secret;
            }
            if (credentials.access_key_id.empty() || credentials.secret_access_key.empty())
            {
                throw_validation("No GCS HMAC credentials supplied and none configured");
            }
            break;
        case Provider::Azure:
            if (credentials.connection_string.empty() && credentials.account_key.empty())
            {
                credentials.connection_string = config.azure.connection_string;
                credentials.account_name = config.azure.account_name;
                credentials.account_key = config.azure.account_key;
            }
            if (credentials.connection_string.empty() &&
                (credentials.account_name.empty() || credentials.account_key.empty()))
            {
                throw_validation("No Azure credentials supplied and none configured");
            }
            break;
        }
        return target;
    }

    void to_json(nlohmann::json &json, const ObjectInfo &info)
    {
        json = {
            {"size", info.size},
            {"content_type", info.content_type},
            {"etag", info.etag},
        };
    }

    void to_json(nlohmann::json &json, const UploadOutcome &outcome)
    {
        json = {
            {"uri", outcome.uri},
            {"size", outcome.size},
        };
    }

    std::string_view to_string(PresignOperation operation) noexcept
    {
        return operation == PresignOperation::Write ? "write" : "read";
    }

    std::optional<PresignOperation> presign_operation_from_string(std::string_view value) noexcept
    {
        if (value == "read")
        {
            return PresignOperation::Read;
        }
        if (value == "write")
        {
            return PresignOperation::Write;
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const PresignedUrl &presigned)
    {
        json = {
            {"url", presigned.url},
            {"method", presigned.method},
            {"expires_at", format_iso8601(presigned.expires_at)},
            {"headers", presigned.headers},
        };
    }

} // namespace chunkyard::server::cloud
