#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "chunkyard/server/cloud/cloud_provider.hpp"
#include "chunkyard/server/cloud/http_client.hpp"
#include "chunkyard/server/config.hpp"
#include "chunkyard/server/file_catalog.hpp"

namespace chunkyard::server::cloud
{

    using ProviderMap = std::map<Provider, std::unique_ptr<CloudProvider>>;

    // S3, Azure and GCS providers sharing one transport.
    ProviderMap make_default_providers(HttpTransport &http, const CloudConfig &config);

    class CloudBroker
    {
    public:
        // Providers missing from the map are created with make_default_providers.
        CloudBroker(FileCatalog &files, HttpTransport &http, CloudConfig config, ProviderMap providers = {});

        const CloudConfig &config() const noexcept { return config_; }

        // Retried with backoff.
        ObjectInfo head(const CloudTarget &target);

        UploadOutcome upload_stream(const CloudTarget &destination, ByteSource &source, std::uint64_t content_length,
                                    const std::string &content_type);

        UploadOutcome upload_file(const std::string &file_id, const CloudTarget &destination,
                                  const std::optional<std::string> &content_type = std::nullopt);

        // Streams an http(s) resource; its Content-Length must be known up front.
        UploadOutcome upload_url(const std::string &source_url, const CloudTarget &destination,
                                 const std::optional<std::string> &content_type = std::nullopt);

        std::uint64_t download_stream(const CloudTarget &source, ByteSink &sink);

        // Materializes the object as a local File with origin "cloud".
        FileRecord download_to_file(const CloudTarget &source, const std::optional<std::string> &filename = std::nullopt);

        // Server-side when both ends use the same provider, otherwise piped through this process.
        UploadOutcome copy(const CloudTarget &source, const CloudTarget &destination);

        PresignedUrl presign(const CloudTarget &target, PresignOperation operation,
                             std::optional<std::chrono::seconds> expiry = std::nullopt,
                             const std::optional<std::string> &content_type = std::nullopt);

    private:
        CloudProvider &provider(Provider kind);

        FileCatalog &files_;
        HttpTransport &http_;
        CloudConfig config_;
        ProviderMap providers_;
    };

} // namespace chunkyard::server::cloud
