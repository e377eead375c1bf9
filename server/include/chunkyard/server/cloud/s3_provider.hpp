#pragma once

#include "chunkyard/server/cloud/cloud_provider.hpp"
#include "chunkyard/server/cloud/http_client.hpp"
#include "chunkyard/server/cloud/signing.hpp"
#include "chunkyard/server/service_error.hpp"

namespace chunkyard::server::cloud
{

    // Amazon S3 and the Google Cloud Storage XML API. Both speak the same multipart and copy
    // protocol; GCS is addressed path-style and signed with GOOG4-HMAC-SHA256 HMAC keys.
    class S3CompatibleProvider : public CloudProvider
    {
    public:
        S3CompatibleProvider(Provider kind, HttpTransport &http, const CloudConfig &config);

        Provider kind() const noexcept override { return kind_; }

        ObjectInfo head(const CloudTarget &target) override;
        UploadOutcome upload(const CloudTarget &target, ByteSource &source, std::uint64_t content_length,
                             const std::string &content_type) override;
        std::uint64_t download(const CloudTarget &target, ByteSink &sink) override;
        bool supports_native_copy() const noexcept override { return true; }
        UploadOutcome copy(const CloudTarget &source, const CloudTarget &destination) override;
        PresignedUrl presign(const CloudTarget &target, PresignOperation operation, std::chrono::seconds expiry,
                             const std::optional<std::string> &content_type, TimePoint now) override;
        std::string uri(const CloudTarget &target) const override;

    private:
        struct Location
        {
            std::string base_url;
            std::string host;
            std::string path;
        };

        Location locate(const CloudTarget &target) const;
        const V4Scheme &scheme() const noexcept;
        V4Credentials credentials(const CloudTarget &target) const;

        HttpResponse send(const CloudTarget &target, HttpRequest request, QueryList query, HeaderList headers);
        ProviderError failure(const HttpResponse &response, std::string_view action) const;

        UploadOutcome put_single(const CloudTarget &target, ByteSource &source, std::uint64_t content_length,
                                 const std::string &content_type);
        UploadOutcome put_multipart(const CloudTarget &target, ByteSource &source, std::uint64_t content_length,
                                    const std::string &content_type);
        void abort_multipart(const CloudTarget &target, const std::string &upload_id);

        Provider kind_;
        HttpTransport &http_;
        CloudConfig config_;
    };

} // namespace chunkyard::server::cloud
