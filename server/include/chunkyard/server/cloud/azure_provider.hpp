#pragma once

#include "chunkyard/server/cloud/cloud_provider.hpp"
#include "chunkyard/server/cloud/http_client.hpp"
#include "chunkyard/server/cloud/signing.hpp"
#include "chunkyard/server/service_error.hpp"

namespace chunkyard::server::cloud
{

    // Azure Blob Storage block blobs, authorized with SharedKey and service SAS tokens.
    class AzureBlobProvider : public CloudProvider
    {
    public:
        AzureBlobProvider(HttpTransport &http, const CloudConfig &config);

        Provider kind() const noexcept override { return Provider::Azure; }

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
        AzureAccount account(const CloudTarget &target) const;
        std::string blob_path(const CloudTarget &target) const;

        HttpResponse send(const CloudTarget &target, HttpRequest request, QueryList query, HeaderList headers);
        ProviderError failure(const HttpResponse &response, std::string_view action) const;

        UploadOutcome put_blocks(const CloudTarget &target, ByteSource &source, std::uint64_t content_length,
                                 const std::string &content_type);

        HttpTransport &http_;
        CloudConfig config_;
    };

} // namespace chunkyard::server::cloud
