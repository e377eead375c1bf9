#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "chunkyard/server/cloud/http_client.hpp"
#include "chunkyard/time_format.hpp"

namespace chunkyard::server::cloud
{

    using QueryList = std::vector<std::pair<std::string, std::string>>;

    // RFC 3986 percent-encoding; '/' survives when encode_slash is false.
    std::string uri_encode(std::string_view value, bool encode_slash = true);

    // Encodes every segment of an object key, keeping the separators.
    std::string encode_path(std::string_view path);

    // "a=1&b=2" with keys and values encoded, in the given order.
    std::string build_query(const QueryList &query);

    // Payload hash placeholder accepted by both S3 and GCS.
    inline constexpr std::string_view kUnsignedPayload = "UNSIGNED-PAYLOAD";

    // Parameters of the V4 HMAC signing family. S3 and the GCS XML API differ only in these labels.
    struct V4Scheme
    {
        std::string_view algorithm;
        std::string_view key_prefix;
        std::string_view terminator;
        std::string_view header_prefix;
        std::string_view query_prefix;
        std::string_view service;
    };

    inline constexpr V4Scheme kAwsV4{
        .algorithm = "AWS4-HMAC-SHA256",
        .key_prefix = "AWS4",
        .terminator = "aws4_request",
        .header_prefix = "x-amz",
        .query_prefix = "X-Amz",
        .service = "s3",
    };

    inline constexpr V4Scheme kGoogV4{
        .algorithm = "GOOG4-HMAC-SHA256",
        .key_prefix = "GOOG4",
        .terminator = "goog4_request",
        .header_prefix = "x-goog",
        .query_prefix = "X-Goog",
        .service = "storage",
    };

    struct V4Credentials
    {
        std::string access_key_id;
        std::string secret_access_key;
        std::string session_token;
        std::string region;
    };

    struct V4Request
    {
        std::string method;
        std::string host;
        // Already percent-encoded.
        std::string path;
        QueryList query;
        HeaderList headers;
        std::string payload_hash{kUnsignedPayload};
    };

    // Adds host, date, content hash, security token and Authorization headers to request.headers.
    void sign_v4(const V4Scheme &scheme, const V4Credentials &credentials, V4Request &request, TimePoint now);

    // Query-string authenticated URL. signed_headers lists extra headers the caller must send verbatim.
    std::string presign_v4(const V4Scheme &scheme, const V4Credentials &credentials, std::string_view method,
                           std::string_view base_url, std::string_view host, std::string_view path,
                           std::chrono::seconds expires, const HeaderList &signed_headers, TimePoint now);

    struct AzureAccount
    {
        std::string name;
        // Base64 encoded as issued by the portal.
        std::string key;
        // "https://<account>.blob.core.windows.net" unless overridden.
        std::string blob_endpoint;
    };

    inline constexpr std::string_view kAzureApiVersion = "2021-08-06";

    // AccountName, AccountKey, BlobEndpoint, EndpointSuffix and DefaultEndpointsProtocol are honoured.
    std::optional<AzureAccount> parse_connection_string(std::string_view connection_string);

    std::string azure_default_endpoint(std::string_view account_name);

    struct SharedKeyRequest
    {
        std::string method;
        // Encoded URL path, "/container/blob".
        std::string path;
        QueryList query;
        HeaderList headers;
    };

    // Adds x-ms-date, x-ms-version and the SharedKey Authorization header.
    void sign_shared_key(const AzureAccount &account, SharedKeyRequest &request, TimePoint now);

    // Service SAS query string for a single blob, without the leading '?'.
    std::string blob_service_sas(const AzureAccount &account, std::string_view container, std::string_view blob,
                                 std::string_view permissions, TimePoint start, TimePoint expiry);

    // Text of the first <tag>...</tag> element; enough for the flat XML bodies the providers return.
    std::optional<std::string> xml_element(std::string_view xml, std::string_view tag);

    std::string xml_escape(std::string_view text);

    // "Sun, 06 Nov 1994 08:49:37 GMT"
    std::string format_http_date(TimePoint time);

} // namespace chunkyard::server::cloud
