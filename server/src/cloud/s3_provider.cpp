#include "chunkyard/server/cloud/s3_provider.hpp"

#include <algorithm>
#include <charconv>

#include <spdlog/spdlog.h>

namespace chunkyard::server::cloud
{

    namespace
    {

        constexpr std::uint64_t kMaxParts = 10000;
        constexpr std::chrono::seconds kMaxPresignExpiry{7 * 24 * 3600};

        std::uint64_t parse_length(const std::optional<std::string> &value)
        {
            std::uint64_t length = 0;
            if (value)
            {
                std::from_chars(value->data(), value->data() + value->size(), length);
            }
            return length;
        }

        std::string strip_trailing_slash(std::string value)
        {
            while (value.ends_with('/'))
            {
                value.pop_back();
            }
            return value;
        }

        // Copy and CompleteMultipartUpload may answer 200 with an error document.
        bool is_error_document(const HttpResponse &response)
        {
            return response.body.find("<Error>") != std::string::npos;
        }

    } // namespace

    S3CompatibleProvider::S3CompatibleProvider(Provider kind, HttpTransport &http, const CloudConfig &config)
        : kind_(kind), http_(http), config_(config)
    {
    }

    const V4Scheme &S3CompatibleProvider::scheme() const noexcept
    {
        return kind_ == Provider::Gcs ? kGoogV4 : kAwsV4;
    }

    V4Credentials S3CompatibleProvider::credentials(const CloudTarget &target) const
    {
        return V4Credentials{
            .access_key_id = target.credentials.access_key_id,
            .secret_access_key = target.credentials.secret_access_key,
            .session_token = target.credentials.session_token,
            .region = kind_ == Provider::Gcs ? std::string("auto")
                                             : (target.credentials.region.empty() ? std::string("us-east-1")
                                                                                  : target.credentials.region),
        };
    }

    S3CompatibleProvider::Location S3CompatibleProvider::locate(const CloudTarget &target) const
    {
        const auto object_path = "/" + encode_path(target.key);
        std::string endpoint = target.credentials.endpoint;
        if (endpoint.empty() && kind_ == Provider::Gcs)
        {
            endpoint = "https://storage.googleapis.com";
        }

        if (!endpoint.empty())
        {
            endpoint = strip_trailing_slash(std::move(endpoint));
            const auto scheme_end = endpoint.find("://");
            const auto host = scheme_end == std::string::npos ? endpoint : endpoint.substr(scheme_end + 3);
            const auto base = scheme_end == std::string::npos ? "https://" + endpoint : endpoint;
            return Location{
                .base_url = base,
                .host = host,
                .path = "/" + uri_encode(target.bucket) + object_path,
            };
        }

        const auto region = credentials(target).region;
        const auto host = region == "us-east-1" ? target.bucket + ".s3.amazonaws.com"
                                                : target.bucket + ".s3." + region + ".amazonaws.com";
        return Location{
            .base_url = "https://" + host,
            .host = host,
            .path = object_path,
        };
    }

    HttpResponse S3CompatibleProvider::send(const CloudTarget &target, HttpRequest request, QueryList query,
                                            HeaderList headers)
    {
        const auto location = locate(target);
        V4Request signable{
            .method = request.method,
            .host = location.host,
            .path = location.path,
            .query = std::move(query),
            .headers = std::move(headers),
        };
        sign_v4(scheme(), credentials(target), signable, Clock::now());

        request.url = location.base_url + location.path;
        if (!signable.query.empty())
        {
            request.url += "?" + build_query(signable.query);
        }
        request.headers = std::move(signable.headers);
        try
        {
            return http_.execute(request);
        }
        catch (const HttpError &error)
        {
            throw ProviderError(std::string(to_string(kind_)), error.what(), std::nullopt,
                                error.bytes_sent() + error.bytes_received());
        }
    }

    ProviderError S3CompatibleProvider::failure(const HttpResponse &response, std::string_view action) const
    {
        std::string cause = std::string(action) + " failed with HTTP " + std::to_string(response.status);
        if (const auto code = xml_element(response.body, "Code"))
        {
            cause += " " + *code;
        }
        if (const auto message = xml_element(response.body, "Message"))
        {
            cause += ": " + *message;
        }
        return ProviderError(std::string(to_string(kind_)), cause, response.status);
    }

    ObjectInfo S3CompatibleProvider::head(const CloudTarget &target)
    {
        const auto response = send(target, HttpRequest{.method = "HEAD"}, {}, {});
        if (!response.ok())
        {
            throw failure(response, "HEAD " + target.key);
        }
        return ObjectInfo{
            .size = parse_length(response.header("content-length")),
            .content_type = response.header("content-type").value_or(""),
            .etag = response.header("etag").value_or(""),
        };
    }

    UploadOutcome S3CompatibleProvider::upload(const CloudTarget &target, ByteSource &source,
                                               std::uint64_t content_length, const std::string &content_type)
    {
        if (content_length <= config_.multipart_threshold)
        {
            return put_single(target, source, content_length, content_type);
        }
        return put_multipart(target, source, content_length, content_type);
    }

    UploadOutcome S3CompatibleProvider::put_single(const CloudTarget &target, ByteSource &source,
                                                   std::uint64_t content_length, const std::string &content_type)
    {
        HttpRequest request{
            .method = "PUT",
            .body_source = &source,
            .body_length = content_length,
        };
        const auto response = send(target, std::move(request), {}, {{"Content-Type", content_type}});
        if (!response.ok())
        {
            throw failure(response, "PUT " + target.key).with_bytes_transferred(response.bytes_sent);
        }
        spdlog::debug("Uploaded {} bytes to {}", content_length, uri(target));
        return UploadOutcome{.uri = uri(target), .size = content_length};
    }

    UploadOutcome S3CompatibleProvider::put_multipart(const CloudTarget &target, ByteSource &source,
                                                      std::uint64_t content_length, const std::string &content_type)
    {
        const auto init = send(target, HttpRequest{.method = "POST"}, {{"uploads", ""}},
                               {{"Content-Type", content_type}});
        if (!init.ok())
        {
            throw failure(init, "CreateMultipartUpload");
        }
        const auto upload_id = xml_element(init.body, "UploadId");
        if (!upload_id || upload_id->empty())
        {
            throw ProviderError(std::string(to_string(kind_)), "CreateMultipartUpload returned no UploadId",
                                init.status);
        }

        const auto part_size = std::max(config_.part_size, (content_length + kMaxParts - 1) / kMaxParts);
        std::vector<std::pair<std::uint64_t, std::string>> etags;
        std::uint64_t transferred = 0;
        try
        {
            std::string part;
            for (std::uint64_t number = 1;; ++number)
            {
                part.resize(static_cast<std::size_t>(part_size));
                const auto filled = read_full(source, std::as_writable_bytes(std::span<char>(part.data(), part.size())));
                if (filled == 0)
                {
                    break;
                }
                part.resize(filled);

                HttpRequest request{.method = "PUT", .body = std::move(part)};
                const auto response = send(target, std::move(request),
                                           {{"partNumber", std::to_string(number)}, {"uploadId", *upload_id}}, {});
                if (!response.ok())
                {
                    throw failure(response, "UploadPart " + std::to_string(number));
                }
                etags.emplace_back(number, response.header("etag").value_or(""));
                transferred += filled;
                part = std::string();
            }

            if (transferred != content_length)
            {
                throw ProviderError(std::string(to_string(kind_)),
                                    "Source produced " + std::to_string(transferred) + " bytes, expected " +
                                        std::to_string(content_length));
            }

            std::string manifest = "<CompleteMultipartUpload>";
            for (const auto &[number, etag] : etags)
            {
                manifest += "<Part><PartNumber>" + std::to_string(number) + "</PartNumber><ETag>" + xml_escape(etag) +
                            "</ETag></Part>";
            }
            manifest += "</CompleteMultipartUpload>";

            const auto response = send(target, HttpRequest{.method = "POST", .body = std::move(manifest)},
                                       {{"uploadId", *upload_id}}, {{"Content-Type", "application/xml"}});
            if (!response.ok() || is_error_document(response))
            {
                throw failure(response, "CompleteMultipartUpload");
            }
        }
        catch (const ProviderError &error)
        {
            abort_multipart(target, *upload_id);
            throw error.with_bytes_transferred(transferred);
        }
        catch (...)
        {
            abort_multipart(target, *upload_id);
            throw;
        }

        spdlog::debug("Uploaded {} bytes to {} in {} parts", transferred, uri(target), etags.size());
        return UploadOutcome{.uri = uri(target), .size = transferred};
    }

    void S3CompatibleProvider::abort_multipart(const CloudTarget &target, const std::string &upload_id)
    {
        try
        {
            const auto response = send(target, HttpRequest{.method = "DELETE"}, {{"uploadId", upload_id}}, {});
            if (!response.ok())
            {
                spdlog::warn("AbortMultipartUpload for {} returned HTTP {}", uri(target), response.status);
            }
        }
        catch (const ProviderError &error)
        {
            spdlog::warn("AbortMultipartUpload for {} failed: {}", uri(target), error.what());
        }
    }

    std::uint64_t S3CompatibleProvider::download(const CloudTarget &target, ByteSink &sink)
    {
        const auto response = send(target, HttpRequest{.method = "GET", .response_sink = &sink}, {}, {});
        if (!response.ok())
        {
            throw failure(response, "GET " + target.key);
        }
        return response.bytes_received;
    }

    UploadOutcome S3CompatibleProvider::copy(const CloudTarget &source, const CloudTarget &destination)
    {
        const auto header = std::string(scheme().header_prefix) + "-copy-source";
        const auto copy_source = "/" + uri_encode(source.bucket) + "/" + encode_path(source.key);
        const auto response =
            send(destination, HttpRequest{.method = "PUT"}, {}, {{header, copy_source}});
        if (!response.ok() || is_error_document(response))
        {
            throw failure(response, "CopyObject");
        }
        const auto info = head(destination);
        return UploadOutcome{.uri = uri(destination), .size = info.size};
    }

    PresignedUrl S3CompatibleProvider::presign(const CloudTarget &target, PresignOperation operation,
                                               std::chrono::seconds expiry,
                                               const std::optional<std::string> &content_type, TimePoint now)
    {
        if (expiry.count() <= 0 || expiry > kMaxPresignExpiry)
        {
            throw_validation("Presigned URL expiry must be between 1 second and 7 days");
        }
        const auto location = locate(target);
        const std::string method = operation == PresignOperation::Write ? "PUT" : "GET";

        HeaderList signed_headers;
        PresignedUrl presigned{
            .method = method,
            .expires_at = now + expiry,
        };
        if (operation == PresignOperation::Write && content_type)
        {
            signed_headers.emplace_back("content-type", *content_type);
            presigned.headers["Content-Type"] = *content_type;
        }
        presigned.url = presign_v4(scheme(), credentials(target), method, location.base_url, location.host,
                                   location.path, expiry, signed_headers, now);
        return presigned;
    }

    std::string S3CompatibleProvider::uri(const CloudTarget &target) const
    {
        return std::string(kind_ == Provider::Gcs ? "gs://" : "s3://") + target.bucket + "/" + target.key;
    }

} // namespace chunkyard::server::cloud
