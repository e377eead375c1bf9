#include "chunkyard/server/cloud/azure_provider.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <thread>

#include <spdlog/spdlog.h>

#include "chunkyard/encoding/base64.hpp"

namespace chunkyard::server::cloud
{

    namespace
    {

        constexpr std::uint64_t kMaxBlocks = 50000;
        constexpr int kCopyStatusPolls = 10;
        constexpr std::chrono::minutes kSasClockSkew{5};
        constexpr std::chrono::hours kCopySourceValidity{1};

        std::uint64_t parse_length(const std::optional<std::string> &value)
        {
            std::uint64_t length = 0;
            if (value)
            {
                std::from_chars(value->data(), value->data() + value->size(), length);
            }
            return length;
        }

        // Block ids must share one length within a blob.
        std::string block_id(std::uint64_t index)
        {
            char raw[32];
            std::snprintf(raw, sizeof(raw), "block-%010llu", static_cast<unsigned long long>(index));
            return encoding::encode_base64(std::string_view(raw));
        }

    } // namespace

    AzureBlobProvider::AzureBlobProvider(HttpTransport &http, const CloudConfig &config)
        : http_(http), config_(config)
    {
    }

    AzureAccount AzureBlobProvider::account(const CloudTarget &target) const
    {
        AzureAccount result;
        if (!target.credentials.connection_string.empty())
        {
            auto parsed = parse_connection_string(target.credentials.connection_string);
            if (!parsed)
            {
                throw_validation("Azure connection string lacks AccountName or AccountKey");
            }
            result = std::move(*parsed);
        }
        else
        {
            result.name = target.credentials.account_name;
            result.key = target.credentials.account_key;
            result.blob_endpoint = azure_default_endpoint(result.name);
        }
        if (!target.credentials.endpoint.empty())
        {
            result.blob_endpoint = target.credentials.endpoint;
            while (result.blob_endpoint.ends_with('/'))
            {
                result.blob_endpoint.pop_back();
            }
        }
        return result;
    }

    std::string AzureBlobProvider::blob_path(const CloudTarget &target) const
    {
        return "/" + uri_encode(target.bucket) + "/" + encode_path(target.key);
    }

    HttpResponse AzureBlobProvider::send(const CloudTarget &target, HttpRequest request, QueryList query,
                                         HeaderList headers)
    {
        const auto storage_account = account(target);
        SharedKeyRequest signable{
            .method = request.method,
            .path = blob_path(target),
            .query = std::move(query),
            .headers = std::move(headers),
        };
        sign_shared_key(storage_account, signable, Clock::now());

        request.url = storage_account.blob_endpoint + signable.path;
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
            throw ProviderError("azure", error.what(), std::nullopt, error.bytes_sent() + error.bytes_received());
        }
    }

    ProviderError AzureBlobProvider::failure(const HttpResponse &response, std::string_view action) const
    {
        std::string cause = std::string(action) + " failed with HTTP " + std::to_string(response.status);
        if (const auto code = response.header("x-ms-error-code"))
        {
            cause += " " + *code;
        }
        else if (const auto xml_code = xml_element(response.body, "Code"))
        {
            cause += " " + *xml_code;
        }
        if (const auto message = xml_element(response.body, "Message"))
        {
            cause += ": " + *message;
        }
        return ProviderError("azure", cause, response.status);
    }

    ObjectInfo AzureBlobProvider::head(const CloudTarget &target)
    {
        const auto response = send(target, HttpRequest{.method = "HEAD"}, {}, {});
        if (!response.ok())
        {
            throw failure(response, "Get Blob Properties " + target.key);
        }
        return ObjectInfo{
            .size = parse_length(response.header("content-length")),
            .content_type = response.header("content-type").value_or(""),
            .etag = response.header("etag").value_or(""),
        };
    }

    UploadOutcome AzureBlobProvider::upload(const CloudTarget &target, ByteSource &source,
                                            std::uint64_t content_length, const std::string &content_type)
    {
        if (content_length > config_.multipart_threshold)
        {
            return put_blocks(target, source, content_length, content_type);
        }

        HttpRequest request{
            .method = "PUT",
            .body_source = &source,
            .body_length = content_length,
        };
        const auto response = send(target, std::move(request), {},
                                   {
                                       {"Content-Length", std::to_string(content_length)},
                                       {"Content-Type", content_type},
                                       {"x-ms-blob-type", "BlockBlob"},
                                   });
        if (!response.ok())
        {
            throw failure(response, "Put Blob " + target.key).with_bytes_transferred(response.bytes_sent);
        }
        return UploadOutcome{.uri = uri(target), .size = content_length};
    }

    UploadOutcome AzureBlobProvider::put_blocks(const CloudTarget &target, ByteSource &source,
                                                std::uint64_t content_length, const std::string &content_type)
    {
        const auto block_size = std::max(config_.part_size, (content_length + kMaxBlocks - 1) / kMaxBlocks);
        std::vector<std::string> block_ids;
        std::uint64_t transferred = 0;

        // Uncommitted blocks are discarded by the service, so a failure needs no explicit cleanup.
        try
        {
            std::string block;
            for (std::uint64_t index = 0;; ++index)
            {
                block.resize(static_cast<std::size_t>(block_size));
                const auto filled =
                    read_full(source, std::as_writable_bytes(std::span<char>(block.data(), block.size())));
                if (filled == 0)
                {
                    break;
                }
                block.resize(filled);

                auto id = block_id(index);
                HttpRequest request{.method = "PUT", .body = std::move(block)};
                const auto response = send(target, std::move(request), {{"comp", "block"}, {"blockid", id}},
                                           {{"Content-Length", std::to_string(filled)}});
                if (!response.ok())
                {
                    throw failure(response, "Put Block " + std::to_string(index));
                }
                block_ids.push_back(std::move(id));
                transferred += filled;
                block = std::string();
            }

            if (transferred != content_length)
            {
                throw ProviderError("azure", "Source produced " + std::to_string(transferred) +
                                                 " bytes, expected " + std::to_string(content_length));
            }

            std::string block_list = "<?xml version=\"1.0\" encoding=\"utf-8\"?><BlockList>";
            for (const auto &id : block_ids)
            {
                block_list += "<Latest>" + id + "</Latest>";
            }
            block_list += "</BlockList>";

            const auto length = block_list.size();
            const auto response = send(target, HttpRequest{.method = "PUT", .body = std::move(block_list)},
                                       {{"comp", "blocklist"}},
                                       {
                                           {"Content-Length", std::to_string(length)},
                                           {"Content-Type", "application/xml"},
                                           {"x-ms-blob-content-type", content_type},
                                       });
            if (!response.ok())
            {
                throw failure(response, "Put Block List");
            }
        }
        catch (const ProviderError &error)
        {
            throw error.with_bytes_transferred(transferred);
        }

        spdlog::debug("Uploaded {} bytes to {} in {} blocks", transferred, uri(target), block_ids.size());
        return UploadOutcome{.uri = uri(target), .size = transferred};
    }

    std::uint64_t AzureBlobProvider::download(const CloudTarget &target, ByteSink &sink)
    {
        const auto response = send(target, HttpRequest{.method = "GET", .response_sink = &sink}, {}, {});
        if (!response.ok())
        {
            throw failure(response, "Get Blob " + target.key);
        }
        return response.bytes_received;
    }

    UploadOutcome AzureBlobProvider::copy(const CloudTarget &source, const CloudTarget &destination)
    {
        const auto source_account = account(source);
        const auto now = Clock::now();
        const auto source_url = source_account.blob_endpoint + blob_path(source) + "?" +
                                blob_service_sas(source_account, source.bucket, source.key, "r",
                                                 now - kSasClockSkew, now + kCopySourceValidity);

        const auto response = send(destination, HttpRequest{.method = "PUT"}, {},
                                   {{"Content-Length", "0"}, {"x-ms-copy-source", source_url}});
        if (!response.ok())
        {
            throw failure(response, "Copy Blob");
        }

        auto status = response.header("x-ms-copy-status").value_or("success");
        auto delay = config_.retry_base_delay;
        for (int poll = 0; status == "pending" && poll < kCopyStatusPolls; ++poll)
        {
            std::this_thread::sleep_for(delay);
            delay *= 2;
            const auto properties = send(destination, HttpRequest{.method = "HEAD"}, {}, {});
            if (!properties.ok())
            {
                throw failure(properties, "Get Blob Properties " + destination.key);
            }
            status = properties.header("x-ms-copy-status").value_or("success");
        }
        if (status != "success")
        {
            throw ProviderError("azure", "Copy Blob ended with status " + status);
        }

        const auto info = head(destination);
        return UploadOutcome{.uri = uri(destination), .size = info.size};
    }

    PresignedUrl AzureBlobProvider::presign(const CloudTarget &target, PresignOperation operation,
                                            std::chrono::seconds expiry,
                                            const std::optional<std::string> &content_type, TimePoint now)
    {
        if (expiry.count() <= 0)
        {
            throw_validation("Presigned URL expiry must be positive");
        }
        const auto storage_account = account(target);
        const bool write = operation == PresignOperation::Write;

        PresignedUrl presigned{
            .url = storage_account.blob_endpoint + blob_path(target) + "?" +
                   blob_service_sas(storage_account, target.bucket, target.key, write ? "cw" : "r",
                                    now - kSasClockSkew, now + expiry),
            .method = write ? "PUT" : "GET",
            .expires_at = now + expiry,
        };
        if (write)
        {
            presigned.headers["x-ms-blob-type"] = "BlockBlob";
            if (content_type)
            {
                presigned.headers["Content-Type"] = *content_type;
            }
        }
        return presigned;
    }

    std::string AzureBlobProvider::uri(const CloudTarget &target) const
    {
        return account(target).blob_endpoint + blob_path(target);
    }

} // namespace chunkyard::server::cloud
