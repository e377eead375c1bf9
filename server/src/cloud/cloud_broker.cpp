#include "chunkyard/server/cloud/cloud_broker.hpp"

#include <atomic>
#include <charconv>
#include <exception>
#include <functional>
#include <thread>

#include <spdlog/spdlog.h>

#include "chunkyard/server/cloud/azure_provider.hpp"
#include "chunkyard/server/cloud/byte_pipe.hpp"
#include "chunkyard/server/cloud/s3_provider.hpp"
#include "chunkyard/server/mime_types.hpp"
#include "chunkyard/server/service_error.hpp"

namespace chunkyard::server::cloud
{

    namespace
    {

        constexpr std::size_t kPipeCapacity = 8 * 1024 * 1024;

        bool is_retryable(const ProviderError &error)
        {
            const auto status = error.http_status();
            return !status || *status >= 500 || *status == 429 || *status == 408;
        }

        template <typename Operation>
        auto with_retry(const CloudConfig &config, std::string_view action, Operation operation)
            -> decltype(operation())
        {
            auto delay = config.retry_base_delay;
            for (int attempt = 1;; ++attempt)
            {
                try
                {
                    return operation();
                }
                catch (const ProviderError &error)
                {
                    if (attempt >= config.max_attempts || !is_retryable(error))
                    {
                        throw;
                    }
                    spdlog::warn("{} attempt {}/{} failed: {}; retrying in {} ms", action, attempt,
                                 config.max_attempts, error.what(), delay.count());
                }
                std::this_thread::sleep_for(delay);
                delay *= 2;
            }
        }

        // Producer runs on a helper thread and fills the pipe; the consumer drains it on the caller's thread.
        UploadOutcome pipe_transfer(const std::function<void(ByteSink &)> &produce,
                                    const std::function<UploadOutcome(ByteSource &)> &consume)
        {
            BoundedPipe pipe(kPipeCapacity);
            std::exception_ptr producer_failure;
            std::atomic<bool> consumer_failed{false};
            std::thread producer([&]()
                                 {
                try
                {
                    produce(pipe);
                    pipe.close();
                }
                catch (const PipeClosed &)
                {
                    // Consumer already has everything it asked for.
                }
                catch (...)
                {
                    // A failure caused by the consumer's abort is not the root cause.
                    if (!consumer_failed)
                    {
                        producer_failure = std::current_exception();
                    }
                    pipe.abort("source stream failed");
                } });

            UploadOutcome outcome;
            try
            {
                outcome = consume(pipe);
            }
            catch (...)
            {
                consumer_failed = true;
                pipe.abort("destination stream failed");
                producer.join();
                if (producer_failure)
                {
                    std::rethrow_exception(producer_failure);
                }
                throw;
            }
            pipe.close_read();
            producer.join();
            if (producer_failure)
            {
                std::rethrow_exception(producer_failure);
            }
            return outcome;
        }

        std::string last_segment(const std::string &path)
        {
            auto trimmed = path;
            if (const auto query = trimmed.find_first_of("?#"); query != std::string::npos)
            {
                trimmed.resize(query);
            }
            const auto slash = trimmed.find_last_of('/');
            auto name = slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
            return name.empty() ? std::string("download") : name;
        }

        std::string resolve_content_type(const std::optional<std::string> &requested, const std::string &reported,
                                         const std::string &name)
        {
            if (requested && !requested->empty())
            {
                return *requested;
            }
            if (!reported.empty() && reported != kDefaultMimeType)
            {
                return reported;
            }
            return mime_type_for(name);
        }

    } // namespace

    ProviderMap make_default_providers(HttpTransport &http, const CloudConfig &config)
    {
        ProviderMap providers;
        providers.emplace(Provider::S3, std::make_unique<S3CompatibleProvider>(Provider::S3, http, config));
        providers.emplace(Provider::Gcs, std::make_unique<S3CompatibleProvider>(Provider::Gcs, http, config));
        providers.emplace(Provider::Azure, std::make_unique<AzureBlobProvider>(http, config));
        return providers;
    }

    CloudBroker::CloudBroker(FileCatalog &files, HttpTransport &http, CloudConfig config, ProviderMap providers)
        : files_(files), http_(http), config_(std::move(config)), providers_(std::move(providers))
    {
        for (auto &[kind, instance] : make_default_providers(http_, config_))
        {
            providers_.try_emplace(kind, std::move(instance));
        }
    }

    CloudProvider &CloudBroker::provider(Provider kind)
    {
        auto it = providers_.find(kind);
        if (it == providers_.end() || !it->second)
        {
            throw ServiceError(ErrorCode::UnsupportedProvider,
                               "No provider registered for " + std::string(to_string(kind)));
        }
        return *it->second;
    }

    ObjectInfo CloudBroker::head(const CloudTarget &target)
    {
        auto &backend = provider(target.provider);
        return with_retry(config_, "HEAD " + backend.uri(target), [&]()
                          { return backend.head(target); });
    }

    UploadOutcome CloudBroker::upload_stream(const CloudTarget &destination, ByteSource &source,
                                             std::uint64_t content_length, const std::string &content_type)
    {
        auto &backend = provider(destination.provider);
        spdlog::info("Uploading {} bytes to {}", content_length, backend.uri(destination));
        try
        {
            auto outcome = backend.upload(destination, source, content_length, content_type);
            spdlog::info("Uploaded {} ({} bytes)", outcome.uri, outcome.size);
            return outcome;
        }
        catch (const ProviderError &error)
        {
            spdlog::error("Upload to {} failed: {}", backend.uri(destination), error.what());
            throw;
        }
    }

    UploadOutcome CloudBroker::upload_file(const std::string &file_id, const CloudTarget &destination,
                                           const std::optional<std::string> &content_type)
    {
        const auto file = files_.require(file_id);
        auto source = files_.open(file, 0, file.size);
        return upload_stream(destination, *source, file.size,
                             content_type && !content_type->empty() ? *content_type : file.mime_type);
    }

    UploadOutcome CloudBroker::upload_url(const std::string &source_url, const CloudTarget &destination,
                                          const std::optional<std::string> &content_type)
    {
        if (!source_url.starts_with("http://") && !source_url.starts_with("https://"))
        {
            throw_validation("source_url must be an http or https URL");
        }

        HttpResponse head_response;
        try
        {
            head_response = http_.execute(HttpRequest{.method = "HEAD", .url = source_url});
        }
        catch (const HttpError &error)
        {
            throw ProviderError("http", error.what());
        }
        if (!head_response.ok())
        {
            throw ProviderError("http", "HEAD " + source_url + " returned HTTP " + std::to_string(head_response.status),
                                head_response.status);
        }
        const auto length_header = head_response.header("content-length");
        std::uint64_t length = 0;
        if (!length_header ||
            std::from_chars(length_header->data(), length_header->data() + length_header->size(), length).ec !=
                std::errc{})
        {
            throw_validation("source_url does not report a Content-Length");
        }
        const auto type = resolve_content_type(content_type, head_response.header("content-type").value_or(""),
                                               last_segment(source_url));

        auto &backend = provider(destination.provider);
        spdlog::info("Streaming {} bytes from URL to {}", length, backend.uri(destination));
        return pipe_transfer(
            [&](ByteSink &sink)
            {
                HttpResponse response;
                try
                {
                    response = http_.execute(HttpRequest{.method = "GET", .url = source_url, .response_sink = &sink});
                }
                catch (const HttpError &error)
                {
                    throw ProviderError("http", error.what(), std::nullopt, error.bytes_received());
                }
                if (!response.ok())
                {
                    throw ProviderError("http", "GET returned HTTP " + std::to_string(response.status),
                                        response.status);
                }
            },
            [&](ByteSource &source)
            { return backend.upload(destination, source, length, type); });
    }

    std::uint64_t CloudBroker::download_stream(const CloudTarget &source, ByteSink &sink)
    {
        auto &backend = provider(source.provider);
        try
        {
            return backend.download(source, sink);
        }
        catch (const ProviderError &error)
        {
            spdlog::error("Download from {} failed: {}", backend.uri(source), error.what());
            throw;
        }
    }

    FileRecord CloudBroker::download_to_file(const CloudTarget &source, const std::optional<std::string> &filename)
    {
        auto &backend = provider(source.provider);
        const auto info = head(source);
        const auto name = filename && !filename->empty() ? *filename : last_segment(source.key);

        auto ingest = files_.begin_file(NewFile{
            .filename = name,
            .mime_type = resolve_content_type(std::nullopt, info.content_type, name),
            .metadata = nlohmann::json{{"source_uri", backend.uri(source)}},
            .origin = FileOrigin::Cloud,
        });
        const auto received = download_stream(source, *ingest);
        auto record = ingest->commit();
        spdlog::info("Downloaded {} into file {} ({} bytes)", backend.uri(source), record.file_id, received);
        return record;
    }

    UploadOutcome CloudBroker::copy(const CloudTarget &source, const CloudTarget &destination)
    {
        auto &from = provider(source.provider);
        auto &to = provider(destination.provider);

        if (source.provider == destination.provider && from.supports_native_copy())
        {
            spdlog::info("Server-side copy {} -> {}", from.uri(source), to.uri(destination));
            return with_retry(config_, "COPY " + to.uri(destination), [&]()
                              { return from.copy(source, destination); });
        }

        const auto info = head(source);
        const auto type = resolve_content_type(std::nullopt, info.content_type, last_segment(source.key));
        spdlog::info("Streaming copy {} -> {} ({} bytes)", from.uri(source), to.uri(destination), info.size);
        return pipe_transfer([&](ByteSink &sink)
                             { from.download(source, sink); },
                             [&](ByteSource &pipe_source)
                             { return to.upload(destination, pipe_source, info.size, type); });
    }

    PresignedUrl CloudBroker::presign(const CloudTarget &target, PresignOperation operation,
                                      std::optional<std::chrono::seconds> expiry,
                                      const std::optional<std::string> &content_type)
    {
        return provider(target.provider)
            .presign(target, operation, expiry.value_or(config_.presign_expiry), content_type, Clock::now());
    }

} // namespace chunkyard::server::cloud
