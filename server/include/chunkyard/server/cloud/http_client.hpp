#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "chunkyard/server/byte_stream.hpp"

namespace chunkyard::server::cloud
{

    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    struct HttpRequest
    {
        std::string method{"GET"};
        std::string url;
        HeaderList headers;
        // Request body when body_source is not set.
        std::string body;
        ByteSource *body_source{nullptr};
        std::uint64_t body_length{0};
        // Receives a successful response body; error bodies are always buffered in HttpResponse::body.
        ByteSink *response_sink{nullptr};
    };

    struct HttpResponse
    {
        long status{0};
        // Lowercase header names.
        std::map<std::string, std::string> headers;
        std::string body;
        std::uint64_t bytes_sent{0};
        std::uint64_t bytes_received{0};

        bool ok() const noexcept { return status >= 200 && status < 300; }
        std::optional<std::string> header(std::string_view name) const;
    };

    // Connection level failure: no HTTP status was obtained.
    class HttpError : public std::runtime_error
    {
    public:
        HttpError(std::string message, std::uint64_t bytes_sent, std::uint64_t bytes_received)
            : std::runtime_error(std::move(message)), bytes_sent_(bytes_sent), bytes_received_(bytes_received)
        {
        }

        std::uint64_t bytes_sent() const noexcept { return bytes_sent_; }
        std::uint64_t bytes_received() const noexcept { return bytes_received_; }

    private:
        std::uint64_t bytes_sent_;
        std::uint64_t bytes_received_;
    };

    class HttpTransport
    {
    public:
        virtual ~HttpTransport() = default;

        virtual HttpResponse execute(const HttpRequest &request) = 0;
    };

    class CurlHttpClient : public HttpTransport
    {
    public:
        explicit CurlHttpClient(std::chrono::seconds connect_timeout = std::chrono::seconds{30});

        HttpResponse execute(const HttpRequest &request) override;

    private:
        std::chrono::seconds connect_timeout_;
    };

} // namespace chunkyard::server::cloud
