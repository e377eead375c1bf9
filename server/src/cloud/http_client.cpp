#include "chunkyard/server/cloud/http_client.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <exception>
#include <memory>
#include <mutex>
#include <span>

#include <curl/curl.h>

namespace chunkyard::server::cloud
{

    namespace
    {

        constexpr std::size_t kMaxErrorBody = 64 * 1024;

        void ensure_curl_initialized()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           { curl_global_init(CURL_GLOBAL_ALL); });
        }

        std::string lowercase(std::string_view value)
        {
            std::string result(value);
            std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        std::string trim(std::string_view value)
        {
            const auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos)
            {
                return {};
            }
            const auto last = value.find_last_not_of(" \t\r\n");
            return std::string(value.substr(first, last - first + 1));
        }

        struct TransferContext
        {
            CURL *curl{nullptr};
            const HttpRequest *request{nullptr};
            HttpResponse *response{nullptr};
            std::size_t body_offset{0};
            std::exception_ptr failure;
        };

        std::size_t read_callback(char *buffer, std::size_t size, std::size_t count, void *user_data)
        {
            auto *context = static_cast<TransferContext *>(user_data);
            const auto capacity = size * count;
            try
            {
                std::size_t produced = 0;
                if (context->request->body_source)
                {
                    produced = context->request->body_source->read(
                        std::span<std::byte>(reinterpret_cast<std::byte *>(buffer), capacity));
                }
                else
                {
                    const auto &body = context->request->body;
                    produced = std::min(capacity, body.size() - context->body_offset);
                    std::memcpy(buffer, body.data() + context->body_offset, produced);
                    context->body_offset += produced;
                }
                context->response->bytes_sent += produced;
                return produced;
            }
            catch (...)
            {
                context->failure = std::current_exception();
                return CURL_READFUNC_ABORT;
            }
        }

        std::size_t write_callback(char *data, std::size_t size, std::size_t count, void *user_data)
        {
            auto *context = static_cast<TransferContext *>(user_data);
            const auto length = size * count;
            try
            {
                long status = 0;
                curl_easy_getinfo(context->curl, CURLINFO_RESPONSE_CODE, &status);
                context->response->bytes_received += length;
                if (context->request->response_sink && status >= 200 && status < 300)
                {
                    context->request->response_sink->write(
                        std::span<const std::byte>(reinterpret_cast<const std::byte *>(data), length));
                }
                else if (context->response->body.size() < kMaxErrorBody || context->request->response_sink == nullptr)
                {
                    context->response->body.append(data, length);
                }
                return length;
            }
            catch (...)
            {
                context->failure = std::current_exception();
                return 0;
            }
        }

        std::size_t header_callback(char *data, std::size_t size, std::size_t count, void *user_data)
        {
            auto *response = static_cast<HttpResponse *>(user_data);
            const auto length = size * count;
            const std::string_view line(data, length);
            if (line.starts_with("HTTP/"))
            {
                // A new status line (redirect or 100-continue) starts a fresh header block.
                response->headers.clear();
                return length;
            }
            const auto colon = line.find(':');
            if (colon != std::string_view::npos)
            {
                response->headers[lowercase(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
            }
            return length;
        }

        struct CurlDeleter
        {
            void operator()(CURL *curl) const noexcept { curl_easy_cleanup(curl); }
        };

        struct HeaderListDeleter
        {
            void operator()(curl_slist *list) const noexcept { curl_slist_free_all(list); }
        };

    } // namespace

    std::optional<std::string> HttpResponse::header(std::string_view name) const
    {
        if (auto it = headers.find(lowercase(name)); it != headers.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    CurlHttpClient::CurlHttpClient(std::chrono::seconds connect_timeout) : connect_timeout_(connect_timeout)
    {
        ensure_curl_initialized();
    }

    HttpResponse CurlHttpClient::execute(const HttpRequest &request)
    {
        std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
        if (!curl)
        {
            throw HttpError("curl_easy_init failed", 0, 0);
        }

        HttpResponse response;
        TransferContext context{
            .curl = curl.get(),
            .request = &request,
            .response = &response,
        };

        curl_slist *raw_headers = nullptr;
        for (const auto &[name, value] : request.headers)
        {
            const auto line = value.empty() ? name + ";" : name + ": " + value;
            raw_headers = curl_slist_append(raw_headers, line.c_str());
        }
        // Let large bodies start without waiting for a 100-continue round trip.
        raw_headers = curl_slist_append(raw_headers, "Expect:");
        std::unique_ptr<curl_slist, HeaderListDeleter> header_list(raw_headers);

        CURL *handle = curl.get();
        curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get());
        curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, static_cast<long>(connect_timeout_.count()));
        curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 5L);
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, &context);
        curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response);

        const bool has_body = request.body_source != nullptr || !request.body.empty();
        const auto body_length = request.body_source ? request.body_length : request.body.size();
        if (request.method == "GET")
        {
            curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
        }
        else if (request.method == "HEAD")
        {
            curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
        }
        else if (request.method == "PUT" || request.method == "POST")
        {
            curl_easy_setopt(handle, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(handle, CURLOPT_READFUNCTION, read_callback);
            curl_easy_setopt(handle, CURLOPT_READDATA, &context);
            curl_easy_setopt(handle, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(has_body ? body_length : 0));
            if (request.method == "POST")
            {
                curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, "POST");
            }
        }
        else
        {
            curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }

        const auto code = curl_easy_perform(handle);
        if (context.failure)
        {
            std::rethrow_exception(context.failure);
        }
        if (code != CURLE_OK)
        {
            throw HttpError(std::string("HTTP ") + request.method + " failed: " + curl_easy_strerror(code),
                            response.bytes_sent, response.bytes_received);
        }
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
        return response;
    }

} // namespace chunkyard::server::cloud
