#include "chunkyard/server/cloud/signing.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <map>

#include "chunkyard/crypto.hpp"
#include "chunkyard/encoding/base64.hpp"
#include "chunkyard/server/service_error.hpp"

namespace chunkyard::server::cloud
{

    namespace
    {

        std::string lowercase(std::string_view value)
        {
            std::string result(value);
            std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        std::string trim(std::string_view value)
        {
            const auto first = value.find_first_not_of(" \t");
            if (first == std::string_view::npos)
            {
                return {};
            }
            const auto last = value.find_last_not_of(" \t");
            return std::string(value.substr(first, last - first + 1));
        }

        std::string hex_of(const std::string &raw)
        {
            return crypto::to_hex(
                std::span<const unsigned char>(reinterpret_cast<const unsigned char *>(raw.data()), raw.size()));
        }

        std::string canonical_query(const QueryList &query)
        {
            std::vector<std::pair<std::string, std::string>> encoded;
            encoded.reserve(query.size());
            for (const auto &[key, value] : query)
            {
                encoded.emplace_back(uri_encode(key), uri_encode(value));
            }
            std::sort(encoded.begin(), encoded.end());
            std::string result;
            for (const auto &[key, value] : encoded)
            {
                if (!result.empty())
                {
                    result += '&';
                }
                result += key + "=" + value;
            }
            return result;
        }

        struct CanonicalHeaders
        {
            std::string block;
            std::string signed_names;
        };

        CanonicalHeaders canonicalize_headers(const HeaderList &headers)
        {
            std::map<std::string, std::string> sorted;
            for (const auto &[name, value] : headers)
            {
                auto &slot = sorted[lowercase(name)];
                slot = slot.empty() ? trim(value) : slot + "," + trim(value);
            }
            CanonicalHeaders result;
            for (const auto &[name, value] : sorted)
            {
                result.block += name + ":" + value + "\n";
                if (!result.signed_names.empty())
                {
                    result.signed_names += ';';
                }
                result.signed_names += name;
            }
            return result;
        }

        std::string v4_signature(const V4Scheme &scheme, const V4Credentials &credentials, std::string_view date,
                                 const std::string &string_to_sign)
        {
            auto key = crypto::hmac_sha256(std::string(scheme.key_prefix) + credentials.secret_access_key, date);
            key = crypto::hmac_sha256(key, credentials.region);
            key = crypto::hmac_sha256(key, scheme.service);
            key = crypto::hmac_sha256(key, scheme.terminator);
            return hex_of(crypto::hmac_sha256(key, string_to_sign));
        }

        std::string v4_scope(const V4Scheme &scheme, const V4Credentials &credentials, std::string_view date)
        {
            return std::string(date) + "/" + credentials.region + "/" + std::string(scheme.service) + "/" +
                   std::string(scheme.terminator);
        }

        std::string v4_string_to_sign(const V4Scheme &scheme, std::string_view timestamp, const std::string &scope,
                                      const std::string &canonical_request)
        {
            return std::string(scheme.algorithm) + "\n" + std::string(timestamp) + "\n" + scope + "\n" +
                   crypto::sha256_hex(canonical_request);
        }

        std::string find_header(const HeaderList &headers, std::string_view name)
        {
            const auto wanted = lowercase(name);
            for (const auto &[key, value] : headers)
            {
                if (lowercase(key) == wanted)
                {
                    return value;
                }
            }
            return {};
        }

        std::string azure_signature(const AzureAccount &account, const std::string &string_to_sign)
        {
            const auto key = encoding::decode_base64_string(account.key);
            if (!key)
            {
                throw_validation("Azure account key is not valid base64");
            }
            return encoding::encode_base64(crypto::hmac_sha256(*key, string_to_sign));
        }

    } // namespace

    std::string uri_encode(std::string_view value, bool encode_slash)
    {
        static constexpr char kHex[] = "0123456789ABCDEF";
        std::string result;
        result.reserve(value.size());
        for (const unsigned char c : value)
        {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (c == '/' && !encode_slash))
            {
                result += static_cast<char>(c);
            }
            else
            {
                result += '%';
                result += kHex[c >> 4];
                result += kHex[c & 0x0F];
            }
        }
        return result;
    }

    std::string encode_path(std::string_view path)
    {
        return uri_encode(path, false);
    }

    std::string build_query(const QueryList &query)
    {
        std::string result;
        for (const auto &[key, value] : query)
        {
            if (!result.empty())
            {
                result += '&';
            }
            result += uri_encode(key);
            if (!value.empty())
            {
                result += "=" + uri_encode(value);
            }
        }
        return result;
    }

    void sign_v4(const V4Scheme &scheme, const V4Credentials &credentials, V4Request &request, TimePoint now)
    {
        const auto timestamp = format_utc(now, "%Y%m%dT%H%M%SZ");
        const auto date = timestamp.substr(0, 8);
        const std::string prefix(scheme.header_prefix);

        request.headers.emplace_back("host", request.host);
        request.headers.emplace_back(prefix + "-date", timestamp);
        request.headers.emplace_back(prefix + "-content-sha256", request.payload_hash);
        if (!credentials.session_token.empty())
        {
            request.headers.emplace_back(prefix + "-security-token", credentials.session_token);
        }

        const auto canonical = canonicalize_headers(request.headers);
        const auto canonical_request = request.method + "\n" + request.path + "\n" + canonical_query(request.query) +
                                       "\n" + canonical.block + "\n" + canonical.signed_names + "\n" +
                                       request.payload_hash;
        const auto scope = v4_scope(scheme, credentials, date);
        const auto signature =
            v4_signature(scheme, credentials, date, v4_string_to_sign(scheme, timestamp, scope, canonical_request));

        request.headers.emplace_back("Authorization", std::string(scheme.algorithm) +
                                                          " Credential=" + credentials.access_key_id + "/" + scope +
                                                          ", SignedHeaders=" + canonical.signed_names +
                                                          ", Signature=" + signature);
    }

    std::string presign_v4(const V4Scheme &scheme, const V4Credentials &credentials, std::string_view method,
                           std::string_view base_url, std::string_view host, std::string_view path,
                           std::chrono::seconds expires, const HeaderList &signed_headers, TimePoint now)
    {
        const auto timestamp = format_utc(now, "%Y%m%dT%H%M%SZ");
        const auto date = timestamp.substr(0, 8);
        const std::string prefix(scheme.query_prefix);

        HeaderList headers{{"host", std::string(host)}};
        headers.insert(headers.end(), signed_headers.begin(), signed_headers.end());
        const auto canonical = canonicalize_headers(headers);
        const auto scope = v4_scope(scheme, credentials, date);

        QueryList query{
            {prefix + "-Algorithm", std::string(scheme.algorithm)},
            {prefix + "-Credential", credentials.access_key_id + "/" + scope},
            {prefix + "-Date", timestamp},
            {prefix + "-Expires", std::to_string(expires.count())},
            {prefix + "-SignedHeaders", canonical.signed_names},
        };
        if (!credentials.session_token.empty())
        {
            query.emplace_back(prefix + "-Security-Token", credentials.session_token);
        }

        const auto query_string = canonical_query(query);
        const auto canonical_request = std::string(method) + "\n" + std::string(path) + "\n" + query_string + "\n" +
                                       canonical.block + "\n" + canonical.signed_names + "\n" +
                                       std::string(kUnsignedPayload);
        const auto signature =
            v4_signature(scheme, credentials, date, v4_string_to_sign(scheme, timestamp, scope, canonical_request));

        return std::string(base_url) + std::string(path) + "?" + query_string + "&" + prefix +
               "-Signature=" + signature;
    }

    std::optional<AzureAccount> parse_connection_string(std::string_view connection_string)
    {
        std::map<std::string, std::string> fields;
        std::size_t position = 0;
        while (position <= connection_string.size())
        {
            auto end = connection_string.find(';', position);
            if (end == std::string_view::npos)
            {
                end = connection_string.size();
            }
            const auto part = connection_string.substr(position, end - position);
            const auto equals = part.find('=');
            if (equals != std::string_view::npos)
            {
                fields[trim(part.substr(0, equals))] = trim(part.substr(equals + 1));
            }
            position = end + 1;
        }

        const auto name = fields.find("AccountName");
        const auto key = fields.find("AccountKey");
        if (name == fields.end() || key == fields.end() || name->second.empty() || key->second.empty())
        {
            return std::nullopt;
        }

        AzureAccount account{.name = name->second, .key = key->second};
        if (auto endpoint = fields.find("BlobEndpoint"); endpoint != fields.end() && !endpoint->second.empty())
        {
            account.blob_endpoint = endpoint->second;
            while (account.blob_endpoint.ends_with('/'))
            {
                account.blob_endpoint.pop_back();
            }
        }
        else
        {
            const auto protocol = fields.contains("DefaultEndpointsProtocol") ? fields["DefaultEndpointsProtocol"]
                                                                             : std::string("https");
            const auto suffix =
                fields.contains("EndpointSuffix") ? fields["EndpointSuffix"] : std::string("core.windows.net");
            account.blob_endpoint = protocol + "://" + account.name + ".blob." + suffix;
        }
        return account;
    }

    std::string azure_default_endpoint(std::string_view account_name)
    {
        return "https://" + std::string(account_name) + ".blob.core.windows.net";
    }

    void sign_shared_key(const AzureAccount &account, SharedKeyRequest &request, TimePoint now)
    {
        request.headers.emplace_back("x-ms-date", format_http_date(now));
        request.headers.emplace_back("x-ms-version", std::string(kAzureApiVersion));

        static constexpr std::array<std::string_view, 11> kStandardHeaders{
            "Content-Encoding", "Content-Language", "Content-Length", "Content-MD5",
            "Content-Type", "Date", "If-Modified-Since", "If-Match",
            "If-None-Match", "If-Unmodified-Since", "Range"};

        std::string string_to_sign = request.method + "\n";
        for (const auto name : kStandardHeaders)
        {
            auto value = find_header(request.headers, name);
            if (name == "Content-Length" && value == "0")
            {
                value.clear();
            }
            string_to_sign += value + "\n";
        }

        std::map<std::string, std::string> ms_headers;
        for (const auto &[name, value] : request.headers)
        {
            auto lowered = lowercase(name);
            if (lowered.starts_with("x-ms-"))
            {
                ms_headers[std::move(lowered)] = trim(value);
            }
        }
        for (const auto &[name, value] : ms_headers)
        {
            string_to_sign += name + ":" + value + "\n";
        }

        string_to_sign += "/" + account.name + request.path;
        std::map<std::string, std::string> parameters;
        for (const auto &[key, value] : request.query)
        {
            auto &slot = parameters[lowercase(key)];
            slot = slot.empty() ? value : slot + "," + value;
        }
        for (const auto &[key, value] : parameters)
        {
            string_to_sign += "\n" + key + ":" + value;
        }

        request.headers.emplace_back("Authorization",
                                     "SharedKey " + account.name + ":" + azure_signature(account, string_to_sign));
    }

    std::string blob_service_sas(const AzureAccount &account, std::string_view container, std::string_view blob,
                                 std::string_view permissions, TimePoint start, TimePoint expiry)
    {
        const auto signed_start = format_utc(start, "%Y-%m-%dT%H:%M:%SZ");
        const auto signed_expiry = format_utc(expiry, "%Y-%m-%dT%H:%M:%SZ");
        const std::string version(kAzureApiVersion);

        // Field order of the 2020-12-06+ service SAS; unused fields stay empty.
        const auto string_to_sign = std::string(permissions) + "\n" + signed_start + "\n" + signed_expiry + "\n" +
                                    "/blob/" + account.name + "/" + std::string(container) + "/" +
                                    std::string(blob) + "\n" +
                                    "\n" // signed identifier
                                    "\n" // signed ip
                                    "\n" // signed protocol
                                    + version + "\n" + "b\n" +
                                    "\n" // snapshot time
                                    "\n" // encryption scope
                                    "\n\n\n\n";

        return build_query({
            {"sv", version},
            {"sr", "b"},
            {"sp", std::string(permissions)},
            {"st", signed_start},
            {"se", signed_expiry},
            {"sig", azure_signature(account, string_to_sign)},
        });
    }

    std::optional<std::string> xml_element(std::string_view xml, std::string_view tag)
    {
        const auto open = "<" + std::string(tag) + ">";
        const auto close = "</" + std::string(tag) + ">";
        const auto begin = xml.find(open);
        if (begin == std::string_view::npos)
        {
            return std::nullopt;
        }
        const auto content = begin + open.size();
        const auto end = xml.find(close, content);
        if (end == std::string_view::npos)
        {
            return std::nullopt;
        }
        return std::string(xml.substr(content, end - content));
    }

    std::string xml_escape(std::string_view text)
    {
        std::string result;
        result.reserve(text.size());
        for (const char c : text)
        {
            switch (c)
            {
            case '&':
                result += "&amp;";
                break;
            case '<':
                result += "&lt;";
                break;
            case '>':
                result += "&gt;";
                break;
            case '"':
                result += "&quot;";
                break;
            case '\'':
                result += "&apos;";
                break;
            default:
                result += c;
            }
        }
        return result;
    }

    std::string format_http_date(TimePoint time)
    {
        return format_utc(time, "%a, %d %b %Y %H:%M:%S GMT");
    }

} // namespace chunkyard::server::cloud
