#include "chunkyard/server/mime_types.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace chunkyard::server
{

    namespace
    {
        struct MimeMapping
        {
            std::string_view extension;
            std::string_view mime_type;
        };

        constexpr std::array<MimeMapping, 36> kMimeMappings{{
            {"pdf", "application/pdf"},
            {"zip", "application/zip"},
            {"tar", "application/x-tar"},
            {"gz", "application/gzip"},
            {"json", "application/json"},
            {"xml", "application/xml"},
            {"txt", "text/plain"},
            {"csv", "text/csv"},
            {"html", "text/html"},
            {"htm", "text/html"},
            {"md", "text/markdown"},
            {"jpg", "image/jpeg"},
            {"jpeg", "image/jpeg"},
            {"png", "image/png"},
            {"gif", "image/gif"},
            {"webp", "image/webp"},
            {"svg", "image/svg+xml"},
            {"mp4", "video/mp4"},
            {"m4v", "video/x-m4v"},
            {"mkv", "video/x-matroska"},
            {"webm", "video/webm"},
            {"mov", "video/quicktime"},
            {"avi", "video/x-msvideo"},
            {"mpeg", "video/mpeg"},
            {"ts", "video/mp2t"},
            {"flv", "video/x-flv"},
            {"ogv", "video/ogg"},
            {"mp3", "audio/mpeg"},
            {"aac", "audio/aac"},
            {"m4a", "audio/mp4"},
            {"wav", "audio/wav"},
            {"flac", "audio/flac"},
            {"ogg", "audio/ogg"},
            {"opus", "audio/opus"},
            {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
            {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        }};
    } // namespace

    std::string mime_type_for(std::string_view filename)
    {
        const auto dot = filename.rfind('.');
        if (dot == std::string_view::npos || dot + 1 == filename.size())
        {
            return std::string(kDefaultMimeType);
        }
        std::string extension(filename.substr(dot + 1));
        std::transform(extension.begin(), extension.end(), extension.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        for (const auto &mapping : kMimeMappings)
        {
            if (mapping.extension == extension)
            {
                return std::string(mapping.mime_type);
            }
        }
        return std::string(kDefaultMimeType);
    }

    bool is_media_type(std::string_view mime_type) noexcept
    {
        return mime_type.starts_with("video/") || mime_type.starts_with("audio/");
    }

} // namespace chunkyard::server
