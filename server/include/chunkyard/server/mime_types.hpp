#pragma once

#include <string>
#include <string_view>

namespace chunkyard::server
{

    inline constexpr std::string_view kDefaultMimeType = "application/octet-stream";

    // Guess from the filename extension; unknown extensions map to application/octet-stream.
    std::string mime_type_for(std::string_view filename);

    bool is_media_type(std::string_view mime_type) noexcept;

} // namespace chunkyard::server
