#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace chunkyard::server::transform
{

    // Container duration in seconds, when ffprobe can tell.
    std::optional<double> probe_duration(const std::string &ffprobe, const std::filesystem::path &path);

    // {duration, bitrate, format, video_codec, resolution, fps, audio_codec, sample_rate, channels};
    // std::nullopt when ffprobe fails or is not installed.
    std::optional<nlohmann::json> probe_media(const std::string &ffprobe, const std::filesystem::path &path);

} // namespace chunkyard::server::transform
