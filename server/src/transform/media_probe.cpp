#include "chunkyard/server/transform/media_probe.hpp"

#include <charconv>

#include <spdlog/spdlog.h>

#include "chunkyard/server/transform/process_runner.hpp"

namespace chunkyard::server::transform
{

    namespace
    {

        std::optional<nlohmann::json> run_ffprobe(const std::string &ffprobe, const std::filesystem::path &path)
        {
            std::string output;
            const auto result = run_process(
                {ffprobe, "-v", "error", "-show_format", "-show_streams", "-of", "json", path.string()},
                [&](std::string_view line)
                {
                    output += line;
                    output += '\n';
                });
            if (result.exit_code != 0)
            {
                spdlog::debug("ffprobe exited with {} for {}", result.exit_code, path.filename().string());
                return std::nullopt;
            }
            auto parsed = nlohmann::json::parse(output, nullptr, false);
            if (parsed.is_discarded() || !parsed.is_object())
            {
                return std::nullopt;
            }
            return parsed;
        }

        std::optional<double> to_number(const nlohmann::json &value)
        {
            if (value.is_number())
            {
                return value.get<double>();
            }
            if (value.is_string())
            {
                const auto text = value.get<std::string>();
                double parsed = 0.0;
                const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
                if (ec == std::errc{} && ptr == text.data() + text.size())
                {
                    return parsed;
                }
            }
            return std::nullopt;
        }

        // "30000/1001" -> 29.97
        std::optional<double> frame_rate(const nlohmann::json &value)
        {
            if (!value.is_string())
            {
                return std::nullopt;
            }
            const auto text = value.get<std::string>();
            const auto slash = text.find('/');
            if (slash == std::string::npos)
            {
                return to_number(value);
            }
            const auto numerator = to_number(text.substr(0, slash));
            const auto denominator = to_number(text.substr(slash + 1));
            if (!numerator || !denominator || *denominator == 0.0)
            {
                return std::nullopt;
            }
            return *numerator / *denominator;
        }

        const nlohmann::json *find_stream(const nlohmann::json &probe, std::string_view codec_type)
        {
            const auto streams = probe.find("streams");
            if (streams == probe.end() || !streams->is_array())
            {
                return nullptr;
            }
            for (const auto &stream : *streams)
            {
                if (stream.value("codec_type", std::string()) == codec_type)
                {
                    return &stream;
                }
            }
            return nullptr;
        }

    } // namespace

    std::optional<double> probe_duration(const std::string &ffprobe, const std::filesystem::path &path)
    {
        const auto probe = run_ffprobe(ffprobe, path);
        if (!probe)
        {
            return std::nullopt;
        }
        const auto format = probe->find("format");
        if (format == probe->end() || !format->contains("duration"))
        {
            return std::nullopt;
        }
        return to_number((*format)["duration"]);
    }

    std::optional<nlohmann::json> probe_media(const std::string &ffprobe, const std::filesystem::path &path)
    {
        const auto probe = run_ffprobe(ffprobe, path);
        if (!probe)
        {
            return std::nullopt;
        }

        nlohmann::json info = nlohmann::json::object();
        if (const auto format = probe->find("format"); format != probe->end() && format->is_object())
        {
            if (const auto duration = to_number(format->value("duration", nlohmann::json())))
            {
                info["duration"] = *duration;
            }
            if (const auto bitrate = to_number(format->value("bit_rate", nlohmann::json())))
            {
                info["bitrate"] = static_cast<std::int64_t>(*bitrate);
            }
            if (format->contains("format_name"))
            {
                info["format"] = (*format)["format_name"];
            }
        }
        if (const auto *video = find_stream(*probe, "video"))
        {
            info["video_codec"] = video->value("codec_name", std::string());
            info["resolution"] =
                std::to_string(video->value("width", 0)) + "x" + std::to_string(video->value("height", 0));
            if (const auto fps = frame_rate(video->value("r_frame_rate", nlohmann::json())))
            {
                info["fps"] = *fps;
            }
        }
        if (const auto *audio = find_stream(*probe, "audio"))
        {
            info["audio_codec"] = audio->value("codec_name", std::string());
            if (const auto rate = to_number(audio->value("sample_rate", nlohmann::json())))
            {
                info["sample_rate"] = static_cast<std::int64_t>(*rate);
            }
            info["channels"] = audio->value("channels", 0);
        }
        return info;
    }

} // namespace chunkyard::server::transform
