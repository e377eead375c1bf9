#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>

#include <spdlog/spdlog.h>

#include "chunkyard/server/mime_types.hpp"
#include "chunkyard/server/service_error.hpp"
#include "chunkyard/server/transform/media_probe.hpp"
#include "chunkyard/server/transform/operations.hpp"
#include "chunkyard/server/transform/process_runner.hpp"

namespace chunkyard::server::transform
{

    namespace
    {

        constexpr std::array<std::string_view, 11> kVideoFormats{
            "mp4", "mkv", "webm", "mov", "avi", "m4v", "mpeg", "ts", "flv", "ogv", "gif"};
        constexpr std::array<std::string_view, 7> kAudioFormats{"mp3", "aac", "m4a", "wav", "flac", "ogg", "opus"};
        constexpr std::array<std::string_view, 2> kImageFormats{"jpg", "png"};

        template <std::size_t N>
        std::string choice_param(const nlohmann::json &params, const char *key,
                                 const std::array<std::string_view, N> &allowed, std::string_view fallback)
        {
            const auto value = string_param(params, key).value_or(std::string(fallback));
            if (std::find(allowed.begin(), allowed.end(), value) == allowed.end())
            {
                std::string list;
                for (const auto option : allowed)
                {
                    list += (list.empty() ? "" : ", ") + std::string(option);
                }
                throw_validation(std::string(key) + " must be one of " + list);
            }
            return value;
        }

        // Codec and preset names: letters, digits and _ . -
        std::optional<std::string> token_param(const nlohmann::json &params, const char *key)
        {
            auto value = string_param(params, key);
            if (value && (value->empty() || !std::all_of(value->begin(), value->end(), [](unsigned char c)
                                                         { return std::isalnum(c) || c == '_' || c == '.' || c == '-'; })))
            {
                throw_validation(std::string(key) + " contains unsupported characters");
            }
            return value;
        }

        bool all_digits(std::string_view text)
        {
            return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c)
                                                { return std::isdigit(c); });
        }

        // "1280x720"
        std::optional<std::string> resolution_param(const nlohmann::json &params)
        {
            auto value = string_param(params, "resolution");
            if (value)
            {
                const auto x = value->find('x');
                if (x == std::string::npos || !all_digits(std::string_view(*value).substr(0, x)) ||
                    !all_digits(std::string_view(*value).substr(x + 1)))
                {
                    throw_validation("resolution must look like 1280x720");
                }
            }
            return value;
        }

        // "800k", "2M", "128000"
        std::optional<std::string> bitrate_param(const nlohmann::json &params)
        {
            auto value = string_param(params, "bitrate");
            if (value)
            {
                std::string_view digits(*value);
                if (!digits.empty() && std::string_view("kKmM").find(digits.back()) != std::string_view::npos)
                {
                    digits.remove_suffix(1);
                }
                if (!all_digits(digits))
                {
                    throw_validation("bitrate must be a number with an optional k or M suffix");
                }
            }
            return value;
        }

        // Turns ffmpeg "-progress" key=value lines into percentages of the input duration.
        class FfmpegProgress
        {
        public:
            FfmpegProgress(std::optional<double> duration, const std::function<void(double)> &report)
                : duration_(duration), report_(report)
            {
            }

            void operator()(std::string_view line) const
            {
                if (line == "progress=end")
                {
                    report_(100.0);
                    return;
                }
                if (!duration_ || *duration_ <= 0.0)
                {
                    return;
                }
                for (const std::string_view key : {"out_time_us=", "out_time_ms="})
                {
                    if (line.starts_with(key))
                    {
                        const auto value = line.substr(key.size());
                        std::int64_t micros = 0;
                        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), micros);
                        if (ec == std::errc{} && micros >= 0)
                        {
                            report_(100.0 * (static_cast<double>(micros) / 1'000'000.0) / *duration_);
                        }
                        return;
                    }
                }
            }

        private:
            std::optional<double> duration_;
            const std::function<void(double)> &report_;
        };

        std::vector<std::string> ffmpeg_command(const TransformConfig &config, const std::filesystem::path &input)
        {
            return {config.tools.ffmpeg, "-hide_banner", "-nostdin", "-y", "-nostats", "-progress", "pipe:1",
                    "-i", input.string(), "-threads", std::to_string(config.ffmpeg_threads)};
        }

        std::filesystem::path output_path(const OperationContext &context, const std::string &filename)
        {
            const auto directory = context.workspace / "out";
            std::filesystem::create_directories(directory);
            return directory / filename;
        }

        void require_output(const std::filesystem::path &path, std::string_view what)
        {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec) || std::filesystem::file_size(path, ec) == 0)
            {
                throw std::runtime_error(std::string(what) + " produced no output");
            }
        }

        ProducedFile media_output(const std::filesystem::path &path, const std::string &filename,
                                  std::string_view fallback_type)
        {
            auto type = mime_type_for(filename);
            if (type == kDefaultMimeType)
            {
                type = std::string(fallback_type);
            }
            return ProducedFile{.path = path, .filename = filename, .mime_type = std::move(type)};
        }

    } // namespace

    void TranscodeOperation::validate(const nlohmann::json &params, std::size_t input_count) const
    {
        require_inputs(kind(), input_count, 1, 1);
        choice_param(params, "outputFormat", kVideoFormats, "mp4");
        token_param(params, "videoCodec");
        token_param(params, "audioCodec");
        token_param(params, "preset");
        resolution_param(params);
        bitrate_param(params);
    }

    OperationResult TranscodeOperation::run(const OperationContext &context)
    {
        const auto &input = context.inputs.front();
        const auto format = choice_param(context.params, "outputFormat", kVideoFormats, "mp4");
        const auto filename = filename_stem(input.filename) + "." + format;
        const auto target = output_path(context, filename);

        auto command = ffmpeg_command(config_, input.path);
        if (const auto codec = token_param(context.params, "videoCodec"))
        {
            command.insert(command.end(), {"-c:v", *codec});
        }
        if (const auto codec = token_param(context.params, "audioCodec"))
        {
            command.insert(command.end(), {"-c:a", *codec});
        }
        if (const auto resolution = resolution_param(context.params))
        {
            command.insert(command.end(), {"-s", *resolution});
        }
        if (const auto bitrate = bitrate_param(context.params))
        {
            command.insert(command.end(), {"-b:v", *bitrate});
        }
        if (const auto preset = token_param(context.params, "preset"))
        {
            command.insert(command.end(), {"-preset", *preset});
        }
        command.push_back(target.string());

        const auto duration = probe_duration(config_.tools.ffprobe, input.path);
        run_checked(command, FfmpegProgress(duration, context.report_progress));
        require_output(target, "ffmpeg transcode");
        spdlog::debug("Transcoded {} to {}", input.file_id, filename);

        OperationResult result;
        result.outputs.push_back(media_output(target, filename, "video/" + format));
        result.result["output_format"] = format;
        if (duration)
        {
            result.result["duration"] = *duration;
        }
        return result;
    }

    void ExtractAudioOperation::validate(const nlohmann::json &params, std::size_t input_count) const
    {
        require_inputs(kind(), input_count, 1, 1);
        choice_param(params, "outputFormat", kAudioFormats, "mp3");
        token_param(params, "audioCodec");
        bitrate_param(params);
    }

    OperationResult ExtractAudioOperation::run(const OperationContext &context)
    {
        const auto &input = context.inputs.front();
        const auto format = choice_param(context.params, "outputFormat", kAudioFormats, "mp3");
        const auto filename = filename_stem(input.filename) + "." + format;
        const auto target = output_path(context, filename);

        auto command = ffmpeg_command(config_, input.path);
        command.push_back("-vn");
        if (const auto codec = token_param(context.params, "audioCodec"))
        {
            command.insert(command.end(), {"-c:a", *codec});
        }
        if (const auto bitrate = bitrate_param(context.params))
        {
            command.insert(command.end(), {"-b:a", *bitrate});
        }
        command.push_back(target.string());

        const auto duration = probe_duration(config_.tools.ffprobe, input.path);
        run_checked(command, FfmpegProgress(duration, context.report_progress));
        require_output(target, "ffmpeg audio extraction");

        OperationResult result;
        result.outputs.push_back(media_output(target, filename, "audio/" + format));
        result.result["output_format"] = format;
        return result;
    }

    void ThumbnailOperation::validate(const nlohmann::json &params, std::size_t input_count) const
    {
        require_inputs(kind(), input_count, 1, 1);
        if (number_param(params, "timestamp").value_or(1.0) < 0.0)
        {
            throw_validation("timestamp must not be negative");
        }
        if (const auto width = integer_param(params, "width"); width && *width <= 0)
        {
            throw_validation("width must be positive");
        }
        choice_param(params, "format", kImageFormats, "jpg");
    }

    OperationResult ThumbnailOperation::run(const OperationContext &context)
    {
        const auto &input = context.inputs.front();
        const auto timestamp = number_param(context.params, "timestamp").value_or(1.0);
        const auto width = integer_param(context.params, "width");
        const auto format = choice_param(context.params, "format", kImageFormats, "jpg");
        const auto filename = filename_stem(input.filename) + "_thumb." + format;
        const auto target = output_path(context, filename);

        std::vector<std::string> command{config_.tools.ffmpeg, "-hide_banner", "-nostdin", "-y",
                                         "-ss", std::to_string(timestamp), "-i", input.path.string(),
                                         "-frames:v", "1"};
        if (width)
        {
            command.insert(command.end(), {"-vf", "scale=" + std::to_string(*width) + ":-2"});
        }
        command.push_back(target.string());

        run_checked(command);
        require_output(target, "ffmpeg thumbnail at " + std::to_string(timestamp) + "s");
        context.report_progress(100.0);

        OperationResult result;
        result.outputs.push_back(media_output(target, filename, format == "png" ? "image/png" : "image/jpeg"));
        result.result["timestamp"] = timestamp;
        return result;
    }

} // namespace chunkyard::server::transform
