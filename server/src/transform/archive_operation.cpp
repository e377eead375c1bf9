#include <array>
#include <set>

#include "chunkyard/server/service_error.hpp"
#include "chunkyard/server/transform/operations.hpp"
#include "chunkyard/server/transform/process_runner.hpp"

namespace chunkyard::server::transform
{

    namespace
    {

        struct ArchiveFormat
        {
            std::string_view name;
            std::string_view mime_type;
        };

        constexpr std::array<ArchiveFormat, 3> kFormats{{
            {"zip", "application/zip"},
            {"tar", "application/x-tar"},
            {"tar.gz", "application/gzip"},
        }};

        const ArchiveFormat &format_of(const nlohmann::json &params)
        {
            const auto requested = string_param(params, "format").value_or("zip");
            for (const auto &format : kFormats)
            {
                if (format.name == requested)
                {
                    return format;
                }
            }
            throw_validation("format must be one of zip, tar, tar.gz");
        }

        int level_of(const nlohmann::json &params)
        {
            const auto level = integer_param(params, "compressionLevel").value_or(6);
            if (level < 0 || level > 9)
            {
                throw_validation("compressionLevel must be between 0 and 9");
            }
            return static_cast<int>(level);
        }

        // Entry names follow the original filenames; duplicates get a " (n)" suffix before the extension.
        std::string unique_entry_name(const std::string &filename, std::set<std::string> &taken)
        {
            auto candidate = filename;
            for (int counter = 1; !taken.insert(candidate).second; ++counter)
            {
                const auto stem = filename_stem(filename);
                candidate = stem + " (" + std::to_string(counter) + ")" + filename.substr(stem.size());
            }
            return candidate;
        }

    } // namespace

    void CompressOperation::validate(const nlohmann::json &params, std::size_t input_count) const
    {
        require_inputs(kind(), input_count, 1, std::nullopt);
        format_of(params);
        level_of(params);
    }

    OperationResult CompressOperation::run(const OperationContext &context)
    {
        const auto &format = format_of(context.params);
        const auto level = level_of(context.params);

        // Links give every entry its display name without copying the inputs.
        const auto contents = context.workspace / "contents";
        std::filesystem::create_directories(contents);
        std::set<std::string> taken;
        std::vector<std::string> entries;
        for (const auto &input : context.inputs)
        {
            auto name = unique_entry_name(input.filename, taken);
            std::filesystem::create_symlink(std::filesystem::absolute(input.path), contents / name);
            entries.push_back(std::move(name));
        }

        const auto filename = "archive." + std::string(format.name);
        const auto output_directory = context.workspace / "out";
        std::filesystem::create_directories(output_directory);
        const auto target = std::filesystem::absolute(output_directory / filename);

        std::vector<std::string> command;
        if (format.name == "zip")
        {
            command = {tools_.zip, "-q", "-X", "-" + std::to_string(level), target.string()};
            // zip has no "--" terminator; the "./" prefix keeps names from being read as options.
            for (const auto &entry : entries)
            {
                command.push_back("./" + entry);
            }
        }
        else
        {
            command = {tools_.tar, "-h"};
            if (format.name == "tar.gz")
            {
                command.insert(command.end(), {"-I", "gzip -" + std::to_string(level)});
            }
            command.insert(command.end(), {"-cf", target.string(), "--"});
            command.insert(command.end(), entries.begin(), entries.end());
        }
        run_checked(command, {}, {0}, contents.string());
        context.report_progress(100.0);

        OperationResult result;
        result.outputs.push_back(ProducedFile{
            .path = target,
            .filename = filename,
            .mime_type = std::string(format.mime_type),
            .details = {{"entries", entries}},
        });
        result.result["format"] = std::string(format.name);
        result.result["compression_level"] = level;
        result.result["entries"] = entries;
        return result;
    }

} // namespace chunkyard::server::transform
