#include <algorithm>
#include <charconv>
#include <limits>

#include <spdlog/spdlog.h>

#include "chunkyard/server/service_error.hpp"
#include "chunkyard/server/transform/operations.hpp"
#include "chunkyard/server/transform/process_runner.hpp"

namespace chunkyard::server::transform
{

    namespace
    {

        // qpdf exits with 3 when it succeeded with warnings.
        constexpr int kQpdfWarnings = 3;

        struct PageRange
        {
            std::int64_t start{};
            // -1 for the last page.
            std::int64_t end{};
        };

        std::vector<PageRange> parse_ranges(const nlohmann::json &params)
        {
            auto it = params.find("ranges");
            if (it == params.end() || !it->is_array() || it->empty())
            {
                throw_validation("ranges must be a non-empty list of [start, end] pairs");
            }
            std::vector<PageRange> ranges;
            for (const auto &entry : *it)
            {
                if (!entry.is_array() || entry.size() != 2 || !entry[0].is_number_integer() ||
                    !entry[1].is_number_integer())
                {
                    throw_validation("each range must be a [start, end] pair of integers");
                }
                PageRange range{.start = entry[0].get<std::int64_t>(), .end = entry[1].get<std::int64_t>()};
                if (range.start < 1)
                {
                    throw_validation("page numbers start at 1");
                }
                if (range.end != -1 && range.end < range.start)
                {
                    throw_validation("range end " + std::to_string(range.end) + " is before start " +
                                     std::to_string(range.start));
                }
                ranges.push_back(range);
            }

            auto sorted = ranges;
            std::sort(sorted.begin(), sorted.end(), [](const PageRange &a, const PageRange &b)
                      { return a.start < b.start; });
            for (std::size_t i = 1; i < sorted.size(); ++i)
            {
                const auto previous_end =
                    sorted[i - 1].end == -1 ? std::numeric_limits<std::int64_t>::max() : sorted[i - 1].end;
                if (sorted[i].start <= previous_end)
                {
                    throw_validation("page ranges must not overlap");
                }
            }
            return ranges;
        }

        std::int64_t count_pages(const std::string &qpdf, const std::filesystem::path &input)
        {
            std::int64_t pages = -1;
            run_checked({qpdf, "--show-npages", input.string()}, [&](std::string_view line)
                        {
                std::int64_t value = 0;
                const auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), value);
                if (ec == std::errc{} && ptr == line.data() + line.size())
                {
                    pages = value;
                } },
                        {0, kQpdfWarnings});
            if (pages <= 0)
            {
                throw std::runtime_error("qpdf could not determine the page count of " + input.filename().string());
            }
            return pages;
        }

        std::filesystem::path output_dir(const OperationContext &context)
        {
            auto directory = context.workspace / "out";
            std::filesystem::create_directories(directory);
            return directory;
        }

    } // namespace

    void SplitPdfOperation::validate(const nlohmann::json &params, std::size_t input_count) const
    {
        require_inputs(kind(), input_count, 1, 1);
        parse_ranges(params);
    }

    OperationResult SplitPdfOperation::run(const OperationContext &context)
    {
        const auto &input = context.inputs.front();
        const auto ranges = parse_ranges(context.params);
        const auto pages = count_pages(tools_.qpdf, input.path);
        const auto directory = output_dir(context);
        const auto stem = filename_stem(input.filename);

        OperationResult result;
        result.result["page_count"] = pages;
        result.result["ranges"] = nlohmann::json::array();
        for (std::size_t i = 0; i < ranges.size(); ++i)
        {
            const auto start = ranges[i].start;
            const auto end = ranges[i].end == -1 ? pages : ranges[i].end;
            if (start > pages || end > pages)
            {
                throw_validation("range " + std::to_string(start) + "-" + std::to_string(end) + " exceeds " +
                                 std::to_string(pages) + " pages");
            }
            const auto label = std::to_string(start) + "-" + std::to_string(end);
            const auto filename = stem + "_pages_" + label + ".pdf";
            const auto target = directory / filename;
            run_checked({tools_.qpdf, "--empty", "--pages", input.path.string(), label, "--", target.string()}, {},
                        {0, kQpdfWarnings});

            result.outputs.push_back(ProducedFile{
                .path = target,
                .filename = filename,
                .mime_type = "application/pdf",
                .details = {{"pages", label}},
            });
            result.result["ranges"].push_back({start, end});
            context.report_progress(100.0 * static_cast<double>(i + 1) / static_cast<double>(ranges.size()));
        }
        return result;
    }

    void MergePdfOperation::validate(const nlohmann::json &params, std::size_t input_count) const
    {
        require_inputs(kind(), input_count, 2, std::nullopt);
        if (const auto name = string_param(params, "outputFilename"))
        {
            if (name->empty() || name->find_first_of("/\\") != std::string::npos || *name == "." || *name == "..")
            {
                throw_validation("outputFilename must be a plain file name");
            }
        }
    }

    OperationResult MergePdfOperation::run(const OperationContext &context)
    {
        const auto filename = string_param(context.params, "outputFilename").value_or("merged.pdf");
        const auto target = output_dir(context) / filename;

        std::vector<std::string> command{tools_.qpdf, "--empty", "--pages"};
        for (const auto &input : context.inputs)
        {
            command.push_back(input.path.string());
        }
        command.push_back("--");
        command.push_back(target.string());
        run_checked(command, {}, {0, kQpdfWarnings});
        spdlog::debug("Merged {} PDFs into {}", context.inputs.size(), filename);

        OperationResult result;
        result.outputs.push_back(ProducedFile{
            .path = target,
            .filename = filename,
            .mime_type = "application/pdf",
        });
        result.result["merged_inputs"] = context.inputs.size();
        return result;
    }

} // namespace chunkyard::server::transform
