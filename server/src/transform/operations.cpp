#include "chunkyard/server/transform/operations.hpp"

#include "chunkyard/server/service_error.hpp"

namespace chunkyard::server::transform
{

    OperationMap make_default_operations(const TransformConfig &config)
    {
        OperationMap operations;
        operations.emplace(TransformKind::SplitPdf, std::make_unique<SplitPdfOperation>(config.tools));
        operations.emplace(TransformKind::MergePdf, std::make_unique<MergePdfOperation>(config.tools));
        operations.emplace(TransformKind::Compress, std::make_unique<CompressOperation>(config.tools));
        operations.emplace(TransformKind::Transcode, std::make_unique<TranscodeOperation>(config));
        operations.emplace(TransformKind::ExtractAudio, std::make_unique<ExtractAudioOperation>(config));
        operations.emplace(TransformKind::Thumbnail, std::make_unique<ThumbnailOperation>(config));
        operations.emplace(TransformKind::Checksum, std::make_unique<ChecksumOperation>());
        return operations;
    }

    std::optional<std::string> string_param(const nlohmann::json &params, const char *key)
    {
        auto it = params.find(key);
        if (it == params.end() || it->is_null())
        {
            return std::nullopt;
        }
        if (!it->is_string())
        {
            throw_validation(std::string(key) + " must be a string");
        }
        return it->get<std::string>();
    }

    std::optional<std::int64_t> integer_param(const nlohmann::json &params, const char *key)
    {
        auto it = params.find(key);
        if (it == params.end() || it->is_null())
        {
            return std::nullopt;
        }
        if (!it->is_number_integer())
        {
            throw_validation(std::string(key) + " must be an integer");
        }
        return it->get<std::int64_t>();
    }

    std::optional<double> number_param(const nlohmann::json &params, const char *key)
    {
        auto it = params.find(key);
        if (it == params.end() || it->is_null())
        {
            return std::nullopt;
        }
        if (!it->is_number())
        {
            throw_validation(std::string(key) + " must be a number");
        }
        return it->get<double>();
    }

    void require_inputs(TransformKind kind, std::size_t input_count, std::size_t minimum,
                        std::optional<std::size_t> maximum)
    {
        if (input_count < minimum || (maximum && input_count > *maximum))
        {
            std::string expected = maximum && *maximum == minimum
                                       ? std::to_string(minimum)
                                       : "at least " + std::to_string(minimum);
            throw_validation(std::string(to_string(kind)) + " expects " + expected + " input file(s), got " +
                             std::to_string(input_count));
        }
    }

    std::string filename_stem(const std::string &filename)
    {
        const auto dot = filename.find_last_of('.');
        if (dot == std::string::npos || dot == 0)
        {
            return filename;
        }
        return filename.substr(0, dot);
    }

} // namespace chunkyard::server::transform
