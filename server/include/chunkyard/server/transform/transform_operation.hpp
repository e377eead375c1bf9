#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkyard/server/config.hpp"
#include "chunkyard/server/records.hpp"

namespace chunkyard::server::transform
{

    struct OperationInput
    {
        std::string file_id;
        std::string filename;
        std::string mime_type;
        std::uint64_t size{};
        // Readable local copy, either the blob itself or a staged copy.
        std::filesystem::path path;
    };

    struct ProducedFile
    {
        std::filesystem::path path;
        std::string filename;
        std::string mime_type;
        // Merged into this output's entry of the job result.
        nlohmann::json details{nlohmann::json::object()};
    };

    struct OperationResult
    {
        std::vector<ProducedFile> outputs;
        nlohmann::json result{nlohmann::json::object()};
    };

    struct OperationContext
    {
        std::vector<OperationInput> inputs;
        std::filesystem::path workspace;
        nlohmann::json params{nlohmann::json::object()};
        // Percent complete; the engine clamps and keeps it monotonic.
        std::function<void(double)> report_progress;
    };

    class TransformOperation
    {
    public:
        virtual ~TransformOperation() = default;

        virtual TransformKind kind() const noexcept = 0;

        // Throws ServiceError(ValidationError) for malformed params or a wrong number of inputs.
        virtual void validate(const nlohmann::json &params, std::size_t input_count) const = 0;

        // Runs on an engine worker thread; any exception fails the job.
        virtual OperationResult run(const OperationContext &context) = 0;
    };

    using OperationMap = std::map<TransformKind, std::unique_ptr<TransformOperation>>;

    // One operation per TransformKind, backed by qpdf, zip/tar, ffmpeg and libsodium.
    OperationMap make_default_operations(const TransformConfig &config);

    // Param helpers shared by the operations; all throw ValidationError on a type mismatch.
    std::optional<std::string> string_param(const nlohmann::json &params, const char *key);
    std::optional<std::int64_t> integer_param(const nlohmann::json &params, const char *key);
    std::optional<double> number_param(const nlohmann::json &params, const char *key);

    void require_inputs(TransformKind kind, std::size_t input_count, std::size_t minimum,
                        std::optional<std::size_t> maximum);

    // "report.final.pdf" -> "report.final"
    std::string filename_stem(const std::string &filename);

} // namespace chunkyard::server::transform
