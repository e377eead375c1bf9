#pragma once

#include "chunkyard/server/config.hpp"
#include "chunkyard/server/transform/transform_operation.hpp"

namespace chunkyard::server::transform
{

    // Params: ranges = [[start, end], ...], 1-based and inclusive, end -1 meaning the last page.
    class SplitPdfOperation : public TransformOperation
    {
    public:
        explicit SplitPdfOperation(ToolPaths tools) : tools_(std::move(tools)) {}

        TransformKind kind() const noexcept override { return TransformKind::SplitPdf; }
        void validate(const nlohmann::json &params, std::size_t input_count) const override;
        OperationResult run(const OperationContext &context) override;

    private:
        ToolPaths tools_;
    };

    class MergePdfOperation : public TransformOperation
    {
    public:
        explicit MergePdfOperation(ToolPaths tools) : tools_(std::move(tools)) {}

        TransformKind kind() const noexcept override { return TransformKind::MergePdf; }
        void validate(const nlohmann::json &params, std::size_t input_count) const override;
        OperationResult run(const OperationContext &context) override;

    private:
        ToolPaths tools_;
    };

    class CompressOperation : public TransformOperation
    {
    public:
        explicit CompressOperation(ToolPaths tools) : tools_(std::move(tools)) {}

        TransformKind kind() const noexcept override { return TransformKind::Compress; }
        void validate(const nlohmann::json &params, std::size_t input_count) const override;
        OperationResult run(const OperationContext &context) override;

    private:
        ToolPaths tools_;
    };

    class TranscodeOperation : public TransformOperation
    {
    public:
        explicit TranscodeOperation(TransformConfig config) : config_(std::move(config)) {}

        TransformKind kind() const noexcept override { return TransformKind::Transcode; }
        void validate(const nlohmann::json &params, std::size_t input_count) const override;
        OperationResult run(const OperationContext &context) override;

    private:
        TransformConfig config_;
    };

    class ExtractAudioOperation : public TransformOperation
    {
    public:
        explicit ExtractAudioOperation(TransformConfig config) : config_(std::move(config)) {}

        TransformKind kind() const noexcept override { return TransformKind::ExtractAudio; }
        void validate(const nlohmann::json &params, std::size_t input_count) const override;
        OperationResult run(const OperationContext &context) override;

    private:
        TransformConfig config_;
    };

    class ThumbnailOperation : public TransformOperation
    {
    public:
        explicit ThumbnailOperation(TransformConfig config) : config_(std::move(config)) {}

        TransformKind kind() const noexcept override { return TransformKind::Thumbnail; }
        void validate(const nlohmann::json &params, std::size_t input_count) const override;
        OperationResult run(const OperationContext &context) override;

    private:
        TransformConfig config_;
    };

    // Digest computed in-process; produces no output file.
    class ChecksumOperation : public TransformOperation
    {
    public:
        TransformKind kind() const noexcept override { return TransformKind::Checksum; }
        void validate(const nlohmann::json &params, std::size_t input_count) const override;
        OperationResult run(const OperationContext &context) override;
    };

} // namespace chunkyard::server::transform
