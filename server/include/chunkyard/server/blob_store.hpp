#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include "chunkyard/server/byte_stream.hpp"
#include "chunkyard/time_format.hpp"

namespace chunkyard::server
{

    struct BlobStat
    {
        std::uint64_t size{};
        TimePoint modified{};
    };

    // Streaming writer. Bytes become visible under the key only after commit();
    // a writer destroyed without commit leaves no trace.
    class BlobWriter : public ByteSink
    {
    public:
        virtual void commit() = 0;
        virtual std::uint64_t bytes_written() const noexcept = 0;
    };

    // Keys are relative, slash separated paths ("files/<id>/report.pdf").
    class BlobStore
    {
    public:
        virtual ~BlobStore() = default;

        virtual void write(const std::string &key, std::span<const std::byte> data);
        virtual std::unique_ptr<BlobWriter> open_writer(const std::string &key) = 0;

        // Reads up to buffer.size() bytes at offset; returns 0 at end of blob.
        virtual std::size_t read(const std::string &key, std::uint64_t offset, std::span<std::byte> buffer) const = 0;

        // Lazy sequence over [offset, offset + length).
        virtual std::unique_ptr<ByteSource> open_range(const std::string &key, std::uint64_t offset,
                                                       std::uint64_t length) const;

        virtual bool remove(const std::string &key) = 0;
        virtual std::size_t remove_prefix(const std::string &prefix) = 0;
        virtual std::optional<BlobStat> stat(const std::string &key) const = 0;

        // Filesystem location when the backend keeps blobs as plain files.
        virtual std::optional<std::filesystem::path> local_path(const std::string &key) const;
    };

    class LocalBlobStore : public BlobStore
    {
    public:
        explicit LocalBlobStore(std::filesystem::path root);

        std::unique_ptr<BlobWriter> open_writer(const std::string &key) override;
        std::size_t read(const std::string &key, std::uint64_t offset, std::span<std::byte> buffer) const override;
        std::unique_ptr<ByteSource> open_range(const std::string &key, std::uint64_t offset,
                                               std::uint64_t length) const override;
        bool remove(const std::string &key) override;
        std::size_t remove_prefix(const std::string &prefix) override;
        std::optional<BlobStat> stat(const std::string &key) const override;
        std::optional<std::filesystem::path> local_path(const std::string &key) const override;

        const std::filesystem::path &root() const noexcept { return root_; }

    private:
        std::filesystem::path resolve(const std::string &key) const;

        std::filesystem::path root_;
    };

} // namespace chunkyard::server
