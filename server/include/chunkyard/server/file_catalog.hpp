#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkyard/crypto.hpp"
#include "chunkyard/server/blob_store.hpp"
#include "chunkyard/server/config.hpp"
#include "chunkyard/server/records.hpp"
#include "chunkyard/server/registry.hpp"

namespace chunkyard::server
{

    struct NewFile
    {
        std::string filename;
        std::string mime_type;
        nlohmann::json metadata{nlohmann::json::object()};
        FileOrigin origin{FileOrigin::Upload};
    };

    class FileCatalog;

    // Streams bytes into a fresh blob while hashing them; commit() registers the File.
    class FileIngest : public ByteSink
    {
    public:
        FileIngest(FileCatalog &catalog, FileRecord draft, std::unique_ptr<BlobWriter> writer);

        void write(std::span<const std::byte> data) override;

        std::uint64_t bytes_written() const noexcept;
        const std::string &file_id() const noexcept { return draft_.file_id; }

        FileRecord commit();

    private:
        FileCatalog &catalog_;
        FileRecord draft_;
        std::unique_ptr<BlobWriter> writer_;
        crypto::Digest digest_;
    };

    class FileCatalog
    {
    public:
        FileCatalog(BlobStore &store, Registry<FileRecord> &registry, FileConfig config);

        std::unique_ptr<FileIngest> begin_file(NewFile file);

        // Copies a file produced outside the store (e.g. by an external tool) into a new File.
        FileRecord ingest_path(const std::filesystem::path &source, NewFile file);

        std::optional<FileRecord> find(const std::string &file_id) const;
        FileRecord require(const std::string &file_id) const;

        // Removes record and blob; false when the file was unknown.
        bool remove(const std::string &file_id);

        FileRecord extend_expiry(const std::string &file_id, std::chrono::seconds extension);

        std::vector<FileRecord> list() const;
        std::size_t count() const;

        std::unique_ptr<ByteSource> open(const FileRecord &file, std::uint64_t offset, std::uint64_t length) const;
        std::string compute_checksum(const std::string &file_id, crypto::DigestAlgorithm algorithm) const;

        BlobStore &store() noexcept { return store_; }
        const BlobStore &store() const noexcept { return store_; }

    private:
        friend class FileIngest;

        void register_file(const FileRecord &record);

        BlobStore &store_;
        Registry<FileRecord> &registry_;
        FileConfig config_;
    };

    std::string file_prefix(const std::string &file_id);

} // namespace chunkyard::server
