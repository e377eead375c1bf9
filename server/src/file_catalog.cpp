#include "chunkyard/server/file_catalog.hpp"

#include <fstream>
#include <vector>

#include <spdlog/spdlog.h>

#include "chunkyard/server/mime_types.hpp"
#include "chunkyard/server/service_error.hpp"

namespace chunkyard::server
{

    namespace
    {
        constexpr std::size_t kCopyBufferSize = 256 * 1024;

        std::string storage_name(const std::string &filename)
        {
            std::string name = filename;
            for (auto &ch : name)
            {
                if (ch == '/' || ch == '\\')
                {
                    ch = '_';
                }
            }
            if (name.empty() || name == "." || name == "..")
            {
                return "file";
            }
            return name;
        }
    } // namespace

    std::string file_prefix(const std::string &file_id)
    {
        return "files/" + file_id;
    }

    FileIngest::FileIngest(FileCatalog &catalog, FileRecord draft, std::unique_ptr<BlobWriter> writer)
        : catalog_(catalog), draft_(std::move(draft)), writer_(std::move(writer)), digest_(crypto::DigestAlgorithm::Sha256)
    {
    }

    void FileIngest::write(std::span<const std::byte> data)
    {
        writer_->write(data);
        digest_.update(data);
    }

    std::uint64_t FileIngest::bytes_written() const noexcept
    {
        return writer_->bytes_written();
    }

    FileRecord FileIngest::commit()
    {
        draft_.size = writer_->bytes_written();
        draft_.checksum = digest_.finish_hex();
        writer_->commit();
        draft_.created_at = Clock::now();
        draft_.expires_at = draft_.created_at + catalog_.config_.retention;
        try
        {
            catalog_.register_file(draft_);
        }
        catch (const std::exception &)
        {
            catalog_.store_.remove_prefix(file_prefix(draft_.file_id));
            throw;
        }
        return draft_;
    }

    FileCatalog::FileCatalog(BlobStore &store, Registry<FileRecord> &registry, FileConfig config)
        : store_(store), registry_(registry), config_(config)
    {
    }

    std::unique_ptr<FileIngest> FileCatalog::begin_file(NewFile file)
    {
        FileRecord draft{};
        draft.file_id = crypto::random_uuid();
        draft.filename = file.filename;
        draft.storage_key = file_prefix(draft.file_id) + "/" + storage_name(file.filename);
        draft.mime_type = file.mime_type.empty() ? mime_type_for(file.filename) : file.mime_type;
        draft.metadata = file.metadata.is_object() ? std::move(file.metadata) : nlohmann::json::object();
        draft.origin = file.origin;
        auto writer = store_.open_writer(draft.storage_key);
        return std::make_unique<FileIngest>(*this, std::move(draft), std::move(writer));
    }

    FileRecord FileCatalog::ingest_path(const std::filesystem::path &source, NewFile file)
    {
        std::ifstream in(source, std::ios::binary);
        if (!in.is_open())
        {
            throw std::runtime_error("Failed to open produced file: " + source.string());
        }
        auto ingest = begin_file(std::move(file));
        std::vector<char> buffer(kCopyBufferSize);
        while (in)
        {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto count = static_cast<std::size_t>(in.gcount());
            if (count > 0)
            {
                ingest->write(std::as_bytes(std::span<const char>(buffer.data(), count)));
            }
        }
        if (in.bad())
        {
            throw std::runtime_error("Failed to read produced file: " + source.string());
        }
        return ingest->commit();
    }

    std::optional<FileRecord> FileCatalog::find(const std::string &file_id) const
    {
        return registry_.get(file_id);
    }

    FileRecord FileCatalog::require(const std::string &file_id) const
    {
        auto record = registry_.get(file_id);
        if (!record)
        {
            throw_not_found("File not found: " + file_id);
        }
        return *record;
    }

    bool FileCatalog::remove(const std::string &file_id)
    {
        if (!registry_.remove(file_id))
        {
            return false;
        }
        store_.remove_prefix(file_prefix(file_id));
        spdlog::info("Removed file {}", file_id);
        return true;
    }

    FileRecord FileCatalog::extend_expiry(const std::string &file_id, std::chrono::seconds extension)
    {
        if (extension.count() <= 0)
        {
            throw_validation("Expiry extension must be positive");
        }
        auto updated = registry_.update(file_id, [&](FileRecord &record)
                                        { record.expires_at += extension; });
        if (!updated)
        {
            throw_not_found("File not found: " + file_id);
        }
        return *updated;
    }

    std::vector<FileRecord> FileCatalog::list() const
    {
        return registry_.list();
    }

    std::size_t FileCatalog::count() const
    {
        return registry_.size();
    }

    std::unique_ptr<ByteSource> FileCatalog::open(const FileRecord &file, std::uint64_t offset,
                                                  std::uint64_t length) const
    {
        return store_.open_range(file.storage_key, offset, length);
    }

    std::string FileCatalog::compute_checksum(const std::string &file_id, crypto::DigestAlgorithm algorithm) const
    {
        const auto file = require(file_id);
        auto source = open(file, 0, file.size);
        crypto::Digest digest(algorithm);
        std::vector<std::byte> buffer(kCopyBufferSize);
        while (const auto count = source->read(buffer))
        {
            digest.update(std::span<const std::byte>(buffer.data(), count));
        }
        return digest.finish_hex();
    }

    void FileCatalog::register_file(const FileRecord &record)
    {
        registry_.put(record);
        spdlog::info("Registered file {} ({}, {} bytes, origin {})", record.file_id, record.filename, record.size,
                     to_string(record.origin));
    }

} // namespace chunkyard::server
