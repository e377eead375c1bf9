#include "chunkyard/server/blob_store.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "chunkyard/crypto.hpp"
#include "chunkyard/server/service_error.hpp"

namespace chunkyard::server
{

    namespace
    {

        TimePoint to_system_time(const std::filesystem::file_time_type &time)
        {
            return std::chrono::time_point_cast<Clock::duration>(time - std::filesystem::file_time_type::clock::now() +
                                                                 Clock::now());
        }

        class StoreRangeSource : public ByteSource
        {
        public:
            StoreRangeSource(const BlobStore &store, std::string key, std::uint64_t offset, std::uint64_t length)
                : store_(store), key_(std::move(key)), position_(offset), remaining_(length)
            {
            }

            std::size_t read(std::span<std::byte> buffer) override
            {
                if (remaining_ == 0 || buffer.empty())
                {
                    return 0;
                }
                const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), remaining_));
                const auto count = store_.read(key_, position_, buffer.first(want));
                position_ += count;
                remaining_ -= count;
                if (count == 0)
                {
                    remaining_ = 0;
                }
                return count;
            }

        private:
            const BlobStore &store_;
            std::string key_;
            std::uint64_t position_;
            std::uint64_t remaining_;
        };

        class FileRangeSource : public ByteSource
        {
        public:
            FileRangeSource(const std::filesystem::path &path, std::uint64_t offset, std::uint64_t length)
                : stream_(path, std::ios::binary), remaining_(length)
            {
                if (!stream_.is_open())
                {
                    throw std::runtime_error("Failed to open blob: " + path.string());
                }
                stream_.seekg(static_cast<std::streamoff>(offset));
            }

            std::size_t read(std::span<std::byte> buffer) override
            {
                if (remaining_ == 0 || buffer.empty() || !stream_)
                {
                    return 0;
                }
                const auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(buffer.size(), remaining_));
                stream_.read(reinterpret_cast<char *>(buffer.data()), want);
                const auto count = static_cast<std::size_t>(stream_.gcount());
                remaining_ -= count;
                if (count == 0)
                {
                    remaining_ = 0;
                }
                return count;
            }

        private:
            std::ifstream stream_;
            std::uint64_t remaining_;
        };

        class LocalBlobWriter : public BlobWriter
        {
        public:
            explicit LocalBlobWriter(std::filesystem::path target)
                : target_(std::move(target)),
                  temp_(target_.string() + ".partial-" + crypto::random_uuid().substr(0, 8))
            {
                std::filesystem::create_directories(target_.parent_path());
                stream_.open(temp_, std::ios::binary | std::ios::trunc);
                if (!stream_.is_open())
                {
                    throw std::runtime_error("Failed to open blob for writing: " + target_.string());
                }
            }

            ~LocalBlobWriter() override
            {
                if (!committed_)
                {
                    stream_.close();
                    std::error_code ec;
                    std::filesystem::remove(temp_, ec);
                }
            }

            void write(std::span<const std::byte> data) override
            {
                if (committed_)
                {
                    throw std::logic_error("write after commit");
                }
                stream_.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
                if (!stream_)
                {
                    throw std::runtime_error("Failed to write blob: " + target_.string());
                }
                written_ += data.size();
            }

            void commit() override
            {
                stream_.close();
                if (stream_.fail())
                {
                    throw std::runtime_error("Failed to flush blob: " + target_.string());
                }
                std::filesystem::rename(temp_, target_);
                committed_ = true;
            }

            std::uint64_t bytes_written() const noexcept override { return written_; }

        private:
            std::filesystem::path target_;
            std::filesystem::path temp_;
            std::ofstream stream_;
            std::uint64_t written_{0};
            bool committed_{false};
        };

    } // namespace

    void BlobStore::write(const std::string &key, std::span<const std::byte> data)
    {
        auto writer = open_writer(key);
        writer->write(data);
        writer->commit();
    }

    std::unique_ptr<ByteSource> BlobStore::open_range(const std::string &key, std::uint64_t offset,
                                                      std::uint64_t length) const
    {
        return std::make_unique<StoreRangeSource>(*this, key, offset, length);
    }

    std::optional<std::filesystem::path> BlobStore::local_path(const std::string & /*key*/) const
    {
        return std::nullopt;
    }

    LocalBlobStore::LocalBlobStore(std::filesystem::path root) : root_(std::move(root))
    {
        std::filesystem::create_directories(root_);
    }

    std::unique_ptr<BlobWriter> LocalBlobStore::open_writer(const std::string &key)
    {
        return std::make_unique<LocalBlobWriter>(resolve(key));
    }

    std::size_t LocalBlobStore::read(const std::string &key, std::uint64_t offset, std::span<std::byte> buffer) const
    {
        const auto path = resolve(key);
        std::ifstream stream(path, std::ios::binary);
        if (!stream.is_open())
        {
            throw ServiceError(chunkyard::ErrorCode::NotFound, "Blob not found: " + key);
        }
        stream.seekg(static_cast<std::streamoff>(offset));
        if (!stream)
        {
            return 0;
        }
        stream.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        return static_cast<std::size_t>(stream.gcount());
    }

    std::unique_ptr<ByteSource> LocalBlobStore::open_range(const std::string &key, std::uint64_t offset,
                                                           std::uint64_t length) const
    {
        const auto path = resolve(key);
        if (!std::filesystem::is_regular_file(path))
        {
            throw ServiceError(chunkyard::ErrorCode::NotFound, "Blob not found: " + key);
        }
        return std::make_unique<FileRangeSource>(path, offset, length);
    }

    bool LocalBlobStore::remove(const std::string &key)
    {
        std::error_code ec;
        const bool removed = std::filesystem::remove(resolve(key), ec);
        if (ec)
        {
            spdlog::warn("Failed to remove blob {}: {}", key, ec.message());
        }
        return removed;
    }

    std::size_t LocalBlobStore::remove_prefix(const std::string &prefix)
    {
        const auto path = resolve(prefix);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
        {
            return 0;
        }
        std::size_t count = 0;
        if (std::filesystem::is_directory(path, ec))
        {
            for (const auto &entry : std::filesystem::recursive_directory_iterator(path, ec))
            {
                if (entry.is_regular_file())
                {
                    ++count;
                }
            }
        }
        else
        {
            count = 1;
        }
        std::filesystem::remove_all(path, ec);
        if (ec)
        {
            spdlog::warn("Failed to remove blobs under {}: {}", prefix, ec.message());
        }
        return count;
    }

    std::optional<BlobStat> LocalBlobStore::stat(const std::string &key) const
    {
        const auto path = resolve(key);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            return std::nullopt;
        }
        return BlobStat{
            .size = std::filesystem::file_size(path),
            .modified = to_system_time(std::filesystem::last_write_time(path)),
        };
    }

    std::optional<std::filesystem::path> LocalBlobStore::local_path(const std::string &key) const
    {
        return resolve(key);
    }

    std::filesystem::path LocalBlobStore::resolve(const std::string &key) const
    {
        std::filesystem::path relative = key;
        if (relative.is_absolute())
        {
            relative = relative.lexically_relative("/");
        }

        std::filesystem::path resolved = root_;
        bool has_component = false;
        for (const auto &part : relative)
        {
            const auto part_string = part.generic_string();
            if (part_string.empty() || part_string == ".")
            {
                continue;
            }
            if (part_string == "..")
            {
                throw ServiceError(chunkyard::ErrorCode::ValidationError, "Path traversal detected in key: " + key);
            }
            resolved /= part;
            has_component = true;
        }
        if (!has_component)
        {
            throw ServiceError(chunkyard::ErrorCode::ValidationError, "Empty blob key");
        }
        return resolved;
    }

} // namespace chunkyard::server
