#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkyard/server/blob_store.hpp"
#include "chunkyard/server/config.hpp"
#include "chunkyard/server/file_catalog.hpp"
#include "chunkyard/server/records.hpp"
#include "chunkyard/server/registry.hpp"

namespace chunkyard::server
{

    struct InitUploadRequest
    {
        std::string filename;
        std::uint64_t total_size{};
        std::optional<std::string> mime_type{};
        std::optional<std::uint64_t> chunk_size{};
        nlohmann::json metadata{nlohmann::json::object()};
    };

    struct InitUploadResult
    {
        std::string upload_id;
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        TimePoint expires_at{};
    };

    struct ChunkResult
    {
        std::uint64_t chunk_index{};
        std::uint64_t bytes_received{};
        std::string checksum;
    };

    struct UploadStatus
    {
        std::string upload_id;
        std::string filename;
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        std::vector<std::uint64_t> received_chunks;
        std::vector<std::uint64_t> missing_chunks;
        std::uint64_t bytes_uploaded{};
        int percent_complete{};
        TimePoint expires_at{};
    };

    struct CompleteResult
    {
        std::string file_id;
        std::string filename;
        std::uint64_t size{};
        std::string checksum;
        std::string mime_type;
    };

    void to_json(nlohmann::json &json, const InitUploadResult &result);
    void to_json(nlohmann::json &json, const ChunkResult &result);
    void to_json(nlohmann::json &json, const UploadStatus &status);
    void to_json(nlohmann::json &json, const CompleteResult &result);

    // Resumable chunked uploads. Chunks land in the store as staging/<upload_id>/chunk_<i>.
    class UploadManager
    {
    public:
        UploadManager(BlobStore &store, Registry<UploadSession> &sessions, FileCatalog &files, UploadConfig config);

        InitUploadResult init(const InitUploadRequest &request);

        ChunkResult put_chunk(const std::string &upload_id, std::uint64_t chunk_index, std::span<const std::byte> data);

        UploadStatus status(const std::string &upload_id) const;

        // client_checksums: null, an index-aligned array, or an {"<index>": digest} object.
        CompleteResult complete(const std::string &upload_id, const nlohmann::json &client_checksums = nullptr);

        // Idempotent; unknown ids are ignored.
        void cancel(const std::string &upload_id);

        // Removes sessions whose expiry has passed; returns how many were removed.
        std::size_t sweep_expired(TimePoint now);

        std::size_t active_count() const;

    private:
        static std::string staging_prefix(const std::string &upload_id);
        static std::string chunk_key(const std::string &upload_id, std::uint64_t chunk_index);

        void discard(const std::string &upload_id);
        void release_assembly(const std::string &upload_id);

        BlobStore &store_;
        Registry<UploadSession> &sessions_;
        FileCatalog &files_;
        UploadConfig config_;
    };

} // namespace chunkyard::server
