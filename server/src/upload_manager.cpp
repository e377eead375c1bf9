#include "chunkyard/server/upload_manager.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <vector>

#include <spdlog/spdlog.h>

#include "chunkyard/crypto.hpp"
#include "chunkyard/server/mime_types.hpp"
#include "chunkyard/server/service_error.hpp"

namespace chunkyard::server
{

    namespace
    {
        constexpr std::size_t kAssemblyBufferSize = 256 * 1024;
        constexpr std::uint64_t kMaxChunksPerUpload = 1'000'000;

        std::uint64_t expected_chunk_size(const UploadSession &session, std::uint64_t chunk_index)
        {
            if (chunk_index + 1 < session.total_chunks)
            {
                return session.chunk_size;
            }
            return session.total_size - chunk_index * session.chunk_size;
        }

        void validate_filename(const std::string &filename)
        {
            if (filename.empty())
            {
                throw_validation("filename is required");
            }
            if (filename.find_first_of("/\\") != std::string::npos || filename == "." || filename == "..")
            {
                throw_validation("filename must not contain path separators");
            }
        }

        std::optional<std::uint64_t> parse_index(const std::string &text)
        {
            if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c)
                                             { return std::isdigit(c) != 0; }))
            {
                return std::nullopt;
            }
            return std::stoull(text);
        }

        std::map<std::uint64_t, std::string> normalize_checksums(const nlohmann::json &checksums)
        {
            std::map<std::uint64_t, std::string> result;
            if (checksums.is_null())
            {
                return result;
            }
            if (checksums.is_array())
            {
                for (std::size_t i = 0; i < checksums.size(); ++i)
                {
                    if (checksums[i].is_string())
                    {
                        result[i] = checksums[i].get<std::string>();
                    }
                    else if (!checksums[i].is_null())
                    {
                        throw_validation("checksums entries must be strings");
                    }
                }
                return result;
            }
            if (checksums.is_object())
            {
                for (const auto &[key, value] : checksums.items())
                {
                    auto index = parse_index(key);
                    if (!index || !value.is_string())
                    {
                        throw_validation("checksums must map chunk indices to digest strings");
                    }
                    result[*index] = value.get<std::string>();
                }
                return result;
            }
            throw_validation("checksums must be an array or an object");
        }

        std::string lowercase(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return value;
        }

    } // namespace

    void to_json(nlohmann::json &json, const InitUploadResult &result)
    {
        json = {
            {"upload_id", result.upload_id},
            {"chunk_size", result.chunk_size},
            {"total_chunks", result.total_chunks},
            {"expires_at", format_iso8601(result.expires_at)},
        };
    }

    void to_json(nlohmann::json &json, const ChunkResult &result)
    {
        json = {
            {"chunk_index", result.chunk_index},
            {"bytes_received", result.bytes_received},
            {"checksum", result.checksum},
        };
    }

    void to_json(nlohmann::json &json, const UploadStatus &status)
    {
        json = {
            {"upload_id", status.upload_id},
            {"filename", status.filename},
            {"total_size", status.total_size},
            {"chunk_size", status.chunk_size},
            {"total_chunks", status.total_chunks},
            {"received_chunks", status.received_chunks},
            {"missing_chunks", status.missing_chunks},
            {"bytes_uploaded", status.bytes_uploaded},
            {"percent_complete", status.percent_complete},
            {"expires_at", format_iso8601(status.expires_at)},
        };
    }

    void to_json(nlohmann::json &json, const CompleteResult &result)
    {
        json = {
            {"file_id", result.file_id},
            {"filename", result.filename},
            {"size", result.size},
            {"checksum", result.checksum},
            {"mime_type", result.mime_type},
        };
    }

    UploadManager::UploadManager(BlobStore &store, Registry<UploadSession> &sessions, FileCatalog &files,
                                 UploadConfig config)
        : store_(store), sessions_(sessions), files_(files), config_(config)
    {
    }

    InitUploadResult UploadManager::init(const InitUploadRequest &request)
    {
        validate_filename(request.filename);
        if (request.total_size == 0)
        {
            throw_validation("total_size must be positive");
        }
        if (config_.max_file_size > 0 && request.total_size > config_.max_file_size)
        {
            throw_validation("total_size exceeds the maximum of " + std::to_string(config_.max_file_size) + " bytes");
        }
        const auto chunk_size = request.chunk_size.value_or(config_.default_chunk_size);
        if (chunk_size == 0)
        {
            throw_validation("chunk_size must be positive");
        }
        if (config_.max_chunk_size > 0 && chunk_size > config_.max_chunk_size)
        {
            throw_validation("chunk_size exceeds the transferable maximum of " + std::to_string(config_.max_chunk_size) +
                             " bytes");
        }
        const auto total_chunks = request.total_size / chunk_size + (request.total_size % chunk_size != 0 ? 1 : 0);
        if (total_chunks > kMaxChunksPerUpload)
        {
            throw_validation("total_size needs " + std::to_string(total_chunks) + " chunks; the limit is " +
                             std::to_string(kMaxChunksPerUpload));
        }
        if (!request.metadata.is_object())
        {
            throw_validation("metadata must be an object");
        }

        UploadSession session{};
        session.upload_id = crypto::random_uuid();
        session.filename = request.filename;
        session.total_size = request.total_size;
        session.mime_type = request.mime_type.value_or(mime_type_for(request.filename));
        session.chunk_size = chunk_size;
        session.total_chunks = total_chunks;
        session.metadata = request.metadata;
        session.created_at = Clock::now();
        session.expires_at = session.created_at + config_.expiry;
        sessions_.put(session);

        spdlog::info("Upload {} started: {} ({} bytes, {} chunks of {})", session.upload_id, session.filename,
                     session.total_size, session.total_chunks, session.chunk_size);
        return InitUploadResult{
            .upload_id = session.upload_id,
            .chunk_size = session.chunk_size,
            .total_chunks = session.total_chunks,
            .expires_at = session.expires_at,
        };
    }

    ChunkResult UploadManager::put_chunk(const std::string &upload_id, std::uint64_t chunk_index,
                                         std::span<const std::byte> data)
    {
        const auto session = sessions_.get(upload_id);
        if (!session)
        {
            throw_not_found("Upload session not found: " + upload_id);
        }
        if (chunk_index >= session->total_chunks)
        {
            throw_validation("chunk_index " + std::to_string(chunk_index) + " outside [0, " +
                             std::to_string(session->total_chunks) + ")");
        }
        if (session->assembling)
        {
            throw ServiceError(chunkyard::ErrorCode::Conflict, "Upload is being assembled");
        }
        // Only the last chunk may be short, so a bad size is reported against its index here.
        const auto expected = expected_chunk_size(*session, chunk_index);
        if (data.size() != expected)
        {
            throw ServiceError(chunkyard::ErrorCode::ValidationError,
                               "chunk " + std::to_string(chunk_index) + " must be " + std::to_string(expected) +
                                   " bytes, got " + std::to_string(data.size()),
                               {{"chunk_index", chunk_index}, {"expected_size", expected}});
        }

        const auto checksum = crypto::sha256_hex(data);
        const auto key = chunk_key(upload_id, chunk_index);
        store_.write(key, data);

        const auto updated = sessions_.update(upload_id, [&](UploadSession &current)
                                              {
            if (current.assembling)
            {
                throw ServiceError(chunkyard::ErrorCode::Conflict, "Upload is being assembled");
            }
            current.chunks[chunk_index] = ChunkReceipt{.size = data.size(), .checksum = checksum}; });
        if (!updated)
        {
            // Cancelled or expired while the bytes were being written.
            store_.remove_prefix(staging_prefix(upload_id));
            throw_not_found("Upload session not found: " + upload_id);
        }

        spdlog::debug("Upload {} chunk {} stored ({} bytes)", upload_id, chunk_index, data.size());
        return ChunkResult{
            .chunk_index = chunk_index,
            .bytes_received = data.size(),
            .checksum = checksum,
        };
    }

    UploadStatus UploadManager::status(const std::string &upload_id) const
    {
        const auto session = sessions_.get(upload_id);
        if (!session)
        {
            throw_not_found("Upload session not found: " + upload_id);
        }

        UploadStatus status{
            .upload_id = session->upload_id,
            .filename = session->filename,
            .total_size = session->total_size,
            .chunk_size = session->chunk_size,
            .total_chunks = session->total_chunks,
            .expires_at = session->expires_at,
        };
        status.received_chunks.reserve(session->chunks.size());
        for (const auto &[index, receipt] : session->chunks)
        {
            status.received_chunks.push_back(index);
        }
        for (std::uint64_t i = 0; i < session->total_chunks; ++i)
        {
            if (!session->chunks.contains(i))
            {
                status.missing_chunks.push_back(i);
            }
        }
        const auto received = static_cast<std::uint64_t>(session->chunks.size());
        status.bytes_uploaded = std::min(received * session->chunk_size, session->total_size);
        status.percent_complete = static_cast<int>(
            std::lround(static_cast<double>(received) * 100.0 / static_cast<double>(session->total_chunks)));
        return status;
    }

    CompleteResult UploadManager::complete(const std::string &upload_id, const nlohmann::json &client_checksums)
    {
        const auto snapshot = sessions_.get(upload_id);
        if (!snapshot)
        {
            throw_not_found("Upload session not found: " + upload_id);
        }

        std::vector<std::uint64_t> missing;
        for (std::uint64_t i = 0; i < snapshot->total_chunks; ++i)
        {
            if (!snapshot->chunks.contains(i))
            {
                missing.push_back(i);
            }
        }
        if (!missing.empty())
        {
            throw MissingChunksError(std::move(missing));
        }

        for (const auto &[index, expected] : normalize_checksums(client_checksums))
        {
            auto it = snapshot->chunks.find(index);
            if (it == snapshot->chunks.end())
            {
                throw_validation("checksum supplied for unknown chunk " + std::to_string(index));
            }
            if (lowercase(expected) != it->second.checksum)
            {
                throw ChecksumMismatchError(index);
            }
        }

        const auto claimed = sessions_.update(upload_id, [](UploadSession &current)
                                              {
            if (current.assembling)
            {
                throw ServiceError(chunkyard::ErrorCode::Conflict, "Upload is already being completed");
            }
            current.assembling = true; });
        if (!claimed)
        {
            throw_not_found("Upload session not found: " + upload_id);
        }

        FileRecord file{};
        try
        {
            auto ingest = files_.begin_file(NewFile{
                .filename = claimed->filename,
                .mime_type = claimed->mime_type,
                .metadata = claimed->metadata,
                .origin = FileOrigin::Upload,
            });

            std::vector<std::byte> buffer(kAssemblyBufferSize);
            for (const auto &[index, receipt] : claimed->chunks)
            {
                std::unique_ptr<ByteSource> source;
                try
                {
                    source = store_.open_range(chunk_key(upload_id, index), 0, receipt.size);
                }
                catch (const ServiceError &ex)
                {
                    if (ex.code() != chunkyard::ErrorCode::NotFound)
                    {
                        throw;
                    }
                    sessions_.update(upload_id, [index](UploadSession &current)
                                     { current.chunks.erase(index); });
                    throw MissingChunksError({index});
                }

                crypto::Digest digest(crypto::DigestAlgorithm::Sha256);
                std::uint64_t chunk_bytes = 0;
                while (const auto count = source->read(buffer))
                {
                    const std::span<const std::byte> slice(buffer.data(), count);
                    digest.update(slice);
                    ingest->write(slice);
                    chunk_bytes += count;
                }
                if (chunk_bytes != receipt.size || digest.finish_hex() != receipt.checksum)
                {
                    throw ChecksumMismatchError(index);
                }
            }

            if (ingest->bytes_written() != claimed->total_size)
            {
                throw_validation("Assembled size " + std::to_string(ingest->bytes_written()) +
                                 " does not match declared total_size " + std::to_string(claimed->total_size));
            }
            file = ingest->commit();
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Upload {} completion failed: {}", upload_id, ex.what());
            release_assembly(upload_id);
            throw;
        }

        discard(upload_id);
        spdlog::info("Upload {} completed as file {} ({} bytes)", upload_id, file.file_id, file.size);
        return CompleteResult{
            .file_id = file.file_id,
            .filename = file.filename,
            .size = file.size,
            .checksum = file.checksum,
            .mime_type = file.mime_type,
        };
    }

    void UploadManager::cancel(const std::string &upload_id)
    {
        // Staging is keyed by the id, so only ids of live sessions may reach the store.
        if (!crypto::is_uuid(upload_id) || !sessions_.remove(upload_id))
        {
            return;
        }
        store_.remove_prefix(staging_prefix(upload_id));
        spdlog::info("Upload {} cancelled", upload_id);
    }

    std::size_t UploadManager::sweep_expired(TimePoint now)
    {
        std::size_t removed = 0;
        for (const auto &session : sessions_.list())
        {
            if (session.expires_at <= now && !session.assembling)
            {
                discard(session.upload_id);
                ++removed;
            }
        }
        return removed;
    }

    std::size_t UploadManager::active_count() const
    {
        return sessions_.size();
    }

    std::string UploadManager::staging_prefix(const std::string &upload_id)
    {
        return "staging/" + upload_id;
    }

    std::string UploadManager::chunk_key(const std::string &upload_id, std::uint64_t chunk_index)
    {
        return staging_prefix(upload_id) + "/chunk_" + std::to_string(chunk_index);
    }

    void UploadManager::discard(const std::string &upload_id)
    {
        sessions_.remove(upload_id);
        store_.remove_prefix(staging_prefix(upload_id));
    }

    void UploadManager::release_assembly(const std::string &upload_id)
    {
        sessions_.update(upload_id, [](UploadSession &current)
                         { current.assembling = false; });
    }

} // namespace chunkyard::server
