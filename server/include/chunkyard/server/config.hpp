#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "chunkyard/server/registry.hpp"

namespace chunkyard::server
{

    inline constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;

    struct UploadConfig
    {
        std::uint64_t default_chunk_size{10 * kMiB};
        // 0 disables the limit.
        std::uint64_t max_file_size{0};
        // Largest chunk one UPLOAD_CHUNK frame can carry; 0 disables. The server derives it from max_frame_bytes.
        std::uint64_t max_chunk_size{0};
        std::chrono::seconds expiry{std::chrono::hours{24}};
    };

    struct FileConfig
    {
        std::chrono::seconds retention{std::chrono::hours{72}};
    };

    struct DownloadConfig
    {
        std::uint64_t default_chunk_size{10 * kMiB};
        std::size_t frame_bytes{256 * 1024};
    };

    struct ToolPaths
    {
        std::string ffmpeg{"ffmpeg"};
        std::string ffprobe{"ffprobe"};
        std::string qpdf{"qpdf"};
        std::string zip{"zip"};
        std::string tar{"tar"};
    };

    struct TransformConfig
    {
        std::size_t worker_threads{4};
        std::size_t max_concurrent_heavy{2};
        int ffmpeg_threads{4};
        ToolPaths tools{};
    };

    struct RetentionConfig
    {
        std::chrono::seconds sweep_interval{std::chrono::minutes{5}};
        std::chrono::seconds job_retention{std::chrono::hours{24}};
    };

    struct S3Defaults
    {
        std::string access_key_id;
        std::string secret_access_key;
        std::string session_token;
        std::string region{"us-east-1"};
        std::string endpoint;
    };

    struct AzureDefaults
    {
        std::string connection_string;
        std::string account_name;
        std::string account_key;
    };

    struct GcsDefaults
    {
        std::string hmac_access_id;
        std::string hmac_secret;
    };

    struct CloudConfig
    {
        std::uint64_t multipart_threshold{16 * kMiB};
        std::uint64_t part_size{8 * kMiB};
        int max_attempts{3};
        std::chrono::milliseconds retry_base_delay{200};
        std::chrono::seconds presign_expiry{3600};
        std::chrono::seconds connect_timeout{30};
        S3Defaults s3{};
        AzureDefaults azure{};
        GcsDefaults gcs{};
    };

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};
        std::size_t max_frame_bytes{64 * kMiB};
        RegistryBackend registry{RegistryBackend::Memory};

        UploadConfig upload{};
        FileConfig files{};
        DownloadConfig download{};
        TransformConfig transform{};
        RetentionConfig retention{};
        CloudConfig cloud{};
    };

    // Overlays the keys present in a JSON document onto config. Throws std::invalid_argument on bad values.
    void apply_config_json(const nlohmann::json &json, ServerConfig &config);

    void load_config_file(const std::filesystem::path &path, ServerConfig &config);

    // Default cloud credentials from AWS_*, AZURE_STORAGE_*, GCS_HMAC_* variables.
    void apply_environment(CloudConfig &cloud);

    enum class ParseOutcome
    {
        Run,
        ShowHelp
    };

    // Command line flags; "--config" is applied first so flags override the file.
    ParseOutcome parse_arguments(int argc, char *argv[], ServerConfig &config);

    std::string usage(const char *program_name);

} // namespace chunkyard::server
