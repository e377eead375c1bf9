#include "chunkyard/server/config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "chunkyard/framing.hpp"
#include "chunkyard/version.hpp"

namespace chunkyard::server
{

    namespace
    {

        std::string env_or_empty(const char *name)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string{};
        }

        template <typename T>
        void read_value(const nlohmann::json &section, const char *key, T &target)
        {
            if (auto it = section.find(key); it != section.end() && !it->is_null())
            {
                target = it->get<T>();
            }
        }

        template <typename Duration>
        void read_duration(const nlohmann::json &section, const char *key, Duration &target)
        {
            if (auto it = section.find(key); it != section.end() && !it->is_null())
            {
                const auto count = it->get<std::int64_t>();
                if (count < 0)
                {
                    throw std::invalid_argument(std::string(key) + " must not be negative");
                }
                target = Duration(count);
            }
        }

        const nlohmann::json &section_of(const nlohmann::json &json, const char *name)
        {
            static const nlohmann::json kEmpty = nlohmann::json::object();
            if (auto it = json.find(name); it != json.end() && it->is_object())
            {
                return *it;
            }
            return kEmpty;
        }

        std::optional<std::string> read_option(int &index, int argc, char *argv[])
        {
            if (index + 1 >= argc)
            {
                return std::nullopt;
            }
            ++index;
            return std::string(argv[index]);
        }

        std::string require_option(int &index, int argc, char *argv[], const std::string &flag)
        {
            auto value = read_option(index, argc, argv);
            if (!value)
            {
                throw std::invalid_argument("Missing value for " + flag);
            }
            return *value;
        }

        void validate(const ServerConfig &config)
        {
            if (config.upload.default_chunk_size == 0 || config.download.default_chunk_size == 0)
            {
                throw std::invalid_argument("chunk sizes must be positive");
            }
            if (config.upload.default_chunk_size > chunkyard::protocol::max_chunk_bytes(config.max_frame_bytes))
            {
                throw std::invalid_argument("upload.chunk_size does not fit in a max_frame_bytes frame");
            }
            if (config.transform.worker_threads == 0 || config.transform.max_concurrent_heavy == 0)
            {
                throw std::invalid_argument("transform threads and heavy ceiling must be positive");
            }
            if (config.cloud.part_size < 5 * kMiB)
            {
                throw std::invalid_argument("cloud.part_size must be at least 5 MiB");
            }
            if (config.cloud.max_attempts < 1)
            {
                throw std::invalid_argument("cloud.max_attempts must be at least 1");
            }
            if (config.download.frame_bytes == 0)
            {
                throw std::invalid_argument("download.frame_bytes must be positive");
            }
        }

    } // namespace

    std::string_view to_string(RegistryBackend backend) noexcept
    {
        return backend == RegistryBackend::JsonFiles ? "json" : "memory";
    }

    std::optional<RegistryBackend> registry_backend_from_string(std::string_view value) noexcept
    {
        if (value == "memory")
        {
            return RegistryBackend::Memory;
        }
        if (value == "json")
        {
            return RegistryBackend::JsonFiles;
        }
        return std::nullopt;
    }

    void apply_config_json(const nlohmann::json &json, ServerConfig &config)
    {
        if (!json.is_object())
        {
            throw std::invalid_argument("configuration must be a JSON object");
        }
        try
        {
            read_value(json, "address", config.address);
            read_value(json, "port", config.port);
            if (auto it = json.find("root"); it != json.end())
            {
                config.root = it->get<std::string>();
            }
            read_value(json, "threads", config.worker_threads);
            if (auto it = json.find("log_file"); it != json.end())
            {
                config.log_file = std::filesystem::path(it->get<std::string>());
            }
            read_value(json, "log_level", config.log_level);
            read_value(json, "max_frame_bytes", config.max_frame_bytes);
            if (auto it = json.find("registry"); it != json.end())
            {
                const auto label = it->get<std::string>();
                auto backend = registry_backend_from_string(label);
                if (!backend)
                {
                    throw std::invalid_argument("Unknown registry backend: " + label);
                }
                config.registry = *backend;
            }

            const auto &upload = section_of(json, "upload");
            read_value(upload, "chunk_size", config.upload.default_chunk_size);
            read_value(upload, "max_file_size", config.upload.max_file_size);
            read_duration(upload, "expiry_seconds", config.upload.expiry);

            read_duration(section_of(json, "files"), "retention_seconds", config.files.retention);

            const auto &download = section_of(json, "download");
            read_value(download, "chunk_size", config.download.default_chunk_size);
            read_value(download, "frame_bytes", config.download.frame_bytes);

            const auto &transform = section_of(json, "transform");
            read_value(transform, "threads", config.transform.worker_threads);
            read_value(transform, "max_concurrent_heavy", config.transform.max_concurrent_heavy);
            read_value(transform, "ffmpeg_threads", config.transform.ffmpeg_threads);
            const auto &tools = section_of(transform, "tools");
            read_value(tools, "ffmpeg", config.transform.tools.ffmpeg);
            read_value(tools, "ffprobe", config.transform.tools.ffprobe);
            read_value(tools, "qpdf", config.transform.tools.qpdf);
            read_value(tools, "zip", config.transform.tools.zip);
            read_value(tools, "tar", config.transform.tools.tar);

            const auto &retention = section_of(json, "retention");
            read_duration(retention, "sweep_interval_seconds", config.retention.sweep_interval);
            read_duration(retention, "job_retention_seconds", config.retention.job_retention);

            const auto &cloud = section_of(json, "cloud");
            read_value(cloud, "multipart_threshold", config.cloud.multipart_threshold);
            read_value(cloud, "part_size", config.cloud.part_size);
            read_value(cloud, "max_attempts", config.cloud.max_attempts);
            read_duration(cloud, "retry_base_delay_ms", config.cloud.retry_base_delay);
            read_duration(cloud, "presign_expiry_seconds", config.cloud.presign_expiry);
            read_duration(cloud, "connect_timeout_seconds", config.cloud.connect_timeout);
            read_value(cloud, "s3_region", config.cloud.s3.region);
            read_value(cloud, "s3_endpoint", config.cloud.s3.endpoint);
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::invalid_argument(std::string("Invalid configuration value: ") + ex.what());
        }
        validate(config);
    }

    void load_config_file(const std::filesystem::path &path, ServerConfig &config)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::invalid_argument("Cannot open configuration file: " + path.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw std::invalid_argument("Malformed configuration file " + path.string() + ": " + ex.what());
        }
        apply_config_json(json, config);
    }

    void apply_environment(CloudConfig &cloud)
    {
        if (auto value = env_or_empty("AWS_ACCESS_KEY_ID"); !value.empty())
        {
            cloud.s3.access_key_id = value;
        }
        if (auto value = env_or_empty("AWS_SECRET_ACCESS_KEY"); !value.empty())
        {
            cloud.s3.secret_access_key = value;
        }
        if (auto value = env_or_empty("AWS_SESSION_TOKEN"); !value.empty())
        {
            cloud.s3.session_token = value;
        }
        if (auto value = env_or_empty("AWS_REGION"); !value.empty())
        {
            cloud.s3.region = value;
        }
        if (auto value = env_or_empty("AZURE_STORAGE_CONNECTION_STRING"); !value.empty())
        {
            cloud.azure.connection_string = value;
        }
        if (auto value = env_or_empty("AZURE_STORAGE_ACCOUNT"); !value.empty())
        {
            cloud.azure.account_name = value;
        }
        if (auto value = env_or_empty("AZURE_STORAGE_KEY"); !value.empty())
        {
            cloud.azure.account_key = value;
        }
        if (auto value = env_or_empty("GCS_HMAC_ACCESS_ID"); !value.empty())
        {
            cloud.gcs.hmac_access_id = value;
        }
        if (auto value = env_or_empty("GCS_HMAC_SECRET"); !value.empty())
        {
            cloud.gcs.hmac_secret = value;
        }
    }

    ParseOutcome parse_arguments(int argc, char *argv[], ServerConfig &config)
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                return ParseOutcome::ShowHelp;
            }
            if (arg == "--config")
            {
                load_config_file(require_option(i, argc, argv, arg), config);
            }
        }

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--config")
            {
                ++i;
            }
            else if (arg == "--port")
            {
                const auto value = std::stoi(require_option(i, argc, argv, arg));
                if (value <= 0 || value > 65535)
                {
                    throw std::invalid_argument("Port out of range");
                }
                config.port = static_cast<std::uint16_t>(value);
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(require_option(i, argc, argv, arg));
            }
            else if (arg == "--address")
            {
                config.address = require_option(i, argc, argv, arg);
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(std::stoul(require_option(i, argc, argv, arg)));
            }
            else if (arg == "--transform-threads")
            {
                config.transform.worker_threads = static_cast<std::size_t>(std::stoul(require_option(i, argc, argv, arg)));
            }
            else if (arg == "--max-heavy-jobs")
            {
                config.transform.max_concurrent_heavy =
                    static_cast<std::size_t>(std::stoul(require_option(i, argc, argv, arg)));
            }
            else if (arg == "--registry")
            {
                const auto label = require_option(i, argc, argv, arg);
                auto backend = registry_backend_from_string(label);
                if (!backend)
                {
                    throw std::invalid_argument("Unknown registry backend: " + label);
                }
                config.registry = *backend;
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(require_option(i, argc, argv, arg));
            }
            else if (arg == "--log-level")
            {
                config.log_level = require_option(i, argc, argv, arg);
            }
            else
            {
                throw std::invalid_argument("Unknown argument: " + arg);
            }
        }

        if (config.port == 0 || config.root.empty())
        {
            throw std::invalid_argument("--port and --root are required");
        }
        validate(config);
        return ParseOutcome::Run;
    }

    std::string usage(const char *program_name)
    {
        std::ostringstream out;
        out << "Chunkyard server " << chunkyard::version() << "\n"
            << "Usage: " << program_name
            << " --port <PORT> --root <ROOT> [--address <ADDRESS>] [--threads <N>] [--config <FILE.json>]\n"
               "       [--transform-threads <N>] [--max-heavy-jobs <N>] [--registry memory|json]\n"
               "       [--log <FILE>] [--log-level trace|debug|info|warn|error]\n";
        return out.str();
    }

} // namespace chunkyard::server
