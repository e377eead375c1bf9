#pragma once

#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio/ip/tcp.hpp>
#include <asio/thread_pool.hpp>
#include <nlohmann/json.hpp>

#include "chunkyard/error_codes.hpp"
#include "chunkyard/protocol.hpp"
#include "chunkyard/server/cloud/cloud_broker.hpp"
#include "chunkyard/server/config.hpp"
#include "chunkyard/server/download_streamer.hpp"
#include "chunkyard/server/file_catalog.hpp"
#include "chunkyard/server/job_engine.hpp"
#include "chunkyard/server/upload_manager.hpp"

namespace chunkyard::server
{

    struct ServerServices
    {
        UploadManager &uploads;
        FileCatalog &files;
        DownloadStreamer &downloads;
        cloud::CloudBroker &cloud;
        JobEngine &jobs;
        // Cloud transfers, checksums and media inspection run here instead of on the connection strand.
        asio::thread_pool &blocking;
        const ServerConfig &config;
    };

    // One client connection. The socket's executor is a strand, so every handler of a
    // session runs serialized.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);
        ~Session();

        void start();

        void stop();

    private:
        using Handler = std::function<nlohmann::json()>;
        using Envelope = chunkyard::protocol::RequestEnvelope;

        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void dispatch(const Envelope &envelope);

        void send_response(const chunkyard::protocol::ResponseEnvelope &envelope,
                           std::function<void()> on_written = {});
        void send_error(chunkyard::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt,
                        nlohmann::json details = nlohmann::json::object());
        void write_next();

        // Runs action; anything it throws is answered with an ERROR frame. False when it threw.
        bool guard(const std::optional<std::string> &request_id, const std::function<void()> &action);
        // Runs handler and answers OK with its result, or ERROR with whatever it threw.
        void respond(const std::optional<std::string> &request_id, const Handler &handler);
        // Same, with handler executed on the blocking pool.
        void respond_blocking(const std::optional<std::string> &request_id, Handler handler);

        // Command handlers
        nlohmann::json handle_upload_init(const Envelope &envelope);
        nlohmann::json handle_upload_chunk(const Envelope &envelope);
        nlohmann::json handle_upload_status(const Envelope &envelope);
        nlohmann::json handle_upload_complete(const Envelope &envelope);
        nlohmann::json handle_upload_cancel(const Envelope &envelope);
        void handle_download(const Envelope &envelope);
        nlohmann::json handle_download_init(const Envelope &envelope);
        nlohmann::json handle_cloud_upload(const Envelope &envelope);
        nlohmann::json handle_cloud_download(const Envelope &envelope);
        nlohmann::json handle_cloud_copy(const Envelope &envelope);
        nlohmann::json handle_cloud_presign(const Envelope &envelope);
        nlohmann::json handle_transform_submit(const Envelope &envelope);
        nlohmann::json handle_transform_status(const Envelope &envelope);
        nlohmann::json handle_file_checksum(const Envelope &envelope);
        nlohmann::json handle_file_metadata(const Envelope &envelope);
        nlohmann::json handle_file_delete(const Envelope &envelope);
        nlohmann::json handle_file_extend(const Envelope &envelope);
        nlohmann::json handle_health(const Envelope &envelope);

        void pump_download();
        void finish_download();

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;
        std::string endpoint_;
        bool closed_{false};

        std::array<std::uint8_t, 4> header_buffer_{};
        std::vector<std::uint8_t> buffer_;

        struct PendingWrite
        {
            std::vector<std::uint8_t> frame;
            std::function<void()> on_written;
        };
        std::deque<PendingWrite> write_queue_;

        struct ActiveDownload
        {
            RangeStream stream;
            std::uint64_t sent{};
            std::optional<std::string> request_id;
        };
        std::optional<ActiveDownload> download_;
    };

} // namespace chunkyard::server
