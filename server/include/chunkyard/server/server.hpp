#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/thread_pool.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "chunkyard/server/blob_store.hpp"
#include "chunkyard/server/cloud/cloud_broker.hpp"
#include "chunkyard/server/cloud/http_client.hpp"
#include "chunkyard/server/config.hpp"
#include "chunkyard/server/download_streamer.hpp"
#include "chunkyard/server/file_catalog.hpp"
#include "chunkyard/server/job_engine.hpp"
#include "chunkyard/server/records.hpp"
#include "chunkyard/server/registry.hpp"
#include "chunkyard/server/retention_manager.hpp"
#include "chunkyard/server/upload_manager.hpp"

namespace chunkyard::server
{

    class Session;

    class Server
    {
    public:
        explicit Server(ServerConfig config);
        ~Server();

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        LocalBlobStore store_;
        std::unique_ptr<Registry<UploadSession>> sessions_;
        std::unique_ptr<Registry<FileRecord>> file_records_;
        std::unique_ptr<Registry<TransformJob>> jobs_;

        FileCatalog files_;
        UploadManager uploads_;
        DownloadStreamer downloads_;
        cloud::CurlHttpClient http_;
        cloud::CloudBroker cloud_;
        JobEngine engine_;
        RetentionManager retention_;
        asio::thread_pool blocking_;

        std::vector<std::thread> workers_;
    };

} // namespace chunkyard::server
