#include "chunkyard/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/strand.hpp>

#include <algorithm>
#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "chunkyard/framing.hpp"
#include "chunkyard/server/session.hpp"

namespace chunkyard::server
{

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

        UploadConfig upload_config(const ServerConfig &config)
        {
            auto upload = config.upload;
            upload.max_chunk_size = chunkyard::protocol::max_chunk_bytes(config.max_frame_bytes);
            return upload;
        }

        std::size_t blocking_threads(std::size_t io_threads)
        {
            return std::max<std::size_t>(4, io_threads);
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          store_(config_.root / "blobs"),
          sessions_(make_registry<UploadSession>(config_.registry, config_.root / "registry" / "uploads")),
          file_records_(make_registry<FileRecord>(config_.registry, config_.root / "registry" / "files")),
          jobs_(make_registry<TransformJob>(config_.registry, config_.root / "registry" / "jobs")),
          files_(store_, *file_records_, config_.files),
          uploads_(store_, *sessions_, files_, upload_config(config_)),
          downloads_(files_, config_.download),
          http_(config_.cloud.connect_timeout),
          cloud_(files_, http_, config_.cloud),
          engine_(files_, *jobs_, config_.transform, config_.root / "work"),
          retention_(io_context_, uploads_, files_, engine_, config_.retention),
          blocking_(blocking_threads(resolve_worker_threads(config_.worker_threads)))
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with root {} ({} registry)", config_.address, config_.port,
                     config_.root.string(), to_string(config_.registry));

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
                                if (!ec)
                                {
                                    handle_signal();
                                }
                            });
    }

    Server::~Server()
    {
        blocking_.join();
        engine_.shutdown();
    }

    void Server::run()
    {
        accept_next();
        retention_.start();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
    }

    void Server::accept_next()
    {
        acceptor_.async_accept(asio::make_strand(io_context_),
                               [this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            ServerServices services{uploads_, files_, downloads_, cloud_, engine_, blocking_, config_};
            auto session = std::make_shared<Session>(std::move(socket), services);
            session->start();
            spdlog::debug("Accepted new connection");
        }
        if (!ec || ec == asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::handle_signal()
    {
        std::error_code ec;
        acceptor_.close(ec);
        retention_.stop();
        io_context_.stop();
        spdlog::info("Signal received, shutting down");
    }

} // namespace chunkyard::server
