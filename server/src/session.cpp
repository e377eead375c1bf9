#include "chunkyard/server/session.hpp"

#include <asio/post.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <exception>
#include <string>

#include <spdlog/spdlog.h>

#include "chunkyard/framing.hpp"
#include "chunkyard/server/service_error.hpp"
#include "session_common.hpp"

namespace chunkyard::server
{

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services)
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        endpoint_ = ec ? std::string("unknown") : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    Session::~Session()
    {
        spdlog::debug("Session for {} released", endpoint_);
    }

    void Session::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Session::stop()
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        download_.reset();
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Session::read_frame_header()
    {
        if (closed_)
        {
            return;
        }
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             std::uint32_t payload_size = 0;
                             try
                             {
                                 payload_size = chunkyard::protocol::checked_frame_length(header_buffer_,
                                                                                          services_.config.max_frame_bytes);
                             }
                             catch (const chunkyard::protocol::FrameTooLarge &ex)
                             {
                                 spdlog::warn("{} sent an oversized frame: {}", remote_endpoint(), ex.what());
                                 send_response(
                                     chunkyard::protocol::ResponseEnvelope{
                                         .kind = chunkyard::protocol::ResponseKind::Error,
                                         .error = chunkyard::ErrorCode::ValidationError,
                                         .message = ex.what(),
                                         .payload = {{"limit", ex.limit()}},
                                     },
                                     [this]()
                                     { stop(); });
                                 return;
                             }
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Session::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             const std::string payload(reinterpret_cast<const char *>(buffer_.data()), buffer_.size());
                             auto json = nlohmann::json::parse(payload, nullptr, false);
                             if (json.is_discarded())
                             {
                                 send_error(chunkyard::ErrorCode::InvalidCommand, "Frame is not valid JSON");
                             }
                             else
                             {
                                 process_message(json);
                             }
                             // A streaming download resumes reading once its last frame is queued.
                             if (!download_)
                             {
                                 read_frame_header();
                             }
                         });
    }

    void Session::process_message(const nlohmann::json &json)
    {
        chunkyard::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<chunkyard::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            std::optional<std::string> request_id;
            if (json.is_object() && json.contains("id") && json["id"].is_string())
            {
                request_id = json["id"].get<std::string>();
            }
            send_error(chunkyard::ErrorCode::InvalidCommand, ex.what(), request_id);
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), chunkyard::protocol::to_string(envelope.command));
        dispatch(envelope);
    }

    void Session::dispatch(const Envelope &envelope)
    {
        using chunkyard::protocol::Command;
        const auto &id = envelope.request_id;
        switch (envelope.command)
        {
        case Command::UploadInit:
            respond(id, [&]
                    { return handle_upload_init(envelope); });
            break;
        case Command::UploadChunk:
            respond(id, [&]
                    { return handle_upload_chunk(envelope); });
            break;
        case Command::UploadStatus:
            respond(id, [&]
                    { return handle_upload_status(envelope); });
            break;
        case Command::UploadComplete:
            respond_blocking(id, [this, envelope]
                             { return handle_upload_complete(envelope); });
            break;
        case Command::UploadCancel:
            respond(id, [&]
                    { return handle_upload_cancel(envelope); });
            break;
        case Command::Download:
            handle_download(envelope);
            break;
        case Command::DownloadInit:
            respond(id, [&]
                    { return handle_download_init(envelope); });
            break;
        case Command::CloudUpload:
            respond_blocking(id, [this, envelope]
                             { return handle_cloud_upload(envelope); });
            break;
        case Command::CloudDownload:
            respond_blocking(id, [this, envelope]
                             { return handle_cloud_download(envelope); });
            break;
        case Command::CloudCopy:
            respond_blocking(id, [this, envelope]
                             { return handle_cloud_copy(envelope); });
            break;
        case Command::CloudPresign:
            respond(id, [&]
                    { return handle_cloud_presign(envelope); });
            break;
        case Command::TransformSubmit:
            respond(id, [&]
                    { return handle_transform_submit(envelope); });
            break;
        case Command::TransformStatus:
            respond(id, [&]
                    { return handle_transform_status(envelope); });
            break;
        case Command::FileChecksum:
            respond_blocking(id, [this, envelope]
                             { return handle_file_checksum(envelope); });
            break;
        case Command::FileMetadata:
            respond_blocking(id, [this, envelope]
                             { return handle_file_metadata(envelope); });
            break;
        case Command::FileDelete:
            respond(id, [&]
                    { return handle_file_delete(envelope); });
            break;
        case Command::FileExtend:
            respond(id, [&]
                    { return handle_file_extend(envelope); });
            break;
        case Command::Health:
            respond(id, [&]
                    { return handle_health(envelope); });
            break;
        case Command::Ping:
            respond(id, []
                    { return nlohmann::json{{"pong", true}}; });
            break;
        default:
            send_error(chunkyard::ErrorCode::InvalidCommand, "Command not supported", id);
            break;
        }
    }

    bool Session::guard(const std::optional<std::string> &request_id, const std::function<void()> &action)
    {
        try
        {
            action();
            return true;
        }
        catch (const ServiceError &ex)
        {
            spdlog::debug("{} request failed with {}: {}", remote_endpoint(), chunkyard::to_string(ex.code()), ex.what());
            send_error(ex.code(), ex.what(), request_id, ex.details());
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(chunkyard::ErrorCode::ValidationError, ex.what(), request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Request from {} failed: {}", remote_endpoint(), ex.what());
            send_error(chunkyard::ErrorCode::InternalError, ex.what(), request_id);
        }
        return false;
    }

    void Session::respond(const std::optional<std::string> &request_id, const Handler &handler)
    {
        guard(request_id, [&]
              { send_response(session_common::make_ok_response(handler(), request_id)); });
    }

    void Session::respond_blocking(const std::optional<std::string> &request_id, Handler handler)
    {
        auto self = shared_from_this();
        asio::post(services_.blocking, [this, self, request_id, handler = std::move(handler)]()
                   {
            nlohmann::json result;
            std::exception_ptr failure;
            try
            {
                result = handler();
            }
            catch (...)
            {
                // Rethrown on the strand, where respond() maps it to an ERROR frame.
                failure = std::current_exception();
            }
            asio::post(socket_.get_executor(), [this, self, request_id, result = std::move(result), failure]() mutable
                       {
                if (closed_)
                {
                    return;
                }
                respond(request_id, [&]() -> nlohmann::json
                        {
                    if (failure)
                    {
                        std::rethrow_exception(failure);
                    }
                    return std::move(result); }); }); });
    }

    void Session::send_response(const chunkyard::protocol::ResponseEnvelope &envelope, std::function<void()> on_written)
    {
        if (closed_)
        {
            return;
        }
        const bool idle = write_queue_.empty();
        write_queue_.push_back(PendingWrite{
            .frame = chunkyard::protocol::encode_frame(nlohmann::json(envelope)),
            .on_written = std::move(on_written),
        });
        if (idle)
        {
            write_next();
        }
    }

    void Session::write_next()
    {
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(write_queue_.front().frame),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  write_queue_.clear();
                                  stop();
                                  return;
                              }
                              auto on_written = std::move(write_queue_.front().on_written);
                              write_queue_.pop_front();
                              if (!write_queue_.empty())
                              {
                                  write_next();
                              }
                              if (on_written)
                              {
                                  on_written();
                              }
                          });
    }

    void Session::send_error(chunkyard::ErrorCode code, std::string message, std::optional<std::string> request_id,
                             nlohmann::json details)
    {
        chunkyard::protocol::ResponseEnvelope envelope;
        envelope.kind = chunkyard::protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.payload = details.is_object() ? std::move(details) : nlohmann::json::object();
        envelope.request_id = std::move(request_id);
        send_response(envelope);
    }

    std::string Session::remote_endpoint() const
    {
        return endpoint_;
    }

} // namespace chunkyard::server
