#include "chunkyard/server/session.hpp"

#include <asio/post.hpp>

#include <algorithm>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chunkyard/encoding/base64.hpp"
#include "chunkyard/server/byte_stream.hpp"
#include "session_common.hpp"

namespace chunkyard::server
{

    void Session::handle_download(const Envelope &envelope)
    {
        const bool started = guard(envelope.request_id, [&]
                                   {
            const auto request = session_common::parse_payload<chunkyard::protocol::DownloadRequest>(envelope.payload);
            auto start = request.range_start;
            auto end = request.range_end;
            if (!start && !end && request.range)
            {
                const auto file = services_.files.require(request.file_id);
                const auto parsed = parse_range_header(*request.range, file.size);
                start = parsed.start;
                end = parsed.end;
            }
            download_ = ActiveDownload{
                .stream = services_.downloads.stream_range(request.file_id, start, end),
                .sent = 0,
                .request_id = envelope.request_id,
            };
            spdlog::info("{} downloading {} ({})", remote_endpoint(), download_->stream.file.file_id,
                         download_->stream.content_range()); });
        if (started)
        {
            // Deferred so the frame handler has returned before the stream can finish and resume reads.
            auto self = shared_from_this();
            asio::post(socket_.get_executor(), [this, self]()
                       { pump_download(); });
        }
    }

    // Sends one CONTINUE frame and schedules the next only after it has been written,
    // so at most one frame of the file is buffered per connection.
    void Session::pump_download()
    {
        if (closed_ || !download_)
        {
            return;
        }
        auto &active = *download_;
        const auto remaining = active.stream.length - active.sent;
        if (remaining == 0)
        {
            finish_download();
            return;
        }

        const auto request_id = active.request_id;
        const bool sent = guard(request_id, [&]
                                {
            const auto frame_size = static_cast<std::size_t>(
                std::min<std::uint64_t>(remaining, services_.config.download.frame_bytes));
            std::vector<std::byte> buffer(frame_size);
            const auto count = read_full(*active.stream.body, buffer);
            if (count == 0)
            {
                throw std::runtime_error("Stored blob ended " + std::to_string(remaining) + " bytes early");
            }
            const chunkyard::protocol::DownloadChunkFrame frame{
                .offset = active.stream.start + active.sent,
                .bytes = count,
                .data_base64 = chunkyard::encoding::encode_base64(std::span<const std::byte>(buffer.data(), count)),
            };
            active.sent += count;
            auto self = shared_from_this();
            send_response(session_common::make_continue_response(frame, request_id), [this, self]()
                          { pump_download(); }); });
        if (!sent)
        {
            spdlog::warn("Download for {} aborted after {} bytes", remote_endpoint(), active.sent);
            download_.reset();
            read_frame_header();
        }
    }

    void Session::finish_download()
    {
        const auto &stream = download_->stream;
        nlohmann::json payload{
            {"file_id", stream.file.file_id},
            {"status", std::string(to_string(stream.status))},
            {"content_range", stream.content_range()},
            {"total_size", stream.file.size},
            {"bytes_sent", download_->sent},
            {"accept_ranges", "bytes"},
            {"filename", stream.file.filename},
            {"mime_type", stream.file.mime_type},
        };
        const auto request_id = download_->request_id;
        download_.reset();
        send_response(session_common::make_ok_response(std::move(payload), request_id));
        read_frame_header();
    }

    nlohmann::json Session::handle_download_init(const Envelope &envelope)
    {
        const auto request = session_common::parse_payload<chunkyard::protocol::DownloadInitRequest>(envelope.payload);
        return services_.downloads.plan_chunked_download(request.file_id, request.chunk_size);
    }

} // namespace chunkyard::server
