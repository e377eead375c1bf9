#include "chunkyard/framing.hpp"

#include <limits>
#include <string>

namespace chunkyard::protocol
{

    FrameTooLarge::FrameTooLarge(std::size_t payload_size, std::size_t limit)
        : std::length_error("Frame of " + std::to_string(payload_size) + " bytes exceeds the " + std::to_string(limit) +
                            " byte limit"),
          payload_size_(payload_size),
          limit_(limit)
    {
    }

    std::uint32_t read_frame_length(std::span<const std::uint8_t, kFrameHeaderSize> header) noexcept
    {
        std::uint32_t length = 0;
        for (const auto byte : header)
        {
            length = (length << 8) | byte;
        }
        return length;
    }

    std::uint32_t checked_frame_length(std::span<const std::uint8_t, kFrameHeaderSize> header, std::size_t max_payload)
    {
        const auto length = read_frame_length(header);
        if (length > max_payload)
        {
            throw FrameTooLarge(length, max_payload);
        }
        return length;
    }

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message)
    {
        const auto text = message.dump();
        if (text.size() > std::numeric_limits<std::uint32_t>::max())
        {
            throw FrameTooLarge(text.size(), std::numeric_limits<std::uint32_t>::max());
        }
        const auto length = static_cast<std::uint32_t>(text.size());

        std::vector<std::uint8_t> frame;
        frame.reserve(kFrameHeaderSize + text.size());
        for (int shift = 24; shift >= 0; shift -= 8)
        {
            frame.push_back(static_cast<std::uint8_t>(length >> shift));
        }
        frame.insert(frame.end(), text.begin(), text.end());
        return frame;
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer, std::size_t max_payload)
    {
        if (buffer.size() < kFrameHeaderSize)
        {
            return std::nullopt;
        }
        const std::size_t payload_size = checked_frame_length(buffer.first<kFrameHeaderSize>(), max_payload);
        if (buffer.size() - kFrameHeaderSize < payload_size)
        {
            return std::nullopt;
        }
        const auto body = buffer.subspan(kFrameHeaderSize, payload_size);
        return DecodedFrame{
            .message = nlohmann::json::parse(body.begin(), body.end()),
            .bytes_consumed = kFrameHeaderSize + payload_size,
        };
    }

    std::uint64_t max_chunk_bytes(std::size_t max_frame_bytes) noexcept
    {
        if (max_frame_bytes <= kChunkEnvelopeReserve)
        {
            return 0;
        }
        // Base64 turns every 3 raw bytes into 4 characters.
        return static_cast<std::uint64_t>((max_frame_bytes - kChunkEnvelopeReserve) / 4) * 3;
    }

} // namespace chunkyard::protocol
