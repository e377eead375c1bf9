/**
 * Chunkyard - Length-prefixed JSON frames with a per-connection size ceiling.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

namespace chunkyard::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);
    inline constexpr std::size_t kDefaultMaxFrameBytes = 64 * 1024 * 1024;

    // Room left in an UPLOAD_CHUNK frame for the envelope around the base64 data.
    inline constexpr std::size_t kChunkEnvelopeReserve = 4096;

    // A peer announced a payload above the ceiling. The stream cannot be resynchronized after this.
    class FrameTooLarge : public std::length_error
    {
    public:
        FrameTooLarge(std::size_t payload_size, std::size_t limit);

        std::size_t payload_size() const noexcept { return payload_size_; }
        std::size_t limit() const noexcept { return limit_; }

    private:
        std::size_t payload_size_;
        std::size_t limit_;
    };

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    // nullopt until a whole frame is buffered. Throws FrameTooLarge as soon as the header is seen,
    // and nlohmann::json::parse_error for a body that is not JSON.
    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer,
                                                 std::size_t max_payload = kDefaultMaxFrameBytes);

    // Payload length announced by a header; throws FrameTooLarge above max_payload.
    std::uint32_t checked_frame_length(std::span<const std::uint8_t, kFrameHeaderSize> header, std::size_t max_payload);

    std::uint32_t read_frame_length(std::span<const std::uint8_t, kFrameHeaderSize> header) noexcept;

    // Largest raw chunk whose base64 form still fits an UPLOAD_CHUNK frame; 0 when none does.
    std::uint64_t max_chunk_bytes(std::size_t max_frame_bytes) noexcept;

} // namespace chunkyard::protocol
