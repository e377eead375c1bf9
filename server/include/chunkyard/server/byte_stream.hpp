#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chunkyard::server
{

    // Forward-only byte producer. read() returns 0 once the stream is exhausted.
    class ByteSource
    {
    public:
        virtual ~ByteSource() = default;

        virtual std::size_t read(std::span<std::byte> buffer) = 0;
    };

    class ByteSink
    {
    public:
        virtual ~ByteSink() = default;

        virtual void write(std::span<const std::byte> data) = 0;
    };

    class MemorySource : public ByteSource
    {
    public:
        explicit MemorySource(std::string data) : data_(std::move(data)) {}

        std::size_t read(std::span<std::byte> buffer) override;

    private:
        std::string data_;
        std::size_t position_{0};
    };

    class MemorySink : public ByteSink
    {
    public:
        void write(std::span<const std::byte> data) override;

        const std::string &data() const noexcept { return data_; }
        std::string take() { return std::move(data_); }

    private:
        std::string data_;
    };

    inline std::span<const std::byte> as_byte_span(std::string_view text) noexcept
    {
        return std::as_bytes(std::span<const char>(text.data(), text.size()));
    }

    // Reads until buffer is full or the source is exhausted.
    std::size_t read_full(ByteSource &source, std::span<std::byte> buffer);

    // Pumps source into sink until the source is exhausted; returns bytes moved.
    std::uint64_t copy_stream(ByteSource &source, ByteSink &sink, std::size_t buffer_size = 256 * 1024);

} // namespace chunkyard::server
