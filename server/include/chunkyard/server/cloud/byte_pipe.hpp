#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "chunkyard/server/byte_stream.hpp"

namespace chunkyard::server::cloud
{

    // Thrown on the writing side once the reader has stopped consuming.
    class PipeClosed : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Single-producer single-consumer pipe with a fixed capacity; writers block while it is full.
    class BoundedPipe : public ByteSink, public ByteSource
    {
    public:
        explicit BoundedPipe(std::size_t capacity);

        void write(std::span<const std::byte> data) override;
        std::size_t read(std::span<std::byte> buffer) override;

        // Writer side: no more data, read() drains the buffer then returns 0.
        void close();

        // Either side: wakes the other one, which then throws with reason.
        void abort(std::string reason);

        // Reader side: further writes throw PipeClosed.
        void close_read();

    private:
        std::mutex mutex_;
        std::condition_variable readable_;
        std::condition_variable writable_;
        std::vector<std::byte> buffer_;
        std::size_t head_{0};
        std::size_t size_{0};
        bool closed_{false};
        bool read_closed_{false};
        std::string abort_reason_;
    };

} // namespace chunkyard::server::cloud
