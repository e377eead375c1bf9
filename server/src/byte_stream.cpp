#include "chunkyard/server/byte_stream.hpp"

#include <algorithm>
#include <cstring>

namespace chunkyard::server
{

    std::size_t MemorySource::read(std::span<std::byte> buffer)
    {
        const auto count = std::min(buffer.size(), data_.size() - position_);
        std::memcpy(buffer.data(), data_.data() + position_, count);
        position_ += count;
        return count;
    }

    void MemorySink::write(std::span<const std::byte> data)
    {
        data_.append(reinterpret_cast<const char *>(data.data()), data.size());
    }

    std::size_t read_full(ByteSource &source, std::span<std::byte> buffer)
    {
        std::size_t filled = 0;
        while (filled < buffer.size())
        {
            const auto count = source.read(buffer.subspan(filled));
            if (count == 0)
            {
                break;
            }
            filled += count;
        }
        return filled;
    }

    std::uint64_t copy_stream(ByteSource &source, ByteSink &sink, std::size_t buffer_size)
    {
        std::vector<std::byte> buffer(buffer_size);
        std::uint64_t total = 0;
        while (true)
        {
            const auto count = source.read(buffer);
            if (count == 0)
            {
                break;
            }
            sink.write(std::span<const std::byte>(buffer.data(), count));
            total += count;
        }
        return total;
    }

} // namespace chunkyard::server
