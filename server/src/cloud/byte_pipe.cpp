#include "chunkyard/server/cloud/byte_pipe.hpp"

#include <algorithm>
#include <cstring>

namespace chunkyard::server::cloud
{

    BoundedPipe::BoundedPipe(std::size_t capacity) : buffer_(std::max<std::size_t>(capacity, 1))
    {
    }

    void BoundedPipe::write(std::span<const std::byte> data)
    {
        std::unique_lock lock(mutex_);
        while (!data.empty())
        {
            writable_.wait(lock, [this]()
                           { return size_ < buffer_.size() || read_closed_ || !abort_reason_.empty(); });
            if (!abort_reason_.empty())
            {
                throw std::runtime_error("Pipe aborted: " + abort_reason_);
            }
            if (read_closed_)
            {
                throw PipeClosed("Pipe reader closed");
            }
            const auto capacity = buffer_.size();
            const auto tail = (head_ + size_) % capacity;
            const auto count = std::min({data.size(), capacity - size_, capacity - tail});
            std::memcpy(buffer_.data() + tail, data.data(), count);
            size_ += count;
            data = data.subspan(count);
            readable_.notify_one();
        }
    }

    std::size_t BoundedPipe::read(std::span<std::byte> buffer)
    {
        if (buffer.empty())
        {
            return 0;
        }
        std::unique_lock lock(mutex_);
        readable_.wait(lock, [this]()
                       { return size_ > 0 || closed_ || !abort_reason_.empty(); });
        if (!abort_reason_.empty())
        {
            throw std::runtime_error("Pipe aborted: " + abort_reason_);
        }
        if (size_ == 0)
        {
            return 0;
        }
        const auto capacity = buffer_.size();
        const auto count = std::min({buffer.size(), size_, capacity - head_});
        std::memcpy(buffer.data(), buffer_.data() + head_, count);
        head_ = (head_ + count) % capacity;
        size_ -= count;
        writable_.notify_one();
        return count;
    }

    void BoundedPipe::close()
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
        readable_.notify_all();
    }

    void BoundedPipe::abort(std::string reason)
    {
        std::lock_guard lock(mutex_);
        if (abort_reason_.empty())
        {
            abort_reason_ = reason.empty() ? std::string("aborted") : std::move(reason);
        }
        readable_.notify_all();
        writable_.notify_all();
    }

    void BoundedPipe::close_read()
    {
        std::lock_guard lock(mutex_);
        read_closed_ = true;
        writable_.notify_all();
    }

} // namespace chunkyard::server::cloud
