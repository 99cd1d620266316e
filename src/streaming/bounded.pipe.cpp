#include "bounded.pipe.hh"
#include "macros.hh"

#include <algorithm>

backup::BoundedPipe::BoundedPipe(size_t capacity)
  : buffer_(capacity)
  , head_{ 0 }
  , size_{ 0 }
  , write_closed_{ false }
  , read_closed_{ false }
{
    EXPECT(capacity > 0, "Pipe capacity must be positive");
}

bool
backup::BoundedPipe::write(std::span<const std::byte> data)
{
    const size_t capacity = buffer_.size();

    while (!data.empty()) {
        std::unique_lock lock(mutex_);
        cv_writable_.wait(lock, [this, capacity] {
            return read_closed_ || write_closed_ || size_ < capacity;
        });

        if (read_closed_ || write_closed_) {
            return false;
        }

        const size_t n = std::min(data.size(), capacity - size_);
        size_t tail = (head_ + size_) % capacity;

        // the free region may wrap around the end of the buffer
        const size_t first = std::min(n, capacity - tail);
        std::copy_n(data.begin(), first, buffer_.begin() + tail);
        std::copy_n(data.begin() + first, n - first, buffer_.begin());

        size_ += n;
        data = data.subspan(n);

        lock.unlock();
        cv_readable_.notify_one();
    }

    return true;
}

size_t
backup::BoundedPipe::read(std::span<std::byte> buf)
{
    if (buf.empty()) {
        return 0;
    }

    const size_t capacity = buffer_.size();

    std::unique_lock lock(mutex_);
    cv_readable_.wait(lock, [this] {
        return read_closed_ || write_closed_ || size_ > 0;
    });

    // an aborted writer discards whatever is still buffered
    if (read_closed_ || (write_closed_ && !error_.empty()) || size_ == 0) {
        return 0;
    }

    const size_t n = std::min(buf.size(), size_);
    const size_t first = std::min(n, capacity - head_);
    std::copy_n(buffer_.begin() + head_, first, buf.begin());
    std::copy_n(buffer_.begin(), n - first, buf.begin() + first);

    head_ = (head_ + n) % capacity;
    size_ -= n;

    lock.unlock();
    cv_writable_.notify_one();

    return n;
}

void
backup::BoundedPipe::close_write()
{
    {
        std::scoped_lock lock(mutex_);
        write_closed_ = true;
    }
    cv_readable_.notify_all();
    cv_writable_.notify_all();
}

void
backup::BoundedPipe::close_write(const std::string& error)
{
    {
        std::scoped_lock lock(mutex_);
        write_closed_ = true;
        if (error_.empty()) {
            error_ = error;
        }
    }
    cv_readable_.notify_all();
    cv_writable_.notify_all();
}

void
backup::BoundedPipe::close_read(const std::string& error)
{
    {
        std::scoped_lock lock(mutex_);
        read_closed_ = true;
        if (error_.empty()) {
            error_ = error;
        }
    }
    cv_readable_.notify_all();
    cv_writable_.notify_all();
}

std::string
backup::BoundedPipe::error() const
{
    std::scoped_lock lock(mutex_);
    return error_;
}
