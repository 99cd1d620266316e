#pragma once

#include <condition_variable>
#include <cstddef> // size_t, std::byte
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace backup {
/**
 * @brief A fixed-capacity byte channel between one producer and one consumer.
 * @details Writers block while the buffer is full and readers block while it
 * is empty. Either end may be closed with an error, which wakes the other end.
 */
class BoundedPipe
{
  public:
    static constexpr size_t default_capacity = 1 << 20;

    explicit BoundedPipe(size_t capacity = default_capacity);

    /**
     * @brief Write all of @p data to the pipe, blocking while it is full.
     * @param data The bytes to write.
     * @return True if every byte was written, false if either end was closed
     * before that happened. See error().
     */
    [[nodiscard]] bool write(std::span<const std::byte> data);

    /**
     * @brief Read up to @p buf.size() bytes, blocking until at least one byte
     * is available or the write end is closed.
     * @param buf The buffer to fill.
     * @return The number of bytes read. 0 means end of stream, or that the
     * write end was closed with an error. See error().
     */
    size_t read(std::span<std::byte> buf);

    /// @brief Signal end of stream to the reader.
    void close_write();

    /// @brief Close the write end, failing the reader with @p error.
    void close_write(const std::string& error);

    /// @brief Close the read end, failing any writer with @p error.
    void close_read(const std::string& error);

    /// @brief The error an end was closed with, or empty.
    std::string error() const;

    size_t capacity() const noexcept { return buffer_.size(); }

  private:
    std::vector<std::byte> buffer_;
    size_t head_; // next byte to read
    size_t size_; // bytes buffered

    bool write_closed_;
    bool read_closed_;
    std::string error_;

    mutable std::mutex mutex_;
    std::condition_variable cv_readable_;
    std::condition_variable cv_writable_;
};
} // namespace backup
