#pragma once

#include "writer.layer.hh"

#include <vector>

namespace backup {
/**
 * @brief A layer that compresses data written to it into the Snappy framing
 * format.
 * @details Data is buffered into chunks of at most 64 KiB, each compressed
 * independently and checksummed. Chunks that do not compress are stored.
 */
class SnappyLayer final : public CodecLayer
{
  public:
    explicit SnappyLayer(WriterLayer& next);

    std::string_view name() const noexcept override { return "snappy"; }

    bool write(std::span<const std::byte> data) override;

    /// @brief Emit the buffered chunk, if any.
    bool flush() override;

    /// @brief Emit the buffered chunk. The format has no trailer.
    bool close() override;

    static constexpr size_t max_chunk_size = 1 << 16;

  private:
    std::vector<std::byte> in_;
    size_t nbytes_buffered_;
    std::vector<std::byte> out_;
    bool stream_identifier_written_;

    /// @brief Compress and write the buffered chunk.
    [[nodiscard]] bool write_chunk_();
};
} // namespace backup
