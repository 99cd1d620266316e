#pragma once

#include "writer.layer.hh"

#include <lz4frame.h>

#include <vector>

namespace backup {
/**
 * @brief A layer that compresses data written to it into the LZ4 frame
 * format.
 */
class Lz4Layer final : public CodecLayer
{
  public:
    /**
     * @param next The layer receiving compressed data.
     * @param level LZ4 compression level, 1 to 12, or 0 for the default.
     * Levels above 2 use LZ4 HC.
     * @throws ConstructionError if the compression context cannot be created.
     */
    Lz4Layer(WriterLayer& next, int level);
    ~Lz4Layer() noexcept override;

    std::string_view name() const noexcept override { return "lz4"; }

    bool write(std::span<const std::byte> data) override;

    /// @brief Emit the block buffered so far.
    bool flush() override;

    /// @brief Emit the last block and the frame end mark.
    bool close() override;

  private:
    static constexpr size_t chunk_size_ = 1 << 16;

    LZ4F_cctx* ctx_;
    LZ4F_preferences_t prefs_;
    bool header_written_;
    std::vector<std::byte> out_;

    /// @brief Write the frame header, once, before any block.
    [[nodiscard]] bool begin_frame_();

    /// @brief Check an LZ4F return value, forwarding @p out_ on success.
    [[nodiscard]] bool emit_(size_t ret, const char* what);
};
} // namespace backup
