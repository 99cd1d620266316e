#pragma once

#include "writer.layer.hh"

#include <zlib.h>

#include <vector>

namespace backup {
/**
 * @brief A layer that compresses data written to it using zlib, forwarding
 * compressed data in the "gzip" format.
 */
class GzipLayer final : public CodecLayer
{
  public:
    /**
     * @param next The layer receiving compressed data.
     * @param level zlib compression level, 1 to 9, or 0 for the default.
     * @throws ConstructionError if zlib cannot be initialized.
     */
    GzipLayer(WriterLayer& next, int level);
    ~GzipLayer() noexcept override;

    std::string_view name() const noexcept override { return "gzip"; }

    bool write(std::span<const std::byte> data) override;

    /// @brief Emit everything compressed so far, ending on a byte boundary.
    bool flush() override;

    /// @brief Finish the stream and write the gzip trailer.
    bool close() override;

  private:
    z_stream z_;
    bool stream_ended_;
    std::vector<std::byte> out_;

    /// @brief Run deflate until the output buffer stops filling up.
    [[nodiscard]] bool deflate_(int flush_mode);
};
} // namespace backup
