#include "gzip.layer.hh"
#include "backup.errors.hh"
#include "macros.hh"

#include <algorithm>
#include <limits>

namespace {
constexpr size_t output_buffer_size = 16384;
} // namespace

backup::GzipLayer::GzipLayer(WriterLayer& next, int level)
  : CodecLayer(next)
  , z_{}
  , stream_ended_{ false }
  , out_(output_buffer_size)
{
    if (level == 0) {
        level = Z_DEFAULT_COMPRESSION;
    }

    // 16 selects the gzip wrapper
    const int ret =
      deflateInit2(&z_, level, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        const std::string err = LOG_ERROR(
          "Failed to initialize gzip encoder: ", z_.msg ? z_.msg : zError(ret));
        throw ConstructionError(err);
    }
}

backup::GzipLayer::~GzipLayer() noexcept
{
    deflateEnd(&z_);
}

bool
backup::GzipLayer::write(std::span<const std::byte> data)
{
    if (closed_) {
        LOG_ERROR("Cannot write to closed gzip stream");
        return false;
    }

    constexpr size_t max_chunk = std::numeric_limits<uInt>::max();

    while (!data.empty()) {
        const size_t n = std::min(data.size(), max_chunk);

        z_.next_in =
          const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data.data()));
        z_.avail_in = static_cast<uInt>(n);

        if (!deflate_(Z_NO_FLUSH)) {
            return false;
        }

        data = data.subspan(n);
    }

    return true;
}

bool
backup::GzipLayer::flush()
{
    if (closed_) {
        LOG_ERROR("Cannot flush closed gzip stream");
        return false;
    }

    return deflate_(Z_SYNC_FLUSH);
}

bool
backup::GzipLayer::close()
{
    if (closed_) {
        return true;
    }

    z_.next_in = nullptr;
    z_.avail_in = 0;
    const bool retval = deflate_(Z_FINISH);
    closed_ = true;

    return retval;
}

bool
backup::GzipLayer::deflate_(int flush_mode)
{
    do {
        z_.next_out = reinterpret_cast<Bytef*>(out_.data());
        z_.avail_out = static_cast<uInt>(out_.size());

        const int ret = deflate(&z_, flush_mode);
        if (ret == Z_STREAM_ERROR) {
            LOG_ERROR("gzip encoder failed: ", z_.msg ? z_.msg : zError(ret));
            return false;
        }
        stream_ended_ = ret == Z_STREAM_END;

        const size_t nbytes_out = out_.size() - z_.avail_out;
        if (!write_next_({ out_.data(), nbytes_out })) {
            return false;
        }
    } while (z_.avail_out == 0);

    if (flush_mode == Z_FINISH && !stream_ended_) {
        LOG_ERROR("gzip encoder did not reach the end of the stream");
        return false;
    }

    return true;
}
