#include "lz4.layer.hh"
#include "backup.errors.hh"
#include "macros.hh"

#include <algorithm>
#include <cstring>

backup::Lz4Layer::Lz4Layer(WriterLayer& next, int level)
  : CodecLayer(next)
  , ctx_{ nullptr }
  , header_written_{ false }
{
    std::memset(&prefs_, 0, sizeof(prefs_));
    prefs_.compressionLevel = level;
    prefs_.frameInfo.blockSizeID = LZ4F_max64KB;
    prefs_.frameInfo.contentChecksumFlag = LZ4F_contentChecksumEnabled;

    const size_t ret = LZ4F_createCompressionContext(&ctx_, LZ4F_VERSION);
    if (LZ4F_isError(ret)) {
        const std::string err =
          LOG_ERROR("Failed to create LZ4 compression context: ",
                    LZ4F_getErrorName(ret));
        throw ConstructionError(err);
    }

    out_.resize(std::max<size_t>(LZ4F_compressBound(chunk_size_, &prefs_),
                                 LZ4F_HEADER_SIZE_MAX));
}

backup::Lz4Layer::~Lz4Layer() noexcept
{
    if (ctx_ != nullptr) {
        LZ4F_freeCompressionContext(ctx_);
    }
}

bool
backup::Lz4Layer::write(std::span<const std::byte> data)
{
    if (closed_) {
        LOG_ERROR("Cannot write to closed LZ4 stream");
        return false;
    }

    if (data.empty()) {
        return true;
    }

    if (!begin_frame_()) {
        return false;
    }

    while (!data.empty()) {
        const size_t n = std::min(data.size(), chunk_size_);
        const size_t ret = LZ4F_compressUpdate(
          ctx_, out_.data(), out_.size(), data.data(), n, nullptr);
        if (!emit_(ret, "compress")) {
            return false;
        }

        data = data.subspan(n);
    }

    return true;
}

bool
backup::Lz4Layer::flush()
{
    if (closed_) {
        LOG_ERROR("Cannot flush closed LZ4 stream");
        return false;
    }

    if (!header_written_) {
        return true; // nothing buffered
    }

    const size_t ret = LZ4F_flush(ctx_, out_.data(), out_.size(), nullptr);
    return emit_(ret, "flush");
}

bool
backup::Lz4Layer::close()
{
    if (closed_) {
        return true;
    }
    closed_ = true;

    // an empty stream is still a valid, empty frame
    if (!begin_frame_()) {
        return false;
    }

    const size_t ret =
      LZ4F_compressEnd(ctx_, out_.data(), out_.size(), nullptr);
    return emit_(ret, "end frame");
}

bool
backup::Lz4Layer::begin_frame_()
{
    if (header_written_) {
        return true;
    }

    const size_t ret =
      LZ4F_compressBegin(ctx_, out_.data(), out_.size(), &prefs_);
    if (!emit_(ret, "begin frame")) {
        return false;
    }

    header_written_ = true;
    return true;
}

bool
backup::Lz4Layer::emit_(size_t ret, const char* what)
{
    if (LZ4F_isError(ret)) {
        LOG_ERROR("LZ4 encoder failed to ", what, ": ", LZ4F_getErrorName(ret));
        return false;
    }

    return write_next_({ out_.data(), ret });
}
