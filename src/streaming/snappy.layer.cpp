#include "snappy.layer.hh"
#include "crc32c.hh"
#include "macros.hh"

#include <snappy.h>

#include <algorithm>
#include <array>

namespace {
constexpr std::byte chunk_type_compressed{ 0x00 };
constexpr std::byte chunk_type_uncompressed{ 0x01 };

constexpr std::array<std::byte, 10> stream_identifier = {
    std::byte{ 0xff }, std::byte{ 0x06 }, std::byte{ 0x00 },
    std::byte{ 0x00 }, std::byte{ 's' },  std::byte{ 'N' },
    std::byte{ 'a' },  std::byte{ 'P' },  std::byte{ 'p' },
    std::byte{ 'Y' },
};

constexpr size_t chunk_header_size = 8; // type, 3-byte length, 4-byte CRC
} // namespace

backup::SnappyLayer::SnappyLayer(WriterLayer& next)
  : CodecLayer(next)
  , in_(max_chunk_size)
  , nbytes_buffered_{ 0 }
  , out_(chunk_header_size + snappy::MaxCompressedLength(max_chunk_size))
  , stream_identifier_written_{ false }
{
}

bool
backup::SnappyLayer::write(std::span<const std::byte> data)
{
    if (closed_) {
        LOG_ERROR("Cannot write to closed Snappy stream");
        return false;
    }

    while (!data.empty()) {
        const size_t n =
          std::min(data.size(), in_.size() - nbytes_buffered_);
        std::copy_n(data.begin(), n, in_.begin() + nbytes_buffered_);
        nbytes_buffered_ += n;
        data = data.subspan(n);

        if (nbytes_buffered_ == in_.size() && !write_chunk_()) {
            return false;
        }
    }

    return true;
}

bool
backup::SnappyLayer::flush()
{
    if (closed_) {
        LOG_ERROR("Cannot flush closed Snappy stream");
        return false;
    }

    return write_chunk_();
}

bool
backup::SnappyLayer::close()
{
    if (closed_) {
        return true;
    }

    const bool retval = write_chunk_();
    closed_ = true;

    return retval;
}

bool
backup::SnappyLayer::write_chunk_()
{
    if (nbytes_buffered_ == 0) {
        return true;
    }

    if (!stream_identifier_written_) {
        if (!write_next_(stream_identifier)) {
            return false;
        }
        stream_identifier_written_ = true;
    }

    const uint32_t crc = mask_crc32c(crc32c({ in_.data(), nbytes_buffered_ }));

    size_t nbytes_compressed = 0;
    snappy::RawCompress(reinterpret_cast<const char*>(in_.data()),
                        nbytes_buffered_,
                        reinterpret_cast<char*>(out_.data() + chunk_header_size),
                        &nbytes_compressed);

    // store the chunk if compression saves less than 12.5%
    std::byte chunk_type = chunk_type_compressed;
    size_t nbytes_payload = nbytes_compressed;
    if (nbytes_compressed >= nbytes_buffered_ - nbytes_buffered_ / 8) {
        chunk_type = chunk_type_uncompressed;
        nbytes_payload = nbytes_buffered_;
        std::copy_n(in_.begin(),
                    nbytes_buffered_,
                    out_.begin() + chunk_header_size);
    }

    // chunk length covers the CRC and the payload, little endian
    const size_t chunk_length = 4 + nbytes_payload;
    out_[0] = chunk_type;
    out_[1] = static_cast<std::byte>(chunk_length & 0xff);
    out_[2] = static_cast<std::byte>((chunk_length >> 8) & 0xff);
    out_[3] = static_cast<std::byte>((chunk_length >> 16) & 0xff);
    out_[4] = static_cast<std::byte>(crc & 0xff);
    out_[5] = static_cast<std::byte>((crc >> 8) & 0xff);
    out_[6] = static_cast<std::byte>((crc >> 16) & 0xff);
    out_[7] = static_cast<std::byte>((crc >> 24) & 0xff);

    nbytes_buffered_ = 0;

    return write_next_({ out_.data(), chunk_header_size + nbytes_payload });
}
