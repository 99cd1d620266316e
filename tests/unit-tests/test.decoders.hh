#pragma once

#include "crc32c.hh"

#include <lz4frame.h>
#include <snappy.h>
#include <zlib.h>

#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace backup::test {
/// Decompress a complete gzip stream.
inline std::string
gunzip(const std::vector<std::byte>& compressed)
{
    z_stream z{};
    if (inflateInit2(&z, 15 + 16) != Z_OK) {
        throw std::runtime_error("inflateInit2 failed");
    }

    z.next_in = const_cast<Bytef*>(
      reinterpret_cast<const Bytef*>(compressed.data()));
    z.avail_in = static_cast<uInt>(compressed.size());

    std::string out;
    char buf[16384];
    int ret = Z_OK;
    do {
        z.next_out = reinterpret_cast<Bytef*>(buf);
        z.avail_out = sizeof(buf);
        ret = inflate(&z, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&z);
            throw std::runtime_error("inflate failed: " + std::to_string(ret));
        }
        out.append(buf, sizeof(buf) - z.avail_out);
    } while (ret != Z_STREAM_END);

    inflateEnd(&z);
    return out;
}

/// Decompress a complete LZ4 frame.
inline std::string
lz4_decompress(const std::vector<std::byte>& compressed)
{
    LZ4F_dctx* ctx = nullptr;
    if (LZ4F_isError(LZ4F_createDecompressionContext(&ctx, LZ4F_VERSION))) {
        throw std::runtime_error("LZ4F_createDecompressionContext failed");
    }

    std::string out;
    char buf[65536];
    const std::byte* src = compressed.data();
    size_t remaining = compressed.size();
    size_t hint = 1;

    while (remaining > 0 && hint != 0) {
        size_t dst_size = sizeof(buf);
        size_t src_size = remaining;
        hint = LZ4F_decompress(ctx, buf, &dst_size, src, &src_size, nullptr);
        if (LZ4F_isError(hint)) {
            LZ4F_freeDecompressionContext(ctx);
            throw std::runtime_error(std::string("LZ4F_decompress failed: ") +
                                     LZ4F_getErrorName(hint));
        }
        out.append(buf, dst_size);
        src += src_size;
        remaining -= src_size;
    }

    LZ4F_freeDecompressionContext(ctx);
    if (hint != 0) {
        throw std::runtime_error("Truncated LZ4 frame");
    }
    return out;
}

/// Decode a Snappy framing format stream, verifying each chunk's checksum.
inline std::string
snappy_frame_decompress(const std::vector<std::byte>& framed)
{
    const auto* p = reinterpret_cast<const unsigned char*>(framed.data());
    size_t remaining = framed.size();

    std::string out;
    bool seen_identifier = false;

    while (remaining > 0) {
        if (remaining < 4) {
            throw std::runtime_error("Truncated chunk header");
        }
        const unsigned char type = p[0];
        const size_t length = p[1] | (p[2] << 8) | (p[3] << 16);
        p += 4;
        remaining -= 4;
        if (remaining < length) {
            throw std::runtime_error("Truncated chunk");
        }

        if (type == 0xff) {
            if (length != 6 || std::memcmp(p, "sNaPpY", 6) != 0) {
                throw std::runtime_error("Bad stream identifier");
            }
            seen_identifier = true;
        } else if (type == 0x00 || type == 0x01) {
            if (!seen_identifier || length < 4) {
                throw std::runtime_error("Bad data chunk");
            }
            const uint32_t expected_crc =
              p[0] | (p[1] << 8) | (p[2] << 16) | (uint32_t(p[3]) << 24);

            std::string chunk;
            const char* payload = reinterpret_cast<const char*>(p + 4);
            if (type == 0x00) {
                if (!snappy::Uncompress(payload, length - 4, &chunk)) {
                    throw std::runtime_error("Bad compressed chunk");
                }
            } else {
                chunk.assign(payload, length - 4);
            }

            const uint32_t crc = mask_crc32c(
              crc32c({ reinterpret_cast<const std::byte*>(chunk.data()),
                       chunk.size() }));
            if (crc != expected_crc) {
                throw std::runtime_error("Chunk checksum mismatch");
            }
            out += chunk;
        } else {
            throw std::runtime_error("Unexpected chunk type " +
                                     std::to_string(type));
        }

        p += length;
        remaining -= length;
    }

    return out;
}
} // namespace backup::test
