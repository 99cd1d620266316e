#include "codec.creator.hh"
#include "backup.common.hh"
#include "backup.errors.hh"
#include "gzip.layer.hh"
#include "lz4.layer.hh"
#include "snappy.layer.hh"
#include "macros.hh"

#include <string>

namespace {
constexpr uint8_t max_gzip_level = 9;
constexpr uint8_t max_lz4_level = 12;

[[noreturn]] void
throw_unsupported(const std::string& msg)
{
    const std::string err = LOG_ERROR(msg);
    throw backup::UnsupportedCodecError(err);
}
} // namespace

void
backup::validate_codec(BackupCodec codec, uint8_t level)
{
    switch (codec) {
        case BackupCodec_None:
        case BackupCodec_Snappy:
            break;
        case BackupCodec_Gzip:
            if (level > max_gzip_level) {
                throw_unsupported("Invalid gzip compression level: " +
                                  std::to_string(level) +
                                  ". Must be between 0 and 9");
            }
            break;
        case BackupCodec_Lz4:
            if (level > max_lz4_level) {
                throw_unsupported("Invalid LZ4 compression level: " +
                                  std::to_string(level) +
                                  ". Must be between 0 and 12");
            }
            break;
        default:
            throw_unsupported("Unsupported compression codec: " +
                              std::to_string(static_cast<int>(codec)));
    }
}

std::unique_ptr<backup::CodecLayer>
backup::make_codec_layer(BackupCodec codec, uint8_t level, WriterLayer& next)
{
    validate_codec(codec, level);

    LOG_DEBUG("Wrapping ", next.name(), " with ", codec_name(codec), " codec");

    switch (codec) {
        case BackupCodec_Gzip:
            return std::make_unique<GzipLayer>(next, level);
        case BackupCodec_Lz4:
            return std::make_unique<Lz4Layer>(next, level);
        case BackupCodec_Snappy:
            return std::make_unique<SnappyLayer>(next);
        default:
            return nullptr;
    }
}
