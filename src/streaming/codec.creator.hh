#pragma once

#include "writer.layer.hh"
#include "backup.writer.types.h"

#include <cstdint>
#include <memory>

namespace backup {
/**
 * @brief Check that a codec and compression level are supported.
 * @throws UnsupportedCodecError if @p codec is unknown or @p level is out of
 * range for it.
 */
void
validate_codec(BackupCodec codec, uint8_t level);

/**
 * @brief Create the codec layer wrapping @p next.
 * @param codec The codec to use.
 * @param level The compression level. 0 selects the codec's default.
 * @param next The layer receiving encoded bytes.
 * @return The codec layer, or nullptr for BackupCodec_None.
 * @throws UnsupportedCodecError if the codec or level is not supported.
 * @throws ConstructionError if the encoder cannot be initialized.
 */
std::unique_ptr<CodecLayer>
make_codec_layer(BackupCodec codec, uint8_t level, WriterLayer& next);
} // namespace backup
