#pragma once

#include "backup.writer.types.h"

#include <string>
#include <string_view>

namespace backup {
/**
 * @brief Trim whitespace from a string.
 * @param s The string to trim.
 * @return The string with leading and trailing whitespace removed.
 */
[[nodiscard]]
std::string
trim(std::string_view s);

/**
 * @brief Remove a leading "file://" from a path, if present.
 */
std::string_view
strip_file_scheme(std::string_view path);

/**
 * @brief Get a printable name for a codec.
 * @param codec The codec.
 * @return The codec name, or "unknown" if @p codec is not recognized.
 */
const char*
codec_name(BackupCodec codec);
} // namespace backup
