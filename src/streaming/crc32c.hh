#pragma once

#include <cstddef> // std::byte
#include <cstdint>
#include <span>

namespace backup {
/**
 * @brief Compute the CRC-32C (Castagnoli) checksum of @p data.
 */
uint32_t
crc32c(std::span<const std::byte> data);

/**
 * @brief Mask a CRC-32C as the Snappy framing format requires.
 */
constexpr uint32_t
mask_crc32c(uint32_t crc)
{
    return ((crc >> 15) | (crc << 17)) + 0xa282ead8u;
}
} // namespace backup
