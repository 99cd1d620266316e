#include "crc32c.hh"

#include <array>

namespace {
constexpr uint32_t castagnoli_polynomial = 0x82f63b78u; // reversed

constexpr std::array<uint32_t, 256>
make_crc32c_table()
{
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int k = 0; k < 8; ++k) {
            crc = (crc & 1) ? (crc >> 1) ^ castagnoli_polynomial : crc >> 1;
        }
        table[i] = crc;
    }
    return table;
}

constexpr auto crc32c_table = make_crc32c_table();
} // namespace

uint32_t
backup::crc32c(std::span<const std::byte> data)
{
    uint32_t crc = 0xffffffffu;
    for (const auto b : data) {
        crc = crc32c_table[(crc ^ static_cast<uint32_t>(b)) & 0xff] ^ (crc >> 8);
    }
    return crc ^ 0xffffffffu;
}
