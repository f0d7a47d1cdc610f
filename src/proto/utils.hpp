#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace peerwire::proto::utils {

enum class ByteOrder
{
    BigEndian,
    LittleEndian,
};

inline auto append_u32(std::vector<uint8_t>& out, uint32_t value) -> void
{
    out.push_back((value >> 24) & 0xFF);  // Most significant byte
    out.push_back((value >> 16) & 0xFF);
    out.push_back((value >> 8) & 0xFF);
    out.push_back(value & 0xFF);          // Least significant byte
}

inline auto append_u16(
  std::vector<uint8_t>& out, uint16_t value, ByteOrder order = ByteOrder::BigEndian
) -> void
{
    if (order == ByteOrder::BigEndian) {
        out.push_back((value >> 8) & 0xFF);
        out.push_back(value & 0xFF);
    }
    else {
        out.push_back(value & 0xFF);
        out.push_back((value >> 8) & 0xFF);
    }
}

inline auto pack_u32(uint32_t value) -> std::vector<uint8_t>
{
    std::vector<uint8_t> packed;
    packed.reserve(4);
    append_u32(packed, value);
    return packed;
}

/**
 * @brief Read big-endian u32 from the first 4 bytes. Caller checks the size.
 */
inline auto unpack_u32(std::span<const uint8_t> msg) -> uint32_t
{
    return (uint32_t)msg[0] << 24 | ((uint32_t)msg[1] << 16) |
           ((uint32_t)msg[2] << 8) | ((uint32_t)msg[3]);
}

inline auto unpack_u16(
  std::span<const uint8_t> msg, ByteOrder order = ByteOrder::BigEndian
) -> uint16_t
{
    if (order == ByteOrder::BigEndian) {
        return uint16_t((uint16_t)msg[0] << 8 | (uint16_t)msg[1]);
    }
    return uint16_t((uint16_t)msg[1] << 8 | (uint16_t)msg[0]);
}

}  // namespace peerwire::proto::utils
