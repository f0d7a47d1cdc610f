#pragma once

#include <cctype>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace peerwire::utils {

inline auto to_hex(std::span<const uint8_t> bytes) -> std::string
{
    return fmt::format("{:02x}", fmt::join(bytes, ""));
}

/**
 * @brief Parse hex digits. Spaces between bytes are allowed: "00 00 00 01 02".
 */
inline auto from_hex(std::string_view hex) -> std::optional<std::vector<uint8_t>>
{
    auto nibble = [](char c) -> int {
        if (c >= '0' and c <= '9') {
            return c - '0';
        }
        c = char(std::tolower(static_cast<unsigned char>(c)));
        if (c >= 'a' and c <= 'f') {
            return c - 'a' + 10;
        }
        return -1;
    };

    std::vector<uint8_t> bytes;
    std::optional<int> high;

    for (char c : hex) {
        if (c == ' ' and not high) {
            continue;
        }

        auto value = nibble(c);
        if (value < 0) {
            return std::nullopt;
        }

        if (high) {
            bytes.push_back(uint8_t(*high << 4 | value));
            high = std::nullopt;
        }
        else {
            high = value;
        }
    }

    if (high) {
        return std::nullopt;  // odd number of digits
    }

    return bytes;
}

}  // namespace peerwire::utils
