#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "bencode/types.hpp"

namespace peerwire::bencode {

/**
 * @brief Decode a complete bencoded document. Trailing data is an error.
 */
auto decode(std::string_view encoded) -> std::optional<Json>;

/**
 * @brief Decode the value at the start of the input, the rest is left alone
 */
auto decode_prefix(std::string_view encoded) -> std::optional<DecodedValue>;

namespace internal {

auto detect_value_type(std::string_view encoded) -> EncodedValueType;

// Each decoder consumes its value from the front of `remaining`. On failure
// `remaining` is left in an unspecified position.
auto decode_value(std::string_view& remaining, std::size_t depth)
  -> std::optional<Json>;
auto decode_string(std::string_view& remaining) -> std::optional<Json>;
auto decode_integer(std::string_view& remaining) -> std::optional<Json>;
auto decode_list(std::string_view& remaining, std::size_t depth)
  -> std::optional<Json>;
auto decode_dict(std::string_view& remaining, std::size_t depth)
  -> std::optional<Json>;

}  // namespace internal

}  // namespace peerwire::bencode
