#pragma once

#include <optional>
#include <string>

#include "bencode/types.hpp"

namespace peerwire::bencode {

/**
 * @brief Canonical bencoding of a json value, nullopt for values bencode has
 *        no form for (floats, booleans, null)
 */
auto encode(const Json&) -> std::optional<std::string>;

namespace internal {

auto encode_integer(const Json&) -> std::string;
auto encode_string(const Json&) -> std::string;
auto encode_binary(const Json&) -> std::string;
auto encode_dict(const Json&) -> std::optional<std::string>;
auto encode_list(const Json&) -> std::optional<std::string>;

}  // namespace internal

}  // namespace peerwire::bencode
