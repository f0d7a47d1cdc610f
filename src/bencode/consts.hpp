#pragma once

#include <cstddef>

namespace peerwire::bencode {

constexpr const char END_SYMBOL = 'e';
constexpr const char LIST_START_SYMBOL = 'l';
constexpr const char DICT_START_SYMBOL = 'd';
constexpr const char INTEGER_START_SYMBOL = 'i';
constexpr const char STRING_DELIMITER_SYMBOL = ':';

/// Peer supplied documents may not nest deeper than this
constexpr const std::size_t MAX_NESTING_DEPTH = 64;

}  // namespace peerwire::bencode
