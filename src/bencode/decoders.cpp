#include "bencode/decoders.hpp"

#include <cctype>  // isdigit
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "bencode/consts.hpp"
#include "bencode/tools.hpp"
#include "bencode/types.hpp"

namespace peerwire::bencode {

auto decode(std::string_view encoded) -> std::optional<Json>
{
    auto decoded = decode_prefix(encoded);
    if (not decoded) {
        return std::nullopt;
    }

    auto [value, consumed] = *decoded;
    if (consumed != encoded.length()) {
        return std::nullopt;
    }

    return value;
}

auto decode_prefix(std::string_view encoded) -> std::optional<DecodedValue>
{
    std::string_view remaining{encoded};

    auto value = internal::decode_value(remaining, 0);
    if (not value) {
        return std::nullopt;
    }

    return DecodedValue{*value, encoded.length() - remaining.length()};
}

namespace internal {

namespace {

/**
 * @brief "5:hello" -> "hello", without interpreting the content
 */
auto take_string(std::string_view& remaining) -> std::optional<std::string_view>
{
    auto delimiter_index = remaining.find(STRING_DELIMITER_SYMBOL);
    if (delimiter_index == std::string_view::npos) {
        return std::nullopt;
    }

    auto len = to_integer(remaining.substr(0, delimiter_index));
    if (not len or *len < 0) {
        return std::nullopt;
    }

    remaining.remove_prefix(delimiter_index + 1);

    if (std::size_t(*len) > remaining.length()) {
        return std::nullopt;
    }

    auto content = remaining.substr(0, std::size_t(*len));
    remaining.remove_prefix(content.length());

    return content;
}

}  // namespace

auto detect_value_type(std::string_view encoded) -> EncodedValueType
{
    if (encoded.empty()) {
        return EncodedValueType::Unknown;
    }
    if (encoded.starts_with(INTEGER_START_SYMBOL)) {
        return EncodedValueType::Integer;
    }
    if (std::isdigit(static_cast<unsigned char>(encoded.front()))) {
        return EncodedValueType::String;
    }
    if (encoded.starts_with(LIST_START_SYMBOL)) {
        return EncodedValueType::List;
    }
    if (encoded.starts_with(DICT_START_SYMBOL)) {
        return EncodedValueType::Dictionary;
    }
    return EncodedValueType::Unknown;
}

auto decode_value(std::string_view& remaining, std::size_t depth)
  -> std::optional<Json>
{
    if (depth > MAX_NESTING_DEPTH) {
        return std::nullopt;
    }

    switch (detect_value_type(remaining)) {
        case EncodedValueType::String:
            return decode_string(remaining);

        case EncodedValueType::Integer:
            return decode_integer(remaining);

        case EncodedValueType::List:
            return decode_list(remaining, depth + 1);

        case EncodedValueType::Dictionary:
            return decode_dict(remaining, depth + 1);

        default:
            return std::nullopt;
    }
}

/**
 * @brief Decode bencoded string into json string, or json binary when the
 *        content is not valid UTF-8
 *
 * "5:hello" -> "hello"
 * "3:\1\2\xff" -> b"\1\2\xff"
 */
auto decode_string(std::string_view& remaining) -> std::optional<Json>
{
    auto content = take_string(remaining);
    if (not content) {
        return std::nullopt;
    }

    Json text(std::string(*content));

    try {
        // Throws on invalid UTF-8
        text.dump(-1, ' ', /*ensure_ascii=*/true);
        return text;
    } catch (const Json::type_error&) {
        return Json::binary(
          std::vector<std::uint8_t>(content->begin(), content->end())
        );
    }
}

/**
 * @brief "i-123e" -> -123
 */
auto decode_integer(std::string_view& remaining) -> std::optional<Json>
{
    auto end_index = remaining.find(END_SYMBOL);
    if (end_index == std::string_view::npos) {
        return std::nullopt;
    }

    auto decoded_int = to_integer(remaining.substr(1, end_index - 1));
    if (not decoded_int) {
        return std::nullopt;
    }

    remaining.remove_prefix(end_index + 1);
    return Json(*decoded_int);
}

/**
 * @brief "l5:helloi52ee" -> ["hello", 52]
 */
auto decode_list(std::string_view& remaining, std::size_t depth)
  -> std::optional<Json>
{
    remaining.remove_prefix(1);  // rm "l" prefix

    auto list = Json::array();

    while (not remaining.starts_with(END_SYMBOL)) {
        auto item = decode_value(remaining, depth);
        if (not item) {
            return std::nullopt;  // malformed or unterminated list
        }
        list.push_back(std::move(*item));
    }

    remaining.remove_prefix(1);  // rm list end symbol
    return list;
}

/**
 * @brief "d3:foo3:bar5:helloi52ee" -> {"foo": "bar", "hello": 52}
 */
auto decode_dict(std::string_view& remaining, std::size_t depth)
  -> std::optional<Json>
{
    remaining.remove_prefix(1);  // rm "d" prefix

    Dict dict;

    while (not remaining.starts_with(END_SYMBOL)) {
        // Keys are always strings
        auto key = take_string(remaining);
        if (not key) {
            return std::nullopt;
        }

        auto value = decode_value(remaining, depth);
        if (not value) {
            return std::nullopt;
        }

        dict.insert_or_assign(std::string(*key), std::move(*value));
    }

    remaining.remove_prefix(1);  // rm dict end symbol
    return Json(dict);
}

}  // namespace internal

}  // namespace peerwire::bencode
