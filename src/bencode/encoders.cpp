#include "bencode/encoders.hpp"

#include <optional>
#include <string>

#include <fmt/core.h>

#include "bencode/consts.hpp"

namespace peerwire::bencode {

auto encode(const Json& value) -> std::optional<std::string>
{
    using namespace internal;

    if (value.is_number_integer()) {
        return encode_integer(value);
    }
    if (value.is_string()) {
        return encode_string(value);
    }
    if (value.is_binary()) {
        return encode_binary(value);
    }
    if (value.is_object()) {
        return encode_dict(value);
    }
    if (value.is_array()) {
        return encode_list(value);
    }

    return std::nullopt;
}

namespace internal {

auto encode_integer(const Json& value) -> std::string
{
    return fmt::format(
      "{}{}{}", INTEGER_START_SYMBOL, value.get<Integer>(), END_SYMBOL
    );
}

auto encode_string(const Json& value) -> std::string
{
    const auto& str = value.get_ref<const std::string&>();
    return fmt::format("{}{}{}", str.length(), STRING_DELIMITER_SYMBOL, str);
}

auto encode_binary(const Json& value) -> std::string
{
    const auto& bin = value.get_binary();
    return fmt::format(
      "{}{}{}", bin.size(), STRING_DELIMITER_SYMBOL,
      std::string(bin.begin(), bin.end())
    );
}

/**
 * @brief Keys come out sorted since json objects are ordered maps
 */
auto encode_dict(const Json& value) -> std::optional<std::string>
{
    std::string encoded(1, DICT_START_SYMBOL);

    for (auto&& [key, item] : value.items()) {
        auto encoded_item = encode(item);
        if (not encoded_item) {
            return std::nullopt;
        }

        encoded += encode_string(Json(key));
        encoded += *encoded_item;
    }

    encoded += END_SYMBOL;
    return encoded;
}

auto encode_list(const Json& value) -> std::optional<std::string>
{
    std::string encoded(1, LIST_START_SYMBOL);

    for (auto&& item : value) {
        auto encoded_item = encode(item);
        if (not encoded_item) {
            return std::nullopt;
        }
        encoded += *encoded_item;
    }

    encoded += END_SYMBOL;
    return encoded;
}

}  // namespace internal

}  // namespace peerwire::bencode
