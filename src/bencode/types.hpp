#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <tuple>

#include <nlohmann/json.hpp>

namespace peerwire::bencode {

using Json = nlohmann::json;

enum class EncodedValueType
{
    Integer,
    String,
    List,
    Dictionary,
    Unknown,
};

using Dict = std::map<std::string, Json>;

/// Decoded value and the count of source characters it took
using DecodedValue = std::tuple<Json, std::size_t>;

using Integer = long long;

}  // namespace peerwire::bencode
