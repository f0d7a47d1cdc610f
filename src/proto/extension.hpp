#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include "proto/messages.hpp"

namespace peerwire::proto {

enum class ExtensionDecodeError
{
    UNKNOWN_EXTENSION,
    MALFORMED_PAYLOAD,
};

/**
 * @brief Decoders for extension payloads, keyed by extension id
 *
 * The frame decoder leaves Extension payloads opaque; whoever handles them
 * looks the decoder up here.
 */
class ExtensionRegistry
{
 public:
    using Json = nlohmann::json;
    using Decoder =
      std::function<std::optional<Json>(std::span<const uint8_t> payload)>;

    /// Extension id of the extended handshake
    static constexpr uint8_t HANDSHAKE_ID = 0;

    /**
     * @brief Registry knowing the extended handshake
     */
    static auto with_defaults() -> ExtensionRegistry;

    /**
     * @brief Register or replace the decoder for `extension_id`
     */
    auto add(uint8_t extension_id, std::string name, Decoder decoder) -> void;

    auto contains(uint8_t extension_id) const -> bool;
    auto name_of(uint8_t extension_id) const -> std::optional<std::string_view>;

    auto decode(const ExtensionMsg& msg) const
      -> tl::expected<Json, ExtensionDecodeError>;

 private:
    struct Entry
    {
        std::string name;
        Decoder decoder;
    };

    std::map<uint8_t, Entry> _entries;
};

/**
 * @brief Extended handshake payload: a bencoded dictionary
 */
auto decode_extended_handshake(std::span<const uint8_t> payload)
  -> std::optional<nlohmann::json>;

/**
 * @brief Bencode a handshake dictionary, to be sent with
 *        pack_extension_msg(ExtensionRegistry::HANDSHAKE_ID, ...)
 */
auto pack_extended_handshake(const nlohmann::json& handshake)
  -> std::optional<std::vector<uint8_t>>;

}  // namespace peerwire::proto
