#include "proto/extension.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "bencode/decoders.hpp"
#include "bencode/encoders.hpp"
#include "misc/log.hpp"

namespace peerwire::proto {

auto ExtensionRegistry::with_defaults() -> ExtensionRegistry
{
    ExtensionRegistry registry;
    registry.add(HANDSHAKE_ID, "handshake", decode_extended_handshake);
    return registry;
}

auto ExtensionRegistry::add(
  uint8_t extension_id, std::string name, Decoder decoder
) -> void
{
    _entries.insert_or_assign(
      extension_id, Entry{std::move(name), std::move(decoder)}
    );
}

auto ExtensionRegistry::contains(uint8_t extension_id) const -> bool
{
    return _entries.contains(extension_id);
}

auto ExtensionRegistry::name_of(uint8_t extension_id) const
  -> std::optional<std::string_view>
{
    auto entry = _entries.find(extension_id);
    if (entry == _entries.end()) {
        return std::nullopt;
    }
    return entry->second.name;
}

auto ExtensionRegistry::decode(const ExtensionMsg& msg) const
  -> tl::expected<Json, ExtensionDecodeError>
{
    auto entry = _entries.find(msg.extension_id);
    if (entry == _entries.end()) {
        return tl::make_unexpected(ExtensionDecodeError::UNKNOWN_EXTENSION);
    }

    auto decoded = entry->second.decoder(msg.payload.span());
    if (not decoded) {
        log::logger()->debug(
          "Malformed payload of extension {} ({}), {} bytes", msg.extension_id,
          entry->second.name, msg.payload.size()
        );
        return tl::make_unexpected(ExtensionDecodeError::MALFORMED_PAYLOAD);
    }

    return *decoded;
}

auto decode_extended_handshake(std::span<const uint8_t> payload)
  -> std::optional<nlohmann::json>
{
    const std::string encoded(payload.begin(), payload.end());

    auto decoded = bencode::decode(encoded);
    if (not decoded or not decoded->is_object()) {
        return std::nullopt;
    }

    return decoded;
}

auto pack_extended_handshake(const nlohmann::json& handshake)
  -> std::optional<std::vector<uint8_t>>
{
    if (not handshake.is_object()) {
        return std::nullopt;
    }

    auto encoded = bencode::encode(handshake);
    if (not encoded) {
        return std::nullopt;
    }

    return std::vector<uint8_t>(encoded->begin(), encoded->end());
}

}  // namespace peerwire::proto
