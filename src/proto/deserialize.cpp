#include "proto/deserialize.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <utility>
#include <variant>

#include <fmt/core.h>
#include <magic_enum.hpp>
#include <tl/expected.hpp>

#include "misc/log.hpp"
#include "proto/format.hpp"
#include "proto/registry.hpp"
#include "proto/types.hpp"
#include "proto/utils.hpp"
#include "proto/validate.hpp"

namespace peerwire::proto {

namespace {

using Unpacker = tl::expected<Payload, Error> (*)(
  const SharedBytes&, const DecodeOptions&
);

template <typename Msg>
auto unpack_as(const SharedBytes& body, const DecodeOptions& options)
  -> tl::expected<Payload, Error>
{
    return Msg::unpack(body, options).map([](Msg&& msg) {
        return Payload(std::move(msg));
    });
}

template <std::size_t... I>
constexpr auto make_unpackers(std::index_sequence<I...>)
  -> std::array<Unpacker, sizeof...(I)>
{
    return {&unpack_as<std::variant_alternative_t<I, Payload>>...};
}

/// Indexed by MsgKind
constexpr auto UNPACKERS =
  make_unpackers(std::make_index_sequence<std::variant_size_v<Payload>>{});

}  // namespace

auto unpack_msg_header(std::span<const uint8_t> msg)
  -> tl::expected<MsgHeader, Error>
{
    if (msg.size() < MsgHeader::SIZE_IN_BYTES) {
        return tl::make_unexpected(Error{
          .code = ErrorCode::INCOMPLETE_MESSAGE,
          .field = "length",
          .details = fmt::format(
            "{} bytes is too short for a length prefix", msg.size()
          )
        });
    }

    return MsgHeader{utils::unpack_u32(msg)};
}

namespace internal {

auto decode_frame(SharedBytes frame, const DecodeOptions& options)
  -> tl::expected<Message, Error>
{
    const auto header = unpack_msg_header(frame.span());
    if (not header) {
        return tl::make_unexpected(header.error());
    }

    const auto body_size = frame.size() - MsgHeader::SIZE_IN_BYTES;
    if (header->length != body_size) {
        return tl::make_unexpected(Error{
          .code = ErrorCode::LENGTH_MISMATCH,
          .field = "length",
          .details = fmt::format(
            "frame announces {} bytes but {} follow", header->length, body_size
          )
        });
    }

    if (header->length == 0) {
        return Message(KeepAliveMsg{}, std::move(frame));
    }

    const auto id = frame.span()[MsgHeader::SIZE_IN_BYTES];
    const auto kind = kind_of(id);
    if (not kind) {
        return tl::make_unexpected(Error{
          .code = ErrorCode::UNKNOWN_MESSAGE_ID,
          .field = "id",
          .offset = MsgHeader::SIZE_IN_BYTES,
          .details = fmt::format(
            "unknown message id {} at offset {}", id, MsgHeader::SIZE_IN_BYTES
          )
        });
    }

    const auto body = frame.slice(BODY_OFFSET);
    auto payload = UNPACKERS[magic_enum::enum_integer(*kind)](body, options);
    if (not payload) {
        return tl::make_unexpected(payload.error());
    }

    return Message(std::move(*payload), std::move(frame));
}

}  // namespace internal

auto parse_message(
  SharedBytes frame, const Geometry& geometry, const DecodeOptions& options
) -> tl::expected<Message, Error>
{
    return internal::decode_frame(std::move(frame), options)
      .and_then([&](Message&& msg) { return validate(msg, geometry); })
      .map([](Message&& msg) {
          log::logger()->trace("Decoded {}", msg);
          return std::move(msg);
      })
      .map_error([](Error&& e) {
          log::logger()->debug("Rejected frame: {}", e);
          return std::move(e);
      });
}

auto parse_message(
  Bytes&& frame, const Geometry& geometry, const DecodeOptions& options
) -> tl::expected<Message, Error>
{
    return parse_message(SharedBytes(std::move(frame)), geometry, options);
}

auto parse_message(
  std::span<const uint8_t> frame,
  const Geometry& geometry,
  const DecodeOptions& options
) -> tl::expected<Message, Error>
{
    return parse_message(
      SharedBytes(Bytes(frame.begin(), frame.end())), geometry, options
    );
}

}  // namespace peerwire::proto
