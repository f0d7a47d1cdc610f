#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <variant>

#include <tl/expected.hpp>

#include "proto/bitfield.hpp"
#include "proto/buffer.hpp"
#include "proto/types.hpp"
#include "torrent.hpp"

namespace peerwire::proto {

// Every message record carries the whole codec of its kind:
//   static unpack(body, options) -> tl::expected<Msg, Error>
//   pack_fields(out)             appends everything after the message id
//   validate(geometry)           only where the kind has something to check
// `body` is the frame without the length prefix and message id.

using Validity = tl::expected<void, Error>;

/**
 * @brief Kinds without fields: KeepAlive, Choke, Unchoke, Interested,
 *        NotInterested
 */
template <MsgKind Kind>
struct SignalMsg
{
    static constexpr MsgKind KIND = Kind;
    static constexpr std::size_t SIZE = 0;

    static auto unpack(const SharedBytes& body, const DecodeOptions&)
      -> tl::expected<SignalMsg, Error>;

    auto pack_fields(Bytes&) const -> void {}

    friend auto operator==(const SignalMsg&, const SignalMsg&) -> bool = default;
};

using KeepAliveMsg = SignalMsg<MsgKind::KeepAlive>;
using ChokeMsg = SignalMsg<MsgKind::Choke>;
using UnchokeMsg = SignalMsg<MsgKind::Unchoke>;
using InterestedMsg = SignalMsg<MsgKind::Interested>;
using NotInterestedMsg = SignalMsg<MsgKind::NotInterested>;

struct HaveMsg
{
    static constexpr MsgKind KIND = MsgKind::Have;
    static constexpr std::size_t INDEX_SIZE = 4;
    static constexpr std::size_t SIZE = INDEX_SIZE;

    uint32_t index;

    static auto unpack(const SharedBytes& body, const DecodeOptions&)
      -> tl::expected<HaveMsg, Error>;
    auto pack_fields(Bytes& out) const -> void;
    auto validate(const Geometry& geometry) const -> Validity;

    friend auto operator==(const HaveMsg&, const HaveMsg&) -> bool = default;
};

struct BitfieldMsg
{
    static constexpr MsgKind KIND = MsgKind::Bitfield;

    PieceSet pieces;

    static auto unpack(const SharedBytes& body, const DecodeOptions&)
      -> tl::expected<BitfieldMsg, Error>;
    auto pack_fields(Bytes& out) const -> void;
    auto validate(const Geometry& geometry) const -> Validity;

    friend auto operator==(const BitfieldMsg&, const BitfieldMsg&)
      -> bool = default;
};

/**
 * @brief Request and Cancel: <piece index><block offset><block length>
 */
template <MsgKind Kind>
struct BlockRangeMsg
{
    static constexpr MsgKind KIND = Kind;
    static constexpr std::size_t INDEX_SIZE = 4;
    static constexpr std::size_t BEGIN_SIZE = 4;
    static constexpr std::size_t LENGTH_SIZE = 4;
    static constexpr std::size_t SIZE = INDEX_SIZE + BEGIN_SIZE + LENGTH_SIZE;

    uint32_t index;
    uint32_t begin;
    uint32_t length;

    static auto unpack(const SharedBytes& body, const DecodeOptions&)
      -> tl::expected<BlockRangeMsg, Error>;
    auto pack_fields(Bytes& out) const -> void;
    auto validate(const Geometry& geometry) const -> Validity;

    friend auto operator==(const BlockRangeMsg&, const BlockRangeMsg&)
      -> bool = default;
};

using RequestMsg = BlockRangeMsg<MsgKind::Request>;
using CancelMsg = BlockRangeMsg<MsgKind::Cancel>;

/// Block size clients request by default, 2^14 bytes
constexpr const uint32_t DEFAULT_REQUEST_SIZE = 16384;

struct PieceMsg
{
    static constexpr MsgKind KIND = MsgKind::Piece;
    static constexpr std::size_t INDEX_SIZE = 4;
    static constexpr std::size_t BEGIN_SIZE = 4;
    static constexpr std::size_t MIN_SIZE = INDEX_SIZE + BEGIN_SIZE;

    uint32_t index;
    uint32_t begin;
    SharedBytes block;  // view into the frame

    static auto unpack(const SharedBytes& body, const DecodeOptions&)
      -> tl::expected<PieceMsg, Error>;
    auto pack_fields(Bytes& out) const -> void;
    auto validate(const Geometry& geometry) const -> Validity;

    friend auto operator==(const PieceMsg&, const PieceMsg&) -> bool = default;
};

struct PortMsg
{
    static constexpr MsgKind KIND = MsgKind::Port;
    static constexpr std::size_t PORT_SIZE = 2;
    static constexpr std::size_t SIZE = PORT_SIZE;

    std::optional<uint16_t> port;
    utils::ByteOrder byte_order = utils::ByteOrder::BigEndian;

    static auto unpack(const SharedBytes& body, const DecodeOptions& options)
      -> tl::expected<PortMsg, Error>;
    auto pack_fields(Bytes& out) const -> void;
    auto validate(const Geometry& geometry) const -> Validity;

    friend auto operator==(const PortMsg& lhs, const PortMsg& rhs) -> bool
    {
        return lhs.port == rhs.port;
    }
};

/**
 * @brief Vendor extension message. The payload is left undecoded, see
 *        ExtensionRegistry.
 */
struct ExtensionMsg
{
    static constexpr MsgKind KIND = MsgKind::Extension;
    static constexpr std::size_t EXTENSION_ID_SIZE = 1;
    static constexpr std::size_t MIN_SIZE = EXTENSION_ID_SIZE;

    uint8_t extension_id;
    SharedBytes payload;  // view into the frame

    static auto unpack(const SharedBytes& body, const DecodeOptions&)
      -> tl::expected<ExtensionMsg, Error>;
    auto pack_fields(Bytes& out) const -> void;

    friend auto operator==(const ExtensionMsg&, const ExtensionMsg&)
      -> bool = default;
};

/// Alternatives follow MsgKind order: index() == enum value
using Payload = std::variant<
  KeepAliveMsg,
  ChokeMsg,
  UnchokeMsg,
  InterestedMsg,
  NotInterestedMsg,
  HaveMsg,
  BitfieldMsg,
  RequestMsg,
  PieceMsg,
  CancelMsg,
  PortMsg,
  ExtensionMsg>;

namespace internal {

template <std::size_t... I>
constexpr auto is_payload_ordered(std::index_sequence<I...>) -> bool
{
    return ((std::variant_alternative_t<I, Payload>::KIND == MsgKind(I)) and ...);
}

static_assert(
  is_payload_ordered(std::make_index_sequence<std::variant_size_v<Payload>>{}),
  "Payload alternatives must follow MsgKind order"
);

}  // namespace internal

class Message;

namespace internal {

auto decode_frame(SharedBytes frame, const DecodeOptions& options)
  -> tl::expected<Message, Error>;

}  // namespace internal

/**
 * @brief Immutable peer wire message
 *
 * Holds the decoded fields and the frame bytes they came from (length prefix
 * included). Copies share the frame storage. Messages are made either by
 * decoding (see parse_message) or by Message::craft.
 */
class Message
{
 public:
    /**
     * @brief Encode the payload and keep the encoded frame as backing bytes
     */
    static auto craft(Payload payload) -> Message;

    auto kind() const noexcept -> MsgKind { return MsgKind(_payload.index()); }

    auto payload() const noexcept -> const Payload& { return _payload; }

    template <typename T>
    auto as() const noexcept -> const T*
    {
        return std::get_if<T>(&_payload);
    }

    template <typename T>
    auto is() const noexcept -> bool
    {
        return std::holds_alternative<T>(_payload);
    }

    /**
     * @brief The whole frame as on the wire
     */
    auto frame() const noexcept -> const SharedBytes& { return _frame; }

    /**
     * @brief Fresh cursor at the frame start, independent of other readers
     */
    auto reader() const noexcept -> ByteReader { return _frame.reader(); }

 private:
    Message(Payload payload, SharedBytes frame) :
      _payload(std::move(payload)), _frame(std::move(frame))
    {
    }

    friend auto internal::decode_frame(SharedBytes, const DecodeOptions&)
      -> tl::expected<Message, Error>;

    Payload _payload;
    SharedBytes _frame;
};

}  // namespace peerwire::proto
