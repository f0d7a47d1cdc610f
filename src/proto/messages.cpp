#include "proto/messages.hpp"

#include <cstdint>
#include <string_view>

#include <fmt/core.h>
#include <tl/expected.hpp>

#include "proto/bitfield.hpp"
#include "proto/registry.hpp"
#include "proto/utils.hpp"

namespace peerwire::proto {

namespace {

auto incomplete(MsgKind kind, std::string_view field, const ByteReader& reader)
  -> Error
{
    return Error{
      .code = ErrorCode::INCOMPLETE_MESSAGE,
      .kind = kind,
      .field = field,
      .offset = BODY_OFFSET + reader.position(),
      .details = fmt::format(
        "{} message ends before its {} field", name_of(kind), field
      )
    };
}

/**
 * @brief Fixed size kinds must not carry anything after their fields
 */
auto expect_consumed(MsgKind kind, const ByteReader& reader) -> Validity
{
    if (reader.remaining() == 0) {
        return {};
    }

    return tl::make_unexpected(Error{
      .code = ErrorCode::TRAILING_BYTES,
      .kind = kind,
      .offset = BODY_OFFSET + reader.position(),
      .details = fmt::format(
        "{} unexpected bytes after {} message", reader.remaining(),
        name_of(kind)
      )
    });
}

auto check_piece_index(MsgKind kind, uint32_t index, const Geometry& geometry)
  -> Validity
{
    if (index < geometry.piece_count()) {
        return {};
    }

    return tl::make_unexpected(Error{
      .code = ErrorCode::PIECE_INDEX_OUT_OF_RANGE,
      .kind = kind,
      .field = "index",
      .details = fmt::format(
        "piece #{} of torrent with {} pieces", index, geometry.piece_count()
      )
    });
}

/**
 * @brief begin + length must stay inside the piece. Sums are 64 bit, so
 *        nothing wraps around.
 */
auto check_block(
  MsgKind kind,
  uint32_t index,
  uint32_t begin,
  uint64_t length,
  const Geometry& geometry
) -> Validity
{
    return check_piece_index(kind, index, geometry).and_then([&]() -> Validity {
        const auto piece_size = geometry.piece_size(index);
        if (uint64_t(begin) + length <= piece_size) {
            return {};
        }

        return tl::make_unexpected(Error{
          .code = ErrorCode::BLOCK_OUT_OF_PIECE,
          .kind = kind,
          .field = "length",
          .details = fmt::format(
            "block {}@{} exceeds piece #{} of {} bytes", length, begin, index,
            piece_size
          )
        });
    });
}

}  // namespace

// Choke, Unchoke, Interested, NotInterested (and KeepAlive)

template <MsgKind Kind>
auto SignalMsg<Kind>::unpack(const SharedBytes& body, const DecodeOptions&)
  -> tl::expected<SignalMsg, Error>
{
    return expect_consumed(Kind, body.reader()).map([] { return SignalMsg{}; });
}

template struct SignalMsg<MsgKind::KeepAlive>;
template struct SignalMsg<MsgKind::Choke>;
template struct SignalMsg<MsgKind::Unchoke>;
template struct SignalMsg<MsgKind::Interested>;
template struct SignalMsg<MsgKind::NotInterested>;

// Have: <piece index>

auto HaveMsg::unpack(const SharedBytes& body, const DecodeOptions&)
  -> tl::expected<HaveMsg, Error>
{
    auto reader = body.reader();

    const auto index = reader.read_u32();
    if (not index) {
        return tl::make_unexpected(incomplete(KIND, "index", reader));
    }

    return expect_consumed(KIND, reader).map([&] { return HaveMsg{*index}; });
}

auto HaveMsg::pack_fields(Bytes& out) const -> void
{
    utils::append_u32(out, index);
}

auto HaveMsg::validate(const Geometry& geometry) const -> Validity
{
    return check_piece_index(KIND, index, geometry);
}

// Bitfield: <bitfield>

auto BitfieldMsg::unpack(const SharedBytes& body, const DecodeOptions&)
  -> tl::expected<BitfieldMsg, Error>
{
    return BitfieldMsg{unpack_bitfield(body.span())};
}

auto BitfieldMsg::pack_fields(Bytes& out) const -> void
{
    const auto bitfield = pack_bitfield(pieces);
    out.insert(out.end(), bitfield.begin(), bitfield.end());
}

/**
 * @brief Spare bits past the piece count must be clear
 */
auto BitfieldMsg::validate(const Geometry& geometry) const -> Validity
{
    const auto length = pieces.length();
    if (length <= geometry.piece_count()) {
        return {};
    }

    return tl::make_unexpected(Error{
      .code = ErrorCode::BITFIELD_OUT_OF_RANGE,
      .kind = KIND,
      .field = "bitfield",
      .details = fmt::format(
        "piece #{} is set but torrent has {} pieces", length - 1,
        geometry.piece_count()
      )
    });
}

// Request, Cancel: <piece index><block offset><block length>

template <MsgKind Kind>
auto BlockRangeMsg<Kind>::unpack(const SharedBytes& body, const DecodeOptions&)
  -> tl::expected<BlockRangeMsg, Error>
{
    auto reader = body.reader();

    const auto index = reader.read_u32();
    if (not index) {
        return tl::make_unexpected(incomplete(Kind, "index", reader));
    }

    const auto begin = reader.read_u32();
    if (not begin) {
        return tl::make_unexpected(incomplete(Kind, "begin", reader));
    }

    const auto length = reader.read_u32();
    if (not length) {
        return tl::make_unexpected(incomplete(Kind, "length", reader));
    }

    return expect_consumed(Kind, reader).map([&] {
        return BlockRangeMsg{*index, *begin, *length};
    });
}

template <MsgKind Kind>
auto BlockRangeMsg<Kind>::pack_fields(Bytes& out) const -> void
{
    utils::append_u32(out, index);
    utils::append_u32(out, begin);
    utils::append_u32(out, length);
}

template <MsgKind Kind>
auto BlockRangeMsg<Kind>::validate(const Geometry& geometry) const -> Validity
{
    return check_block(Kind, index, begin, length, geometry);
}

template struct BlockRangeMsg<MsgKind::Request>;
template struct BlockRangeMsg<MsgKind::Cancel>;

// Piece: <piece index><block offset><block>

auto PieceMsg::unpack(const SharedBytes& body, const DecodeOptions&)
  -> tl::expected<PieceMsg, Error>
{
    auto reader = body.reader();

    const auto index = reader.read_u32();
    if (not index) {
        return tl::make_unexpected(incomplete(KIND, "index", reader));
    }

    const auto begin = reader.read_u32();
    if (not begin) {
        return tl::make_unexpected(incomplete(KIND, "begin", reader));
    }

    return PieceMsg{*index, *begin, body.slice(reader.position())};
}

auto PieceMsg::pack_fields(Bytes& out) const -> void
{
    utils::append_u32(out, index);
    utils::append_u32(out, begin);

    const auto bytes = block.span();
    out.insert(out.end(), bytes.begin(), bytes.end());
}

auto PieceMsg::validate(const Geometry& geometry) const -> Validity
{
    return check_block(KIND, index, begin, block.size(), geometry);
}

// Port: <listen port>

/**
 * @brief Peers sending less than two port bytes are tolerated here, the
 *        validator turns an absent port into an error
 */
auto PortMsg::unpack(const SharedBytes& body, const DecodeOptions& options)
  -> tl::expected<PortMsg, Error>
{
    auto reader = body.reader();

    if (reader.remaining() < PORT_SIZE) {
        return PortMsg{std::nullopt, options.port_byte_order};
    }

    const auto port = reader.read_u16(options.port_byte_order);

    return expect_consumed(KIND, reader).map([&] {
        return PortMsg{port, options.port_byte_order};
    });
}

auto PortMsg::pack_fields(Bytes& out) const -> void
{
    if (port) {
        utils::append_u16(out, *port, byte_order);
    }
}

auto PortMsg::validate(const Geometry&) const -> Validity
{
    if (port) {
        return {};
    }

    return tl::make_unexpected(Error{
      .code = ErrorCode::PORT_MISSING,
      .kind = KIND,
      .field = "port",
      .details = "port message carries less than 2 bytes"
    });
}

// Extension: <extension id><payload>

auto ExtensionMsg::unpack(const SharedBytes& body, const DecodeOptions&)
  -> tl::expected<ExtensionMsg, Error>
{
    auto reader = body.reader();

    const auto extension_id = reader.read_u8();
    if (not extension_id) {
        return tl::make_unexpected(incomplete(KIND, "extension_id", reader));
    }

    return ExtensionMsg{*extension_id, body.slice(reader.position())};
}

auto ExtensionMsg::pack_fields(Bytes& out) const -> void
{
    out.push_back(extension_id);

    const auto bytes = payload.span();
    out.insert(out.end(), bytes.begin(), bytes.end());
}

}  // namespace peerwire::proto
