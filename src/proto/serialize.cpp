#include "proto/serialize.hpp"

#include <cstdint>
#include <stdexcept>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "proto/registry.hpp"
#include "proto/types.hpp"
#include "proto/utils.hpp"

namespace peerwire::proto {

using namespace internal;

namespace {

template <typename Msg>
auto pack(const Msg& msg) -> std::vector<uint8_t>
{
    std::vector<uint8_t> body;
    msg.pack_fields(body);

    auto packed = pack_msg_header(Msg::KIND, body.size());
    packed.insert(packed.end(), body.begin(), body.end());

    return packed;
}

}  // namespace

auto pack_keep_alive_msg() -> std::vector<uint8_t>
{
    return pack_msg_header(MsgKind::KeepAlive, 0);
}

auto pack_choke_msg() -> std::vector<uint8_t>
{
    return pack_msg_header(MsgKind::Choke, 0);
}

auto pack_unchoke_msg() -> std::vector<uint8_t>
{
    return pack_msg_header(MsgKind::Unchoke, 0);
}

auto pack_interested_msg() -> std::vector<uint8_t>
{
    return pack_msg_header(MsgKind::Interested, 0);
}

auto pack_not_interested_msg() -> std::vector<uint8_t>
{
    return pack_msg_header(MsgKind::NotInterested, 0);
}

auto pack_have_msg(uint32_t piece_idx) -> std::vector<uint8_t>
{
    return pack(HaveMsg{piece_idx});
}

auto pack_bitfield_msg(const PieceSet& pieces) -> std::vector<uint8_t>
{
    return pack(BitfieldMsg{pieces});
}

auto pack_request_msg(uint32_t piece_idx, uint32_t begin, uint32_t length)
  -> std::vector<uint8_t>
{
    return pack(RequestMsg{piece_idx, begin, length});
}

auto pack_piece_msg(
  uint32_t piece_idx, uint32_t begin, std::span<const uint8_t> block
) -> std::vector<uint8_t>
{
    auto msg = pack_msg_header(MsgKind::Piece, PieceMsg::MIN_SIZE + block.size());

    msg.reserve(msg.size() + PieceMsg::MIN_SIZE + block.size());
    utils::append_u32(msg, piece_idx);
    utils::append_u32(msg, begin);
    msg.insert(msg.end(), block.begin(), block.end());

    return msg;
}

auto pack_cancel_msg(uint32_t piece_idx, uint32_t begin, uint32_t length)
  -> std::vector<uint8_t>
{
    return pack(CancelMsg{piece_idx, begin, length});
}

auto pack_port_msg(uint16_t port, utils::ByteOrder order) -> std::vector<uint8_t>
{
    return pack(PortMsg{port, order});
}

auto pack_extension_msg(uint8_t extension_id, std::span<const uint8_t> payload)
  -> std::vector<uint8_t>
{
    auto msg = pack_msg_header(
      MsgKind::Extension, ExtensionMsg::MIN_SIZE + payload.size()
    );

    msg.push_back(extension_id);
    msg.insert(msg.end(), payload.begin(), payload.end());

    return msg;
}

auto pack_payload(const Payload& payload) -> std::vector<uint8_t>
{
    return std::visit([](const auto& msg) { return pack(msg); }, payload);
}

auto Message::craft(Payload payload) -> Message
{
    SharedBytes frame(pack_payload(payload));

    // Re-point views at the new frame so the message owns what it shows
    if (auto* piece = std::get_if<PieceMsg>(&payload)) {
        piece->block = frame.slice(BODY_OFFSET + PieceMsg::MIN_SIZE);
    }
    else if (auto* extension = std::get_if<ExtensionMsg>(&payload)) {
        extension->payload = frame.slice(BODY_OFFSET + ExtensionMsg::MIN_SIZE);
    }

    return Message(std::move(payload), std::move(frame));
}

}  // namespace peerwire::proto


namespace peerwire::proto::internal {

auto pack_msg_header(MsgKind kind, std::size_t body_length)
  -> std::vector<uint8_t>
{
    const auto id = byte_of(kind);
    const auto length = body_length + (id ? ID_SIZE : 0);

    if (length > UINT32_MAX) {
        throw std::length_error(fmt::format(
          "{} message of {} bytes does not fit a length prefix", name_of(kind),
          length
        ));
    }

    auto packed = utils::pack_u32(uint32_t(length));
    if (id) {
        packed.push_back(*id);
    }

    return packed;
}

}  // namespace peerwire::proto::internal
