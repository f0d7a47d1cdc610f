#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "proto/bitfield.hpp"
#include "proto/messages.hpp"
#include "proto/types.hpp"
#include "proto/utils.hpp"

namespace peerwire::proto {

// Builders trust their input: nothing is validated here. They throw
// std::length_error only when the frame cannot be described by a 32 bit
// length prefix.

auto pack_keep_alive_msg() -> std::vector<uint8_t>;
auto pack_choke_msg() -> std::vector<uint8_t>;
auto pack_unchoke_msg() -> std::vector<uint8_t>;
auto pack_interested_msg() -> std::vector<uint8_t>;
auto pack_not_interested_msg() -> std::vector<uint8_t>;
auto pack_have_msg(uint32_t piece_idx) -> std::vector<uint8_t>;
auto pack_bitfield_msg(const PieceSet& pieces) -> std::vector<uint8_t>;
auto pack_request_msg(uint32_t piece_idx, uint32_t begin, uint32_t length)
  -> std::vector<uint8_t>;
auto pack_piece_msg(
  uint32_t piece_idx, uint32_t begin, std::span<const uint8_t> block
) -> std::vector<uint8_t>;
auto pack_cancel_msg(uint32_t piece_idx, uint32_t begin, uint32_t length)
  -> std::vector<uint8_t>;
auto pack_port_msg(
  uint16_t port, utils::ByteOrder order = utils::ByteOrder::BigEndian
) -> std::vector<uint8_t>;
auto pack_extension_msg(uint8_t extension_id, std::span<const uint8_t> payload)
  -> std::vector<uint8_t>;

/**
 * @brief Frame for any payload
 */
auto pack_payload(const Payload& payload) -> std::vector<uint8_t>;

namespace internal {

/**
 * @brief Length prefix plus message id (prefix only for KeepAlive)
 *
 * @param body_length bytes after the message id
 */
auto pack_msg_header(MsgKind kind, std::size_t body_length)
  -> std::vector<uint8_t>;

}  // namespace internal

}  // namespace peerwire::proto
