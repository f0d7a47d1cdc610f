#pragma once

#include <cstdint>
#include <span>

#include <tl/expected.hpp>

#include "proto/buffer.hpp"
#include "proto/messages.hpp"
#include "proto/types.hpp"
#include "torrent.hpp"

namespace peerwire::proto {

/**
 * @brief Read the length prefix at the start of `msg`
 *
 * For the connection layer: tells how many bytes the whole frame needs
 * before it can be handed to parse_message.
 */
auto unpack_msg_header(std::span<const uint8_t> msg)
  -> tl::expected<MsgHeader, Error>;

/**
 * @brief Decode and validate one complete frame (length prefix included)
 *
 * The returned message shares ownership of `frame`; the Piece block and the
 * Extension payload are views into it.
 */
auto parse_message(
  SharedBytes frame, const Geometry& geometry, const DecodeOptions& options = {}
) -> tl::expected<Message, Error>;

/**
 * @brief Same as above, takes over the buffer without copying
 */
auto parse_message(
  Bytes&& frame, const Geometry& geometry, const DecodeOptions& options = {}
) -> tl::expected<Message, Error>;

/**
 * @brief Same as above, copies the frame once
 */
auto parse_message(
  std::span<const uint8_t> frame,
  const Geometry& geometry,
  const DecodeOptions& options = {}
) -> tl::expected<Message, Error>;

}  // namespace peerwire::proto
