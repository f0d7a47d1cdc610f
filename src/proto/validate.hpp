#pragma once

#include <tl/expected.hpp>

#include "proto/messages.hpp"
#include "proto/types.hpp"
#include "torrent.hpp"

namespace peerwire::proto {

/**
 * @brief Check that a message makes sense for the torrent
 *
 * Kinds without a validate() member are always accepted. Pure, the message
 * is returned as is on success.
 */
auto validate(const Message& msg, const Geometry& geometry)
  -> tl::expected<Message, Error>;

}  // namespace peerwire::proto
