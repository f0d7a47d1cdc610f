#pragma once

#include <string>
#include <string_view>

#include <fmt/core.h>
#include <magic_enum.hpp>

#include "peers/identity.hpp"
#include "proto/messages.hpp"
#include "proto/types.hpp"

namespace peerwire::proto {

/**
 * @brief One line summary for logs: "Have #2", "Request #0 (16384@0)", ...
 */
auto describe(const Message& msg) -> std::string;

/**
 * @brief Summary prefixed with the remote address
 */
auto describe(const Message& msg, const peers::PeerIdentity& peer)
  -> std::string;

auto describe(const Error& error) -> std::string;

}  // namespace peerwire::proto

template <>
struct fmt::formatter<peerwire::proto::MsgKind> : fmt::formatter<std::string_view>
{
    auto format(peerwire::proto::MsgKind kind, fmt::format_context& ctx) const
      -> fmt::format_context::iterator
    {
        return fmt::formatter<std::string_view>::format(
          magic_enum::enum_name(kind), ctx
        );
    }
};

template <>
struct fmt::formatter<peerwire::proto::Message> : fmt::formatter<std::string_view>
{
    auto format(const peerwire::proto::Message& msg, fmt::format_context& ctx) const
      -> fmt::format_context::iterator
    {
        return fmt::formatter<std::string_view>::format(
          peerwire::proto::describe(msg), ctx
        );
    }
};

template <>
struct fmt::formatter<peerwire::proto::Error> : fmt::formatter<std::string_view>
{
    auto format(const peerwire::proto::Error& error, fmt::format_context& ctx) const
      -> fmt::format_context::iterator
    {
        return fmt::formatter<std::string_view>::format(
          peerwire::proto::describe(error), ctx
        );
    }
};
