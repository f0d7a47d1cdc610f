#include "proto/format.hpp"

#include <string>
#include <variant>

#include <fmt/core.h>
#include <magic_enum.hpp>

#include "proto/registry.hpp"

namespace peerwire::proto {

namespace {

template <MsgKind Kind>
auto summary(const SignalMsg<Kind>&) -> std::string
{
    return std::string(name_of(Kind));
}

auto summary(const HaveMsg& msg) -> std::string
{
    return fmt::format("{} #{}", msg.KIND, msg.index);
}

auto summary(const BitfieldMsg& msg) -> std::string
{
    return fmt::format("{} {}/{}", msg.KIND, msg.pieces.count(), msg.pieces.size());
}

template <MsgKind Kind>
auto summary(const BlockRangeMsg<Kind>& msg) -> std::string
{
    return fmt::format("{} #{} ({}@{})", Kind, msg.index, msg.length, msg.begin);
}

auto summary(const PieceMsg& msg) -> std::string
{
    return fmt::format(
      "{} #{} ({}@{})", msg.KIND, msg.index, msg.block.size(), msg.begin
    );
}

auto summary(const PortMsg& msg) -> std::string
{
    if (not msg.port) {
        return fmt::format("{} <absent>", msg.KIND);
    }
    return fmt::format("{} {}", msg.KIND, *msg.port);
}

auto summary(const ExtensionMsg& msg) -> std::string
{
    return fmt::format(
      "{} id={} ({} bytes)", msg.KIND, msg.extension_id, msg.payload.size()
    );
}

}  // namespace

auto describe(const Message& msg) -> std::string
{
    return std::visit(
      [](const auto& payload) { return summary(payload); }, msg.payload()
    );
}

auto describe(const Message& msg, const peers::PeerIdentity& peer)
  -> std::string
{
    return fmt::format("{} {}", peer.display_address(), describe(msg));
}

auto describe(const Error& error) -> std::string
{
    auto text = fmt::format(
      "{} error {}", magic_enum::enum_name(error.category()),
      magic_enum::enum_name(error.code)
    );

    if (error.kind) {
        text += fmt::format(" in {}", *error.kind);
    }
    if (not error.field.empty()) {
        text += fmt::format(" [{}]", error.field);
    }
    if (error.offset != 0) {
        text += fmt::format(" at offset {}", error.offset);
    }
    if (not error.details.empty()) {
        text += fmt::format(": {}", error.details);
    }

    return text;
}

}  // namespace peerwire::proto
