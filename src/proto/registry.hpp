#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include <magic_enum.hpp>

#include "proto/types.hpp"

namespace peerwire::proto {

struct KindInfo
{
    MsgKind kind;
    std::optional<uint8_t> id;
    std::size_t base_size;  // smallest payload after the length prefix
};

// clang-format off
inline constexpr std::array<KindInfo, magic_enum::enum_count<MsgKind>()> KINDS{{
    {MsgKind::KeepAlive,     std::nullopt, 0},
    {MsgKind::Choke,         0,            1},
    {MsgKind::Unchoke,       1,            1},
    {MsgKind::Interested,    2,            1},
    {MsgKind::NotInterested, 3,            1},
    {MsgKind::Have,          4,            5},
    {MsgKind::Bitfield,      5,            1},
    {MsgKind::Request,       6,            13},
    {MsgKind::Piece,         7,            9},
    {MsgKind::Cancel,        8,            13},
    {MsgKind::Port,          9,            3},
    {MsgKind::Extension,     20,           2},
}};
// clang-format on

namespace internal {

constexpr auto is_registry_dense() -> bool
{
    for (std::size_t i = 0; i < KINDS.size(); ++i) {
        if (magic_enum::enum_integer(KINDS[i].kind) != i) {
            return false;
        }
    }
    return true;
}

static_assert(is_registry_dense(), "KINDS must be ordered by MsgKind value");

}  // namespace internal

constexpr auto info_of(MsgKind kind) -> const KindInfo&
{
    return KINDS[magic_enum::enum_integer(kind)];
}

/**
 * @brief Wire id of a kind, nullopt for KeepAlive
 */
constexpr auto byte_of(MsgKind kind) -> std::optional<uint8_t>
{
    return info_of(kind).id;
}

constexpr auto kind_of(uint8_t id) -> std::optional<MsgKind>
{
    for (auto&& info : KINDS) {
        if (info.id == id) {
            return info.kind;
        }
    }
    return std::nullopt;
}

constexpr auto base_size_of(MsgKind kind) -> std::size_t
{
    return info_of(kind).base_size;
}

constexpr auto name_of(MsgKind kind) -> std::string_view
{
    return magic_enum::enum_name(kind);
}

}  // namespace peerwire::proto
