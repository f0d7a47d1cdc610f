#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "proto/utils.hpp"

namespace peerwire::proto {

/**
 * @brief Kind of a peer wire message
 *
 * Values are dense and start at zero: they index the message variant. The
 * wire id of each kind lives in the registry, KeepAlive has none.
 */
enum class MsgKind : uint8_t
{
    KeepAlive = 0,
    Choke,
    Unchoke,
    Interested,
    NotInterested,
    Have,
    Bitfield,
    Request,
    Piece,
    Cancel,
    Port,
    Extension,
};

/**
 * @brief Length prefix of a frame
 */
struct MsgHeader
{
    static constexpr std::size_t SIZE_IN_BYTES = 4;

    uint32_t length;

    constexpr auto frame_size() const noexcept -> std::size_t
    {
        return SIZE_IN_BYTES + length;
    }
};

constexpr const std::size_t ID_SIZE = 1;

/// Frame offset of the first byte after the message id
constexpr const std::size_t BODY_OFFSET = MsgHeader::SIZE_IN_BYTES + ID_SIZE;

enum class ErrorCategory
{
    Framing,
    Validation,
};

enum class ErrorCode
{
    // Framing
    INCOMPLETE_MESSAGE,
    LENGTH_MISMATCH,
    UNKNOWN_MESSAGE_ID,
    TRAILING_BYTES,

    // Validation
    PIECE_INDEX_OUT_OF_RANGE,
    BLOCK_OUT_OF_PIECE,
    BITFIELD_OUT_OF_RANGE,
    PORT_MISSING,
};

struct Error
{
    ErrorCode code;
    std::optional<MsgKind> kind = std::nullopt;
    std::string_view field = {};
    std::size_t offset = 0;  // in frame, length prefix included
    std::string details = {};

    constexpr auto category() const noexcept -> ErrorCategory
    {
        switch (code) {
            case ErrorCode::INCOMPLETE_MESSAGE:
            case ErrorCode::LENGTH_MISMATCH:
            case ErrorCode::UNKNOWN_MESSAGE_ID:
            case ErrorCode::TRAILING_BYTES:
                return ErrorCategory::Framing;
            default:
                return ErrorCategory::Validation;
        }
    }

    constexpr auto is_framing() const noexcept -> bool
    {
        return category() == ErrorCategory::Framing;
    }
};

struct DecodeOptions
{
    /// Some legacy peers send the DHT port little-endian
    utils::ByteOrder port_byte_order = utils::ByteOrder::BigEndian;
};

}  // namespace peerwire::proto
