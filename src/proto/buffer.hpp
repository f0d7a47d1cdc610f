#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "proto/utils.hpp"

namespace peerwire::proto {

using Bytes = std::vector<uint8_t>;

/**
 * @brief Forward-only cursor over a byte range it does not own
 *
 * Every consumer gets its own reader, so reading never moves anybody else's
 * position. All reads are bounds checked and return nullopt on underflow
 * without moving the cursor.
 */
class ByteReader
{
 public:
    explicit ByteReader(std::span<const uint8_t> data) noexcept : _data(data)
    {
    }

    inline auto position() const noexcept -> std::size_t { return _position; }

    inline auto remaining() const noexcept -> std::size_t
    {
        return _data.size() - _position;
    }

    inline auto read_u8() -> std::optional<uint8_t>
    {
        if (remaining() < 1) {
            return std::nullopt;
        }
        return _data[_position++];
    }

    inline auto read_u16(utils::ByteOrder order = utils::ByteOrder::BigEndian)
      -> std::optional<uint16_t>
    {
        auto bytes = read_bytes(2);
        if (not bytes) {
            return std::nullopt;
        }
        return utils::unpack_u16(*bytes, order);
    }

    inline auto read_u32() -> std::optional<uint32_t>
    {
        auto bytes = read_bytes(4);
        if (not bytes) {
            return std::nullopt;
        }
        return utils::unpack_u32(*bytes);
    }

    inline auto read_bytes(std::size_t count)
      -> std::optional<std::span<const uint8_t>>
    {
        if (remaining() < count) {
            return std::nullopt;
        }
        auto bytes = _data.subspan(_position, count);
        _position += count;
        return bytes;
    }

    /**
     * @brief Consume everything left
     */
    inline auto rest() -> std::span<const uint8_t>
    {
        auto bytes = _data.subspan(_position);
        _position = _data.size();
        return bytes;
    }

 private:
    std::span<const uint8_t> _data;
    std::size_t _position = 0;
};

/**
 * @brief Immutable byte range sharing ownership of its storage
 *
 * Slices point into the same storage and keep it alive, so a view taken from
 * a frame stays valid for as long as the view itself exists.
 */
class SharedBytes
{
 public:
    SharedBytes() = default;
    explicit SharedBytes(Bytes bytes);

    auto size() const noexcept -> std::size_t { return _length; }
    auto empty() const noexcept -> bool { return _length == 0; }

    auto span() const noexcept -> std::span<const uint8_t>;
    auto reader() const noexcept -> ByteReader { return ByteReader(span()); }

    /**
     * @brief Sub-range sharing the same storage. Throws std::out_of_range.
     */
    auto slice(std::size_t offset, std::size_t length) const -> SharedBytes;
    auto slice(std::size_t offset) const -> SharedBytes;

    auto to_vector() const -> Bytes;

    /**
     * @brief True when both views are backed by the same allocation
     */
    auto shares_storage_with(const SharedBytes& other) const noexcept -> bool
    {
        return _storage and _storage == other._storage;
    }

    friend auto operator==(const SharedBytes& lhs, const SharedBytes& rhs)
      -> bool;

 private:
    SharedBytes(
      std::shared_ptr<const Bytes> storage,
      std::size_t offset,
      std::size_t length
    );

    std::shared_ptr<const Bytes> _storage;
    std::size_t _offset = 0;
    std::size_t _length = 0;
};

}  // namespace peerwire::proto
