#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <vector>

namespace peerwire::proto {

/**
 * @brief Set of piece indices with a declared capacity
 *
 * The capacity is usually the torrent piece count. Setting an index beyond
 * it grows the set.
 */
class PieceSet
{
 public:
    PieceSet() = default;
    explicit PieceSet(std::size_t size) : _bits(size, false) {}
    PieceSet(std::size_t size, std::initializer_list<std::size_t> indices);

    auto set(std::size_t index) -> void;
    auto test(std::size_t index) const noexcept -> bool;

    /// Declared capacity in bits
    auto size() const noexcept -> std::size_t { return _bits.size(); }

    /// Number of set indices
    auto count() const -> std::size_t;

    /// Highest set index + 1, or 0 when nothing is set
    auto length() const -> std::size_t;

    auto indices() const -> std::vector<std::size_t>;

    /**
     * @brief Equal when the same pieces are set, capacity aside
     */
    friend auto operator==(const PieceSet& lhs, const PieceSet& rhs) -> bool;

 private:
    std::vector<bool> _bits;
};

/**
 * @brief Bitfield bytes, MSB of byte 0 is piece 0. ceil(size / 8) bytes long.
 */
auto pack_bitfield(const PieceSet& pieces) -> std::vector<uint8_t>;

/**
 * @brief Inverse of pack_bitfield. The result has capacity bytes * 8.
 */
auto unpack_bitfield(std::span<const uint8_t> bitfield) -> PieceSet;

}  // namespace peerwire::proto
