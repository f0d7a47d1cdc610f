#include "proto/bitfield.hpp"

#include <algorithm>

#include <range/v3/algorithm/count.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/iota.hpp>

namespace peerwire::proto {

constexpr const std::size_t BITS_IN_BYTE = 8;

PieceSet::PieceSet(std::size_t size, std::initializer_list<std::size_t> indices) :
  _bits(size, false)
{
    for (auto index : indices) {
        set(index);
    }
}

auto PieceSet::set(std::size_t index) -> void
{
    if (index >= _bits.size()) {
        _bits.resize(index + 1, false);
    }
    _bits[index] = true;
}

auto PieceSet::test(std::size_t index) const noexcept -> bool
{
    return index < _bits.size() and _bits[index];
}

auto PieceSet::count() const -> std::size_t
{
    return std::size_t(ranges::count(_bits, true));
}

auto PieceSet::length() const -> std::size_t
{
    auto last = std::find(_bits.rbegin(), _bits.rend(), true);
    return std::size_t(std::distance(last, _bits.rend()));
}

auto PieceSet::indices() const -> std::vector<std::size_t>
{
    return ranges::views::ints(std::size_t(0), _bits.size()) |
           ranges::views::filter([this](auto i) { return bool(_bits[i]); }) |
           ranges::to<std::vector<std::size_t>>();
}

auto operator==(const PieceSet& lhs, const PieceSet& rhs) -> bool
{
    return lhs.indices() == rhs.indices();
}

auto pack_bitfield(const PieceSet& pieces) -> std::vector<uint8_t>
{
    std::vector<uint8_t> packed(
      (pieces.size() + BITS_IN_BYTE - 1) / BITS_IN_BYTE, 0
    );

    for (auto i : pieces.indices()) {
        packed[i / BITS_IN_BYTE] |= uint8_t(1 << (7 - (i % BITS_IN_BYTE)));
    }

    return packed;
}

auto unpack_bitfield(std::span<const uint8_t> bitfield) -> PieceSet
{
    PieceSet pieces(bitfield.size() * BITS_IN_BYTE);

    for (std::size_t i = 0; i < pieces.size(); ++i) {
        if (bitfield[i / BITS_IN_BYTE] & (1 << (7 - (i % BITS_IN_BYTE)))) {
            pieces.set(i);
        }
    }

    return pieces;
}

}  // namespace peerwire::proto
