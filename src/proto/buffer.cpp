#include "proto/buffer.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/core.h>

namespace peerwire::proto {

SharedBytes::SharedBytes(Bytes bytes) :
  _storage(std::make_shared<const Bytes>(std::move(bytes))),
  _offset(0),
  _length(_storage->size())
{
}

SharedBytes::SharedBytes(
  std::shared_ptr<const Bytes> storage, std::size_t offset, std::size_t length
) :
  _storage(std::move(storage)),
  _offset(offset),
  _length(length)
{
}

auto SharedBytes::span() const noexcept -> std::span<const uint8_t>
{
    if (not _storage) {
        return {};
    }
    return std::span<const uint8_t>(*_storage).subspan(_offset, _length);
}

auto SharedBytes::slice(std::size_t offset, std::size_t length) const
  -> SharedBytes
{
    if (offset > _length or length > _length - offset) {
        throw std::out_of_range(fmt::format(
          "Slice [{}, +{}) is out of view of {} bytes", offset, length, _length
        ));
    }

    return SharedBytes(_storage, _offset + offset, length);
}

auto SharedBytes::slice(std::size_t offset) const -> SharedBytes
{
    if (offset > _length) {
        throw std::out_of_range(fmt::format(
          "Slice offset {} is out of view of {} bytes", offset, _length
        ));
    }

    return slice(offset, _length - offset);
}

auto SharedBytes::to_vector() const -> Bytes
{
    const auto bytes = span();
    return Bytes(bytes.begin(), bytes.end());
}

auto operator==(const SharedBytes& lhs, const SharedBytes& rhs) -> bool
{
    return std::ranges::equal(lhs.span(), rhs.span());
}

}  // namespace peerwire::proto
