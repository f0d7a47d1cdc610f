#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>


#include "bencode/types.hpp"

namespace peerwire {

/**
 * @brief Read-only view of torrent piece layout
 */
class Geometry
{
 public:
    virtual ~Geometry() = default;

    virtual auto piece_count() const -> uint32_t = 0;
    virtual auto piece_size(uint32_t index) const -> uint64_t = 0;
};

/**
 * @brief Every piece has the same size
 */
class UniformGeometry : public Geometry
{
 public:
    UniformGeometry(uint32_t piece_count, uint64_t piece_size) :
      _piece_count(piece_count), _piece_size(piece_size)
    {
    }

    auto piece_count() const -> uint32_t override { return _piece_count; }

    auto piece_size(uint32_t index) const -> uint64_t override
    {
        return index < _piece_count ? _piece_size : 0;
    }

 private:
    uint32_t _piece_count;
    uint64_t _piece_size;
};

/**
 * @brief Pieces of a file (or concatenated files). The last piece holds the
 *        remainder.
 */
class FileGeometry : public Geometry
{
 public:
    FileGeometry(uint64_t total_length, uint64_t piece_length);

    auto piece_count() const -> uint32_t override { return _piece_count; }
    auto piece_size(uint32_t index) const -> uint64_t override;

    auto total_length() const noexcept -> uint64_t { return _total_length; }
    auto piece_length() const noexcept -> uint64_t { return _piece_length; }

 private:
    uint64_t _total_length;
    uint64_t _piece_length;
    uint32_t _piece_count;
};

struct Metainfo
{
    const std::string announce;
    const bencode::Integer length;
    const bencode::Integer piece_length;

    static auto from_file(std::filesystem::path) -> std::optional<Metainfo>;
    static auto from_bencoded(std::string_view) -> std::optional<Metainfo>;

    auto geometry() const -> FileGeometry;
};

}  // namespace peerwire
