#include "torrent.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "bencode/decoders.hpp"
#include "bencode/types.hpp"
#include "misc/log.hpp"

namespace peerwire {

FileGeometry::FileGeometry(uint64_t total_length, uint64_t piece_length) :
  _total_length(total_length), _piece_length(piece_length), _piece_count(0)
{
    if (piece_length == 0) {
        throw std::invalid_argument("Piece length must be positive");
    }

    const auto count = (total_length + piece_length - 1) / piece_length;
    if (count > UINT32_MAX) {
        throw std::invalid_argument(fmt::format(
          "Torrent of {} bytes has too many pieces of {} bytes", total_length,
          piece_length
        ));
    }

    _piece_count = uint32_t(count);
}

auto FileGeometry::piece_size(uint32_t index) const -> uint64_t
{
    if (index >= _piece_count) {
        return 0;
    }

    if (index == _piece_count - 1) {
        return _total_length - uint64_t(index) * _piece_length;
    }

    return _piece_length;
}

namespace {

/**
 * @brief Single file "length" or the sum of multi file "files" lengths
 */
auto content_length(const bencode::Json& info) -> std::optional<bencode::Integer>
{
    if (info.contains("length")) {
        if (not info["length"].is_number_integer()) {
            return std::nullopt;
        }
        return info["length"].get<bencode::Integer>();
    }

    auto files = info.value("files", bencode::Json::array());
    if (not files.is_array() or files.empty()) {
        return std::nullopt;
    }

    bencode::Integer length = 0;
    for (auto&& file : files) {
        if (not file.is_object() or not file.contains("length") or
            not file["length"].is_number_integer()) {
            return std::nullopt;
        }

        const auto file_length = file["length"].get<bencode::Integer>();
        if (file_length < 0 or
            length > std::numeric_limits<bencode::Integer>::max() - file_length) {
            return std::nullopt;
        }
        length += file_length;
    }

    return length;
}

}  // namespace

auto Metainfo::from_bencoded(std::string_view content) -> std::optional<Metainfo>
{
    auto metainfo_json = bencode::decode(content);
    if (not metainfo_json or not metainfo_json->is_object()) {
        return std::nullopt;
    }

    auto info = metainfo_json->value("info", bencode::Json());
    if (not info.is_object() or not info.contains("piece length") or
        not info["piece length"].is_number_integer()) {
        return std::nullopt;
    }

    auto length = content_length(info);
    auto piece_length = info["piece length"].get<bencode::Integer>();

    if (not length or *length < 0 or piece_length <= 0) {
        log::logger()->debug(
          "Metainfo has bad geometry: length {}, piece length {}",
          length.value_or(-1), piece_length
        );
        return std::nullopt;
    }

    std::string announce = "unknown";
    if (auto it = metainfo_json->find("announce");
        it != metainfo_json->end() and it->is_string()) {
        announce = it->get<std::string>();
    }

    return Metainfo{
      .announce = announce,
      .length = *length,
      .piece_length = piece_length
    };
}

auto Metainfo::from_file(std::filesystem::path file_path)
  -> std::optional<Metainfo>
{
    std::ifstream torrent_file(file_path, std::ios::in | std::ios::binary);
    if (not torrent_file) {
        return std::nullopt;
    }

    std::string torrent_content(
      (std::istreambuf_iterator<char>(torrent_file)),
      (std::istreambuf_iterator<char>())
    );

    return from_bencoded(torrent_content);
}

auto Metainfo::geometry() const -> FileGeometry
{
    return FileGeometry(uint64_t(length), uint64_t(piece_length));
}

}  // namespace peerwire
