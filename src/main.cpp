#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <magic_enum.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "misc/hex.hpp"
#include "misc/log.hpp"
#include "misc/parse_ip_port.hpp"
#include "proto/bitfield.hpp"
#include "proto/deserialize.hpp"
#include "proto/extension.hpp"
#include "proto/format.hpp"
#include "proto/serialize.hpp"
#include "torrent.hpp"

namespace fs = std::filesystem;
namespace proto = peerwire::proto;

#ifdef PEERWIRE_ENABLE_TESTS
void tests();
#endif


#define EXPECTED(assertion, ...)                                               \
    do {                                                                       \
        if (not bool(assertion)) {                                             \
            spdlog::error(__VA_ARGS__);                                        \
            return ExitCode::Fail;                                             \
        }                                                                      \
    } while (0)


enum ExitCode
{
    Success = EXIT_SUCCESS,
    Fail = EXIT_FAILURE,
};

struct CliOptions
{
    spdlog::level::level_enum log_level = spdlog::level::err;
    proto::DecodeOptions decode;
    std::vector<std::string> args;  // positional, command first
};

auto parse_cli(int argc, char* argv[]) -> CliOptions;

auto decode_command(
  const CliOptions& cli,
  uint32_t piece_count,
  uint64_t piece_length,
  std::string_view hex_frame,
  const std::optional<peerwire::peers::PeerEndpoint>& peer
) -> ExitCode;
auto inspect_command(
  const CliOptions& cli, fs::path torrent_file_path, std::string_view hex_frame
) -> ExitCode;
auto encode_command(const std::vector<std::string>& args) -> ExitCode;


int main(int argc, char* argv[])
{
    auto cli = parse_cli(argc, argv);

    spdlog::stdout_color_mt(peerwire::log::LOGGER_NAME);
    spdlog::set_level(cli.log_level);

    if (cli.args.empty()) {
        // clang-format off
        spdlog::error("Usage:");
        spdlog::error("  {} [-v|-vv] [--legacy-port] decode <piece_count> <piece_length> <hex_frame> [<peer_ip>:<peer_port>]", argv[0]);
        spdlog::error("  {} [-v|-vv] [--legacy-port] inspect <torrent_file_path> <hex_frame>", argv[0]);
        spdlog::error("  {} encode <kind> [<field>...]", argv[0]);
        spdlog::error("  {} test", argv[0]);
        // clang-format on
        return ExitCode::Fail;
    }

    const auto& args = cli.args;
    const auto& command = args[0];

    try {
        if (command == "test") {
#ifdef PEERWIRE_ENABLE_TESTS
            tests();
            return ExitCode::Success;
#else
            spdlog::error("Built without tests");
            return ExitCode::Fail;
#endif
        }

        if (command == "decode") {
            EXPECTED(
              args.size() == 4 or args.size() == 5,
              "Usage: {} decode <piece_count> <piece_length> <hex_frame> "
              "[<peer_ip>:<peer_port>]",
              argv[0]
            );

            std::optional<peerwire::peers::PeerEndpoint> peer;
            if (args.size() == 5) {
                peer = peerwire::utils::parse_ip_port(args[4]);
            }

            auto piece_count = std::stoull(args[1]);
            EXPECTED(
              piece_count <= UINT32_MAX, "Piece count {} is too large",
              piece_count
            );

            return decode_command(
              cli, uint32_t(piece_count), std::stoull(args[2]), args[3], peer
            );
        }

        if (command == "inspect") {
            EXPECTED(
              args.size() == 3,
              "Usage: {} inspect <torrent_file_path> <hex_frame>", argv[0]
            );

            return inspect_command(cli, args[1], args[2]);
        }

        if (command == "encode") {
            EXPECTED(
              args.size() >= 2, "Usage: {} encode <kind> [<field>...]", argv[0]
            );

            return encode_command({std::next(args.begin()), args.end()});
        }
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return ExitCode::Fail;
    }

    spdlog::error(R"(Unknown command: "{0}")", command);
    return ExitCode::Fail;
}


auto parse_cli(int argc, char* argv[]) -> CliOptions
{
    CliOptions cli;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-v") {
            cli.log_level = spdlog::level::debug;
        }
        else if (arg == "-vv") {
            cli.log_level = spdlog::level::trace;
        }
        else if (arg == "--legacy-port") {
            cli.decode.port_byte_order = proto::utils::ByteOrder::LittleEndian;
        }
        else {
            cli.args.emplace_back(arg);
        }
    }

    return cli;
}


auto print_message(const proto::Message& msg) -> void
{
    fmt::print("{}\n", msg);

    if (auto piece = msg.as<proto::PieceMsg>()) {
        fmt::print("Block: {}\n", peerwire::utils::to_hex(piece->block.span()));
    }

    if (auto bitfield = msg.as<proto::BitfieldMsg>()) {
        fmt::print("Pieces: {}\n", fmt::join(bitfield->pieces.indices(), " "));
    }

    if (auto extension = msg.as<proto::ExtensionMsg>()) {
        static const auto registry = proto::ExtensionRegistry::with_defaults();

        auto decoded = registry.decode(*extension);
        if (decoded) {
            fmt::print("Payload: {}\n", decoded->dump(
              -1, ' ', false, nlohmann::json::error_handler_t::replace
            ));
        }
        else {
            fmt::print(
              "Payload: {} ({})\n",
              peerwire::utils::to_hex(extension->payload.span()),
              magic_enum::enum_name(decoded.error())
            );
        }
    }
}


auto decode_frame(
  const CliOptions& cli,
  const peerwire::Geometry& geometry,
  std::string_view hex_frame,
  const peerwire::peers::PeerIdentity* peer
) -> ExitCode
{
    auto frame = peerwire::utils::from_hex(hex_frame);
    EXPECTED(frame.has_value(), "Not a hex string: {}", hex_frame);

    auto msg = proto::parse_message(std::move(*frame), geometry, cli.decode);
    EXPECTED(msg.has_value(), "{}", msg.error());

    if (peer) {
        peerwire::log::logger()->debug("{}", proto::describe(*msg, *peer));
    }

    print_message(*msg);

    return ExitCode::Success;
}


auto decode_command(
  const CliOptions& cli,
  uint32_t piece_count,
  uint64_t piece_length,
  std::string_view hex_frame,
  const std::optional<peerwire::peers::PeerEndpoint>& peer
) -> ExitCode
{
    peerwire::UniformGeometry geometry(piece_count, piece_length);
    return decode_frame(cli, geometry, hex_frame, peer ? &*peer : nullptr);
}


auto inspect_command(
  const CliOptions& cli, fs::path torrent_file_path, std::string_view hex_frame
) -> ExitCode
{
    EXPECTED(
      fs::exists(torrent_file_path), "File not found: \"{}\"",
      torrent_file_path.c_str()
    );

    auto metainfo = peerwire::Metainfo::from_file(torrent_file_path);
    EXPECTED(
      metainfo.has_value(), "Error while file decoding: {}",
      torrent_file_path.c_str()
    );

    const auto geometry = metainfo->geometry();
    peerwire::log::logger()->debug(
      "Torrent {}: {} bytes in {} pieces of {} bytes", metainfo->announce,
      geometry.total_length(), geometry.piece_count(), geometry.piece_length()
    );

    return decode_frame(cli, geometry, hex_frame, nullptr);
}


auto to_u32(const std::string& value) -> uint32_t
{
    auto number = std::stoull(value);
    if (number > UINT32_MAX) {
        throw std::out_of_range(fmt::format("{} does not fit 32 bits", value));
    }
    return uint32_t(number);
}


auto encode_command(const std::vector<std::string>& args) -> ExitCode
{
    std::string name;
    for (char c : args[0]) {
        if (c != '_' and c != '-') {
            name.push_back(c);
        }
    }

    auto kind = magic_enum::enum_cast<proto::MsgKind>(
      name, magic_enum::case_insensitive
    );
    EXPECTED(kind.has_value(), "Unknown message kind: {}", args[0]);

    auto expect_fields = [&](std::size_t count) {
        if (args.size() != count + 1) {
            throw std::runtime_error(fmt::format(
              "{} takes {} field(s), {} given", *kind, count, args.size() - 1
            ));
        }
    };

    std::vector<uint8_t> frame;

    switch (*kind) {
        case proto::MsgKind::KeepAlive:
            expect_fields(0);
            frame = proto::pack_keep_alive_msg();
            break;

        case proto::MsgKind::Choke:
            expect_fields(0);
            frame = proto::pack_choke_msg();
            break;

        case proto::MsgKind::Unchoke:
            expect_fields(0);
            frame = proto::pack_unchoke_msg();
            break;

        case proto::MsgKind::Interested:
            expect_fields(0);
            frame = proto::pack_interested_msg();
            break;

        case proto::MsgKind::NotInterested:
            expect_fields(0);
            frame = proto::pack_not_interested_msg();
            break;

        case proto::MsgKind::Have:
            expect_fields(1);
            frame = proto::pack_have_msg(to_u32(args[1]));
            break;

        case proto::MsgKind::Bitfield: {
            EXPECTED(
              args.size() >= 2, "Usage: encode bitfield <piece_count> [<index>...]"
            );

            proto::PieceSet pieces(to_u32(args[1]));
            for (std::size_t i = 2; i < args.size(); ++i) {
                pieces.set(to_u32(args[i]));
            }
            frame = proto::pack_bitfield_msg(pieces);
            break;
        }

        case proto::MsgKind::Request:
            expect_fields(3);
            frame = proto::pack_request_msg(
              to_u32(args[1]), to_u32(args[2]), to_u32(args[3])
            );
            break;

        case proto::MsgKind::Cancel:
            expect_fields(3);
            frame = proto::pack_cancel_msg(
              to_u32(args[1]), to_u32(args[2]), to_u32(args[3])
            );
            break;

        case proto::MsgKind::Piece: {
            expect_fields(3);
            auto block = peerwire::utils::from_hex(args[3]);
            EXPECTED(block.has_value(), "Not a hex string: {}", args[3]);

            frame = proto::pack_piece_msg(to_u32(args[1]), to_u32(args[2]), *block);
            break;
        }

        case proto::MsgKind::Port: {
            expect_fields(1);
            auto port = to_u32(args[1]);
            EXPECTED(port <= UINT16_MAX, "Port {} is out of range", port);

            frame = proto::pack_port_msg(uint16_t(port));
            break;
        }

        case proto::MsgKind::Extension: {
            expect_fields(2);
            auto id = to_u32(args[1]);
            EXPECTED(id <= UINT8_MAX, "Extension id {} is out of range", id);

            auto payload = peerwire::utils::from_hex(args[2]);
            EXPECTED(payload.has_value(), "Not a hex string: {}", args[2]);

            frame = proto::pack_extension_msg(uint8_t(id), *payload);
            break;
        }
    }

    fmt::print("{}\n", peerwire::utils::to_hex(frame));

    return ExitCode::Success;
}
