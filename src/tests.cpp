#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "bencode/decoders.hpp"
#include "bencode/encoders.hpp"
#include "misc/hex.hpp"
#include "misc/parse_ip_port.hpp"
#include "proto/bitfield.hpp"
#include "proto/buffer.hpp"
#include "proto/deserialize.hpp"
#include "proto/extension.hpp"
#include "proto/format.hpp"
#include "proto/messages.hpp"
#include "proto/registry.hpp"
#include "proto/serialize.hpp"
#include "proto/utils.hpp"
#include "proto/validate.hpp"
#include "torrent.hpp"

using namespace peerwire;
using namespace peerwire::proto;
using namespace std::string_view_literals;

using Json = nlohmann::json;

namespace {

const UniformGeometry GEOMETRY(4, 16384);

auto parse(
  std::vector<uint8_t> frame,
  const Geometry& geometry = GEOMETRY,
  const DecodeOptions& options = {}
) -> tl::expected<Message, Error>
{
    return parse_message(std::move(frame), geometry, options);
}

auto to_bytes(std::string_view s) -> std::vector<uint8_t>
{
    return {s.begin(), s.end()};
}

auto decodes_to(std::string_view encoded, const Json& expected) -> bool
{
    auto decoded = bencode::decode(encoded);
    return decoded and *decoded == expected;
}

}  // namespace

void test_pack_u32();
void test_registry();
void test_keep_alive();
void test_signal_messages();
void test_have();
void test_bitfield();
void test_request_and_cancel();
void test_piece();
void test_port();
void test_extension();
void test_framing_errors();
void test_end_to_end();
void test_round_trip();
void test_independent_readers();
void test_describe();
void test_builder_limits();
void test_bencode_decoding();
void test_bencode_encoding();
void test_extension_registry();
void test_geometry();
void test_metainfo();
void test_cli_helpers();

void tests()
{
    test_pack_u32();
    test_registry();
    test_keep_alive();
    test_signal_messages();
    test_have();
    test_bitfield();
    test_request_and_cancel();
    test_piece();
    test_port();
    test_extension();
    test_framing_errors();
    test_end_to_end();
    test_round_trip();
    test_independent_readers();
    test_describe();
    test_builder_limits();
    test_bencode_decoding();
    test_bencode_encoding();
    test_extension_registry();
    test_geometry();
    test_metainfo();
    test_cli_helpers();

    spdlog::info("All tests passed");
}

void test_pack_u32()
{
    uint32_t a = 32768;
    auto packed = proto::utils::pack_u32(a);
    assert((packed == std::vector<uint8_t>{0x00, 0x00, 0x80, 0x00}));
    assert(proto::utils::unpack_u32(packed) == a);

    std::vector<uint8_t> port;
    proto::utils::append_u16(port, 0x1ae1);
    assert((port == std::vector<uint8_t>{0x1a, 0xe1}));
    assert(proto::utils::unpack_u16(port) == 0x1ae1);
    assert(proto::utils::unpack_u16(port, proto::utils::ByteOrder::LittleEndian) == 0xe11a);
}

void test_registry()
{
    assert(byte_of(MsgKind::KeepAlive) == std::nullopt);
    assert(byte_of(MsgKind::Choke) == 0);
    assert(byte_of(MsgKind::Port) == 9);
    assert(byte_of(MsgKind::Extension) == 20);

    assert(kind_of(7) == MsgKind::Piece);
    assert(kind_of(10) == std::nullopt);
    assert(kind_of(99) == std::nullopt);
    assert(kind_of(255) == std::nullopt);

    for (auto&& info : KINDS) {
        if (info.id) {
            assert(kind_of(*info.id) == info.kind);
        }
    }

    assert(base_size_of(MsgKind::KeepAlive) == 0);
    assert(base_size_of(MsgKind::Have) == 5);
    assert(base_size_of(MsgKind::Request) == 13);
    assert(name_of(MsgKind::NotInterested) == "NotInterested");

    // Smallest payloads agree with the message records
    assert(base_size_of(MsgKind::Choke) == ID_SIZE + ChokeMsg::SIZE);
    assert(base_size_of(MsgKind::Have) == ID_SIZE + HaveMsg::SIZE);
    assert(base_size_of(MsgKind::Request) == ID_SIZE + RequestMsg::SIZE);
    assert(base_size_of(MsgKind::Cancel) == ID_SIZE + CancelMsg::SIZE);
    assert(base_size_of(MsgKind::Piece) == ID_SIZE + PieceMsg::MIN_SIZE);
    assert(base_size_of(MsgKind::Port) == ID_SIZE + PortMsg::SIZE);
    assert(base_size_of(MsgKind::Extension) == ID_SIZE + ExtensionMsg::MIN_SIZE);
}

void test_keep_alive()
{
    assert((pack_keep_alive_msg() == std::vector<uint8_t>{0, 0, 0, 0}));

    {
        auto msg = parse({0, 0, 0, 0});
        assert(msg);
        assert(msg->kind() == MsgKind::KeepAlive);
        assert(msg->is<KeepAliveMsg>());
        assert(msg->frame().size() == 4);
    }

    {  // zero length prefix followed by garbage
        auto msg = parse({0, 0, 0, 0, 1});
        assert(not msg);
        assert(msg.error().code == ErrorCode::LENGTH_MISMATCH);
        assert(msg.error().is_framing());
    }
}

void test_signal_messages()
{
    assert((pack_choke_msg() == std::vector<uint8_t>{0, 0, 0, 1, 0}));
    assert((pack_unchoke_msg() == std::vector<uint8_t>{0, 0, 0, 1, 1}));
    assert((pack_interested_msg() == std::vector<uint8_t>{0, 0, 0, 1, 2}));
    assert((pack_not_interested_msg() == std::vector<uint8_t>{0, 0, 0, 1, 3}));

    {
        auto msg = parse(pack_unchoke_msg());
        assert(msg);
        assert(msg->kind() == MsgKind::Unchoke);
    }

    {
        auto msg = parse(pack_not_interested_msg());
        assert(msg);
        assert(msg->kind() == MsgKind::NotInterested);
    }

    {  // fields where none are expected
        auto msg = parse({0, 0, 0, 2, 0, 0xff});
        assert(not msg);
        assert(msg.error().code == ErrorCode::TRAILING_BYTES);
        assert(msg.error().kind == MsgKind::Choke);
        assert(msg.error().offset == 5);
        assert(msg.error().is_framing());
    }
}

void test_have()
{
    {
        auto msg = parse(pack_have_msg(0));
        assert(msg);
        assert(msg->as<HaveMsg>()->index == 0);
    }

    {  // last piece
        auto msg = parse(pack_have_msg(3));
        assert(msg);
        assert(msg->as<HaveMsg>()->index == 3);
    }

    {  // one past the last piece
        auto msg = parse(pack_have_msg(4));
        assert(not msg);
        assert(msg.error().code == ErrorCode::PIECE_INDEX_OUT_OF_RANGE);
        assert(msg.error().category() == ErrorCategory::Validation);
        assert(msg.error().kind == MsgKind::Have);
        assert(msg.error().field == "index");
    }

    {
        UniformGeometry huge(UINT32_MAX, 1);
        auto msg = parse(pack_have_msg(UINT32_MAX - 1), huge);
        assert(msg);
        assert(msg->as<HaveMsg>()->index == UINT32_MAX - 1);

        assert(not parse(pack_have_msg(UINT32_MAX), huge));
    }

    {  // index cut short, prefix consistent
        auto msg = parse({0, 0, 0, 3, 4, 0, 0});
        assert(not msg);
        assert(msg.error().code == ErrorCode::INCOMPLETE_MESSAGE);
        assert(msg.error().field == "index");
        assert(msg.error().is_framing());
    }
}

void test_bitfield()
{
    const PieceSet pieces(10, {0, 3, 7, 8});
    assert(pieces.size() == 10);
    assert(pieces.count() == 4);
    assert(pieces.length() == 9);

    // Piece 0 is the most significant bit of byte 0
    assert((pack_bitfield(pieces) == std::vector<uint8_t>{0x91, 0x80}));
    assert((pack_bitfield_msg(pieces) ==
            std::vector<uint8_t>{0, 0, 0, 3, 5, 0x91, 0x80}));

    {
        UniformGeometry geometry(10, 16384);
        auto msg = parse(pack_bitfield_msg(pieces), geometry);
        assert(msg);

        const auto& decoded = msg->as<BitfieldMsg>()->pieces;
        assert((decoded.indices() == std::vector<std::size_t>{0, 3, 7, 8}));
        assert(decoded.test(0) and decoded.test(8));
        assert(not decoded.test(1) and not decoded.test(9));
        assert(decoded == pieces);
    }

    {  // spare bit for piece #10 set
        UniformGeometry geometry(10, 16384);
        auto msg = parse({0, 0, 0, 3, 5, 0x91, 0xa0}, geometry);
        assert(not msg);
        assert(msg.error().code == ErrorCode::BITFIELD_OUT_OF_RANGE);
        assert(msg.error().category() == ErrorCategory::Validation);
    }

    {  // empty bitfield
        auto msg = parse({0, 0, 0, 1, 5});
        assert(msg);
        assert(msg->as<BitfieldMsg>()->pieces.count() == 0);
    }

    {  // longer than needed but spare bytes clear
        auto msg = parse({0, 0, 0, 4, 5, 0xf0, 0x00, 0x00});
        assert(msg);
        assert(msg->as<BitfieldMsg>()->pieces.count() == 4);
    }

    assert(unpack_bitfield(std::vector<uint8_t>{0x01}).indices() ==
           std::vector<std::size_t>{7});
    assert(pack_bitfield(PieceSet(0)).empty());
}

void test_request_and_cancel()
{
    assert((pack_request_msg(0, 0, 16384) ==
            std::vector<uint8_t>{0, 0, 0, 13, 6, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0x40, 0}));

    {  // whole piece
        auto msg = parse(pack_request_msg(0, 0, 16384));
        assert(msg);
        auto request = msg->as<RequestMsg>();
        assert(request->index == 0);
        assert(request->begin == 0);
        assert(request->length == 16384);
    }

    {  // one byte past the piece end
        auto msg = parse(pack_request_msg(0, 16383, 2));
        assert(not msg);
        assert(msg.error().code == ErrorCode::BLOCK_OUT_OF_PIECE);
        assert(msg.error().kind == MsgKind::Request);
    }

    {  // offset + length would wrap in 32 bits
        auto msg = parse(pack_request_msg(1, UINT32_MAX, UINT32_MAX));
        assert(not msg);
        assert(msg.error().code == ErrorCode::BLOCK_OUT_OF_PIECE);
    }

    {
        auto msg = parse(pack_request_msg(4, 0, 1));
        assert(not msg);
        assert(msg.error().code == ErrorCode::PIECE_INDEX_OUT_OF_RANGE);
    }

    {
        auto msg = parse(pack_cancel_msg(3, 16000, 384));
        assert(msg);
        assert(msg->kind() == MsgKind::Cancel);
        assert((*msg->as<CancelMsg>() == CancelMsg{3, 16000, 384}));
    }

    {
        auto msg = parse(pack_cancel_msg(3, 16000, 385));
        assert(not msg);
        assert(msg.error().kind == MsgKind::Cancel);
    }

    {  // length field missing
        auto msg = parse({0, 0, 0, 9, 6, 0, 0, 0, 0, 0, 0, 0, 0});
        assert(not msg);
        assert(msg.error().code == ErrorCode::INCOMPLETE_MESSAGE);
        assert(msg.error().field == "length");
        assert(msg.error().offset == 13);
    }
}

void test_piece()
{
    const std::vector<uint8_t> block{1, 2, 3};

    assert((pack_piece_msg(1, 0, block) ==
            std::vector<uint8_t>{0, 0, 0, 12, 7, 0, 0, 0, 1, 0, 0, 0, 0, 1, 2, 3}));

    {
        auto msg = parse(pack_piece_msg(1, 16, block));
        assert(msg);

        auto piece = msg->as<PieceMsg>();
        assert(piece->index == 1);
        assert(piece->begin == 16);
        assert(piece->block.to_vector() == block);
        assert(piece->block.shares_storage_with(msg->frame()));
    }

    {  // the block keeps the frame alive
        SharedBytes kept;
        {
            auto msg = parse(pack_piece_msg(2, 0, block));
            assert(msg);
            kept = msg->as<PieceMsg>()->block;
        }
        assert(kept.to_vector() == block);
    }

    {  // empty block
        auto msg = parse(pack_piece_msg(0, 16384, {}));
        assert(msg);
        assert(msg->as<PieceMsg>()->block.empty());
    }

    {
        auto msg = parse(pack_piece_msg(0, 16383, std::vector<uint8_t>{1, 2}));
        assert(not msg);
        assert(msg.error().code == ErrorCode::BLOCK_OUT_OF_PIECE);
        assert(msg.error().kind == MsgKind::Piece);
    }

    {  // begin cut short
        auto msg = parse({0, 0, 0, 7, 7, 0, 0, 0, 1, 0, 0});
        assert(not msg);
        assert(msg.error().code == ErrorCode::INCOMPLETE_MESSAGE);
        assert(msg.error().field == "begin");
    }
}

void test_port()
{
    assert((pack_port_msg(6881) == std::vector<uint8_t>{0, 0, 0, 3, 9, 0x1a, 0xe1}));
    assert((pack_port_msg(6881, proto::utils::ByteOrder::LittleEndian) ==
            std::vector<uint8_t>{0, 0, 0, 3, 9, 0xe1, 0x1a}));

    const DecodeOptions legacy{.port_byte_order = proto::utils::ByteOrder::LittleEndian};

    {  // big-endian on both sides
        auto msg = parse(pack_port_msg(6881));
        assert(msg);
        assert(msg->as<PortMsg>()->port == 6881);
    }

    {  // little-endian on both sides
        auto msg = parse(pack_port_msg(6881, proto::utils::ByteOrder::LittleEndian), GEOMETRY, legacy);
        assert(msg);
        assert(msg->as<PortMsg>()->port == 6881);
    }

    {  // big-endian bytes read as little-endian
        auto msg = parse(pack_port_msg(6881), GEOMETRY, legacy);
        assert(msg);
        assert(msg->as<PortMsg>()->port == 0xe11a);
    }

    {  // one port byte only: decodes, then fails validation
        auto msg = parse({0, 0, 0, 2, 9, 0x1a});
        assert(not msg);
        assert(msg.error().code == ErrorCode::PORT_MISSING);
        assert(msg.error().category() == ErrorCategory::Validation);
    }

    {
        auto msg = parse({0, 0, 0, 1, 9});
        assert(not msg);
        assert(msg.error().code == ErrorCode::PORT_MISSING);
    }

    {
        auto msg = parse({0, 0, 0, 4, 9, 0x1a, 0xe1, 0});
        assert(not msg);
        assert(msg.error().code == ErrorCode::TRAILING_BYTES);
    }
}

void test_extension()
{
    assert((pack_extension_msg(3, {}) == std::vector<uint8_t>{0, 0, 0, 2, 20, 3}));

    {  // empty payload
        auto msg = parse(pack_extension_msg(3, {}));
        assert(msg);
        assert(msg->as<ExtensionMsg>()->extension_id == 3);
        assert(msg->as<ExtensionMsg>()->payload.empty());
    }

    {
        auto payload = to_bytes("d1:ai1ee");
        auto msg = parse(pack_extension_msg(1, payload));
        assert(msg);
        assert(msg->as<ExtensionMsg>()->payload.to_vector() == payload);
        assert(msg->as<ExtensionMsg>()->payload.shares_storage_with(msg->frame()));
    }

    {  // extension id missing
        auto msg = parse({0, 0, 0, 1, 20});
        assert(not msg);
        assert(msg.error().code == ErrorCode::INCOMPLETE_MESSAGE);
        assert(msg.error().field == "extension_id");
    }
}

void test_framing_errors()
{
    {
        auto msg = parse({0, 0, 0, 1, 99});
        assert(not msg);
        assert(msg.error().code == ErrorCode::UNKNOWN_MESSAGE_ID);
        assert(msg.error().is_framing());
        assert(msg.error().offset == 4);
        assert(msg.error().details.find("99") != std::string::npos);
    }

    {  // truncated
        auto frame = pack_have_msg(1);
        frame.pop_back();
        auto msg = parse(frame);
        assert(not msg);
        assert(msg.error().code == ErrorCode::LENGTH_MISMATCH);
    }

    {  // padded
        auto frame = pack_have_msg(1);
        frame.push_back(0);
        auto msg = parse(frame);
        assert(not msg);
        assert(msg.error().code == ErrorCode::LENGTH_MISMATCH);
    }

    {  // shorter than a length prefix
        auto msg = parse({0, 0});
        assert(not msg);
        assert(msg.error().code == ErrorCode::INCOMPLETE_MESSAGE);
    }

    {
        auto msg = parse({});
        assert(not msg);
        assert(msg.error().code == ErrorCode::INCOMPLETE_MESSAGE);
    }

    {
        auto header = unpack_msg_header(std::vector<uint8_t>{0, 0, 0, 5, 4});
        assert(header);
        assert(header->length == 5);
        assert(header->frame_size() == 9);

        assert(not unpack_msg_header(std::vector<uint8_t>{0, 0, 0}));
    }
}

void test_end_to_end()
{
    const UniformGeometry geometry(4, 16384);

    auto frame = pack_have_msg(2);
    assert((frame == std::vector<uint8_t>{0x00, 0x00, 0x00, 0x05, 0x04, 0x00, 0x00, 0x00, 0x02}));

    auto msg = parse_message(std::span<const uint8_t>(frame), geometry);
    assert(msg);
    assert(msg->kind() == MsgKind::Have);
    assert(msg->as<HaveMsg>()->index == 2);

    const UniformGeometry smaller(2, 16384);
    auto rejected = parse_message(std::span<const uint8_t>(frame), smaller);
    assert(not rejected);
    assert(rejected.error().category() == ErrorCategory::Validation);
}

void test_round_trip()
{
    const UniformGeometry geometry(16, 16384);

    const std::vector<Payload> payloads{
      KeepAliveMsg{},
      ChokeMsg{},
      UnchokeMsg{},
      InterestedMsg{},
      NotInterestedMsg{},
      HaveMsg{15},
      BitfieldMsg{PieceSet(16, {0, 1, 14, 15})},
      RequestMsg{1, 0, DEFAULT_REQUEST_SIZE},
      PieceMsg{15, 16380, SharedBytes(Bytes{0xde, 0xad, 0xbe, 0xef})},
      CancelMsg{0, 16383, 1},
      PortMsg{65535},
      ExtensionMsg{255, SharedBytes(to_bytes("d1:pi6881ee"))},
    };

    for (auto&& payload : payloads) {
        auto crafted = Message::craft(payload);
        assert(crafted.payload() == payload);
        assert(crafted.frame().to_vector() == pack_payload(payload));

        auto decoded = parse(crafted.frame().to_vector(), geometry);
        assert(decoded);
        assert(decoded->kind() == crafted.kind());
        assert(decoded->payload() == payload);
    }

    {  // crafted views point into the crafted frame
        auto crafted = Message::craft(PieceMsg{1, 2, SharedBytes(Bytes{7, 7})});
        assert(crafted.as<PieceMsg>()->block.shares_storage_with(crafted.frame()));
        assert((crafted.as<PieceMsg>()->block.to_vector() == Bytes{7, 7}));
    }

    {
        auto crafted = Message::craft(ExtensionMsg{4, SharedBytes(Bytes{1, 2, 3})});
        auto payload = crafted.as<ExtensionMsg>()->payload;
        assert(payload.shares_storage_with(crafted.frame()));
        assert((payload.to_vector() == Bytes{1, 2, 3}));
    }
}

void test_independent_readers()
{
    auto msg = parse(pack_request_msg(1, 2, 3));
    assert(msg);

    auto first = msg->reader();
    auto second = msg->reader();

    assert(first.read_u32() == 13);
    assert(first.read_u8() == 6);
    assert(first.position() == 5);

    // Untouched by the first reader
    assert(second.position() == 0);
    assert(second.read_u32() == 13);

    // Copies share bytes but not cursors
    auto copy = *msg;
    assert(copy.frame().shares_storage_with(msg->frame()));
    assert(copy.reader().position() == 0);

    auto rest = first.rest();
    assert(rest.size() == 12);
    assert(first.remaining() == 0);
    assert(not first.read_u8());
    assert(not first.read_bytes(1));
}

void test_describe()
{
    assert(fmt::format("{}", Message::craft(HaveMsg{2})) == "Have #2");
    assert(fmt::format("{}", Message::craft(RequestMsg{0, 0, 16384})) == "Request #0 (16384@0)");
    assert(fmt::format("{}", Message::craft(BitfieldMsg{PieceSet(10, {0, 3, 7, 8})})) == "Bitfield 4/10");
    assert(fmt::format("{}", Message::craft(PortMsg{6881})) == "Port 6881");
    assert(fmt::format("{}", Message::craft(PortMsg{})) == "Port <absent>");
    assert(fmt::format("{}", Message::craft(ChokeMsg{})) == "Choke");
    assert(fmt::format("{}", Message::craft(ExtensionMsg{0, SharedBytes(Bytes{1, 2})})) == "Extension id=0 (2 bytes)");

    auto peer = peerwire::utils::parse_ip_port("10.0.0.1:6881");
    assert(describe(Message::craft(HaveMsg{2}), peer) == "10.0.0.1:6881 Have #2");

    auto msg = parse({0, 0, 0, 1, 99});
    assert(not msg);
    auto text = fmt::format("{}", msg.error());
    assert(text.find("Framing") != std::string::npos);
    assert(text.find("UNKNOWN_MESSAGE_ID") != std::string::npos);
    assert(text.find("offset 4") != std::string::npos);
}

void test_builder_limits()
{
    bool thrown = false;
    try {
        internal::pack_msg_header(MsgKind::Piece, std::size_t(UINT32_MAX));
    } catch (const std::length_error&) {
        thrown = true;
    }
    assert(thrown);

    auto header = internal::pack_msg_header(MsgKind::Piece, std::size_t(UINT32_MAX) - 1);
    assert((header == std::vector<uint8_t>{0xff, 0xff, 0xff, 0xff, 7}));
}

void test_bencode_decoding()
{
    assert(decodes_to("i-123e", Json(-123)));
    assert(decodes_to("3:abc", Json("abc")));
    assert(decodes_to("l2:abe", Json::array({"ab"})));
    assert(decodes_to("d3:foo3:bar5:helloi52ee", R"({"hello": 52, "foo":"bar"})"_json));

    {  // keys come back sorted
        auto decoded = bencode::decode("d1:b3:foo1:a3:bare");
        assert(decoded);
        assert(decoded->dump() == R"({"a":"bar","b":"foo"})");
    }

    {  // not UTF-8, kept as bytes
        auto decoded = bencode::decode("3:\x01\x02\xff"sv);
        assert(decoded);
        assert(decoded->is_binary());
        assert(decoded->get_binary().size() == 3);
    }

    {
        auto decoded = bencode::decode_prefix("i1ei2e");
        assert(decoded);
        auto [value, consumed] = *decoded;
        assert(value == Json(1));
        assert(consumed == 3);
    }

    assert(not bencode::decode("3:abcX"));  // trailing data
    assert(not bencode::decode("3+abc"));
    assert(not bencode::decode("5:abc"));
    assert(not bencode::decode("iasde"));
    assert(not bencode::decode("l2:aasdasdbe"));
    assert(not bencode::decode("d3:fooe"));
    assert(not bencode::decode("d3:foo2bare"));
    assert(not bencode::decode("li1e"));
    assert(not bencode::decode(""));

    {
        std::string nested(10, 'l');
        nested += std::string(10, 'e');
        assert(bencode::decode(nested));

        std::string too_deep(100, 'l');
        too_deep += std::string(100, 'e');
        assert(not bencode::decode(too_deep));
    }
}

void test_bencode_encoding()
{
    using namespace bencode::internal;

    assert(encode_integer(Json(123)) == "i123e");
    assert(encode_integer(Json(-123)) == "i-123e");
    assert(encode_string(Json("asdasdasd")) == "9:asdasdasd");
    assert(encode_binary(Json::binary(std::vector<uint8_t>{1, 2, 3})) == "3:\1\2\3");

    assert(bencode::encode(R"({"foo":"bar","buz":2})"_json) == "d3:buzi2e3:foo3:bare");
    assert(bencode::encode(R"([1, 2, 3])"_json) == "li1ei2ei3ee");
    assert(bencode::encode(Json(1.5)) == std::nullopt);
    assert(bencode::encode(R"({"a": [true]})"_json) == std::nullopt);

    auto document = R"({"m": {"ut_pex": 1}, "p": 6881, "v": "peerwire"})"_json;
    auto encoded = bencode::encode(document);
    assert(encoded);
    assert(decodes_to(*encoded, document));
}

void test_extension_registry()
{
    auto registry = ExtensionRegistry::with_defaults();
    assert(registry.contains(ExtensionRegistry::HANDSHAKE_ID));
    assert(registry.name_of(0) == "handshake");
    assert(registry.name_of(7) == std::nullopt);

    const auto handshake = R"({"m": {"ut_pex": 1}, "p": 6881, "v": "peerwire"})"_json;

    {
        auto payload = pack_extended_handshake(handshake);
        assert(payload);

        auto msg = parse(pack_extension_msg(ExtensionRegistry::HANDSHAKE_ID, *payload));
        assert(msg);

        auto decoded = registry.decode(*msg->as<ExtensionMsg>());
        assert(decoded);
        assert((*decoded)["m"]["ut_pex"] == 1);
        assert((*decoded)["p"] == 6881);
        assert(*decoded == handshake);
    }

    {  // handshake must be a dictionary
        auto msg = parse(pack_extension_msg(0, to_bytes("i1e")));
        assert(msg);

        auto decoded = registry.decode(*msg->as<ExtensionMsg>());
        assert(not decoded);
        assert(decoded.error() == ExtensionDecodeError::MALFORMED_PAYLOAD);
    }

    {
        auto msg = parse(pack_extension_msg(7, to_bytes("abc")));
        assert(msg);

        auto decoded = registry.decode(*msg->as<ExtensionMsg>());
        assert(not decoded);
        assert(decoded.error() == ExtensionDecodeError::UNKNOWN_EXTENSION);

        registry.add(7, "length", [](std::span<const uint8_t> payload) {
            return std::optional<Json>(payload.size());
        });

        decoded = registry.decode(*msg->as<ExtensionMsg>());
        assert(decoded);
        assert(*decoded == Json(3));
    }

    assert(not pack_extended_handshake(Json::array({1})));
}

void test_geometry()
{
    {
        FileGeometry geometry(40000, 16384);
        assert(geometry.piece_count() == 3);
        assert(geometry.piece_size(0) == 16384);
        assert(geometry.piece_size(2) == 40000 - 2 * 16384);
        assert(geometry.piece_size(3) == 0);

        // Last piece is shorter
        assert(parse(pack_request_msg(2, 7000, 232), geometry));
        assert(not parse(pack_request_msg(2, 7000, 233), geometry));
    }

    {
        FileGeometry geometry(32768, 16384);
        assert(geometry.piece_count() == 2);
        assert(geometry.piece_size(1) == 16384);
    }

    {
        FileGeometry geometry(0, 16384);
        assert(geometry.piece_count() == 0);
        assert(not parse(pack_have_msg(0), geometry));
    }

    bool thrown = false;
    try {
        FileGeometry geometry(1, 0);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
}

void test_metainfo()
{
    {
        auto meta = Metainfo::from_bencoded(
          "d8:announce9:localhost4:infod6:lengthi40000e12:piece lengthi16384eee"
        );
        assert(meta);
        assert(meta->announce == "localhost");
        assert(meta->length == 40000);
        assert(meta->piece_length == 16384);
        assert(meta->geometry().piece_count() == 3);
    }

    {  // multi file
        auto meta = Metainfo::from_bencoded(
          "d4:infod5:filesld6:lengthi100eed6:lengthi28eee12:piece lengthi64eee"
        );
        assert(meta);
        assert(meta->announce == "unknown");
        assert(meta->length == 128);
        assert(meta->geometry().piece_count() == 2);
    }

    assert(not Metainfo::from_bencoded("d4:infod6:lengthi10eee"));
    assert(not Metainfo::from_bencoded("d4:infod6:lengthi10e12:piece lengthi0eee"));
    assert(not Metainfo::from_bencoded("d4:infod6:length3:abc12:piece lengthi1eee"));
    assert(not Metainfo::from_bencoded("i1e"));

    // Negative file length hidden by a larger one
    assert(not Metainfo::from_bencoded(
      "d4:infod5:filesld6:lengthi-5eed6:lengthi10eee12:piece lengthi1eee"
    ));

    // Sum of file lengths past 64 bits
    assert(not Metainfo::from_bencoded(
      "d4:infod5:filesld6:lengthi9000000000000000000eed6:lengthi9000000000000000000eee"
      "12:piece lengthi1eee"
    ));

    {
        auto path = std::filesystem::temp_directory_path() / "peerwire-test.torrent";
        {
            std::ofstream file(path, std::ios::out | std::ios::binary);
            file << "d4:infod6:lengthi16384e12:piece lengthi16384eee";
        }

        auto meta = Metainfo::from_file(path);
        std::filesystem::remove(path);

        assert(meta);
        assert(meta->geometry().piece_count() == 1);
    }

    assert(not Metainfo::from_file("/nonexistent/peerwire.torrent"));
}

void test_cli_helpers()
{
    assert(peerwire::utils::from_hex("00 00 00 05 04") == (std::vector<uint8_t>{0, 0, 0, 5, 4}));
    assert(peerwire::utils::from_hex("DEADbeef") == (std::vector<uint8_t>{0xde, 0xad, 0xbe, 0xef}));
    assert(not peerwire::utils::from_hex("0g"));
    assert(not peerwire::utils::from_hex("000"));
    assert(peerwire::utils::to_hex(std::vector<uint8_t>{0, 0x1a, 0xff}) == "001aff");

    auto peer = peerwire::utils::parse_ip_port("127.0.0.1:51413");
    assert(peer.ip() == "127.0.0.1");
    assert(peer.port() == 51413);
    assert(peer.display_address() == "127.0.0.1:51413");

    bool thrown = false;
    try {
        peerwire::utils::parse_ip_port("localhost");
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
}
