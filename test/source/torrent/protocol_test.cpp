#include <string>

#include <catch2/catch_test_macros.hpp>

#include "client/transmit/transmit.hpp"
#include "torrent/bitfield/bitfield.hpp"

using namespace ftr;

TEST_CASE("Handshake", "[protocol]")
{
  REQUIRE(sizeof(Handshake) == 68);

  Handshake handshake {};

  REQUIRE(handshake.plen == sizeof(handshake.pname));

  // std::string is required to avoid null terminator at the end of the string literal
  REQUIRE(std::string(handshake.pname.view()) == std::string("BitTorrent protocol"));
  REQUIRE(handshake.speaks_protocol());

  InfoHash hash {};
  hash.fill(0x5a);
  aux::PeerId id;
  Handshake addressed {hash, id};
  REQUIRE(addressed.info_hash() == hash);
  REQUIRE(std::equal(id.as_raw().begin(), id.as_raw().end(), addressed.peer_id));

  addressed.plen = 18;
  REQUIRE_FALSE(addressed.speaks_protocol());
}

TEST_CASE("Peer ids carry the client prefix", "[protocol]")
{
  aux::PeerId first;
  aux::PeerId second;
  REQUIRE(first.as_string().starts_with("-FT0100-"));
  REQUIRE(first.as_raw() != second.as_raw());
}

TEST_CASE("Requests encode in network order", "[protocol]")
{
  auto bytes = encode_message(Request {3, 16384, 16384});

  REQUIRE(bytes
          == std::vector<uint8_t> {0, 0, 0, 13, ID_REQUEST, 0, 0, 0, 3, 0, 0,
                                   0x40, 0, 0, 0, 0x40, 0});

  auto decoded = decode_frame(bytes);
  REQUIRE(decoded);
  const auto& request = std::get<Request>(*decoded);
  REQUIRE(static_cast<uint32_t>(request.piece_index) == 3);
  REQUIRE(static_cast<uint32_t>(request.offset_within_piece) == 16384);
}

TEST_CASE("Piece frames carry their block", "[protocol]")
{
  std::vector<uint8_t> block {1, 2, 3, 4, 5};
  auto bytes = encode_message(make_piece(7, 32, block));
  REQUIRE(bytes.size() == 13 + block.size());
  REQUIRE(aux::load_big_endian<uint32_t>(bytes.data()) == 9 + block.size());

  auto decoded = decode_frame(bytes);
  REQUIRE(decoded);
  const auto& piece = std::get<Piece>(*decoded);
  REQUIRE(static_cast<uint32_t>(piece.get_metadata().piece_index) == 7);
  REQUIRE(static_cast<uint32_t>(piece.get_metadata().offset_within_piece) == 32);
  REQUIRE(piece.get_payload() == block);
}

TEST_CASE("Status and bitfield frames", "[protocol]")
{
  REQUIRE(encode_message(Keepalive {}) == std::vector<uint8_t> {0, 0, 0, 0});
  REQUIRE(std::holds_alternative<Keepalive>(*decode_frame(std::vector<uint8_t> {0, 0, 0, 0})));

  auto unchoke = decode_frame(std::vector<uint8_t> {0, 0, 0, 1, ID_UNCHOKE});
  REQUIRE(unchoke);
  REQUIRE(std::holds_alternative<Unchoke>(*unchoke));

  auto have = decode_frame(encode_message(Have {12}));
  REQUIRE(have);
  REQUIRE(static_cast<uint32_t>(std::get<Have>(*have).piece_index) == 12);

  aux::BitField pieces {10};
  pieces.mark(0, true);
  pieces.mark(9, true);
  REQUIRE(pieces.as_raw() == std::vector<uint8_t> {0x80, 0x40});
  REQUIRE(pieces.fits(10));
  REQUIRE(pieces.count() == 2);

  auto bitfield = decode_frame(encode_message(BitFieldMessage {pieces.as_raw()}));
  REQUIRE(bitfield);
  aux::BitField received {std::get<BitFieldMessage>(*bitfield).get_payload()};
  REQUIRE(received.get(9));
  REQUIRE_FALSE(received.get(8));

  aux::BitField spare_bits {std::vector<uint8_t> {0xff, 0xff}};
  REQUIRE_FALSE(spare_bits.fits(10));
  REQUIRE_FALSE(spare_bits.fits(24));
}

TEST_CASE("Malformed frames are rejected", "[protocol]")
{
  auto unknown = decode_frame(std::vector<uint8_t> {0, 0, 0, 1, 42});
  REQUIRE_FALSE(unknown);
  REQUIRE(unknown.error() == ParseError::UnknownId);

  auto long_choke = decode_frame(std::vector<uint8_t> {0, 0, 0, 2, ID_CHOKE, 0});
  REQUIRE_FALSE(long_choke);
  REQUIRE(long_choke.error() == ParseError::LengthMismatch);

  auto truncated = decode_frame(std::vector<uint8_t> {0, 0, 0, 9, ID_HAVE, 0});
  REQUIRE_FALSE(truncated);
  REQUIRE(truncated.error() == ParseError::LengthMismatch);

  auto short_have = decode_frame(std::vector<uint8_t> {0, 0, 0, 2, ID_HAVE, 0});
  REQUIRE_FALSE(short_have);
}
