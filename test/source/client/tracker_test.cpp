#include <cstring>

#include <catch2/catch_test_macros.hpp>

#include "auxiliary/big_endian.hpp"
#include "client/tracker/tracker.hpp"

using ftr::ErrorKind;
using ftr::PeerEndpoint;

namespace
{
std::string compact(std::initializer_list<std::array<uint8_t, 6>> peers)
{
  std::string bytes;
  for (const auto& peer : peers) {
    bytes.append(reinterpret_cast<const char*>(peer.data()), peer.size());
  }
  return bytes;
}

std::vector<uint8_t> udp_header(uint32_t action, uint32_t transaction_id)
{
  std::vector<uint8_t> datagram(8);
  ftr::aux::store_big_endian(datagram.data(), action);
  ftr::aux::store_big_endian(datagram.data() + 4, transaction_id);
  return datagram;
}
}  // namespace

TEST_CASE("Compact peer lists decode", "[tracker]")
{
  auto peers = ftr::parse_compact_peers(compact({
      {10, 0, 0, 1, 0x1a, 0xe1},
      {0, 0, 0, 0, 0x1a, 0xe1},  // unroutable
      {192, 168, 1, 20, 0x00, 0x50},
  }) + std::string("\x01\x02", 2));

  REQUIRE(peers.size() == 2);
  REQUIRE(peers[0].to_string() == "10.0.0.1:6881");
  REQUIRE(peers[1].to_string() == "192.168.1.20:80");
}

TEST_CASE("HTTP announce replies", "[tracker]")
{
  SECTION("compact peers")
  {
    auto body = "d8:intervali900e5:peers12:"
        + compact({{127, 0, 0, 1, 0x1a, 0xe1}, {127, 0, 0, 2, 0x1a, 0xe2}}) + "e";
    auto reply = ftr::parse_http_announce(body);
    REQUIRE(reply);
    REQUIRE(reply->interval == std::chrono::seconds(900));
    REQUIRE(reply->peers.size() == 2);
    REQUIRE(reply->peers[1].port == 6882);
  }

  SECTION("dictionary peers")
  {
    auto reply = ftr::parse_http_announce(
        "d5:peersld2:ip9:127.0.0.14:porti6881eed2:ip3:::14:porti51413eed2:ip"
        "7:garbage4:porti1eeee");
    REQUIRE(reply);
    REQUIRE(reply->peers.size() == 2);
    REQUIRE(reply->peers[0].to_string() == "127.0.0.1:6881");
    REQUIRE(reply->peers[1].to_string() == "[::1]:51413");
  }

  SECTION("failure reason")
  {
    auto reply = ftr::parse_http_announce("d14:failure reason11:not allowede");
    REQUIRE_FALSE(reply);
    REQUIRE(reply.error().kind == ErrorKind::Transport);
    REQUIRE(reply.error().message.find("not allowed") != std::string::npos);
  }

  SECTION("not bencode")
  {
    auto reply = ftr::parse_http_announce("<html>");
    REQUIRE_FALSE(reply);
    REQUIRE(reply.error().kind == ErrorKind::Transport);
  }
}

TEST_CASE("UDP tracker replies", "[tracker]")
{
  constexpr uint32_t TRANSACTION = 0xCAFEBABE;

  SECTION("connect")
  {
    auto datagram = udp_header(0, TRANSACTION);
    datagram.resize(16);
    ftr::aux::store_big_endian(datagram.data() + 8, uint64_t {0x0102030405060708});

    auto connection = ftr::parse_udp_connect(datagram, TRANSACTION);
    REQUIRE(connection);
    REQUIRE(*connection == 0x0102030405060708);

    auto mismatched = ftr::parse_udp_connect(datagram, TRANSACTION + 1);
    REQUIRE_FALSE(mismatched);
  }

  SECTION("announce")
  {
    auto datagram = udp_header(1, TRANSACTION);
    datagram.resize(20);
    ftr::aux::store_big_endian(datagram.data() + 8, uint32_t {120});
    auto peers = compact({{10, 1, 2, 3, 0x1a, 0xe1}});
    datagram.insert(datagram.end(), peers.begin(), peers.end());

    auto reply = ftr::parse_udp_announce(datagram, TRANSACTION);
    REQUIRE(reply);
    REQUIRE(reply->interval == std::chrono::seconds(120));
    REQUIRE(reply->peers.size() == 1);
    REQUIRE(reply->peers[0].to_string() == "10.1.2.3:6881");
  }

  SECTION("error")
  {
    auto datagram = udp_header(3, TRANSACTION);
    std::string_view text = "torrent not registered";
    datagram.insert(datagram.end(), text.begin(), text.end());

    auto reply = ftr::parse_udp_announce(datagram, TRANSACTION);
    REQUIRE_FALSE(reply);
    REQUIRE(reply.error().message.find("not registered") != std::string::npos);
  }

  SECTION("truncated")
  {
    REQUIRE_FALSE(ftr::parse_udp_announce(udp_header(1, TRANSACTION), TRANSACTION));
    REQUIRE_FALSE(ftr::parse_udp_connect(std::vector<uint8_t>(4), TRANSACTION));
  }
}

TEST_CASE("Tracker URLs", "[tracker]")
{
  auto udp = ftr::Tracker::from_url("udp://tracker.example.org:1337/announce");
  REQUIRE(udp);
  REQUIRE(udp->protocol() == ftr::Tracker::Protocol::Udp);

  auto http = ftr::Tracker::from_url("http://tracker.example.org/announce");
  REQUIRE(http);
  REQUIRE(http->protocol() == ftr::Tracker::Protocol::Http);

  REQUIRE_FALSE(ftr::Tracker::from_url("udp://tracker.example.org"));
  REQUIRE_FALSE(ftr::Tracker::from_url("wss://tracker.example.org"));
}

TEST_CASE("Binary values are percent-encoded", "[tracker]")
{
  std::array<uint8_t, 6> bytes {'a', 'Z', '9', '-', 0x00, 0xff};
  REQUIRE(ftr::url_encode(bytes) == "aZ9-%00%FF");
}

TEST_CASE("Peer endpoints parse from text", "[tracker]")
{
  auto v4 = PeerEndpoint::parse("192.0.2.7:6881");
  REQUIRE(v4);
  REQUIRE(v4->port == 6881);

  auto v6 = PeerEndpoint::parse("[2001:db8::1]:51413");
  REQUIRE(v6);
  REQUIRE(v6->address.is_v6());
  REQUIRE(v6->to_string() == "[2001:db8::1]:51413");

  for (auto text : {"192.0.2.7", "192.0.2.7:0", "host:70000", "example.com:80"}) {
    INFO(text);
    REQUIRE_FALSE(PeerEndpoint::parse(text));
  }
}
