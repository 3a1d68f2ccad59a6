#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>

#include "auxiliary/peer_id.hpp"
#include "client/context.hpp"
#include "client/error.hpp"
#include "client/peer_endpoint.hpp"
#include "client/transport/locator.hpp"
#include "torrent/tracker_messages.hpp"

namespace ftr
{
struct AnnounceParams
{
  InfoHash info_hash {};
  aux::PeerId peer_id;
  uint64_t downloaded = 0;
  uint64_t uploaded = 0;
  uint64_t left = 0;
  uint16_t port = 6881;
  int32_t num_want = 50;
  AnnounceEvent event = AnnounceEvent::None;
};

struct AnnounceResponse
{
  std::chrono::seconds interval {0};
  std::vector<PeerEndpoint> peers;
};

// 6 bytes per peer: IPv4 address and port in network order.
std::vector<PeerEndpoint> parse_compact_peers(std::string_view bytes);

// Bencoded HTTP tracker reply; "failure reason" becomes a TransportError.
Result<AnnounceResponse> parse_http_announce(std::string_view body);

Result<uint64_t> parse_udp_connect(std::span<const uint8_t> datagram,
                                   uint32_t transaction_id);

Result<AnnounceResponse> parse_udp_announce(std::span<const uint8_t> datagram,
                                            uint32_t transaction_id);

std::string url_encode(std::span<const uint8_t> bytes);

class Tracker
{
public:
  enum class Protocol : uint8_t
  {
    Udp,
    Http
  };

  static Result<Tracker> from_url(std::string_view url);

  const std::string& url() const { return m_url; }

  Protocol protocol() const { return m_protocol; }

  /*
   * One announce round trip. Throws TransferException(Transport) on timeout,
   * unreachable tracker, or an error reply.
   */
  boost::asio::awaitable<AnnounceResponse> announce(
      const AnnounceParams& params, std::chrono::seconds timeout) const;

private:
  Tracker() = default;

  boost::asio::awaitable<AnnounceResponse> announce_udp(
      const AnnounceParams& params, std::chrono::seconds timeout) const;

  // Connect and announce round trips of the UDP tracker protocol.
  boost::asio::awaitable<AnnounceResponse> exchange_udp(
      const AnnounceParams& params) const;

  boost::asio::awaitable<AnnounceResponse> announce_http(
      const AnnounceParams& params, std::chrono::seconds timeout) const;

  std::string m_url;
  Protocol m_protocol = Protocol::Udp;
  std::string m_host;
  std::string m_port;
  Locator m_http_locator;
};
}  // namespace ftr
