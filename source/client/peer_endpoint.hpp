#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "client/error.hpp"

namespace ftr
{
// Address of a remote peer as learned from a tracker or injected directly.
struct PeerEndpoint
{
  boost::asio::ip::address address;
  uint16_t port = 0;

  boost::asio::ip::tcp::endpoint as_tcp() const { return {address, port}; }

  std::string to_string() const;

  // Accepts "host:port" and "[v6]:port" with a literal address.
  static Result<PeerEndpoint> parse(std::string_view text);

  bool operator==(const PeerEndpoint& other) const
  {
    return address == other.address && port == other.port;
  }

  bool operator<(const PeerEndpoint& other) const
  {
    return address < other.address
        || (address == other.address && port < other.port);
  }
};
}  // namespace ftr
