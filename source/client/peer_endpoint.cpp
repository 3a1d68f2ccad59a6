#include <charconv>

#include "client/peer_endpoint.hpp"

#include <fmt/format.h>

namespace ftr
{
std::string PeerEndpoint::to_string() const
{
  if (address.is_v6()) {
    return fmt::format("[{}]:{}", address.to_string(), port);
  }

  return fmt::format("{}:{}", address.to_string(), port);
}

Result<PeerEndpoint> PeerEndpoint::parse(std::string_view text)
{
  auto colon = text.rfind(':');
  if (colon == std::string_view::npos || colon == 0) {
    return std::unexpected(make_error(
        ErrorKind::InvalidInput, fmt::format("peer '{}': expected host:port", text)));
  }

  auto host = text.substr(0, colon);
  auto port_text = text.substr(colon + 1);
  if (host.starts_with('[') && host.ends_with(']')) {
    host = host.substr(1, host.size() - 2);
  }

  uint16_t port = 0;
  auto [end, ec] =
      std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
  if (ec != std::errc {} || end != port_text.data() + port_text.size()
      || port == 0)
  {
    return std::unexpected(make_error(
        ErrorKind::InvalidInput, fmt::format("peer '{}': invalid port", text)));
  }

  boost::system::error_code address_error;
  auto address = boost::asio::ip::make_address(std::string(host), address_error);
  if (address_error) {
    return std::unexpected(make_error(
        ErrorKind::InvalidInput, fmt::format("peer '{}': invalid address", text)));
  }

  return PeerEndpoint {.address = address, .port = port};
}
}  // namespace ftr
