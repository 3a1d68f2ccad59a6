#include <algorithm>
#include <cstring>
#include <vector>

#include "client/tracker/tracker.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "auxiliary/timeout.hpp"
#include "client/transport/http_client.hpp"
#include "torrent/metadata/bencode.hpp"

using boost::asio::awaitable;
using boost::asio::use_awaitable;
using boost::asio::ip::udp;
using ftr::bencode::BeValue;
using ftr::bencode::BeValueTypeIndex;
using ftr::bencode::Dict;
using ftr::bencode::List;

namespace ftr
{
namespace
{
constexpr std::string_view UDP_PREFIX = "udp://";
constexpr size_t COMPACT_PEER_SIZE = 6;
constexpr size_t UDP_HEADER_SIZE = 8;
constexpr size_t MAX_DATAGRAM_SIZE = 65535;
constexpr uint64_t MAX_HTTP_RESPONSE = 1024 * 1024;
constexpr std::chrono::seconds DEFAULT_INTERVAL {1800};

TransferError tracker_error(std::string message)
{
  return make_error(ErrorKind::Transport, std::move(message));
}

// Error replies carry the message text after the 8 byte header.
std::optional<TransferError> udp_error_reply(std::span<const uint8_t> datagram,
                                             uint32_t transaction_id)
{
  if (datagram.size() < UDP_HEADER_SIZE) {
    return tracker_error("short tracker reply");
  }

  auto action = aux::load_big_endian<uint32_t>(datagram.data());
  auto received_id = aux::load_big_endian<uint32_t>(datagram.data() + 4);

  if (received_id != transaction_id) {
    return tracker_error("tracker transaction id mismatch");
  }

  if (action == static_cast<uint32_t>(Actions::Error)) {
    auto text = datagram.subspan(UDP_HEADER_SIZE);
    return tracker_error(fmt::format(
        "tracker error: {}",
        std::string_view(reinterpret_cast<const char*>(text.data()),
                         text.size())));
  }

  return std::nullopt;
}

std::string_view event_name(AnnounceEvent event)
{
  switch (event) {
    case AnnounceEvent::Started:
      return "started";
    case AnnounceEvent::Completed:
      return "completed";
    case AnnounceEvent::Stopped:
      return "stopped";
    case AnnounceEvent::None:
      break;
  }

  return {};
}
}  // namespace

std::vector<PeerEndpoint> parse_compact_peers(std::string_view bytes)
{
  std::vector<PeerEndpoint> peers;
  auto data = reinterpret_cast<const uint8_t*>(bytes.data());

  for (size_t i = 0; i + COMPACT_PEER_SIZE <= bytes.size();
       i += COMPACT_PEER_SIZE)
  {
    auto ip = aux::load_big_endian<uint32_t>(data + i);
    auto port = aux::load_big_endian<uint16_t>(data + i + 4);
    if (ip == 0 || port == 0) {
      continue;
    }
    peers.push_back(PeerEndpoint {
        .address = boost::asio::ip::make_address_v4(ip), .port = port});
  }

  return peers;
}

Result<AnnounceResponse> parse_http_announce(std::string_view body)
{
  BeValue document;
  try {
    document = bencode::BDecoder {}(body);
  } catch (const std::exception& e) {
    return std::unexpected(
        tracker_error(fmt::format("malformed tracker response: {}", e.what())));
  }

  if (document.which() != BeValueTypeIndex::IDict) {
    return std::unexpected(tracker_error("tracker response is not a dictionary"));
  }
  const auto& reply = boost::get<Dict>(document);

  if (auto failure = reply.find("failure reason"); failure != reply.end()) {
    auto reason = failure->second.which() == BeValueTypeIndex::IString
        ? boost::get<std::string>(failure->second)
        : std::string("unspecified");
    return std::unexpected(tracker_error(fmt::format("tracker failure: {}", reason)));
  }

  AnnounceResponse response {.interval = DEFAULT_INTERVAL, .peers = {}};

  if (auto interval = reply.find("interval");
      interval != reply.end() && interval->second.which() == BeValueTypeIndex::IInt64)
  {
    auto seconds = boost::get<int64_t>(interval->second);
    if (seconds > 0) {
      response.interval = std::chrono::seconds(seconds);
    }
  }

  auto peers = reply.find("peers");
  if (peers == reply.end()) {
    return response;
  }

  if (peers->second.which() == BeValueTypeIndex::IString) {
    response.peers = parse_compact_peers(boost::get<std::string>(peers->second));
    return response;
  }

  if (peers->second.which() != BeValueTypeIndex::IList) {
    return std::unexpected(tracker_error("tracker peers field has invalid type"));
  }

  for (const auto& entry : boost::get<List>(peers->second)) {
    if (entry.which() != BeValueTypeIndex::IDict) {
      continue;
    }
    const auto& peer = boost::get<Dict>(entry);
    auto ip = peer.find("ip");
    auto port = peer.find("port");
    if (ip == peer.end() || port == peer.end()
        || ip->second.which() != BeValueTypeIndex::IString
        || port->second.which() != BeValueTypeIndex::IInt64)
    {
      continue;
    }

    auto port_value = boost::get<int64_t>(port->second);
    boost::system::error_code ec;
    auto address =
        boost::asio::ip::make_address(boost::get<std::string>(ip->second), ec);
    if (ec || port_value <= 0 || port_value > 65535) {
      continue;
    }
    response.peers.push_back(PeerEndpoint {
        .address = address, .port = static_cast<uint16_t>(port_value)});
  }

  return response;
}

Result<uint64_t> parse_udp_connect(std::span<const uint8_t> datagram,
                                   uint32_t transaction_id)
{
  if (auto error = udp_error_reply(datagram, transaction_id)) {
    return std::unexpected(*error);
  }

  if (datagram.size() < sizeof(ConnectResponse)
      || aux::load_big_endian<uint32_t>(datagram.data())
          != static_cast<uint32_t>(Actions::Connect))
  {
    return std::unexpected(tracker_error("unexpected reply to connect"));
  }

  ConnectResponse response {};
  std::memcpy(&response, datagram.data(), sizeof(response));
  return static_cast<uint64_t>(response.connection_id);
}

Result<AnnounceResponse> parse_udp_announce(std::span<const uint8_t> datagram,
                                            uint32_t transaction_id)
{
  if (auto error = udp_error_reply(datagram, transaction_id)) {
    return std::unexpected(*error);
  }

  if (datagram.size() < sizeof(UdpAnnounceResponse)
      || aux::load_big_endian<uint32_t>(datagram.data())
          != static_cast<uint32_t>(Actions::Announce))
  {
    return std::unexpected(tracker_error("unexpected reply to announce"));
  }

  UdpAnnounceResponse header {};
  std::memcpy(&header, datagram.data(), sizeof(header));

  auto peers = datagram.subspan(sizeof(UdpAnnounceResponse));
  return AnnounceResponse {
      .interval = std::chrono::seconds(static_cast<uint32_t>(header.interval)),
      .peers = parse_compact_peers(std::string_view(
          reinterpret_cast<const char*>(peers.data()), peers.size()))};
}

std::string url_encode(std::span<const uint8_t> bytes)
{
  std::string encoded;
  encoded.reserve(bytes.size() * 3);

  for (auto byte : bytes) {
    if ((byte >= '0' && byte <= '9') || (byte >= 'a' && byte <= 'z')
        || (byte >= 'A' && byte <= 'Z') || byte == '-' || byte == '.'
        || byte == '_' || byte == '~')
    {
      encoded.push_back(static_cast<char>(byte));
    } else {
      encoded += fmt::format("%{:02X}", byte);
    }
  }

  return encoded;
}

Result<Tracker> Tracker::from_url(std::string_view url)
{
  Tracker tracker;
  tracker.m_url = std::string(url);

  if (url.starts_with(UDP_PREFIX)) {
    auto authority = url.substr(UDP_PREFIX.size());
    authority = authority.substr(0, authority.find('/'));
    auto colon = authority.rfind(':');
    if (colon == std::string_view::npos || colon == 0
        || colon + 1 == authority.size())
    {
      return std::unexpected(make_error(
          ErrorKind::InvalidInput,
          fmt::format("tracker '{}': udp trackers need host:port", url)));
    }
    tracker.m_protocol = Protocol::Udp;
    tracker.m_host = std::string(authority.substr(0, colon));
    tracker.m_port = std::string(authority.substr(colon + 1));
    return tracker;
  }

  auto locator = Locator::parse(url);
  if (!locator) {
    return std::unexpected(locator.error());
  }
  if (locator->scheme != Scheme::Http && locator->scheme != Scheme::Https) {
    return std::unexpected(make_error(
        ErrorKind::InvalidInput,
        fmt::format("tracker '{}': unsupported scheme", url)));
  }

  tracker.m_protocol = Protocol::Http;
  tracker.m_host = locator->host;
  tracker.m_port = locator->port;
  tracker.m_http_locator = std::move(*locator);
  return tracker;
}

awaitable<AnnounceResponse> Tracker::announce(const AnnounceParams& params,
                                              std::chrono::seconds timeout) const
{
  if (m_protocol == Protocol::Udp) {
    co_return co_await announce_udp(params, timeout);
  }

  co_return co_await announce_http(params, timeout);
}

awaitable<AnnounceResponse> Tracker::announce_udp(
    const AnnounceParams& params, std::chrono::seconds timeout) const
{
  std::optional<AnnounceResponse> response;
  try {
    response = co_await aux::within(exchange_udp(params),
                                    aux::deadline_after(timeout));
  } catch (const boost::system::system_error& error) {
    throw TransferException(
        ErrorKind::Transport,
        fmt::format("tracker {} unreachable: {}", m_host, error.what()));
  }

  if (!response) {
    throw TransferException(ErrorKind::Transport,
                            fmt::format("tracker {} timed out", m_host));
  }

  co_return std::move(*response);
}

awaitable<AnnounceResponse> Tracker::exchange_udp(
    const AnnounceParams& params) const
{
  auto executor = co_await boost::asio::this_coro::executor;

  udp::resolver resolver {executor};
  auto results =
      co_await resolver.async_resolve(udp::v4(), m_host, m_port, use_awaitable);
  if (results.empty()) {
    throw TransferException(ErrorKind::Transport,
                            fmt::format("cannot resolve tracker {}", m_host));
  }
  auto remote = results.begin()->endpoint();

  udp::socket socket {executor, udp::v4()};
  std::vector<uint8_t> buffer(MAX_DATAGRAM_SIZE);
  udp::endpoint sender {};

  ConnectRequest connect {};
  co_await socket.async_send_to(
      boost::asio::buffer(&connect, sizeof(connect)), remote, use_awaitable);

  size_t received = 0;
  do {
    received = co_await socket.async_receive_from(
        boost::asio::buffer(buffer), sender, use_awaitable);
  } while (sender != remote);

  auto connection_id = parse_udp_connect(std::span(buffer).first(received),
                                         connect.transaction_id);
  if (!connection_id) {
    throw TransferException(connection_id.error());
  }

  UdpAnnounceRequest request {};
  request.connection_id = *connection_id;
  std::copy(params.info_hash.begin(), params.info_hash.end(), request.info_hash);
  std::copy(params.peer_id.as_raw().begin(),
            params.peer_id.as_raw().end(),
            request.peer_id);
  request.downloaded = params.downloaded;
  request.left = params.left;
  request.uploaded = params.uploaded;
  request.event = static_cast<uint32_t>(params.event);
  request.num_want = params.num_want;
  request.port = params.port;

  co_await socket.async_send_to(
      boost::asio::buffer(&request, sizeof(request)), remote, use_awaitable);

  do {
    received = co_await socket.async_receive_from(
        boost::asio::buffer(buffer), sender, use_awaitable);
  } while (sender != remote);

  auto response = parse_udp_announce(std::span(buffer).first(received),
                                     request.transaction_id);
  if (!response) {
    throw TransferException(response.error());
  }

  co_return std::move(*response);
}

awaitable<AnnounceResponse> Tracker::announce_http(
    const AnnounceParams& params, std::chrono::seconds timeout) const
{
  auto locator = m_http_locator;
  locator.target += locator.target.find('?') == std::string::npos ? '?' : '&';
  locator.target += fmt::format(
      "info_hash={}&peer_id={}&port={}&uploaded={}&downloaded={}&left={}"
      "&compact=1&numwant={}",
      url_encode(params.info_hash),
      url_encode(params.peer_id.as_raw()),
      params.port,
      params.uploaded,
      params.downloaded,
      params.left,
      params.num_want);
  if (auto event = event_name(params.event); !event.empty()) {
    locator.target += fmt::format("&event={}", event);
  }

  http::response<http::string_body> reply;
  try {
    reply = co_await http_get(locator, timeout, MAX_HTTP_RESPONSE);
  } catch (const boost::system::system_error& error) {
    throw TransferException(
        ErrorKind::Transport,
        fmt::format("tracker unreachable: {}", error.what()));
  }

  if (reply.result() != http::status::ok) {
    throw TransferException(
        ErrorKind::Transport,
        fmt::format("tracker replied HTTP {}", reply.result_int()));
  }

  auto response = parse_http_announce(reply.body());
  if (!response) {
    throw TransferException(response.error());
  }

  spdlog::debug("tracker {} returned {} peers", m_url, response->peers.size());
  co_return std::move(*response);
}
}  // namespace ftr
