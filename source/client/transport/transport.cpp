#include "client/transport/transport.hpp"

#include "auxiliary/variant_aux.hpp"

namespace ftr
{
Transport make_transport(const Locator& locator, const Settings& settings)
{
  switch (locator.scheme) {
    case Scheme::Http:
    case Scheme::Https:
      return HttpTransport {
          locator, settings.stall_timeout, settings.increment_bytes};
    case Scheme::Torrent:
      return SwarmTransport {locator.path};
    case Scheme::File:
      break;
  }

  return FileTransport {locator.path, settings.increment_bytes};
}

TransportKind kind_of(const Transport& transport)
{
  return std::visit(
      aux::overloaded {
          [](const HttpTransport&) { return TransportKind::Http; },
          [](const FileTransport&) { return TransportKind::File; },
          [](const SwarmTransport&) { return TransportKind::Swarm; },
      },
      transport);
}
}  // namespace ftr
