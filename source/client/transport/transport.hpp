#pragma once

#include <concepts>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <variant>

#include <boost/asio.hpp>

#include "client/context.hpp"
#include "client/settings.hpp"
#include "client/transport/file_transport.hpp"
#include "client/transport/http_transport.hpp"
#include "client/transport/locator.hpp"
#include "client/transport/swarm_transport.hpp"

namespace ftr
{
/*
 * Closed set of transfer shapes. Http and File fetch byte ranges and are
 * driven by chunk workers; Swarm yields a piece descriptor and is driven by
 * the swarm coordinator.
 */
using Transport = std::variant<HttpTransport, FileTransport, SwarmTransport>;

template<typename T>
concept RangedTransport =
    requires(T& transport, const ByteRange& range, RangeSink sink) {
      {
        transport.resolve_metadata()
      } -> std::same_as<boost::asio::awaitable<ResourceMetadata>>;
      {
        transport.fetch_range(range, std::move(sink))
      } -> std::same_as<boost::asio::awaitable<void>>;
    };

static_assert(RangedTransport<HttpTransport>);
static_assert(RangedTransport<FileTransport>);

Transport make_transport(const Locator& locator, const Settings& settings);

TransportKind kind_of(const Transport& transport);
}  // namespace ftr
