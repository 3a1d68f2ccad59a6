#pragma once

#include <chrono>
#include <cstdint>

#include <boost/asio.hpp>

#include "client/context.hpp"
#include "client/transport/locator.hpp"
#include "client/transport/range_sink.hpp"

namespace ftr
{
class HttpTransport
{
  Locator m_locator;
  std::chrono::seconds m_stall_timeout;
  uint32_t m_increment_bytes;

public:
  static constexpr int MAX_REDIRECTS = 5;

  HttpTransport(Locator locator,
                std::chrono::seconds stall_timeout,
                uint32_t increment_bytes);

  const Locator& locator() const { return m_locator; }

  /*
   * HEAD request. Follows redirects and keeps the final location for the
   * range requests that follow. Must not overlap fetch_range().
   */
  boost::asio::awaitable<ResourceMetadata> resolve_metadata();

  /*
   * Streams `range` into `sink` with one GET carrying a Range header. Safe
   * to run concurrently; a redirect seen here is not remembered.
   */
  boost::asio::awaitable<void> fetch_range(const ByteRange& range,
                                           RangeSink sink) const;
};
}  // namespace ftr
