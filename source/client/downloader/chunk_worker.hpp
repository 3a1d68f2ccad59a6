#pragma once

#include <atomic>
#include <cstdint>

#include <boost/asio.hpp>
#include <fmt/format.h>

#include "client/context.hpp"
#include "client/error.hpp"
#include "client/storage/storage.hpp"
#include "client/transport/transport.hpp"

namespace ftr
{
enum class FetchOutcome : uint8_t
{
  Completed,
  Stopped,
};

struct FetchResult
{
  FetchOutcome outcome;
  uint64_t bytes_written;
};

/*
 * Moves one byte range from a transport into its part file. The stop flag is
 * checked after every increment, so a stop takes effect within one
 * increment and leaves the part ending exactly at the bytes counted.
 */
class ChunkWorker
{
  const std::atomic<bool>& m_stop;
  std::atomic<uint64_t>& m_progress;

public:
  ChunkWorker(const std::atomic<bool>& stop, std::atomic<uint64_t>& progress)
      : m_stop {stop}
      , m_progress {progress}
  {
  }

  /*
   * `range` is the part of the unit still missing; `part` is positioned at
   * its start. Throws TransferException(Integrity) when the transport ends
   * the range early, and whatever the transport throws on I/O failure.
   */
  template<RangedTransport T>
  boost::asio::awaitable<FetchResult> fetch(T& transport,
                                            const ByteRange& range,
                                            PartWriter& part)
  {
    if (m_stop.load(std::memory_order_acquire)) {
      co_return FetchResult {FetchOutcome::Stopped, 0};
    }

    uint64_t written = 0;
    bool stopped = false;

    co_await transport.fetch_range(
        range,
        [&](std::span<const uint8_t> data) -> boost::asio::awaitable<bool>
        {
          co_await part.append(data);
          written += data.size();
          m_progress.fetch_add(data.size(), std::memory_order_relaxed);

          if (m_stop.load(std::memory_order_acquire)) {
            stopped = true;
            co_return false;
          }
          co_return true;
        });

    if (stopped && (range.is_open() || written != range.length())) {
      co_return FetchResult {FetchOutcome::Stopped, written};
    }

    if (!range.is_open() && written != range.length()) {
      throw TransferException(
          ErrorKind::Integrity,
          fmt::format("range [{}, {}) delivered {} of {} bytes",
                      range.begin,
                      range.end,
                      written,
                      range.length()));
    }

    part.sync();
    co_return FetchResult {FetchOutcome::Completed, written};
  }
};
}  // namespace ftr
