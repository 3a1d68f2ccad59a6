#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <span>

#include <boost/asio.hpp>

namespace ftr
{
struct ResourceMetadata
{
  std::optional<uint64_t> size;
  bool resumable = false;
};

// Receives consecutive increments of a range. Completing with false asks the
// transport to stop after the current increment. The transport keeps the
// increment alive until the sink completes.
using RangeSink =
    std::function<boost::asio::awaitable<bool>(std::span<const uint8_t>)>;
}  // namespace ftr
