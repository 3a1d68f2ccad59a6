#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include <boost/circular_buffer.hpp>

#include "client/context.hpp"

namespace ftr
{
struct UnitProgress
{
  UnitStatus status = UnitStatus::Pending;
  uint64_t bytes_done = 0;
};

struct ProgressSnapshot
{
  TransferPhase phase = TransferPhase::Initializing;
  uint64_t bytes_done = 0;
  std::optional<uint64_t> bytes_total;
  double rate = 0.0;  // bytes per second
  std::optional<std::chrono::seconds> eta;
  std::vector<UnitProgress> units;
  size_t connected_peers = 0;
};

class IProgressSink
{
public:
  virtual void on_phase(TransferPhase phase) = 0;

  virtual void on_progress(const ProgressSnapshot& snapshot) = 0;

  virtual ~IProgressSink() = default;
};

// Transfer rate over a sliding window of byte-count samples.
class RateEstimator
{
  using clock = std::chrono::steady_clock;

  boost::circular_buffer<std::pair<clock::time_point, uint64_t>> m_samples;

public:
  explicit RateEstimator(size_t window = 10);

  void sample(clock::time_point when, uint64_t bytes_done);

  double rate() const;

  std::optional<std::chrono::seconds> eta(uint64_t bytes_remaining) const;
};
}  // namespace ftr
