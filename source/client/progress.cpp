#include <cmath>

#include "client/progress.hpp"

namespace ftr
{
RateEstimator::RateEstimator(size_t window)
    : m_samples {window < 2 ? 2 : window}
{
}

void RateEstimator::sample(clock::time_point when, uint64_t bytes_done)
{
  m_samples.push_back({when, bytes_done});
}

double RateEstimator::rate() const
{
  if (m_samples.size() < 2) {
    return 0.0;
  }

  const auto& [first_time, first_bytes] = m_samples.front();
  const auto& [last_time, last_bytes] = m_samples.back();

  std::chrono::duration<double> elapsed = last_time - first_time;
  if (elapsed.count() <= 0.0 || last_bytes < first_bytes) {
    return 0.0;
  }

  return static_cast<double>(last_bytes - first_bytes) / elapsed.count();
}

std::optional<std::chrono::seconds> RateEstimator::eta(
    uint64_t bytes_remaining) const
{
  auto current = rate();
  if (current <= 0.0) {
    return std::nullopt;
  }

  return std::chrono::seconds(static_cast<int64_t>(
      std::ceil(static_cast<double>(bytes_remaining) / current)));
}
}  // namespace ftr
