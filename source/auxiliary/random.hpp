#pragma once

#include <chrono>
#include <random>

namespace ftr::aux
{
template<typename T, T Min, T Max>
T generate_random_in_range()
{
  thread_local std::mt19937 rng {std::random_device {}()};
  std::uniform_int_distribution<T> uni {Min, Max};
  return uni(rng);
}

template<typename T>
T generate_random_in_range(T min, T max)
{
  thread_local std::mt19937 rng {std::random_device {}()};
  std::uniform_int_distribution<T> uni {min, max};
  return uni(rng);
}

/*
 * Exponential backoff: base * 2^attempt capped at `cap`, then scaled by a
 * random factor in [0.5, 1.0] so parallel retries spread out.
 */
template<typename Duration>
Duration jittered_backoff(Duration base, Duration cap, unsigned attempt)
{
  auto delay = base;
  for (unsigned i = 0; i < attempt && delay < cap; i++) {
    delay *= 2;
  }
  if (delay > cap) {
    delay = cap;
  }

  auto ticks = static_cast<long long>(delay.count());
  auto jittered =
      generate_random_in_range<long long>(ticks / 2, ticks > 0 ? ticks : 0);
  return Duration {static_cast<typename Duration::rep>(jittered)};
}
}  // namespace ftr::aux
