#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>

#include <boost/asio.hpp>

namespace ftr::aux
{
/*
 * Counts running tasks so a coroutine can wait for all of them with a
 * deadline. wait_until() and done() must both run on `strand`; running() may
 * be read from anywhere.
 */
class WaitGroup
{
  boost::asio::steady_timer m_timer;
  std::atomic<size_t> m_count {0};

public:
  explicit WaitGroup(boost::asio::any_io_executor strand)
      : m_timer {std::move(strand)}
  {
  }

  void add(size_t count = 1)
  {
    m_count.fetch_add(count, std::memory_order_acq_rel);
  }

  void done()
  {
    if (m_count.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      m_timer.cancel();
    }
  }

  size_t running() const { return m_count.load(std::memory_order_acquire); }

  boost::asio::any_io_executor executor() { return m_timer.get_executor(); }

  // True when the count reached zero before `deadline`.
  boost::asio::awaitable<bool> wait_until(
      std::chrono::steady_clock::time_point deadline)
  {
    while (running() > 0) {
      if (std::chrono::steady_clock::now() >= deadline) {
        co_return false;
      }

      m_timer.expires_at(deadline);
      boost::system::error_code ec;
      co_await m_timer.async_wait(
          boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    co_return true;
  }
};
}  // namespace ftr::aux
