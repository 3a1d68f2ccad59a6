#pragma once

#include <chrono>
#include <exception>
#include <optional>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>

namespace ftr::aux
{
using time_point = std::chrono::steady_clock::time_point;

inline time_point deadline_after(std::chrono::steady_clock::duration timeout)
{
  return std::chrono::steady_clock::now() + timeout;
}

// Completes once `deadline` has passed.
inline boost::asio::awaitable<void> timeout(time_point deadline)
{
  boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
  auto now = std::chrono::steady_clock::now();

  while (deadline > now) {
    timer.expires_at(deadline);
    co_await timer.async_wait(boost::asio::use_awaitable);
    now = std::chrono::steady_clock::now();
  }
}

namespace detail
{
/*
 * The || operator only reports the first branch to succeed, so a failing
 * operation would lose the race to the timer. Errors are parked here and
 * rethrown once the race is decided.
 */
template<typename T>
boost::asio::awaitable<void> settle(boost::asio::awaitable<T> operation,
                                    std::optional<T>& value,
                                    std::exception_ptr& failure)
{
  try {
    value.emplace(co_await std::move(operation));
  } catch (...) {
    failure = std::current_exception();
  }
}

inline boost::asio::awaitable<void> settle(
    boost::asio::awaitable<void> operation, std::exception_ptr& failure)
{
  try {
    co_await std::move(operation);
  } catch (...) {
    failure = std::current_exception();
  }
}
}  // namespace detail

/*
 * Runs `operation` against `deadline`. When the deadline wins the operation
 * is cancelled and std::nullopt comes back; errors of the operation itself
 * propagate.
 */
template<typename T>
boost::asio::awaitable<std::optional<T>> within(
    boost::asio::awaitable<T> operation, time_point deadline)
{
  using namespace boost::asio::experimental::awaitable_operators;

  std::optional<T> value;
  std::exception_ptr failure;

  auto winner = co_await (detail::settle(std::move(operation), value, failure)
                          || timeout(deadline));
  if (winner.index() == 1) {
    co_return std::nullopt;
  }
  if (failure) {
    std::rethrow_exception(failure);
  }

  co_return std::move(value);
}

// As above for operations without a result; false when the deadline won.
inline boost::asio::awaitable<bool> within(
    boost::asio::awaitable<void> operation, time_point deadline)
{
  using namespace boost::asio::experimental::awaitable_operators;

  std::exception_ptr failure;

  auto winner =
      co_await (detail::settle(std::move(operation), failure) || timeout(deadline));
  if (winner.index() == 1) {
    co_return false;
  }
  if (failure) {
    std::rethrow_exception(failure);
  }

  co_return true;
}
}  // namespace ftr::aux
