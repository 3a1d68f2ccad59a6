#pragma once

#include <chrono>
#include <string>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include "client/error.hpp"
#include "client/transport/locator.hpp"

namespace ftr
{
namespace beast = boost::beast;
namespace http = beast::http;

constexpr std::string_view USER_AGENT = "fetcher/1.0";

template<typename Stream>
void expire_after(Stream& stream, std::chrono::steady_clock::duration timeout)
{
  beast::get_lowest_layer(stream).expires_after(timeout);
}

http::request<http::empty_body> make_request(http::verb verb,
                                             const Locator& locator);

/*
 * Connects to the locator's host (TLS for https) and runs `handler` with the
 * connected stream. `handler` takes `auto& stream` and returns awaitable<R>;
 * the same body serves plain and TLS streams. Each network operation the
 * handler issues should re-arm the stream timeout with expire_after().
 */
template<typename R, typename Handler>
boost::asio::awaitable<R> with_connection(
    const Locator& locator,
    std::chrono::steady_clock::duration timeout,
    Handler handler)
{
  using boost::asio::use_awaitable;

  if (locator.scheme != Scheme::Http && locator.scheme != Scheme::Https) {
    throw TransferException(ErrorKind::InvalidInput,
                            "not an http locator: " + locator.text);
  }

  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::ip::tcp::resolver resolver {executor};
  auto endpoints = co_await resolver.async_resolve(
      locator.host, locator.port, use_awaitable);

  if (locator.scheme == Scheme::Http) {
    beast::tcp_stream stream {executor};
    stream.expires_after(timeout);
    co_await stream.async_connect(endpoints, use_awaitable);

    auto result = co_await handler(stream);

    beast::error_code ignored;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both,
                             ignored);
    co_return result;
  }

  boost::asio::ssl::context context {boost::asio::ssl::context::tls_client};
  context.set_default_verify_paths();
  context.set_verify_mode(boost::asio::ssl::verify_peer);

  beast::ssl_stream<beast::tcp_stream> stream {executor, context};
  if (!SSL_set_tlsext_host_name(stream.native_handle(), locator.host.c_str()))
  {
    throw TransferException(ErrorKind::Transport,
                            "cannot set TLS server name for " + locator.host);
  }
  stream.set_verify_callback(
      boost::asio::ssl::host_name_verification(locator.host));

  expire_after(stream, timeout);
  co_await beast::get_lowest_layer(stream).async_connect(endpoints,
                                                         use_awaitable);
  expire_after(stream, timeout);
  co_await stream.async_handshake(boost::asio::ssl::stream_base::client,
                                  use_awaitable);

  co_return co_await handler(stream);
}

// GET with the whole body buffered; for small documents such as tracker
// responses.
boost::asio::awaitable<http::response<http::string_body>> http_get(
    const Locator& locator,
    std::chrono::steady_clock::duration timeout,
    uint64_t body_limit);
}  // namespace ftr
