#include "client/transport/http_client.hpp"

using boost::asio::awaitable;
using boost::asio::use_awaitable;

namespace ftr
{
http::request<http::empty_body> make_request(http::verb verb,
                                             const Locator& locator)
{
  http::request<http::empty_body> request {verb, locator.target, 11};

  auto default_port = locator.scheme == Scheme::Https ? "443" : "80";
  request.set(http::field::host,
              locator.port == default_port
                  ? locator.host
                  : locator.host + ":" + locator.port);
  request.set(http::field::user_agent, USER_AGENT);
  request.set(http::field::accept, "*/*");
  return request;
}

awaitable<http::response<http::string_body>> http_get(
    const Locator& locator,
    std::chrono::steady_clock::duration timeout,
    uint64_t body_limit)
{
  co_return co_await with_connection<http::response<http::string_body>>(
      locator,
      timeout,
      [&](auto& stream) -> awaitable<http::response<http::string_body>>
      {
        auto request = make_request(http::verb::get, locator);

        expire_after(stream, timeout);
        co_await http::async_write(stream, request, use_awaitable);

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(body_limit);

        expire_after(stream, timeout);
        co_await http::async_read(stream, buffer, parser, use_awaitable);

        co_return parser.release();
      });
}
}  // namespace ftr
