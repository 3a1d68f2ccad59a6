#include <charconv>
#include <chrono>
#include <cstdint>
#include <future>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <catch2/catch_test_macros.hpp>
#include <fmt/format.h>

#include "client/transport/http_transport.hpp"
#include "test_support.hpp"

namespace http = boost::beast::http;

using boost::asio::awaitable;
using boost::asio::use_awaitable;
using boost::asio::ip::tcp;

namespace
{
// "bytes=a-b" as [a, b + 1)
ftr::ByteRange parse_range(std::string_view header, uint64_t size)
{
  ftr::ByteRange range {0, size};
  auto spec = header.substr(header.find('=') + 1);
  auto dash = spec.find('-');

  std::from_chars(spec.data(), spec.data() + dash, range.begin);
  if (dash + 1 < spec.size()) {
    uint64_t last = 0;
    std::from_chars(spec.data() + dash + 1, spec.data() + spec.size(), last);
    range.end = last + 1;
  }
  return range;
}

// Answers one request: /moved redirects to /content, which serves ranges.
awaitable<void> answer(tcp::socket socket,
                       const std::vector<uint8_t>& content,
                       std::string target_url)
{
  boost::beast::flat_buffer buffer;
  http::request<http::empty_body> request;
  co_await http::async_read(socket, buffer, request, use_awaitable);

  if (request.target() == "/moved") {
    http::response<http::empty_body> reply {http::status::found,
                                            request.version()};
    reply.set(http::field::location, target_url);
    reply.keep_alive(false);
    reply.prepare_payload();
    co_await http::async_write(socket, reply, use_awaitable);
  } else {
    auto field = request[http::field::range];
    auto range = parse_range({field.data(), field.size()}, content.size());

    http::response<http::vector_body<uint8_t>> reply {
        http::status::partial_content, request.version()};
    reply.set(http::field::content_range,
              fmt::format("bytes {}-{}/{}",
                          range.begin,
                          range.end - 1,
                          content.size()));
    reply.body().assign(content.begin() + range.begin,
                        content.begin() + range.end);
    reply.keep_alive(false);
    reply.prepare_payload();
    co_await http::async_write(socket, reply, use_awaitable);
  }

  boost::system::error_code ec;
  socket.shutdown(tcp::socket::shutdown_send, ec);
}

awaitable<void> serve(tcp::acceptor& acceptor,
                      const std::vector<uint8_t>& content,
                      std::string target_url)
{
  for (;;) {
    auto socket = co_await acceptor.async_accept(use_awaitable);
    boost::asio::co_spawn(acceptor.get_executor(),
                          answer(std::move(socket), content, target_url),
                          boost::asio::detached);
  }
}

awaitable<std::vector<uint8_t>> collect(const ftr::HttpTransport& transport,
                                        ftr::ByteRange range)
{
  std::vector<uint8_t> received;
  co_await transport.fetch_range(
      range,
      [&received](std::span<const uint8_t> data) -> awaitable<bool>
      {
        received.insert(received.end(), data.begin(), data.end());
        co_return true;
      });
  co_return received;
}
}  // namespace

TEST_CASE("Lanes sharing a transport follow redirects independently",
          "[http_transport]")
{
  constexpr size_t SIZE = 96 * 1024;
  auto content = ftr::test::pattern_bytes(SIZE);

  boost::asio::thread_pool pool {4};
  tcp::acceptor acceptor {pool, {boost::asio::ip::make_address("127.0.0.1"), 0}};
  auto base = fmt::format("http://127.0.0.1:{}", acceptor.local_endpoint().port());

  boost::asio::co_spawn(pool,
                        serve(acceptor, content, base + "/content"),
                        boost::asio::detached);

  auto locator = ftr::Locator::parse(base + "/moved");
  REQUIRE(locator);
  ftr::HttpTransport transport {*locator, std::chrono::seconds(5), 4096};

  std::vector<ftr::ByteRange> lanes {
      {0, 32 * 1024}, {32 * 1024, 64 * 1024}, {64 * 1024, SIZE}};
  std::vector<std::future<std::vector<uint8_t>>> results;
  for (const auto& lane : lanes) {
    results.push_back(boost::asio::co_spawn(
        pool, collect(transport, lane), boost::asio::use_future));
  }

  for (size_t i = 0; i < lanes.size(); i++) {
    auto received = results[i].get();
    REQUIRE(received
            == std::vector<uint8_t>(content.begin() + lanes[i].begin,
                                    content.begin() + lanes[i].end));
  }

  REQUIRE(transport.locator().text == base + "/moved");

  boost::asio::post(acceptor.get_executor(), [&acceptor] { acceptor.close(); });
  pool.join();
}
