#include <algorithm>
#include <charconv>
#include <limits>
#include <string_view>
#include <vector>

#include "client/transport/http_transport.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "client/transport/http_client.hpp"

using boost::asio::awaitable;
using boost::asio::use_awaitable;

namespace ftr
{
namespace
{
bool is_redirect(http::status status)
{
  switch (status) {
    case http::status::moved_permanently:
    case http::status::found:
    case http::status::see_other:
    case http::status::temporary_redirect:
    case http::status::permanent_redirect:
      return true;
    default:
      return false;
  }
}

std::string_view field_value(const http::response_header<>& header,
                             http::field field)
{
  auto value = header[field];
  return {value.data(), value.size()};
}

std::string range_header(const ByteRange& range)
{
  if (range.is_open()) {
    return fmt::format("bytes={}-", range.begin);
  }

  return fmt::format("bytes={}-{}", range.begin, range.end - 1);
}

Locator redirect_target(const Locator& current,
                        const http::response_header<>& header)
{
  auto location = field_value(header, http::field::location);
  if (location.empty()) {
    throw TransferException(
        ErrorKind::Transport,
        fmt::format("redirect without location from {}", current.text));
  }

  auto next = current.resolve(location);
  if (!next) {
    throw TransferException(next.error());
  }

  spdlog::debug("redirect {} -> {}", current.text, next->text);
  return std::move(*next);
}

TransferException http_status_error(const Locator& locator,
                                    unsigned status)
{
  return TransferException(
      ErrorKind::Transport,
      fmt::format("{} replied HTTP {}", locator.text, status));
}
}  // namespace

HttpTransport::HttpTransport(Locator locator,
                             std::chrono::seconds stall_timeout,
                             uint32_t increment_bytes)
    : m_locator {std::move(locator)}
    , m_stall_timeout {stall_timeout}
    , m_increment_bytes {increment_bytes}
{
}

awaitable<ResourceMetadata> HttpTransport::resolve_metadata()
{
  for (int hop = 0; hop <= MAX_REDIRECTS; hop++) {
    auto header = co_await with_connection<http::response_header<>>(
        m_locator,
        m_stall_timeout,
        [this](auto& stream) -> awaitable<http::response_header<>>
        {
          auto request = make_request(http::verb::head, m_locator);

          expire_after(stream, m_stall_timeout);
          co_await http::async_write(stream, request, use_awaitable);

          beast::flat_buffer buffer;
          http::response_parser<http::empty_body> parser;
          parser.skip(true);

          expire_after(stream, m_stall_timeout);
          co_await http::async_read(stream, buffer, parser, use_awaitable);

          co_return parser.release().base();
        });

    if (is_redirect(header.result())) {
      m_locator = redirect_target(m_locator, header);
      continue;
    }

    if (header.result() != http::status::ok) {
      throw http_status_error(m_locator, header.result_int());
    }

    ResourceMetadata metadata {};

    auto length = field_value(header, http::field::content_length);
    uint64_t size = 0;
    auto [end, ec] =
        std::from_chars(length.data(), length.data() + length.size(), size);
    if (!length.empty() && ec == std::errc {}
        && end == length.data() + length.size())
    {
      metadata.size = size;
    }

    metadata.resumable =
        field_value(header, http::field::accept_ranges) == "bytes";

    co_return metadata;
  }

  throw TransferException(
      ErrorKind::Transport,
      fmt::format("more than {} redirects for {}", MAX_REDIRECTS, m_locator.text));
}

awaitable<void> HttpTransport::fetch_range(const ByteRange& range,
                                           RangeSink sink) const
{
  // lanes share the transport; redirects only move this request
  auto locator = m_locator;

  for (int hop = 0; hop <= MAX_REDIRECTS; hop++) {
    auto redirected = co_await with_connection<bool>(
        locator,
        m_stall_timeout,
        [&](auto& stream) -> awaitable<bool>
        {
          auto request = make_request(http::verb::get, locator);
          if (range.begin != 0 || !range.is_open()) {
            request.set(http::field::range, range_header(range));
          }

          expire_after(stream, m_stall_timeout);
          co_await http::async_write(stream, request, use_awaitable);

          beast::flat_buffer buffer;
          http::response_parser<http::buffer_body> parser;
          parser.body_limit(std::numeric_limits<uint64_t>::max());

          expire_after(stream, m_stall_timeout);
          co_await http::async_read_header(
              stream, buffer, parser, use_awaitable);

          auto status = parser.get().result();
          if (is_redirect(status)) {
            locator = redirect_target(locator, parser.get().base());
            co_return true;
          }
          if (status == http::status::range_not_satisfiable) {
            throw TransferException(
                ErrorKind::Transport,
                fmt::format("{} rejected range {}",
                            locator.text,
                            range_header(range)));
          }
          if (status == http::status::ok && range.begin != 0) {
            throw TransferException(
                ErrorKind::Transport,
                fmt::format("{} ignored range {}",
                            locator.text,
                            range_header(range)));
          }
          if (status != http::status::ok
              && status != http::status::partial_content)
          {
            throw http_status_error(locator, parser.get().result_int());
          }

          uint64_t remaining = range.length();
          if (status == http::status::partial_content && !range.is_open()) {
            if (auto length = parser.content_length();
                length && *length != remaining)
            {
              throw TransferException(
                  ErrorKind::Integrity,
                  fmt::format("server sends {} bytes for a range of {}",
                              *length,
                              remaining));
            }
          }

          std::vector<uint8_t> chunk(m_increment_bytes);
          while (!parser.is_done() && remaining > 0) {
            parser.get().body().data = chunk.data();
            parser.get().body().size = chunk.size();

            boost::system::error_code ec;
            expire_after(stream, m_stall_timeout);
            co_await http::async_read(
                stream,
                buffer,
                parser,
                boost::asio::redirect_error(use_awaitable, ec));
            if (ec && ec != http::error::need_buffer) {
              throw boost::system::system_error(ec);
            }

            auto received = std::min<uint64_t>(
                chunk.size() - parser.get().body().size, remaining);
            if (!range.is_open()) {
              remaining -= received;
            }

            if (received > 0
                && !co_await sink(
                    std::span<const uint8_t>(chunk.data(), received)))
            {
              break;
            }
          }

          co_return false;
        });

    if (!redirected) {
      co_return;
    }
  }

  throw TransferException(
      ErrorKind::Transport,
      fmt::format("more than {} redirects for {}", MAX_REDIRECTS, locator.text));
}
}  // namespace ftr
