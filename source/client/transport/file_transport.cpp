#include <algorithm>
#include <vector>

#include "client/transport/file_transport.hpp"

#include <boost/asio/random_access_file.hpp>
#include <fmt/format.h>

#include "client/error.hpp"

using boost::asio::awaitable;
using boost::asio::use_awaitable;

namespace ftr
{
FileTransport::FileTransport(std::filesystem::path path,
                             uint32_t increment_bytes)
    : m_path {std::move(path)}
    , m_increment_bytes {increment_bytes}
{
}

awaitable<ResourceMetadata> FileTransport::resolve_metadata()
{
  std::error_code ec;
  auto size = std::filesystem::file_size(m_path, ec);
  if (ec) {
    throw TransferException(
        ErrorKind::Transport,
        fmt::format("cannot stat {}: {}", m_path.string(), ec.message()));
  }

  co_return ResourceMetadata {.size = size, .resumable = true};
}

awaitable<void> FileTransport::fetch_range(const ByteRange& range,
                                           RangeSink sink)
{
  boost::asio::random_access_file source {
      co_await boost::asio::this_coro::executor};

  boost::system::error_code ec;
  source.open(m_path.string(),
              boost::asio::random_access_file::flags::read_only,
              ec);
  if (ec) {
    throw TransferException(
        ErrorKind::Transport,
        fmt::format("cannot open {}: {}", m_path.string(), ec.message()));
  }

  std::vector<uint8_t> chunk(m_increment_bytes);
  auto position = range.begin;
  auto remaining = range.length();

  while (remaining > 0) {
    auto wanted = std::min<uint64_t>(remaining, chunk.size());
    auto received = co_await source.async_read_some_at(
        position,
        boost::asio::buffer(chunk.data(), wanted),
        boost::asio::redirect_error(use_awaitable, ec));

    if (ec == boost::asio::error::eof || (!ec && received == 0)) {
      co_return;
    }
    if (ec) {
      throw TransferException(
          ErrorKind::Transport,
          fmt::format("read error on {}: {}", m_path.string(), ec.message()));
    }

    position += received;
    if (!range.is_open()) {
      remaining -= received;
    }

    if (!co_await sink(std::span<const uint8_t>(chunk.data(), received))) {
      co_return;
    }
  }
}
}  // namespace ftr
