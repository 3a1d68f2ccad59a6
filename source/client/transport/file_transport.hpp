#pragma once

#include <cstdint>
#include <filesystem>

#include <boost/asio.hpp>

#include "client/context.hpp"
#include "client/transport/range_sink.hpp"

namespace ftr
{
// Ranged reads from a local file. Always resumable.
class FileTransport
{
  std::filesystem::path m_path;
  uint32_t m_increment_bytes;

public:
  FileTransport(std::filesystem::path path, uint32_t increment_bytes);

  const std::filesystem::path& path() const { return m_path; }

  boost::asio::awaitable<ResourceMetadata> resolve_metadata();

  boost::asio::awaitable<void> fetch_range(const ByteRange& range,
                                           RangeSink sink);
};
}  // namespace ftr
