#include <fstream>
#include <iterator>
#include <string>

#include "client/transport/swarm_transport.hpp"

#include <fmt/format.h>

namespace ftr
{
namespace
{
constexpr std::uintmax_t MAX_DESCRIPTOR_SIZE = 64 * 1024 * 1024;
}  // namespace

SwarmTransport::SwarmTransport(std::filesystem::path descriptor_path)
    : m_descriptor_path {std::move(descriptor_path)}
{
}

Result<TorrentFile> SwarmTransport::resolve_descriptor() const
{
  std::error_code ec;
  auto size = std::filesystem::file_size(m_descriptor_path, ec);
  if (ec) {
    return std::unexpected(make_error(
        ErrorKind::Transport,
        fmt::format("cannot read descriptor {}: {}",
                    m_descriptor_path.string(),
                    ec.message())));
  }
  if (size > MAX_DESCRIPTOR_SIZE) {
    return std::unexpected(make_error(
        ErrorKind::InvalidInput,
        fmt::format("descriptor {} is too large", m_descriptor_path.string())));
  }

  std::ifstream input {m_descriptor_path, std::ios::binary};
  std::string encoded {std::istreambuf_iterator<char>(input),
                       std::istreambuf_iterator<char>()};
  if (input.bad()) {
    return std::unexpected(make_error(
        ErrorKind::Transport,
        fmt::format("read error on {}", m_descriptor_path.string())));
  }

  auto torrent = load_torrent_file(encoded);
  if (!torrent) {
    return std::unexpected(make_error(
        ErrorKind::InvalidInput,
        fmt::format("descriptor {}: {}",
                    m_descriptor_path.string(),
                    to_string(torrent.error()))));
  }

  return std::move(*torrent);
}
}  // namespace ftr
