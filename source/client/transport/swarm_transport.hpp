#pragma once

#include <filesystem>

#include "client/error.hpp"
#include "torrent/metadata/torrentfile.hpp"

namespace ftr
{
// Piece exchange with a swarm; the descriptor is a local .torrent file.
class SwarmTransport
{
  std::filesystem::path m_descriptor_path;

public:
  explicit SwarmTransport(std::filesystem::path descriptor_path);

  const std::filesystem::path& descriptor_path() const
  {
    return m_descriptor_path;
  }

  // Reads and parses the descriptor. A missing file is a TransportError, an
  // unparsable one InvalidInput.
  Result<TorrentFile> resolve_descriptor() const;
};
}  // namespace ftr
