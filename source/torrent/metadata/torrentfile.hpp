#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "client/context.hpp"
#include "torrent/metadata/bencode.hpp"

namespace ftr
{
struct FileItem
{
  FileItem(std::string p_path, uint64_t p_size, uint64_t p_offset)
      : path {std::move(p_path)}
      , size {p_size}
      , offset {p_offset}
  {
  }

  std::string path;
  uint64_t size;
  uint64_t offset;
};

struct TorrentFileMetadata
{
  std::string name;
  bool is_private = false;
  std::string comment;
  std::string created_by;
  std::chrono::seconds creation_date {0};
  std::string encoding_type;
};

struct TorrentFile
{
  TorrentFileMetadata metadata;

  InfoHash info_hash {};
  std::vector<FileItem> files;
  std::vector<std::string> trackers;
  std::vector<aux::Sha1Digest> piece_hashes;

  uint64_t file_length = 0;
  uint32_t piece_length = 0;

  uint32_t piece_count() const
  {
    return static_cast<uint32_t>(piece_hashes.size());
  }

  uint32_t get_piece_size(uint32_t index) const;

  // Piece table with final offsets; the last piece absorbs the remainder.
  std::vector<PieceDescriptor> pieces() const;
};

enum class TorrentFileParseError : uint8_t
{
  Malformed,
  MissingField,
  InvalidField,
  Overflow,
  Unsupported
};

std::string_view to_string(TorrentFileParseError error);

std::expected<TorrentFile, TorrentFileParseError> load_torrent_file(
    std::string_view encoded);
}  // namespace ftr
