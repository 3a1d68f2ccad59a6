#include <algorithm>
#include <limits>
#include <stdexcept>

#include "torrent/metadata/torrentfile.hpp"

#include <openssl/sha.h>

using ftr::bencode::BeValue;
using ftr::bencode::BeValueTypeIndex;
using ftr::bencode::Dict;
using ftr::bencode::List;

namespace ftr
{
namespace
{
constexpr size_t SHA1_HASH_SIZE = 20;

template<typename T, BeValueTypeIndex Index>
std::expected<T, TorrentFileParseError> parse_field(
    const Dict& dict, const std::string& field_name)
{
  if (!dict.contains(field_name))
    return std::unexpected {TorrentFileParseError::MissingField};

  const auto& value = dict.at(field_name);

  if (value.which() != Index)
    return std::unexpected {TorrentFileParseError::InvalidField};

  return boost::get<T>(value);
}

std::expected<std::string, TorrentFileParseError> parse_string_field(
    const Dict& dict, const std::string& field_name)
{
  return parse_field<std::string, BeValueTypeIndex::IString>(dict, field_name);
}

std::expected<int64_t, TorrentFileParseError> parse_int_field(
    const Dict& dict, const std::string& field_name)
{
  return parse_field<int64_t, BeValueTypeIndex::IInt64>(dict, field_name);
}

std::expected<List, TorrentFileParseError> parse_list_field(
    const Dict& dict, const std::string& field_name)
{
  return parse_field<List, BeValueTypeIndex::IList>(dict, field_name);
}

std::expected<Dict, TorrentFileParseError> parse_dict_field(
    const Dict& dict, const std::string& field_name)
{
  return parse_field<Dict, BeValueTypeIndex::IDict>(dict, field_name);
}

std::expected<void, TorrentFileParseError> parse_trackers(const Dict& top_level,
                                                          TorrentFile& torrent)
{
  if (top_level.contains("announce")) {
    auto announce = parse_string_field(top_level, "announce");
    if (!announce) {
      return std::unexpected {announce.error()};
    }
    torrent.trackers.push_back(std::move(*announce));
  }

  if (!top_level.contains("announce-list")) {
    return {};
  }

  auto announce_list = parse_list_field(top_level, "announce-list");
  if (!announce_list) {
    return std::unexpected {announce_list.error()};
  }

  for (const auto& tier : *announce_list) {
    if (tier.which() != BeValueTypeIndex::IList) {
      return std::unexpected {TorrentFileParseError::InvalidField};
    }
    for (const auto& item : boost::get<List>(tier)) {
      if (item.which() != BeValueTypeIndex::IString) {
        return std::unexpected {TorrentFileParseError::InvalidField};
      }
      const auto& url = boost::get<std::string>(item);
      if (std::ranges::find(torrent.trackers, url) == torrent.trackers.end()) {
        torrent.trackers.push_back(url);
      }
    }
  }

  return {};
}

void parse_optional_metadata(const Dict& top_level,
                             const Dict& info,
                             TorrentFileMetadata& metadata)
{
  if (auto comment = parse_string_field(top_level, "comment")) {
    metadata.comment = std::move(*comment);
  }
  if (auto created_by = parse_string_field(top_level, "created by")) {
    metadata.created_by = std::move(*created_by);
  }
  if (auto creation_date = parse_int_field(top_level, "creation date")) {
    metadata.creation_date = std::chrono::seconds(*creation_date);
  }
  if (auto encoding = parse_string_field(top_level, "encoding")) {
    metadata.encoding_type = std::move(*encoding);
  }
  if (auto is_private = parse_int_field(info, "private")) {
    metadata.is_private = *is_private == 1;
  }
}
}  // namespace

std::string_view to_string(TorrentFileParseError error)
{
  switch (error) {
    case TorrentFileParseError::Malformed:
      return "malformed bencoding";
    case TorrentFileParseError::MissingField:
      return "missing field";
    case TorrentFileParseError::InvalidField:
      return "invalid field";
    case TorrentFileParseError::Overflow:
      return "value out of range";
    case TorrentFileParseError::Unsupported:
      return "multi-file descriptors are not supported";
  }

  return "unknown error";
}

uint32_t TorrentFile::get_piece_size(uint32_t index) const
{
  auto offset = static_cast<uint64_t>(index) * piece_length;
  if (offset >= file_length) {
    return 0;
  }

  return static_cast<uint32_t>(
      std::min<uint64_t>(piece_length, file_length - offset));
}

std::vector<PieceDescriptor> TorrentFile::pieces() const
{
  std::vector<PieceDescriptor> result;
  result.reserve(piece_hashes.size());

  for (uint32_t index = 0; index < piece_count(); index++) {
    result.push_back(PieceDescriptor {
        .index = index,
        .offset = static_cast<uint64_t>(index) * piece_length,
        .length = get_piece_size(index),
        .hash = piece_hashes[index]});
  }

  return result;
}

std::expected<TorrentFile, TorrentFileParseError> load_torrent_file(
    std::string_view encoded)
{
  BeValue file;
  try {
    file = bencode::BDecoder {}(encoded);
  } catch (const std::exception&) {
    return std::unexpected {TorrentFileParseError::Malformed};
  }

  TorrentFile torrent {};

  if (file.which() != BeValueTypeIndex::IDict) {
    return std::unexpected {TorrentFileParseError::InvalidField};
  }
  const auto& top_level = boost::get<Dict>(file);

  if (auto trackers = parse_trackers(top_level, torrent); !trackers) {
    return std::unexpected {trackers.error()};
  }

  auto info_result = parse_dict_field(top_level, "info");
  if (!info_result) {
    return std::unexpected {info_result.error()};
  }
  const auto& info = *info_result;

  auto raw_info = bencode::raw_dict_value(encoded, "info");
  if (!raw_info) {
    return std::unexpected {TorrentFileParseError::Malformed};
  }
  SHA1(reinterpret_cast<const unsigned char*>(raw_info->data()),
       raw_info->length(),
       torrent.info_hash.data());

  auto name_result = parse_string_field(info, "name");
  if (!name_result) {
    return std::unexpected {name_result.error()};
  }
  torrent.metadata.name = std::move(*name_result);

  auto piece_length_result = parse_int_field(info, "piece length");
  if (!piece_length_result) {
    return std::unexpected {piece_length_result.error()};
  }
  if (*piece_length_result <= 0
      || *piece_length_result > std::numeric_limits<int32_t>::max())
  {
    return std::unexpected {TorrentFileParseError::Overflow};
  }
  torrent.piece_length = static_cast<uint32_t>(*piece_length_result);

  auto pieces_result = parse_string_field(info, "pieces");
  if (!pieces_result) {
    return std::unexpected {pieces_result.error()};
  }

  const std::string& pieces_str = *pieces_result;
  if (pieces_str.empty() || pieces_str.size() % SHA1_HASH_SIZE != 0) {
    return std::unexpected {TorrentFileParseError::InvalidField};
  }

  for (size_t i = 0; i < pieces_str.size(); i += SHA1_HASH_SIZE) {
    aux::Sha1Digest hash {};
    std::copy_n(pieces_str.data() + i, SHA1_HASH_SIZE, hash.begin());
    torrent.piece_hashes.push_back(hash);
  }

  if (info.contains("files")) {
    return std::unexpected {TorrentFileParseError::Unsupported};
  }

  auto length_result = parse_int_field(info, "length");
  if (!length_result) {
    return std::unexpected {length_result.error()};
  }
  if (*length_result <= 0) {
    return std::unexpected {TorrentFileParseError::Overflow};
  }
  torrent.file_length = static_cast<uint64_t>(*length_result);
  torrent.files.emplace_back(torrent.metadata.name, torrent.file_length, 0);

  auto expected_pieces =
      (torrent.file_length + torrent.piece_length - 1) / torrent.piece_length;
  if (expected_pieces != torrent.piece_hashes.size()) {
    return std::unexpected {TorrentFileParseError::InvalidField};
  }

  parse_optional_metadata(top_level, info, torrent.metadata);

  return torrent;
}
}  // namespace ftr
