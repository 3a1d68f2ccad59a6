#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

#include "auxiliary/big_endian.hpp"
#include "auxiliary/peer_id.hpp"
#include "client/context.hpp"

namespace ftr
{
constexpr uint8_t ID_CHOKE = 0;
constexpr uint8_t ID_UNCHOKE = 1;
constexpr uint8_t ID_INTERESTED = 2;
constexpr uint8_t ID_NOT_INTERESTED = 3;
constexpr uint8_t ID_HAVE = 4;
constexpr uint8_t ID_BITFIELD = 5;
constexpr uint8_t ID_REQUEST = 6;
constexpr uint8_t ID_PIECE = 7;
constexpr uint8_t ID_CANCEL = 8;
constexpr uint8_t ID_PORT = 9;

constexpr std::string_view PROTOCOL_NAME = "BitTorrent protocol";

#pragma pack(push, 1)

template<uint8_t Length>
struct FTR_PACKED FixedString
{
  constexpr FixedString(const char (&s)[Length + 1])
  {
    std::copy(s, s + Length, m_data);
  }

  std::string_view view() const { return {m_data, Length}; }

  char m_data[Length];
};

struct FTR_PACKED Handshake
{
  Handshake() = default;

  Handshake(const InfoHash& hash, const aux::PeerId& id)
  {
    std::copy(hash.cbegin(), hash.cend(), infohash);
    std::copy(id.as_raw().cbegin(), id.as_raw().cend(), peer_id);
  }

  bool speaks_protocol() const
  {
    return plen == PROTOCOL_NAME.size() && pname.view() == PROTOCOL_NAME;
  }

  InfoHash info_hash() const
  {
    InfoHash hash {};
    std::copy(std::begin(infohash), std::end(infohash), hash.begin());
    return hash;
  }

  uint8_t plen = 19;
  FixedString<19> pname {"BitTorrent protocol"};
  uint8_t reserved[8] {0};
  uint8_t infohash[20] {0};
  uint8_t peer_id[20] {0};
};

struct FTR_PACKED Keepalive
{
  uint32_big length = 0;
};

template<uint32_t Length = 0, uint8_t Id = 0>
struct FTR_PACKED MessageMetadata
{
  void add_length(uint32_t some_length) { length = length + some_length; }

  uint32_big length = Length;
  uint8_t id = Id;
};

struct FTR_PACKED Have
{
  Have() = default;
  explicit Have(uint32_t index)
      : piece_index {index}
  {
  }

  MessageMetadata<5, ID_HAVE> metadata;
  uint32_big piece_index;
};

template<uint8_t Id>
struct FTR_PACKED BlockReference
{
  BlockReference() = default;
  BlockReference(uint32_t index, uint32_t offset, uint32_t block_length)
      : piece_index {index}
      , offset_within_piece {offset}
      , length {block_length}
  {
  }

  MessageMetadata<13, Id> metadata;
  uint32_big piece_index;
  uint32_big offset_within_piece;
  uint32_big length;
};

using Request = BlockReference<ID_REQUEST>;
using Cancel = BlockReference<ID_CANCEL>;

struct FTR_PACKED Port
{
  MessageMetadata<3, ID_PORT> metadata;
  uint16_big port;
};

using Choke = MessageMetadata<1, ID_CHOKE>;
using Unchoke = MessageMetadata<1, ID_UNCHOKE>;
using Interested = MessageMetadata<1, ID_INTERESTED>;
using NotInterested = MessageMetadata<1, ID_NOT_INTERESTED>;

struct FTR_PACKED PieceMetadata
{
  void add_length(uint32_t some_length) { metadata.add_length(some_length); }

  MessageMetadata<9, ID_PIECE> metadata;
  uint32_big piece_index;
  uint32_big offset_within_piece;
};

#pragma pack(pop)

// dynamic length messages

template<typename T>
concept SupportsDynamicLength = requires(T metadata, uint32_t some_length) {
  metadata.add_length(some_length);
};

template<SupportsDynamicLength Metadata>
struct DynamicLengthMessage
{
  DynamicLengthMessage(std::vector<uint8_t> data, Metadata metadata = {})
      : m_metadata {metadata}
      , m_payload {std::move(data)}
  {
    m_metadata.add_length(static_cast<uint32_t>(m_payload.size()));
  }

  const std::vector<uint8_t>& get_payload() const { return m_payload; }

  const Metadata& get_metadata() const { return m_metadata; }

private:
  Metadata m_metadata;
  std::vector<uint8_t> m_payload;
};

using BitFieldMessage = DynamicLengthMessage<MessageMetadata<1, ID_BITFIELD>>;
using Piece = DynamicLengthMessage<PieceMetadata>;

inline Piece make_piece(uint32_t index,
                        uint32_t offset,
                        std::vector<uint8_t> block)
{
  PieceMetadata metadata {};
  metadata.piece_index = index;
  metadata.offset_within_piece = offset;
  return Piece {std::move(block), metadata};
}

using TorrentMessage = std::variant<Keepalive,
                                    Choke,
                                    Unchoke,
                                    Interested,
                                    NotInterested,
                                    Have,
                                    BitFieldMessage,
                                    Request,
                                    Piece,
                                    Cancel,
                                    Port>;

static_assert(sizeof(Handshake) == 68);
static_assert(sizeof(Request) == 17);
static_assert(sizeof(PieceMetadata) == 13);
}  // namespace ftr
