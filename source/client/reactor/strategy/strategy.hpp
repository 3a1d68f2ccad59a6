#pragma once

#include <cstdint>
#include <optional>

#include "client/storage/piece_store.hpp"
#include "torrent/bitfield/bitfield.hpp"

namespace ftr
{
/*
 * Piece selection. Sessions report what their peer holds and ask for the
 * next piece to download; a returned piece is already claimed for the
 * asking peer in the piece store.
 */
class IPieceStrategy
{
public:
  virtual void add_peer(const aux::BitField& pieces) = 0;

  virtual void remove_peer(const aux::BitField& pieces) = 0;

  virtual void add_piece(uint32_t piece) = 0;

  virtual std::optional<uint32_t> pick(const aux::BitField& peer_pieces,
                                       PeerKey peer) = 0;

  virtual ~IPieceStrategy() = default;
};
}  // namespace ftr
