#pragma once

#include <atomic>
#include <memory>
#include <vector>

#include "client/reactor/strategy/strategy.hpp"

namespace ftr
{
/*
 * Rarest-first: among pieces the peer holds that are still Pending, pick the
 * one held by the fewest connected peers, lowest index first on ties.
 *
 * A piece that failed its hash from this peer is skipped while another
 * connected peer holds it.
 */
class RarestFirstStrategy : public IPieceStrategy
{
  PieceStore& m_store;
  std::unique_ptr<std::atomic<uint32_t>[]> m_availability;

public:
  explicit RarestFirstStrategy(PieceStore& store);

  void add_peer(const aux::BitField& pieces) override final;

  void remove_peer(const aux::BitField& pieces) override final;

  void add_piece(uint32_t piece) override final;

  std::optional<uint32_t> pick(const aux::BitField& peer_pieces,
                               PeerKey peer) override final;

  uint32_t availability(uint32_t piece) const;
};
}  // namespace ftr
