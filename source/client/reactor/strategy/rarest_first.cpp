#include <algorithm>
#include <utility>

#include "client/reactor/strategy/rarest_first.hpp"

namespace ftr
{
RarestFirstStrategy::RarestFirstStrategy(PieceStore& store)
    : m_store {store}
    , m_availability {
          std::make_unique<std::atomic<uint32_t>[]>(store.piece_count())}
{
}

void RarestFirstStrategy::add_peer(const aux::BitField& pieces)
{
  for (uint32_t piece = 0; piece < m_store.piece_count(); piece++) {
    if (pieces.get(piece)) {
      m_availability[piece].fetch_add(1, std::memory_order_relaxed);
    }
  }
}

void RarestFirstStrategy::remove_peer(const aux::BitField& pieces)
{
  for (uint32_t piece = 0; piece < m_store.piece_count(); piece++) {
    if (pieces.get(piece)) {
      m_availability[piece].fetch_sub(1, std::memory_order_relaxed);
    }
  }
}

void RarestFirstStrategy::add_piece(uint32_t piece)
{
  if (piece < m_store.piece_count()) {
    m_availability[piece].fetch_add(1, std::memory_order_relaxed);
  }
}

uint32_t RarestFirstStrategy::availability(uint32_t piece) const
{
  return m_availability[piece].load(std::memory_order_relaxed);
}

std::optional<uint32_t> RarestFirstStrategy::pick(
    const aux::BitField& peer_pieces, PeerKey peer)
{
  // (availability, index) orders rarest first, then lowest index
  std::vector<std::pair<uint32_t, uint32_t>> candidates;

  for (uint32_t piece = 0; piece < m_store.piece_count(); piece++) {
    if (!peer_pieces.get(piece)
        || m_store.status(piece) != UnitStatus::Pending)
    {
      continue;
    }

    auto holders = availability(piece);
    if (holders > 1 && m_store.corrupted_by(piece, peer)) {
      continue;
    }

    candidates.emplace_back(holders, piece);
  }

  std::sort(candidates.begin(), candidates.end());

  for (const auto& [holders, piece] : candidates) {
    if (m_store.try_claim(piece, peer)) {
      return piece;
    }
  }

  return std::nullopt;
}
}  // namespace ftr
