#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/random_access_file.hpp>

#include "client/context.hpp"

namespace ftr
{
using PeerKey = uint64_t;

enum class BlockOutcome : uint8_t
{
  Accepted,
  Duplicate,
  Rejected,  // not claimed by this peer, or misaligned
  PieceCompleted,
  PieceFailed,
};

std::string_view to_string(BlockOutcome outcome);

/*
 * Piece table of a swarm job, backed by the destination file. Blocks are
 * written at their final offset; a piece is hashed once its last block is
 * in. Each piece has its own lock, so blocks of different pieces never wait
 * on each other. Sessions on different strands share the backing file; the
 * positional reads and writes only touch its native handle.
 *
 * A piece is Pending until a peer claims it (InFlight, one owner), then
 * Completed after its hash matches. A mismatch returns it to Pending and
 * remembers the peer that sent it; after `max_hash_failures` mismatches
 * the piece is Failed for good.
 */
class PieceStore
{
public:
  using CompletionHandler = std::function<void(uint32_t piece)>;
  using FailureHandler = std::function<void(uint32_t piece, PeerKey peer)>;

  PieceStore(std::vector<PieceDescriptor> pieces,
             boost::asio::random_access_file backing,
             uint32_t block_bytes,
             uint32_t max_hash_failures);

  void on_piece_completed(CompletionHandler handler);

  void on_piece_failed(FailureHandler handler);

  size_t piece_count() const { return m_pieces.size(); }

  const PieceDescriptor& descriptor(uint32_t piece) const
  {
    return m_pieces[piece];
  }

  uint32_t block_bytes() const { return m_block_bytes; }

  uint32_t block_count(uint32_t piece) const;

  uint32_t block_length(uint32_t piece, uint32_t block) const;

  UnitStatus status(uint32_t piece) const;

  std::vector<UnitStatus> statuses() const;

  size_t completed_count() const
  {
    return m_completed.load(std::memory_order_acquire);
  }

  uint64_t completed_bytes() const
  {
    return m_completed_bytes.load(std::memory_order_relaxed);
  }

  bool all_completed() const { return completed_count() == piece_count(); }

  bool any_failed() const { return m_failed.load(std::memory_order_acquire); }

  // Pending -> InFlight(owner). False when the piece is not Pending.
  bool try_claim(uint32_t piece, PeerKey owner);

  // InFlight(owner) -> Pending; received blocks are discarded.
  void release(uint32_t piece, PeerKey owner);

  BlockOutcome record_block(uint32_t piece,
                            uint32_t offset,
                            std::span<const uint8_t> data,
                            PeerKey owner);

  // Marks a piece verified in an earlier run.
  void mark_completed(uint32_t piece);

  bool corrupted_by(uint32_t piece, PeerKey peer) const;

  uint32_t hash_failures(uint32_t piece) const;

  // Re-reads and hashes a piece from the backing file.
  bool verify(uint32_t piece) const;

  void sync() { m_backing.sync_data(); }

private:
  struct Slot
  {
    mutable std::mutex mutex;
    UnitStatus status = UnitStatus::Pending;
    std::optional<PeerKey> owner;
    std::vector<bool> received;
    uint32_t received_blocks = 0;
    uint32_t hash_failures = 0;
    std::set<PeerKey> corrupted_by;
  };

  void reset_blocks(Slot& slot) const;

  std::vector<PieceDescriptor> m_pieces;
  std::vector<std::unique_ptr<Slot>> m_slots;
  mutable boost::asio::random_access_file m_backing;
  uint32_t m_block_bytes;
  uint32_t m_max_hash_failures;

  std::atomic<size_t> m_completed {0};
  std::atomic<uint64_t> m_completed_bytes {0};
  std::atomic<bool> m_failed {false};

  CompletionHandler m_completion_handler;
  FailureHandler m_failure_handler;
};
}  // namespace ftr
