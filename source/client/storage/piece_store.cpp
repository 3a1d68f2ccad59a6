#include <algorithm>

#include "client/storage/piece_store.hpp"

#include <spdlog/spdlog.h>

#include "auxiliary/hash.hpp"

namespace ftr
{
std::string_view to_string(BlockOutcome outcome)
{
  switch (outcome) {
    case BlockOutcome::Accepted:
      return "accepted";
    case BlockOutcome::Duplicate:
      return "duplicate";
    case BlockOutcome::Rejected:
      return "rejected";
    case BlockOutcome::PieceCompleted:
      return "piece completed";
    case BlockOutcome::PieceFailed:
      return "piece failed";
  }

  return "unknown";
}

PieceStore::PieceStore(std::vector<PieceDescriptor> pieces,
                       boost::asio::random_access_file backing,
                       uint32_t block_bytes,
                       uint32_t max_hash_failures)
    : m_pieces {std::move(pieces)}
    , m_backing {std::move(backing)}
    , m_block_bytes {block_bytes}
    , m_max_hash_failures {max_hash_failures}
{
  m_slots.reserve(m_pieces.size());
  for (uint32_t piece = 0; piece < m_pieces.size(); piece++) {
    auto slot = std::make_unique<Slot>();
    slot->received.assign(block_count(piece), false);
    m_slots.push_back(std::move(slot));
  }
}

void PieceStore::on_piece_completed(CompletionHandler handler)
{
  m_completion_handler = std::move(handler);
}

void PieceStore::on_piece_failed(FailureHandler handler)
{
  m_failure_handler = std::move(handler);
}

uint32_t PieceStore::block_count(uint32_t piece) const
{
  return (m_pieces[piece].length + m_block_bytes - 1) / m_block_bytes;
}

uint32_t PieceStore::block_length(uint32_t piece, uint32_t block) const
{
  auto offset = block * m_block_bytes;
  return std::min(m_block_bytes, m_pieces[piece].length - offset);
}

UnitStatus PieceStore::status(uint32_t piece) const
{
  std::lock_guard lock {m_slots[piece]->mutex};
  return m_slots[piece]->status;
}

std::vector<UnitStatus> PieceStore::statuses() const
{
  std::vector<UnitStatus> result;
  result.reserve(m_slots.size());
  for (const auto& slot : m_slots) {
    std::lock_guard lock {slot->mutex};
    result.push_back(slot->status);
  }
  return result;
}

bool PieceStore::try_claim(uint32_t piece, PeerKey owner)
{
  auto& slot = *m_slots[piece];
  std::lock_guard lock {slot.mutex};

  if (slot.status != UnitStatus::Pending) {
    return false;
  }

  slot.status = UnitStatus::InFlight;
  slot.owner = owner;
  return true;
}

void PieceStore::release(uint32_t piece, PeerKey owner)
{
  auto& slot = *m_slots[piece];
  std::lock_guard lock {slot.mutex};

  if (slot.status != UnitStatus::InFlight || slot.owner != owner) {
    return;
  }

  reset_blocks(slot);
  slot.owner.reset();
  slot.status = UnitStatus::Pending;
}

BlockOutcome PieceStore::record_block(uint32_t piece,
                                      uint32_t offset,
                                      std::span<const uint8_t> data,
                                      PeerKey owner)
{
  if (piece >= m_slots.size()) {
    return BlockOutcome::Rejected;
  }

  auto& slot = *m_slots[piece];
  std::unique_lock lock {slot.mutex};

  if (slot.status == UnitStatus::Completed) {
    return BlockOutcome::Duplicate;
  }
  if (slot.status != UnitStatus::InFlight || slot.owner != owner
      || offset % m_block_bytes != 0)
  {
    return BlockOutcome::Rejected;
  }

  auto block = offset / m_block_bytes;
  if (block >= slot.received.size() || data.size() != block_length(piece, block))
  {
    return BlockOutcome::Rejected;
  }
  if (slot.received[block]) {
    return BlockOutcome::Duplicate;
  }

  const auto& descriptor = m_pieces[piece];
  boost::asio::write_at(m_backing,
                        descriptor.offset + offset,
                        boost::asio::buffer(data.data(), data.size()));
  slot.received[block] = true;
  slot.received_blocks++;

  if (slot.received_blocks < slot.received.size()) {
    return BlockOutcome::Accepted;
  }

  if (verify(piece)) {
    slot.status = UnitStatus::Completed;
    slot.owner.reset();
    m_completed_bytes.fetch_add(descriptor.length, std::memory_order_relaxed);
    m_completed.fetch_add(1, std::memory_order_release);
    lock.unlock();

    if (m_completion_handler) {
      m_completion_handler(piece);
    }
    return BlockOutcome::PieceCompleted;
  }

  slot.hash_failures++;
  slot.corrupted_by.insert(owner);
  slot.owner.reset();
  reset_blocks(slot);

  if (slot.hash_failures >= m_max_hash_failures) {
    slot.status = UnitStatus::Failed;
    m_failed.store(true, std::memory_order_release);
  } else {
    slot.status = UnitStatus::Pending;
  }
  auto failures = slot.hash_failures;
  lock.unlock();

  spdlog::warn("piece {} failed its hash check ({} failures)", piece, failures);
  if (m_failure_handler) {
    m_failure_handler(piece, owner);
  }
  return BlockOutcome::PieceFailed;
}

void PieceStore::mark_completed(uint32_t piece)
{
  auto& slot = *m_slots[piece];
  std::lock_guard lock {slot.mutex};

  if (slot.status == UnitStatus::Completed) {
    return;
  }

  slot.status = UnitStatus::Completed;
  slot.owner.reset();
  std::fill(slot.received.begin(), slot.received.end(), true);
  slot.received_blocks = static_cast<uint32_t>(slot.received.size());
  m_completed_bytes.fetch_add(m_pieces[piece].length, std::memory_order_relaxed);
  m_completed.fetch_add(1, std::memory_order_release);
}

bool PieceStore::corrupted_by(uint32_t piece, PeerKey peer) const
{
  std::lock_guard lock {m_slots[piece]->mutex};
  return m_slots[piece]->corrupted_by.contains(peer);
}

uint32_t PieceStore::hash_failures(uint32_t piece) const
{
  std::lock_guard lock {m_slots[piece]->mutex};
  return m_slots[piece]->hash_failures;
}

bool PieceStore::verify(uint32_t piece) const
{
  const auto& descriptor = m_pieces[piece];
  std::vector<uint8_t> buffer(descriptor.length);

  boost::system::error_code ec;
  auto read = boost::asio::read_at(
      m_backing, descriptor.offset, boost::asio::buffer(buffer), ec);
  if (ec || read != buffer.size()) {
    return false;
  }

  return aux::sha1(buffer) == descriptor.hash;
}

void PieceStore::reset_blocks(Slot& slot) const
{
  std::fill(slot.received.begin(), slot.received.end(), false);
  slot.received_blocks = 0;
}
}  // namespace ftr
