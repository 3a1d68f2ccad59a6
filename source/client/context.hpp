#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "auxiliary/hash.hpp"

namespace ftr
{
using InfoHash = std::array<uint8_t, 20>;

// Half-open byte interval [begin, end) of the resource.
struct ByteRange
{
  static constexpr uint64_t OPEN_END = std::numeric_limits<uint64_t>::max();

  uint64_t begin = 0;
  uint64_t end = 0;

  // A range whose length is not known until the transport runs dry.
  static ByteRange open_ended(uint64_t begin) { return {begin, OPEN_END}; }

  bool is_open() const { return end == OPEN_END; }

  uint64_t length() const { return is_open() ? OPEN_END : end - begin; }

  bool operator==(const ByteRange&) const = default;
};

enum class UnitStatus : uint8_t
{
  Pending,
  InFlight,
  Completed,
  Failed
};

std::string_view to_string(UnitStatus status);

enum class UnitKind : uint8_t
{
  Range,
  Piece
};

// A piece of a swarm resource as listed by its descriptor.
struct PieceDescriptor
{
  uint32_t index;
  uint64_t offset;
  uint32_t length;
  aux::Sha1Digest hash;
};

/*
 * Ordered units of one job. For bulk transfers `ranges` is the split of the
 * resource; for swarm transfers it mirrors the piece table so both shapes
 * persist and resume the same way.
 */
struct WorkPlan
{
  UnitKind kind = UnitKind::Range;
  std::vector<ByteRange> ranges;

  size_t size() const { return ranges.size(); }

  // Contiguous from zero, non-overlapping, and ending at `total` when known.
  bool covers(std::optional<uint64_t> total) const;
};

enum class TransportKind : uint8_t
{
  Http,
  File,
  Swarm
};

std::string_view to_string(TransportKind kind);

enum class TransferPhase : uint8_t
{
  Initializing,
  MetadataResolved,
  Transferring,
  Paused,
  Merging,
  Verifying,
  Complete,
  Failed
};

std::string_view to_string(TransferPhase phase);

struct UnitFailure
{
  size_t unit;
  std::string reason;
};
}  // namespace ftr
