#include "client/context.hpp"

namespace ftr
{
std::string_view to_string(UnitStatus status)
{
  switch (status) {
    case UnitStatus::Pending:
      return "pending";
    case UnitStatus::InFlight:
      return "in_flight";
    case UnitStatus::Completed:
      return "completed";
    case UnitStatus::Failed:
      return "failed";
  }

  return "unknown";
}

std::string_view to_string(TransportKind kind)
{
  switch (kind) {
    case TransportKind::Http:
      return "http";
    case TransportKind::File:
      return "file";
    case TransportKind::Swarm:
      return "swarm";
  }

  return "unknown";
}

std::string_view to_string(TransferPhase phase)
{
  switch (phase) {
    case TransferPhase::Initializing:
      return "Initializing";
    case TransferPhase::MetadataResolved:
      return "MetadataResolved";
    case TransferPhase::Transferring:
      return "Transferring";
    case TransferPhase::Paused:
      return "Paused";
    case TransferPhase::Merging:
      return "Merging";
    case TransferPhase::Verifying:
      return "Verifying";
    case TransferPhase::Complete:
      return "Complete";
    case TransferPhase::Failed:
      return "Failed";
  }

  return "Unknown";
}

bool WorkPlan::covers(std::optional<uint64_t> total) const
{
  uint64_t cursor = 0;

  for (const auto& range : ranges) {
    if (range.begin != cursor || (!range.is_open() && range.end < range.begin))
    {
      return false;
    }

    if (range.is_open()) {
      return &range == &ranges.back() && !total;
    }

    cursor = range.end;
  }

  return !total || cursor == *total;
}
}  // namespace ftr
