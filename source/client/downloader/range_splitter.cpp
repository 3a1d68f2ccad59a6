#include <algorithm>

#include "client/downloader/range_splitter.hpp"

#include <fmt/format.h>

namespace ftr
{
Result<WorkPlan> split_ranges(std::optional<uint64_t> total, uint32_t workers)
{
  if (workers == 0) {
    return std::unexpected(
        make_error(ErrorKind::InvalidInput, "worker count must be at least 1"));
  }

  if (!total) {
    return std::unexpected(make_error(
        ErrorKind::InvalidInput, "cannot range-split a resource of unknown size"));
  }

  if (*total == 0) {
    if (workers > 1) {
      return std::unexpected(make_error(
          ErrorKind::InvalidInput,
          fmt::format("cannot split an empty resource across {} workers",
                      workers)));
    }
    return WorkPlan {.kind = UnitKind::Range, .ranges = {ByteRange {0, 0}}};
  }

  auto count = std::min<uint64_t>(workers, *total);
  auto base = *total / count;

  WorkPlan plan {.kind = UnitKind::Range, .ranges = {}};
  plan.ranges.reserve(count);

  for (uint64_t i = 0; i + 1 < count; i++) {
    plan.ranges.push_back(ByteRange {i * base, (i + 1) * base});
  }
  plan.ranges.push_back(ByteRange {(count - 1) * base, *total});

  return plan;
}

WorkPlan whole_resource_plan(std::optional<uint64_t> total)
{
  return WorkPlan {
      .kind = UnitKind::Range,
      .ranges = {total ? ByteRange {0, *total} : ByteRange::open_ended(0)}};
}
}  // namespace ftr
