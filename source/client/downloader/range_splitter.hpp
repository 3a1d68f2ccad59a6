#pragma once

#include <cstdint>
#include <optional>

#include "client/context.hpp"
#include "client/error.hpp"

namespace ftr
{
/*
 * Splits [0, total) into `workers` near-equal ranges; the last range takes
 * the remainder. The worker count is clamped to `total` so no range is
 * empty, except for a zero-sized resource split by one worker.
 *
 * InvalidInput when the size is unknown, when the worker count is zero, or
 * when a zero-sized resource is split by more than one worker.
 */
Result<WorkPlan> split_ranges(std::optional<uint64_t> total, uint32_t workers);

// One unit covering the whole resource; open-ended when the size is unknown.
WorkPlan whole_resource_plan(std::optional<uint64_t> total);
}  // namespace ftr
