#include <algorithm>

#include <catch2/catch_test_macros.hpp>

#include "client/downloader/range_splitter.hpp"

using ftr::ByteRange;
using ftr::ErrorKind;
using ftr::split_ranges;

TEST_CASE("Three workers split 300 bytes evenly", "[splitter]")
{
  auto plan = split_ranges(300, 3);
  REQUIRE(plan);
  REQUIRE(plan->kind == ftr::UnitKind::Range);
  REQUIRE(plan->ranges
          == std::vector<ByteRange> {{0, 100}, {100, 200}, {200, 300}});
}

TEST_CASE("The last range absorbs the remainder", "[splitter]")
{
  auto plan = split_ranges(10, 3);
  REQUIRE(plan);
  REQUIRE(plan->ranges == std::vector<ByteRange> {{0, 3}, {3, 6}, {6, 10}});
}

TEST_CASE("Ranges tile the resource for any size and worker count",
          "[splitter][property]")
{
  for (uint64_t total : {1ULL, 2ULL, 7ULL, 100ULL, 301ULL, 1024ULL, 99991ULL,
                         (1ULL << 40) + 3})
  {
    for (uint32_t workers = 1; workers <= 17; workers++) {
      INFO("total " << total << ", workers " << workers);

      auto plan = split_ranges(total, workers);
      REQUIRE(plan);

      auto expected_count = std::min<uint64_t>(total, workers);
      REQUIRE(plan->size() == expected_count);
      REQUIRE(plan->covers(total));

      uint64_t cursor = 0;
      uint64_t sum = 0;
      auto base = total / expected_count;
      for (size_t i = 0; i < plan->size(); i++) {
        const auto& range = plan->ranges[i];
        REQUIRE(range.begin == cursor);
        REQUIRE(range.length() > 0);
        if (i + 1 < plan->size()) {
          REQUIRE(range.length() == base);
        }
        cursor = range.end;
        sum += range.length();
      }
      REQUIRE(sum == total);
    }
  }
}

TEST_CASE("Unsplittable inputs are rejected", "[splitter]")
{
  auto unknown = split_ranges(std::nullopt, 4);
  REQUIRE_FALSE(unknown);
  REQUIRE(unknown.error().kind == ErrorKind::InvalidInput);

  auto no_workers = split_ranges(100, 0);
  REQUIRE_FALSE(no_workers);
  REQUIRE(no_workers.error().kind == ErrorKind::InvalidInput);

  auto empty = split_ranges(0, 3);
  REQUIRE_FALSE(empty);
  REQUIRE(empty.error().kind == ErrorKind::InvalidInput);

  auto empty_single = split_ranges(0, 1);
  REQUIRE(empty_single);
  REQUIRE(empty_single->ranges == std::vector<ByteRange> {{0, 0}});
}

TEST_CASE("Whole-resource plans", "[splitter]")
{
  auto sized = ftr::whole_resource_plan(50);
  REQUIRE(sized.ranges == std::vector<ByteRange> {{0, 50}});
  REQUIRE(sized.covers(50));

  auto unsized = ftr::whole_resource_plan(std::nullopt);
  REQUIRE(unsized.size() == 1);
  REQUIRE(unsized.ranges.front().is_open());
  REQUIRE(unsized.covers(std::nullopt));
  REQUIRE_FALSE(unsized.covers(50));
}
