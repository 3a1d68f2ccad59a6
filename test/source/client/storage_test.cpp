#include <catch2/catch_test_macros.hpp>

#include "client/downloader/range_splitter.hpp"
#include "client/storage/storage.hpp"
#include "test_support.hpp"

using ftr::ErrorKind;
using ftr::PartDirectory;
using ftr::TransferException;
using ftr::test::run_sync;
using ftr::test::store_part;

namespace
{
ErrorKind kind_of_failure(auto&& action)
{
  try {
    action();
  } catch (const TransferException& e) {
    return e.error().kind;
  }
  FAIL("expected a TransferException");
  return ErrorKind::Transport;
}
}  // namespace

TEST_CASE("Parts merge in plan order regardless of completion order",
          "[storage]")
{
  ftr::test::TempDirectory directory;
  auto content = ftr::test::pattern_bytes(120);
  auto plan = ftr::split_ranges(120, 12);
  REQUIRE(plan);

  PartDirectory parts {directory / "job.parts"};
  for (size_t index : {7, 3, 11, 0, 5, 9, 1, 10, 2, 8, 4, 6}) {
    const auto& range = plan->ranges[index];
    store_part(parts,
               index,
               0,
               std::span(content).subspan(range.begin, range.length()));
  }

  auto written = run_sync(parts.merge(*plan, directory / "out.bin", 7));

  REQUIRE(written == 120);
  REQUIRE(ftr::test::read_file(directory / "out.bin") == content);
  REQUIRE_FALSE(std::filesystem::exists(directory / "out.bin.merging"));
}

TEST_CASE("A part shorter than its range fails the merge", "[storage]")
{
  ftr::test::TempDirectory directory;
  auto plan = ftr::split_ranges(30, 3);
  REQUIRE(plan);

  PartDirectory parts {directory / "job.parts"};
  auto content = ftr::test::pattern_bytes(30);
  for (size_t index = 0; index < 3; index++) {
    store_part(parts,
               index,
               0,
               std::span(content).subspan(index * 10, index == 1 ? 9 : 10));
  }

  REQUIRE(kind_of_failure(
              [&] { run_sync(parts.merge(*plan, directory / "out.bin", 16)); })
          == ErrorKind::Integrity);
  REQUIRE_FALSE(std::filesystem::exists(directory / "out.bin"));
}

TEST_CASE("Reopening a part truncates it to the checkpoint", "[storage]")
{
  ftr::test::TempDirectory directory;
  PartDirectory parts {directory / "job.parts"};
  auto content = ftr::test::pattern_bytes(50);

  store_part(parts, 0, 0, content);
  REQUIRE(parts.part_size(0) == 50);

  auto reopened_size = run_sync(
      [&]() -> boost::asio::awaitable<uint64_t>
      {
        auto writer = co_await parts.open(0, 20);
        auto size = writer.size();
        co_await writer.append(std::span(content).subspan(20, 5));
        co_return size;
      }());
  REQUIRE(reopened_size == 20);
  REQUIRE(parts.part_size(0) == 25);

  auto stored = ftr::test::read_file(parts.part_path(0));
  REQUIRE(std::equal(stored.begin(), stored.end(), content.begin()));
}

TEST_CASE("A part shorter than its checkpoint is state corruption",
          "[storage]")
{
  ftr::test::TempDirectory directory;
  PartDirectory parts {directory / "job.parts"};

  store_part(parts, 2, 0, ftr::test::pattern_bytes(10));

  try {
    run_sync([&]() -> boost::asio::awaitable<void>
             { co_await parts.open(2, 40); }());
    FAIL("expected a TransferException");
  } catch (const TransferException& e) {
    REQUIRE(e.error().kind == ErrorKind::StateCorruption);
    REQUIRE(e.error().unit == 2);
  }

  REQUIRE(parts.part_size(5) == 0);

  parts.remove_all();
  REQUIRE_FALSE(std::filesystem::exists(parts.vault()));
}
