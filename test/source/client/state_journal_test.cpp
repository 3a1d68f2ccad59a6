#include <catch2/catch_test_macros.hpp>

#include "client/downloader/range_splitter.hpp"
#include "client/journal/state_journal.hpp"
#include "test_support.hpp"

using ftr::ErrorKind;
using ftr::PersistedState;
using ftr::StateJournal;
using ftr::UnitStatus;

namespace
{
PersistedState three_units()
{
  auto plan = ftr::split_ranges(300, 3);
  auto state = PersistedState::fresh(
      "http://example.com/a.bin", 300, *plan, "/downloads/a.bin");
  state.units[0].status = UnitStatus::Completed;
  state.units[0].bytes_received = 100;
  state.units[1].bytes_received = 40;
  state.units[2].status = UnitStatus::Failed;
  state.units[2].failure = "connection reset";
  return state;
}
}  // namespace

TEST_CASE("Saved state loads back unchanged", "[journal]")
{
  ftr::test::TempDirectory directory;
  boost::asio::io_context io;
  StateJournal journal {io.get_executor(),
                        StateJournal::path_for(directory.path(), "abc123")};

  auto empty = journal.load();
  REQUIRE(empty);
  REQUIRE_FALSE(empty->has_value());

  auto state = three_units();
  journal.save(state);
  REQUIRE(journal.exists());
  REQUIRE(journal.path().filename() == "abc123.state.json");

  auto loaded = journal.load();
  REQUIRE(loaded);
  REQUIRE(loaded->has_value());

  const auto& restored = **loaded;
  REQUIRE(restored.locator == state.locator);
  REQUIRE(restored.total_size == 300);
  REQUIRE(restored.destination == state.destination);
  REQUIRE(restored.plan().ranges == state.plan().ranges);
  REQUIRE(restored.units[0].status == UnitStatus::Completed);
  REQUIRE(restored.units[1].bytes_received == 40);
  REQUIRE(restored.units[2].failure == "connection reset");
  REQUIRE(restored.bytes_received() == 140);

  journal.remove();
  REQUIRE_FALSE(journal.exists());
}

TEST_CASE("Open-ended units survive a save", "[journal]")
{
  auto state = PersistedState::fresh(
      "file:///srv/stream", std::nullopt, ftr::whole_resource_plan(std::nullopt), "out");
  state.units[0].bytes_received = 1234;

  auto parsed = ftr::parse_state(ftr::serialize_state(state));
  REQUIRE(parsed);
  REQUIRE_FALSE(parsed->total_size);
  REQUIRE(parsed->units[0].range.is_open());
  REQUIRE(parsed->units[0].bytes_received == 1234);
}

TEST_CASE("Damaged state is reported as corruption", "[journal]")
{
  auto corrupted = [](std::string_view text)
  {
    auto parsed = ftr::parse_state(text);
    REQUIRE_FALSE(parsed);
    return parsed.error().kind;
  };

  SECTION("not JSON")
  {
    REQUIRE(corrupted("{\"version\": 1, \"units\": [") == ErrorKind::StateCorruption);
  }

  SECTION("units that overlap")
  {
    auto state = three_units();
    state.units[1].range.begin = 90;
    REQUIRE(corrupted(ftr::serialize_state(state)) == ErrorKind::StateCorruption);
  }

  SECTION("units that stop short of the size")
  {
    auto state = three_units();
    state.total_size = 400;
    REQUIRE(corrupted(ftr::serialize_state(state)) == ErrorKind::StateCorruption);
  }

  SECTION("more bytes than the range holds")
  {
    auto state = three_units();
    state.units[1].bytes_received = 101;
    REQUIRE(corrupted(ftr::serialize_state(state)) == ErrorKind::StateCorruption);
  }

  SECTION("a completed unit with missing bytes")
  {
    auto state = three_units();
    state.units[0].bytes_received = 99;
    REQUIRE(corrupted(ftr::serialize_state(state)) == ErrorKind::StateCorruption);
  }

  SECTION("an unknown version")
  {
    auto text = ftr::serialize_state(three_units());
    auto at = text.find("\"version\": 1");
    REQUIRE(at != std::string::npos);
    text.replace(at, 12, "\"version\": 9");
    REQUIRE(corrupted(text) == ErrorKind::StateCorruption);
  }
}

TEST_CASE("A journal holding garbage fails to load", "[journal]")
{
  ftr::test::TempDirectory directory;
  boost::asio::io_context io;
  StateJournal journal {io.get_executor(), directory / "job.state.json"};
  ftr::test::write_file(journal.path(), std::string_view("\x00\x01garbage", 9));

  auto loaded = journal.load();
  REQUIRE_FALSE(loaded);
  REQUIRE(loaded.error().kind == ErrorKind::StateCorruption);
}
