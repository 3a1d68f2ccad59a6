#include <fstream>
#include <iterator>

#include "client/journal/state_journal.hpp"

#include <boost/asio/stream_file.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using nlohmann::json;

namespace ftr
{
namespace
{
constexpr std::string_view STATE_SUFFIX = ".state.json";
constexpr std::string_view TEMP_SUFFIX = ".tmp";

std::optional<UnitStatus> status_from_string(std::string_view text)
{
  for (auto status : {UnitStatus::Pending,
                      UnitStatus::InFlight,
                      UnitStatus::Completed,
                      UnitStatus::Failed})
  {
    if (to_string(status) == text) {
      return status;
    }
  }
  return std::nullopt;
}

TransferError corrupt(std::string message)
{
  return make_error(ErrorKind::StateCorruption, std::move(message));
}

json unit_to_json(size_t index, const UnitRecord& unit)
{
  json entry {
      {"index", index},
      {"begin", unit.range.begin},
      {"status", std::string(to_string(unit.status))},
      {"bytes_received", unit.bytes_received},
  };
  entry["end"] = unit.range.is_open() ? json(nullptr) : json(unit.range.end);
  if (!unit.failure.empty()) {
    entry["failure"] = unit.failure;
  }
  return entry;
}

Result<UnitRecord> unit_from_json(const json& entry, size_t expected_index)
{
  if (entry.at("index").get<size_t>() != expected_index) {
    return std::unexpected(
        corrupt(fmt::format("unit {} is out of order", expected_index)));
  }

  UnitRecord unit {};
  unit.range.begin = entry.at("begin").get<uint64_t>();
  unit.range.end = entry.at("end").is_null() ? ByteRange::OPEN_END
                                             : entry.at("end").get<uint64_t>();
  unit.bytes_received = entry.at("bytes_received").get<uint64_t>();
  if (auto failure = entry.find("failure"); failure != entry.end()) {
    unit.failure = failure->get<std::string>();
  }

  auto status = status_from_string(entry.at("status").get<std::string>());
  if (!status) {
    return std::unexpected(
        corrupt(fmt::format("unit {} has an unknown status", expected_index)));
  }
  unit.status = *status;

  if (unit.range.end < unit.range.begin
      || (!unit.range.is_open() && unit.bytes_received > unit.range.length())
      || (unit.status == UnitStatus::Completed && !unit.range.is_open()
          && unit.bytes_received != unit.range.length()))
  {
    return std::unexpected(
        corrupt(fmt::format("unit {} records an impossible byte count",
                            expected_index)));
  }

  return unit;
}
}  // namespace

WorkPlan PersistedState::plan() const
{
  WorkPlan plan {.kind = kind, .ranges = {}};
  plan.ranges.reserve(units.size());
  for (const auto& unit : units) {
    plan.ranges.push_back(unit.range);
  }
  return plan;
}

uint64_t PersistedState::bytes_received() const
{
  uint64_t total = 0;
  for (const auto& unit : units) {
    total += unit.bytes_received;
  }
  return total;
}

PersistedState PersistedState::fresh(std::string locator,
                                     std::optional<uint64_t> total_size,
                                     const WorkPlan& plan,
                                     std::filesystem::path destination)
{
  PersistedState state {};
  state.locator = std::move(locator);
  state.total_size = total_size;
  state.kind = plan.kind;
  state.destination = std::move(destination);
  for (const auto& range : plan.ranges) {
    state.units.push_back(UnitRecord {.range = range});
  }
  return state;
}

std::string serialize_state(const PersistedState& state)
{
  json units = json::array();
  for (size_t index = 0; index < state.units.size(); index++) {
    units.push_back(unit_to_json(index, state.units[index]));
  }

  json document {
      {"version", PersistedState::VERSION},
      {"locator", state.locator},
      {"kind", state.kind == UnitKind::Piece ? "piece" : "range"},
      {"content_id", state.content_id},
      {"destination", state.destination.string()},
      {"units", std::move(units)},
  };
  document["total_size"] =
      state.total_size ? json(*state.total_size) : json(nullptr);

  return document.dump(2);
}

Result<PersistedState> parse_state(std::string_view text)
{
  PersistedState state {};

  try {
    auto document = json::parse(text);

    if (document.at("version").get<int>() != PersistedState::VERSION) {
      return std::unexpected(corrupt("unsupported state version"));
    }

    state.locator = document.at("locator").get<std::string>();
    state.content_id = document.at("content_id").get<std::string>();
    state.destination = document.at("destination").get<std::string>();
    if (!document.at("total_size").is_null()) {
      state.total_size = document.at("total_size").get<uint64_t>();
    }

    auto kind = document.at("kind").get<std::string>();
    if (kind != "range" && kind != "piece") {
      return std::unexpected(corrupt(fmt::format("unknown unit kind {}", kind)));
    }
    state.kind = kind == "piece" ? UnitKind::Piece : UnitKind::Range;

    const auto& units = document.at("units");
    if (!units.is_array() || units.empty()) {
      return std::unexpected(corrupt("state has no units"));
    }
    for (size_t index = 0; index < units.size(); index++) {
      auto unit = unit_from_json(units[index], index);
      if (!unit) {
        return std::unexpected(unit.error());
      }
      state.units.push_back(std::move(*unit));
    }
  } catch (const json::exception& e) {
    return std::unexpected(corrupt(fmt::format("unreadable state: {}", e.what())));
  }

  if (!state.plan().covers(state.total_size)) {
    return std::unexpected(
        corrupt("recorded units do not cover the resource exactly once"));
  }

  return state;
}

StateJournal::StateJournal(boost::asio::any_io_executor executor,
                           std::filesystem::path path)
    : m_executor {std::move(executor)}
    , m_path {std::move(path)}
{
}

std::filesystem::path StateJournal::path_for(
    const std::filesystem::path& directory, std::string_view job_key)
{
  return directory / fmt::format("{}{}", job_key, STATE_SUFFIX);
}

bool StateJournal::exists() const
{
  std::error_code ec;
  return std::filesystem::exists(m_path, ec);
}

Result<std::optional<PersistedState>> StateJournal::load() const
{
  std::lock_guard lock {m_mutex};

  std::ifstream input {m_path, std::ios::binary};
  if (!input) {
    if (!exists()) {
      return std::nullopt;
    }
    return std::unexpected(
        corrupt(fmt::format("cannot open {}", m_path.string())));
  }

  std::string text {std::istreambuf_iterator<char>(input),
                    std::istreambuf_iterator<char>()};

  auto state = parse_state(text);
  if (!state) {
    auto error = state.error();
    error.message = fmt::format("{}: {}", m_path.string(), error.message);
    return std::unexpected(std::move(error));
  }

  return std::optional<PersistedState> {std::move(*state)};
}

void StateJournal::save(const PersistedState& state) const
{
  auto text = serialize_state(state);

  std::lock_guard lock {m_mutex};

  if (m_path.has_parent_path()) {
    std::filesystem::create_directories(m_path.parent_path());
  }

  auto staging = m_path;
  staging += TEMP_SUFFIX;
  {
    boost::asio::stream_file file {
        m_executor,
        staging.string(),
        boost::asio::stream_file::flags::write_only
            | boost::asio::stream_file::flags::create
            | boost::asio::stream_file::flags::truncate};
    boost::asio::write(file, boost::asio::buffer(text));
    file.sync_all();
  }

  std::filesystem::rename(staging, m_path);
}

void StateJournal::remove() const
{
  std::lock_guard lock {m_mutex};

  std::error_code ec;
  std::filesystem::remove(m_path, ec);
  if (ec) {
    spdlog::warn("cannot remove {}: {}", m_path.string(), ec.message());
  }
}
}  // namespace ftr
